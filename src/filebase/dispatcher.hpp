#pragma once

#include "result.hpp"
#include "types.hpp"
#include "object.hpp"
#include <map>
#include <vector>
#include <functional>
#include <memory>
#include <mutex>

namespace filebase {

// Event handler callback type
using EventHandler = std::function<Result<void>(const Dict&)>;

// Dispatcher - pub/sub for handle events.
// Events are Dicts with "source" and "name" keys, handlers are keyed
// "source/name" or "*/name". Handlers may be called from the watcher thread.
class Dispatcher : public Object {
public:
    static Result<std::shared_ptr<Dispatcher>> create();

    Result<void> register_event_handler(const std::string& key, EventHandler handler);
    Result<void> unregister_event_handler(const std::string& key);

    // Returns the number of handlers called. Handler errors are logged.
    Result<size_t> dispatch_event(const Dict& event);

private:
    Dispatcher() = default;

    std::mutex _mutex;
    std::map<std::string, std::vector<EventHandler>> _event_handlers;
};

using DispatcherPtr = std::shared_ptr<Dispatcher>;

} // namespace filebase
