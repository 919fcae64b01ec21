#include "dispatcher.hpp"
#include <spdlog/spdlog.h>

namespace filebase {

Result<std::shared_ptr<Dispatcher>> Dispatcher::create() {
    auto dispatcher = std::shared_ptr<Dispatcher>(new Dispatcher());
    if (auto res = dispatcher->init(); !res) {
        return Err<std::shared_ptr<Dispatcher>>("Dispatcher::create: init failed", res);
    }
    return dispatcher;
}

Result<void> Dispatcher::register_event_handler(const std::string& key, EventHandler handler) {
    if (key.find('/') == std::string::npos) {
        return Err<void>("Dispatcher::register_event_handler: key must be 'source/name': " + key);
    }
    std::lock_guard<std::mutex> lock(_mutex);
    _event_handlers[key].push_back(std::move(handler));
    return Ok();
}

Result<void> Dispatcher::unregister_event_handler(const std::string& key) {
    std::lock_guard<std::mutex> lock(_mutex);
    _event_handlers.erase(key);
    return Ok();
}

Result<size_t> Dispatcher::dispatch_event(const Dict& event) {
    // Extract source and name from event
    std::string source, name;

    auto source_it = event.find("source");
    if (source_it != event.end()) {
        if (auto s = get_as<std::string>(source_it->second)) {
            source = *s;
        }
    }

    auto name_it = event.find("name");
    if (name_it != event.end()) {
        if (auto n = get_as<std::string>(name_it->second)) {
            name = *n;
        }
    }

    if (name.empty()) {
        return Err<size_t>("Dispatcher::dispatch_event: event has no name");
    }

    // Handlers run outside the lock so they can (un)register
    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (const auto& key : {source + "/" + name, "*/" + name}) {
            auto it = _event_handlers.find(key);
            if (it != _event_handlers.end()) {
                handlers.insert(handlers.end(), it->second.begin(), it->second.end());
            }
        }
    }

    for (auto& handler : handlers) {
        if (auto res = handler(event); !res) {
            spdlog::warn("Dispatcher: handler for {}/{} failed: {}", source, name, res.error().to_string());
        }
    }
    return Ok(handlers.size());
}

} // namespace filebase
