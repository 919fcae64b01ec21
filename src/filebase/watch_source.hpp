#pragma once

#include "result.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace filebase {

// Filesystem events delivered for entries of a watched directory
struct MovedEvent {
    std::string src_path;
    std::string dest_path;
};

struct DeletedEvent {
    std::string path;
};

struct ModifiedEvent {
    std::string path;
};

using WatchEvent = std::variant<MovedEvent, DeletedEvent, ModifiedEvent>;

// Path the event is reported for: the source path of a move
inline const std::string& event_path(const WatchEvent& event) {
    return std::visit([](const auto& e) -> const std::string& {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, MovedEvent>) {
            return e.src_path;
        } else {
            return e.path;
        }
    }, event);
}

inline const char* event_name(const WatchEvent& event) {
    switch (event.index()) {
        case 0: return "moved";
        case 1: return "deleted";
        case 2: return "modified";
    }
    return "unknown";
}

using SubscriptionId = uint64_t;
using WatchCallback = std::function<void(const WatchEvent&)>;

/**
 * WatchSource - delivers filesystem events for one directory per subscription
 *
 * Callbacks may run on a thread owned by the source. A callback may call
 * subscribe()/unsubscribe() on the same source.
 */
class WatchSource {
public:
    virtual ~WatchSource() = default;

    virtual Result<SubscriptionId> subscribe(const std::string& directory, bool recursive, WatchCallback callback) = 0;

    // After this returns the callback of `id` is not called again. Unless called
    // from inside that callback, it also waits for a running call to finish.
    virtual Result<void> unsubscribe(SubscriptionId id) = 0;
};

using WatchSourcePtr = std::shared_ptr<WatchSource>;

} // namespace filebase
