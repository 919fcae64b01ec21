#pragma once

#include "watch_source.hpp"
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace filebase {

/**
 * SubscriptionRegistry - bookkeeping shared by the watch sources
 *
 * Maps subscription ids to (directory, callback) and runs callbacks outside
 * its lock, so callbacks can add or remove subscriptions. remove() blocks
 * until calls of that callback running on other threads have returned.
 */
class SubscriptionRegistry {
public:
    SubscriptionId add(const std::string& directory, WatchCallback callback);

    // Returns the directory of the removed subscription, nullopt if unknown
    std::optional<std::string> remove(SubscriptionId id);

    // Calls every subscription of `directory` with `event`, returns the number called
    size_t dispatch(const std::string& directory, const WatchEvent& event);

    size_t count(const std::string& directory) const;
    size_t size() const;

    static std::string normalize(const std::string& directory);

private:
    struct Subscription {
        SubscriptionId id = 0;
        std::string directory;
        WatchCallback callback;
        bool active = true;
        std::vector<std::thread::id> running;
    };

    mutable std::mutex _mutex;
    std::condition_variable _idle;
    std::map<SubscriptionId, std::shared_ptr<Subscription>> _subscriptions;
    SubscriptionId _next_id = 1;
};

} // namespace filebase
