#pragma once

#include "watch_source.hpp"
#include "subscription_registry.hpp"

namespace filebase {

// ManualWatchSource - events are injected with emit() and delivered
// synchronously on the calling thread to subscribers of the event's directory
class ManualWatchSource : public WatchSource {
public:
    static Result<std::shared_ptr<ManualWatchSource>> create();

    Result<SubscriptionId> subscribe(const std::string& directory, bool recursive, WatchCallback callback) override;
    Result<void> unsubscribe(SubscriptionId id) override;

    // Returns the number of subscriptions the event was delivered to
    size_t emit(const WatchEvent& event);

    size_t subscription_count() const { return _registry.size(); }
    size_t subscription_count(const std::string& directory) const { return _registry.count(directory); }

private:
    SubscriptionRegistry _registry;
};

using ManualWatchSourcePtr = std::shared_ptr<ManualWatchSource>;

} // namespace filebase
