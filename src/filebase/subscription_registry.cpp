#include "subscription_registry.hpp"
#include <algorithm>
#include <filesystem>

namespace filebase {

std::string SubscriptionRegistry::normalize(const std::string& directory) {
    auto normal = std::filesystem::path(directory).lexically_normal().string();
    // "/tmp/x/" and "/tmp/x" are the same directory
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

SubscriptionId SubscriptionRegistry::add(const std::string& directory, WatchCallback callback) {
    auto sub = std::make_shared<Subscription>();
    sub->directory = normalize(directory);
    sub->callback = std::move(callback);

    std::lock_guard<std::mutex> lock(_mutex);
    sub->id = _next_id++;
    _subscriptions[sub->id] = sub;
    return sub->id;
}

std::optional<std::string> SubscriptionRegistry::remove(SubscriptionId id) {
    std::unique_lock<std::mutex> lock(_mutex);
    auto it = _subscriptions.find(id);
    if (it == _subscriptions.end()) {
        return std::nullopt;
    }
    auto sub = it->second;
    sub->active = false;
    _subscriptions.erase(it);

    auto self = std::this_thread::get_id();
    _idle.wait(lock, [&] {
        return std::all_of(sub->running.begin(), sub->running.end(),
                           [&](const std::thread::id& t) { return t == self; });
    });
    return sub->directory;
}

size_t SubscriptionRegistry::dispatch(const std::string& directory, const WatchEvent& event) {
    auto key = normalize(directory);
    auto self = std::this_thread::get_id();

    std::vector<std::shared_ptr<Subscription>> targets;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (const auto& [id, sub] : _subscriptions) {
            if (sub->directory == key) {
                targets.push_back(sub);
            }
        }
    }

    size_t called = 0;
    for (auto& sub : targets) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!sub->active) continue;
            sub->running.push_back(self);
        }

        sub->callback(event);
        ++called;

        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto pos = std::find(sub->running.begin(), sub->running.end(), self);
            if (pos != sub->running.end()) sub->running.erase(pos);
        }
        _idle.notify_all();
    }
    return called;
}

size_t SubscriptionRegistry::count(const std::string& directory) const {
    auto key = normalize(directory);
    std::lock_guard<std::mutex> lock(_mutex);
    return std::count_if(_subscriptions.begin(), _subscriptions.end(),
                         [&](const auto& kv) { return kv.second->directory == key; });
}

size_t SubscriptionRegistry::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _subscriptions.size();
}

} // namespace filebase
