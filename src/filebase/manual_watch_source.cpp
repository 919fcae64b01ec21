#include "manual_watch_source.hpp"
#include <filesystem>

namespace filebase {

Result<std::shared_ptr<ManualWatchSource>> ManualWatchSource::create() {
    return Ok(std::make_shared<ManualWatchSource>());
}

Result<SubscriptionId> ManualWatchSource::subscribe(const std::string& directory, bool recursive, WatchCallback callback) {
    if (recursive) {
        return Err<SubscriptionId>(ErrorCode::Watch, "ManualWatchSource: recursive watching is not supported");
    }
    if (directory.empty()) {
        return Err<SubscriptionId>(ErrorCode::Watch, "ManualWatchSource: empty directory");
    }
    return Ok(_registry.add(directory, std::move(callback)));
}

Result<void> ManualWatchSource::unsubscribe(SubscriptionId id) {
    if (!_registry.remove(id)) {
        return Err<void>(ErrorCode::Watch, "ManualWatchSource: unknown subscription " + std::to_string(id));
    }
    return Ok();
}

size_t ManualWatchSource::emit(const WatchEvent& event) {
    auto directory = std::filesystem::path(event_path(event)).parent_path().string();
    return _registry.dispatch(directory, event);
}

} // namespace filebase
