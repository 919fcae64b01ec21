#pragma once

#include "object.hpp"
#include "watch_source.hpp"
#include <chrono>
#include <memory>
#include <thread>

namespace filebase {

/**
 * InotifyWatchSource - Linux inotify backed WatchSource
 *
 * One inotify instance and one watcher thread serve all subscriptions.
 * Callbacks run on the watcher thread.
 *
 * A rename inside watched directories arrives as IN_MOVED_FROM/IN_MOVED_TO
 * with a shared cookie and is reported as MovedEvent. An IN_MOVED_FROM whose
 * partner does not show up within one poll interval means the file left the
 * watched directories and is reported as DeletedEvent.
 *
 * The watcher thread never owns the source. dispose() and the destructor stop
 * and join it, except when the last owner is released from inside a callback:
 * the thread is then detached and exits on its own.
 */
class InotifyWatchSource : public WatchSource, public Object {
public:
    static Result<std::shared_ptr<InotifyWatchSource>> create(
        std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    ~InotifyWatchSource() override;

    InotifyWatchSource(const InotifyWatchSource&) = delete;
    InotifyWatchSource& operator=(const InotifyWatchSource&) = delete;

    Result<SubscriptionId> subscribe(const std::string& directory, bool recursive, WatchCallback callback) override;
    Result<void> unsubscribe(SubscriptionId id) override;

    Result<void> init() override;
    Result<void> dispose() override;

    bool is_running() const;
    size_t subscription_count() const;

private:
    explicit InotifyWatchSource(std::chrono::milliseconds poll_interval);

    // Everything the watcher thread touches, shared with it
    struct State;

    std::shared_ptr<State> _state;
    std::thread _thread;
};

using InotifyWatchSourcePtr = std::shared_ptr<InotifyWatchSource>;

} // namespace filebase
