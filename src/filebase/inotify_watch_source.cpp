#include "inotify_watch_source.hpp"
#include "subscription_registry.hpp"
#include <atomic>
#include <cerrno>
#include <climits>
#include <cstring>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>

namespace filebase {

namespace {

constexpr uint32_t WATCH_MASK = IN_MODIFY | IN_CLOSE_WRITE | IN_DELETE |
                                IN_MOVED_FROM | IN_MOVED_TO | IN_ONLYDIR;

std::string errno_string(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

struct InotifyWatchSource::State {
    struct PendingMove {
        std::string src_path;
        std::chrono::steady_clock::time_point deadline;
    };

    enum class WaitResult { Stop, Events, Timeout };

    State(std::string owner_uid, std::chrono::milliseconds interval)
        : uid(std::move(owner_uid)), poll_interval(interval) {}

    // Closed here so a detached thread keeps valid descriptors until it exits
    ~State() {
        for (int fd : {wake_pipe[0], wake_pipe[1], inotify_fd}) {
            if (fd >= 0) ::close(fd);
        }
    }

    WaitResult wait();
    void read_events();
    void expire_pending_moves();
    void deliver(const WatchEvent& event);
    std::optional<std::string> directory_for(int wd);

    const std::string uid;
    const std::chrono::milliseconds poll_interval;
    int inotify_fd = -1;
    int wake_pipe[2] = {-1, -1};
    std::atomic<bool> running{false};

    SubscriptionRegistry registry;

    // Guards the watch descriptor tables
    std::mutex mutex;
    std::map<std::string, int> dir_to_wd;
    std::map<int, std::string> wd_to_dir;

    // Watcher thread only
    std::map<uint32_t, PendingMove> pending_moves;
};

InotifyWatchSource::InotifyWatchSource(std::chrono::milliseconds poll_interval)
    : _state(std::make_shared<State>(uid(), poll_interval)) {}

Result<std::shared_ptr<InotifyWatchSource>> InotifyWatchSource::create(std::chrono::milliseconds poll_interval) {
    auto source = std::shared_ptr<InotifyWatchSource>(new InotifyWatchSource(poll_interval));
    if (auto res = source->init(); !res) {
        return Err<std::shared_ptr<InotifyWatchSource>>("InotifyWatchSource::create: init failed", res);
    }
    return source;
}

InotifyWatchSource::~InotifyWatchSource() {
    if (auto res = dispose(); !res) {
        spdlog::error("InotifyWatchSource[{}]: dispose failed: {}", uid(), res.error().to_string());
    }
}

Result<void> InotifyWatchSource::init() {
    auto& state = *_state;
    state.inotify_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (state.inotify_fd < 0) {
        return Err<void>(ErrorCode::Watch, errno_string("inotify_init1"));
    }
    if (pipe2(state.wake_pipe, O_NONBLOCK | O_CLOEXEC) < 0) {
        return Err<void>(ErrorCode::Watch, errno_string("pipe2"));
    }

    state.running = true;
    _thread = std::thread([state = _state] {
        while (true) {
            auto result = state->wait();
            if (result == State::WaitResult::Stop) return;
            if (result == State::WaitResult::Events) {
                state->read_events();
            }
            if (!state->running) return;
            state->expire_pending_moves();
        }
    });
    spdlog::info("InotifyWatchSource[{}]: watcher thread started", uid());
    return Ok();
}

Result<void> InotifyWatchSource::dispose() {
    if (_state->running.exchange(false)) {
        char byte = 0;
        if (::write(_state->wake_pipe[1], &byte, 1) < 0 && errno != EAGAIN) {
            spdlog::warn("InotifyWatchSource[{}]: {}", uid(), errno_string("wake write"));
        }
    }

    if (_thread.joinable()) {
        if (_thread.get_id() == std::this_thread::get_id()) {
            // Last owner released from inside a callback
            _thread.detach();
            ydebug("InotifyWatchSource: watcher thread detached");
        } else {
            _thread.join();
            spdlog::info("InotifyWatchSource[{}]: watcher thread stopped", uid());
        }
    }
    return Ok();
}

bool InotifyWatchSource::is_running() const {
    return _state->running.load();
}

size_t InotifyWatchSource::subscription_count() const {
    return _state->registry.size();
}

Result<SubscriptionId> InotifyWatchSource::subscribe(const std::string& directory, bool recursive, WatchCallback callback) {
    if (recursive) {
        return Err<SubscriptionId>(ErrorCode::Watch, "InotifyWatchSource: recursive watching is not supported");
    }
    auto& state = *_state;
    if (!state.running) {
        return Err<SubscriptionId>(ErrorCode::Watch, "InotifyWatchSource: source is disposed");
    }

    auto key = SubscriptionRegistry::normalize(directory);

    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.dir_to_wd.count(key)) {
        int wd = inotify_add_watch(state.inotify_fd, key.c_str(), WATCH_MASK);
        if (wd < 0) {
            return Err<SubscriptionId>(ErrorCode::Watch,
                errno_string(("inotify_add_watch '" + key + "'").c_str()));
        }
        state.dir_to_wd[key] = wd;
        state.wd_to_dir[wd] = key;
        ydebug("InotifyWatchSource: watching {} (wd {})", key, wd);
    }

    auto id = state.registry.add(key, std::move(callback));
    ydebug("InotifyWatchSource: subscription {} on {}", id, key);
    return Ok(id);
}

Result<void> InotifyWatchSource::unsubscribe(SubscriptionId id) {
    auto& state = *_state;
    // Not under state.mutex: remove() may wait for a callback that subscribes
    auto directory = state.registry.remove(id);
    if (!directory) {
        return Err<void>(ErrorCode::Watch, "InotifyWatchSource: unknown subscription " + std::to_string(id));
    }

    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.registry.count(*directory) == 0) {
        auto it = state.dir_to_wd.find(*directory);
        if (it != state.dir_to_wd.end()) {
            // EINVAL: the kernel already dropped the watch (directory removed)
            if (inotify_rm_watch(state.inotify_fd, it->second) < 0 && errno != EINVAL) {
                spdlog::warn("InotifyWatchSource[{}]: {}", uid(), errno_string("inotify_rm_watch"));
            }
            ydebug("InotifyWatchSource: stopped watching {} (wd {})", *directory, it->second);
            state.wd_to_dir.erase(it->second);
            state.dir_to_wd.erase(it);
        }
    }
    return Ok();
}

InotifyWatchSource::State::WaitResult InotifyWatchSource::State::wait() {
    while (running) {
        pollfd fds[2];
        fds[0] = {inotify_fd, POLLIN, 0};
        fds[1] = {wake_pipe[0], POLLIN, 0};

        int ready = ::poll(fds, 2, static_cast<int>(poll_interval.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::error("InotifyWatchSource[{}]: {}", uid, errno_string("poll"));
            return WaitResult::Stop;
        }
        if (fds[1].revents & POLLIN) {
            return WaitResult::Stop;
        }
        return (fds[0].revents & POLLIN) ? WaitResult::Events : WaitResult::Timeout;
    }
    return WaitResult::Stop;
}

void InotifyWatchSource::State::read_events() {
    alignas(inotify_event) char buffer[16 * (sizeof(inotify_event) + NAME_MAX + 1)];

    while (running) {
        ssize_t length = ::read(inotify_fd, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno != EAGAIN && errno != EINTR) {
                spdlog::error("InotifyWatchSource[{}]: {}", uid, errno_string("read"));
            }
            return;
        }
        if (length == 0) return;

        for (char* ptr = buffer; ptr < buffer + length && running;) {
            auto* event = reinterpret_cast<inotify_event*>(ptr);
            ptr += sizeof(inotify_event) + event->len;

            if (event->mask & IN_Q_OVERFLOW) {
                spdlog::warn("InotifyWatchSource[{}]: event queue overflow, events lost", uid);
                continue;
            }
            if (event->mask & IN_IGNORED) {
                std::lock_guard<std::mutex> lock(mutex);
                auto it = wd_to_dir.find(event->wd);
                if (it != wd_to_dir.end()) {
                    ydebug("InotifyWatchSource: watch on {} removed by kernel", it->second);
                    dir_to_wd.erase(it->second);
                    wd_to_dir.erase(it);
                }
                continue;
            }
            if (event->len == 0 || (event->mask & IN_ISDIR)) {
                continue;
            }

            auto directory = directory_for(event->wd);
            if (!directory) continue;
            auto path = (std::filesystem::path(*directory) / event->name).string();

            if (event->mask & IN_MOVED_FROM) {
                pending_moves[event->cookie] = {path, std::chrono::steady_clock::now() + poll_interval};
            } else if (event->mask & IN_MOVED_TO) {
                auto it = pending_moves.find(event->cookie);
                if (it == pending_moves.end()) {
                    // Moved in from an unwatched directory
                    continue;
                }
                MovedEvent moved{it->second.src_path, path};
                pending_moves.erase(it);
                deliver(moved);
            } else if (event->mask & IN_DELETE) {
                deliver(DeletedEvent{path});
            } else if (event->mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
                deliver(ModifiedEvent{path});
            }
        }
    }
}

void InotifyWatchSource::State::expire_pending_moves() {
    auto now = std::chrono::steady_clock::now();
    for (auto it = pending_moves.begin(); it != pending_moves.end() && running;) {
        if (it->second.deadline <= now) {
            // The file left the watched directories
            auto path = it->second.src_path;
            it = pending_moves.erase(it);
            deliver(DeletedEvent{path});
        } else {
            ++it;
        }
    }
}

void InotifyWatchSource::State::deliver(const WatchEvent& event) {
    const auto& path = event_path(event);
    auto directory = std::filesystem::path(path).parent_path().string();
    auto called = registry.dispatch(directory, event);
    ydebug("InotifyWatchSource: {} {} -> {} subscriber(s)", event_name(event), path, called);
}

std::optional<std::string> InotifyWatchSource::State::directory_for(int wd) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = wd_to_dir.find(wd);
    if (it == wd_to_dir.end()) return std::nullopt;
    return it->second;
}

} // namespace filebase
