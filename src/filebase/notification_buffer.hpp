#pragma once

#include "result.hpp"
#include "file_identity.hpp"
#include <chrono>
#include <ctime>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace filebase {

// Error delivered from the watcher thread to the thread owning a handle
struct Notification {
    Error error;
    FileIdentity identity;  // identity of the handle when the event arrived
    spdlog::level::level_enum level;
    std::string timestamp;
};

// Bounded, mutex-protected queue of notifications. The producer is the
// watcher thread, the consumer is whoever owns the handle.
class NotificationBuffer {
public:
    explicit NotificationBuffer(size_t max_size = 256) : _max_size(max_size) {}

    // Add a notification and dump it to spdlog
    void add(Error error, FileIdentity identity = {}, spdlog::level::level_enum level = spdlog::level::warn) {
        spdlog::log(level, "{}", error.to_string());

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        localtime_r(&time_t, &tm_buf);

        char timestamp[32];
        std::strftime(timestamp, sizeof(timestamp), "%H:%M:%S", &tm_buf);
        std::string ms_str = std::to_string(ms.count());
        while (ms_str.size() < 3) ms_str = "0" + ms_str;
        std::string ts = std::string(timestamp) + "." + ms_str;

        std::lock_guard<std::mutex> lock(_mutex);
        _entries.push_back({std::move(error), std::move(identity), level, std::move(ts)});
        while (_entries.size() > _max_size) {
            _entries.pop_front();
        }
    }

    // Remove and return all entries (oldest first)
    [[nodiscard]] std::vector<Notification> take() {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<Notification> out(std::make_move_iterator(_entries.begin()),
                                      std::make_move_iterator(_entries.end()));
        _entries.clear();
        return out;
    }

    // Copy of the pending entries
    [[nodiscard]] std::vector<Notification> entries() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return {_entries.begin(), _entries.end()};
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries.size();
    }

    void set_max_size(size_t max_size) {
        std::lock_guard<std::mutex> lock(_mutex);
        _max_size = max_size;
        while (_entries.size() > _max_size) {
            _entries.pop_front();
        }
    }

private:
    mutable std::mutex _mutex;
    std::deque<Notification> _entries;
    size_t _max_size;
};

} // namespace filebase
