#pragma once

#include "result.hpp"
#include "types.hpp"
#include "object.hpp"
#include "file_identity.hpp"
#include "change_tracker.hpp"
#include "serializer.hpp"
#include "watch_source.hpp"
#include "dispatcher.hpp"
#include "notification_buffer.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace filebase {

struct FileHandleOptions {
    SerializerPtr serializer;
    WatchSourcePtr watch_source;
    DispatcherPtr dispatcher;           // optional, receives file-handle/* events
    size_t notification_capacity = 256;
};

/**
 * FileHandle - a data Value persisted to one file on disk
 *
 * Tracks whether the data changed since the last save and follows the file
 * when it is renamed or moved. The directory of the file is watched through
 * the WatchSource; events for the file itself are reconciled on the watcher
 * thread:
 *   moved    -> identity follows the destination, watch moves with it
 *   modified -> identity re-derived from the reported path
 *   deleted  -> a FileDeleted error is queued (take_notifications()),
 *               identity is kept, so the next save() recreates the file
 *
 * Dispatcher events (source "file-handle"): "saved", "relocated", "deleted".
 * Each carries "path" and "uid"; "deleted" also carries "message".
 *
 * All state is guarded by one mutex, every method is safe to call from any
 * thread. After dispose() no event is acted on and save() fails.
 */
class FileHandle : public Object, public std::enable_shared_from_this<FileHandle> {
public:
    // Unsaved handle without identity
    static Result<std::shared_ptr<FileHandle>> create(FileHandleOptions options);

    // Opens `path` if it exists, otherwise creates it with an initial save
    static Result<std::shared_ptr<FileHandle>> create(const std::string& path, FileHandleOptions options);

    ~FileHandle() override;

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    Result<void> open(const std::string& path);
    Result<void> save();
    Result<void> save_as(const std::string& path);

    // Point the handle at another file after a delete, nothing is written
    Result<void> recover_from_delete(const std::string& new_path);

    void set_data(Value value);
    // Applies fn to a copy of the data and stores the result. A set_data()
    // racing with fn is overwritten.
    void mutate(const std::function<void(Value&)>& fn);
    Value get_data() const;

    bool has_unsaved_changes() const;
    Result<std::string> get_absolute_path() const;
    FileIdentity identity() const;
    bool is_watching() const;
    bool is_disposed() const;

    // Errors raised on the watcher thread, oldest first
    std::vector<Notification> take_notifications();
    size_t pending_notifications() const;

    Result<void> dispose() override;

private:
    explicit FileHandle(FileHandleOptions options);

    static Result<void> _check_options(const FileHandleOptions& options);

    Result<void> _save_locked();
    Result<void> _restart_watch_locked(std::optional<SubscriptionId>& stale);
    Result<void> _release(std::optional<SubscriptionId> stale);
    void _release_logged(std::optional<SubscriptionId> stale);
    void _on_watch_event(const WatchEvent& event, uint64_t generation);
    void _publish(const std::string& name, Dict payload);

    SerializerPtr _serializer;
    WatchSourcePtr _watch_source;
    DispatcherPtr _dispatcher;

    mutable std::mutex _mutex;
    FileIdentity _identity;
    ChangeTracker _tracker;
    Value _data;
    std::optional<SubscriptionId> _subscription;
    uint64_t _watch_generation = 0;
    bool _disposed = false;

    NotificationBuffer _notifications;
};

using FileHandlePtr = std::shared_ptr<FileHandle>;

} // namespace filebase
