#include "file_handle.hpp"
#include "subscription_registry.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>

namespace fs = std::filesystem;

namespace filebase {

namespace {

constexpr const char* EVENT_SOURCE = "file-handle";

// Relative paths resolve against the working directory
Result<std::string> absolute_path(const std::string& path) {
    if (path.empty()) {
        return Ok(path);
    }
    std::error_code ec;
    auto abs = fs::absolute(fs::path(path), ec);
    if (ec) {
        return Err<std::string>(ErrorCode::Io, "cannot resolve '" + path + "': " + ec.message());
    }
    return Ok(abs.lexically_normal().string());
}

Result<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Err<std::string>(ErrorCode::Io, "cannot open '" + path + "' for reading: " + std::strerror(errno));
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Err<std::string>(ErrorCode::Io, "read error on '" + path + "'");
    }
    return Ok(std::move(bytes));
}

// Full overwrite
Result<void> write_file(const std::string& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err<void>(ErrorCode::Io, "cannot open '" + path + "' for writing: " + std::strerror(errno));
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        return Err<void>(ErrorCode::Io, "write error on '" + path + "': " + std::strerror(errno));
    }
    return Ok();
}

} // namespace

FileHandle::FileHandle(FileHandleOptions options)
    : _serializer(std::move(options.serializer)),
      _watch_source(std::move(options.watch_source)),
      _dispatcher(std::move(options.dispatcher)),
      _notifications(options.notification_capacity) {}

FileHandle::~FileHandle() {
    if (auto res = dispose(); !res) {
        spdlog::error("FileHandle[{}]: dispose failed: {}", uid(), res.error().to_string());
    }
}

Result<void> FileHandle::_check_options(const FileHandleOptions& options) {
    if (!options.serializer) {
        return Err<void>("FileHandle: no serializer");
    }
    if (!options.watch_source) {
        return Err<void>("FileHandle: no watch source");
    }
    if (options.notification_capacity == 0) {
        return Err<void>("FileHandle: notification capacity must be positive");
    }
    return Ok();
}

Result<std::shared_ptr<FileHandle>> FileHandle::create(FileHandleOptions options) {
    if (auto res = _check_options(options); !res) {
        return Err<std::shared_ptr<FileHandle>>("FileHandle::create failed", res);
    }
    auto handle = std::shared_ptr<FileHandle>(new FileHandle(std::move(options)));
    if (auto res = handle->init(); !res) {
        return Err<std::shared_ptr<FileHandle>>("FileHandle::create: init failed", res);
    }
    return handle;
}

Result<std::shared_ptr<FileHandle>> FileHandle::create(const std::string& path, FileHandleOptions options) {
    auto handle_res = create(std::move(options));
    if (!handle_res) {
        return handle_res;
    }
    auto handle = *handle_res;
    if (auto res = handle->open(path); !res) {
        return Err<std::shared_ptr<FileHandle>>("FileHandle::create: cannot open '" + path + "'", res);
    }
    return handle;
}

Result<void> FileHandle::open(const std::string& path) {
    auto abs_res = absolute_path(path);
    if (!abs_res) {
        return Err<void>("FileHandle::open failed", abs_res);
    }
    const auto& abs = *abs_res;

    std::error_code ec;
    if (!fs::exists(abs, ec)) {
        ydebug("FileHandle: {} does not exist, creating it", abs);
        return save_as(abs);
    }

    auto identity = FileIdentity::derive_from_path(abs);
    if (!identity.is_complete()) {
        return Err<void>(ErrorCode::IncompleteIdentity,
            "FileHandle::open: missing file " + identity.describe_missing() + " in '" + abs + "'");
    }

    auto bytes = read_file(abs);
    if (!bytes) {
        return Err<void>("FileHandle::open failed", bytes);
    }
    auto value = _serializer->decode(*bytes);
    if (!value) {
        return Err<void>("FileHandle::open: cannot decode '" + abs + "' as " + _serializer->name(), value);
    }

    std::optional<SubscriptionId> stale;
    Result<void> watched = Ok();
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_disposed) {
            return Err<void>(ErrorCode::Disposed, "FileHandle::open: handle is disposed");
        }
        _identity = identity;
        _data = std::move(*value);
        _tracker.mark_clean();
        watched = _restart_watch_locked(stale);
    }
    if (!watched) {
        _release_logged(stale);
        return Err<void>("FileHandle::open: cannot watch '" + abs + "'", watched);
    }
    spdlog::info("FileHandle[{}]: opened {}", uid(), abs);
    return _release(stale);
}

Result<void> FileHandle::save() {
    std::string path;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_disposed) {
            return Err<void>(ErrorCode::Disposed, "FileHandle::save: handle is disposed");
        }
        if (auto res = _save_locked(); !res) {
            return res;
        }
        path = *_identity.to_absolute_path();
    }
    _publish("saved", Dict{{"path", Value(path)}});
    return Ok();
}

Result<void> FileHandle::_save_locked() {
    if (!_identity.is_complete()) {
        return Err<void>(ErrorCode::IncompleteIdentity,
            "FileHandle::save: missing file " + _identity.describe_missing());
    }
    auto path = *_identity.to_absolute_path();

    auto bytes = _serializer->encode(_data);
    if (!bytes) {
        return Err<void>("FileHandle::save: cannot encode data as " + _serializer->name(), bytes);
    }
    if (auto res = write_file(path, *bytes); !res) {
        return Err<void>("FileHandle::save failed", res);
    }

    _tracker.mark_clean();
    spdlog::info("FileHandle[{}]: saved {} ({} bytes)", uid(), path, bytes->size());
    return Ok();
}

Result<void> FileHandle::save_as(const std::string& path) {
    auto abs_res = absolute_path(path);
    if (!abs_res) {
        return Err<void>("FileHandle::save_as failed", abs_res);
    }

    std::optional<SubscriptionId> stale;
    Result<void> watched = Ok();
    std::string saved_path;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_disposed) {
            return Err<void>(ErrorCode::Disposed, "FileHandle::save_as: handle is disposed");
        }

        // A failed save leaves the previous identity in place
        auto previous = _identity;
        _identity = FileIdentity::derive_from_path(*abs_res);
        if (auto res = _save_locked(); !res) {
            _identity = previous;
            return Err<void>("FileHandle::save_as: cannot save to '" + *abs_res + "'", res);
        }
        saved_path = *_identity.to_absolute_path();
        watched = _restart_watch_locked(stale);
    }
    _publish("saved", Dict{{"path", Value(saved_path)}});
    if (!watched) {
        _release_logged(stale);
        return Err<void>("FileHandle::save_as: cannot watch '" + saved_path + "'", watched);
    }
    return _release(stale);
}

Result<void> FileHandle::recover_from_delete(const std::string& new_path) {
    auto abs_res = absolute_path(new_path);
    if (!abs_res) {
        return Err<void>("FileHandle::recover_from_delete failed", abs_res);
    }

    auto identity = FileIdentity::derive_from_path(*abs_res);
    if (!identity.is_complete()) {
        return Err<void>(ErrorCode::IncompleteIdentity,
            "FileHandle::recover_from_delete: missing file " + identity.describe_missing());
    }

    std::optional<SubscriptionId> stale;
    Result<void> watched = Ok();
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_disposed) {
            return Err<void>(ErrorCode::Disposed, "FileHandle::recover_from_delete: handle is disposed");
        }
        _identity = identity;
        watched = _restart_watch_locked(stale);
    }
    if (!watched) {
        _release_logged(stale);
        return Err<void>("FileHandle::recover_from_delete: cannot watch '" + *abs_res + "'", watched);
    }
    spdlog::info("FileHandle[{}]: now pointing at {}", uid(), *abs_res);
    _publish("relocated", Dict{{"path", Value(*abs_res)}});
    return _release(stale);
}

void FileHandle::set_data(Value value) {
    std::lock_guard<std::mutex> lock(_mutex);
    _data = std::move(value);
    _tracker.mark_dirty();
}

void FileHandle::mutate(const std::function<void(Value&)>& fn) {
    Value data = get_data();
    fn(data);
    std::lock_guard<std::mutex> lock(_mutex);
    _data = std::move(data);
    _tracker.mark_dirty();
}

Value FileHandle::get_data() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _data;
}

bool FileHandle::has_unsaved_changes() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tracker.is_dirty();
}

Result<std::string> FileHandle::get_absolute_path() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _identity.to_absolute_path();
}

FileIdentity FileHandle::identity() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _identity;
}

bool FileHandle::is_watching() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _subscription.has_value();
}

bool FileHandle::is_disposed() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _disposed;
}

std::vector<Notification> FileHandle::take_notifications() {
    return _notifications.take();
}

size_t FileHandle::pending_notifications() const {
    return _notifications.size();
}

Result<void> FileHandle::dispose() {
    std::optional<SubscriptionId> stale;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_disposed) {
            return Ok();
        }
        _disposed = true;
        ++_watch_generation;
        stale = _subscription;
        _subscription.reset();
    }
    ydebug("FileHandle[{}]: disposed", uid());
    // Blocks until a callback already running for this handle has returned
    return _release(stale);
}

// Subscribes the current directory before the caller drops the old
// subscription, so a watch on an unchanged directory never lapses.
Result<void> FileHandle::_restart_watch_locked(std::optional<SubscriptionId>& stale) {
    stale = _subscription;
    _subscription.reset();
    auto generation = ++_watch_generation;

    if (!_identity.is_complete()) {
        return Err<void>(ErrorCode::IncompleteIdentity,
            "FileHandle: missing file " + _identity.describe_missing() + " to initialise the watch");
    }

    std::weak_ptr<FileHandle> weak = weak_from_this();
    auto sub = _watch_source->subscribe(*_identity.directory, false,
        [weak, generation](const WatchEvent& event) {
            if (auto self = weak.lock()) {
                self->_on_watch_event(event, generation);
            }
        });
    if (!sub) {
        return Err<void>("FileHandle: subscribe failed", sub);
    }
    _subscription = *sub;
    ydebug("FileHandle[{}]: watching {} (subscription {})", uid(), *_identity.directory, *sub);
    return Ok();
}

Result<void> FileHandle::_release(std::optional<SubscriptionId> stale) {
    if (!stale) {
        return Ok();
    }
    if (auto res = _watch_source->unsubscribe(*stale); !res) {
        return Err<void>("FileHandle: unsubscribe failed", res);
    }
    return Ok();
}

// For paths that already fail with another error
void FileHandle::_release_logged(std::optional<SubscriptionId> stale) {
    if (auto res = _release(stale); !res) {
        spdlog::warn("FileHandle[{}]: {}", uid(), res.error().to_string());
    }
}

void FileHandle::_on_watch_event(const WatchEvent& event, uint64_t generation) {
    std::optional<SubscriptionId> stale;
    std::optional<Error> watch_error;
    std::string event_name_str = event_name(event);
    Dict payload;
    std::string publish_name;

    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_disposed || generation != _watch_generation) {
            return;
        }

        auto current = _identity.to_absolute_path();
        if (!current) {
            return;
        }
        if (SubscriptionRegistry::normalize(event_path(event)) != SubscriptionRegistry::normalize(*current)) {
            return;
        }
        ydebug("FileHandle[{}]: {} event for {}", uid(), event_name_str, *current);

        if (const auto* deleted = std::get_if<DeletedEvent>(&event)) {
            // Identity, dirty flag and watch stay as they are
            Error error(ErrorCode::FileDeleted,
                "The file " + _identity.file_name() + " was either deleted or moved from " + *_identity.directory);
            payload = Dict{{"path", Value(deleted->path)}, {"message", Value(error.message())}};
            publish_name = "deleted";
            _notifications.add(std::move(error), _identity);
        } else {
            const auto& target = std::holds_alternative<MovedEvent>(event)
                ? std::get<MovedEvent>(event).dest_path
                : std::get<ModifiedEvent>(event).path;

            _identity = FileIdentity::derive_from_path(target);
            if (auto res = _restart_watch_locked(stale); !res) {
                watch_error = Error("FileHandle: cannot follow " + event_name_str + " file to '" + target + "'", res.error());
            }
            if (std::holds_alternative<MovedEvent>(event)) {
                spdlog::info("FileHandle[{}]: followed move to {}", uid(), target);
                payload = Dict{{"path", Value(target)}};
                publish_name = "relocated";
            }
        }
    }

    // Called on the watcher thread, unsubscribe does not wait here
    if (auto res = _release(stale); !res) {
        _notifications.add(res.error(), identity());
    }
    if (watch_error) {
        _notifications.add(std::move(*watch_error), identity(), spdlog::level::err);
    }
    if (!publish_name.empty()) {
        _publish(publish_name, std::move(payload));
    }
}

void FileHandle::_publish(const std::string& name, Dict payload) {
    if (!_dispatcher) {
        return;
    }
    payload["source"] = Value(std::string(EVENT_SOURCE));
    payload["name"] = Value(name);
    payload["uid"] = Value(uid());
    if (auto res = _dispatcher->dispatch_event(payload); !res) {
        spdlog::warn("FileHandle[{}]: dispatch of {} failed: {}", uid(), name, res.error().to_string());
    }
}

} // namespace filebase
