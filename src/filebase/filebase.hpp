#pragma once

// filebase - file-backed data handles that follow their file on disk

#include "result.hpp"
#include "types.hpp"
#include "object.hpp"
#include "config.hpp"
#include "file_identity.hpp"
#include "change_tracker.hpp"
#include "serializer.hpp"
#include "yaml_serializer.hpp"
#include "watch_source.hpp"
#include "inotify_watch_source.hpp"
#include "manual_watch_source.hpp"
#include "notification_buffer.hpp"
#include "dispatcher.hpp"
#include "file_handle.hpp"
