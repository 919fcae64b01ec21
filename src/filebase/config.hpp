#pragma once

#include "result.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace filebase {

// Runtime settings, loaded from YAML:
//
//   log-level: info
//   watch:
//     poll-interval-ms: 100
//   notifications:
//     capacity: 256
//
// Every key is optional.
struct Config {
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::chrono::milliseconds watch_poll_interval{100};
    size_t notification_capacity = 256;

    static Result<Config> load(const std::filesystem::path& path);
    static Result<Config> from_yaml_string(const std::string& text);
};

} // namespace filebase
