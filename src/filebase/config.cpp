#include "config.hpp"
#include <yaml-cpp/yaml.h>

namespace filebase {

namespace {

Result<Config> parse(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) {
        return Ok(config);
    }
    if (!root.IsMap()) {
        return Err<Config>(ErrorCode::Config, "Config: top level must be a map");
    }

    try {
        if (auto level = root["log-level"]) {
            auto name = level.as<std::string>();
            auto parsed = spdlog::level::from_str(name);
            // from_str maps unknown names to off
            if (parsed == spdlog::level::off && name != "off") {
                return Err<Config>(ErrorCode::Config, "Config: unknown log-level '" + name + "'");
            }
            config.log_level = parsed;
        }

        if (auto watch = root["watch"]) {
            if (auto interval = watch["poll-interval-ms"]) {
                auto ms = interval.as<long>();
                if (ms <= 0) {
                    return Err<Config>(ErrorCode::Config, "Config: watch.poll-interval-ms must be positive");
                }
                config.watch_poll_interval = std::chrono::milliseconds(ms);
            }
        }

        if (auto notifications = root["notifications"]) {
            if (auto capacity = notifications["capacity"]) {
                auto n = capacity.as<long>();
                if (n <= 0) {
                    return Err<Config>(ErrorCode::Config, "Config: notifications.capacity must be positive");
                }
                config.notification_capacity = static_cast<size_t>(n);
            }
        }
    } catch (const YAML::Exception& e) {
        return Err<Config>(ErrorCode::Config, "Config: bad value: " + std::string(e.what()));
    }

    return Ok(config);
}

} // namespace

Result<Config> Config::load(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Err<Config>(ErrorCode::Config,
            "Config::load: cannot read '" + path.string() + "': " + std::string(e.what()));
    }
    if (auto res = parse(root); !res) {
        return Err<Config>("Config::load: invalid " + path.string(), res);
    } else {
        return res;
    }
}

Result<Config> Config::from_yaml_string(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Err<Config>(ErrorCode::Config, "Config: YAML parse error: " + std::string(e.what()));
    }
    return parse(root);
}

} // namespace filebase
