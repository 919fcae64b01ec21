// Config unit tests
#include <boost/ut.hpp>
#include "filebase/config.hpp"
#include "test_helpers.hpp"

using namespace boost::ut;
using namespace filebase;

suite config_tests = [] {
    "defaults_for_empty_document"_test = [] {
        auto res = Config::from_yaml_string("");
        expect(res.has_value()) << error_msg(res);
        if (!res) return;
        expect(res->log_level == spdlog::level::info);
        expect(res->watch_poll_interval == std::chrono::milliseconds(100));
        expect(res->notification_capacity == 256_ul);
    };

    "all_keys"_test = [] {
        auto res = Config::from_yaml_string(
            "log-level: debug\n"
            "watch:\n"
            "  poll-interval-ms: 25\n"
            "notifications:\n"
            "  capacity: 8\n");
        expect(res.has_value()) << error_msg(res);
        if (!res) return;
        expect(res->log_level == spdlog::level::debug);
        expect(res->watch_poll_interval == std::chrono::milliseconds(25));
        expect(res->notification_capacity == 8_ul);
    };

    "unknown_log_level_is_rejected"_test = [] {
        auto res = Config::from_yaml_string("log-level: chatty\n");
        expect(!res.has_value());
        expect(error_code(res) == ErrorCode::Config);
    };

    "log_level_off_is_accepted"_test = [] {
        auto res = Config::from_yaml_string("log-level: off\n");
        expect(res.has_value()) << error_msg(res);
        expect(res.has_value() && res->log_level == spdlog::level::off);
    };

    "non_positive_values_are_rejected"_test = [] {
        expect(!Config::from_yaml_string("watch:\n  poll-interval-ms: 0\n").has_value());
        expect(!Config::from_yaml_string("notifications:\n  capacity: -1\n").has_value());
    };

    "non_numeric_value_is_rejected"_test = [] {
        auto res = Config::from_yaml_string("watch:\n  poll-interval-ms: soon\n");
        expect(!res.has_value());
        expect(error_code(res) == ErrorCode::Config);
    };

    "top_level_must_be_a_map"_test = [] {
        expect(!Config::from_yaml_string("- a\n- b\n").has_value());
    };

    "load_from_file"_test = [] {
        test::TempDir dir;
        auto path = dir.file("filebase.yaml");
        test::write_text(path, "notifications:\n  capacity: 3\n");
        auto res = Config::load(path);
        expect(res.has_value()) << error_msg(res);
        expect(res.has_value() && res->notification_capacity == 3u);
    };

    "load_missing_file_fails"_test = [] {
        test::TempDir dir;
        auto res = Config::load(dir.file("absent.yaml"));
        expect(!res.has_value());
        expect(error_code(res) == ErrorCode::Config);
    };
};

int main() {
    return 0;
}
