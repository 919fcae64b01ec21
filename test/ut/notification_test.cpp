// NotificationBuffer and Dispatcher unit tests
#include <boost/ut.hpp>
#include "filebase/notification_buffer.hpp"
#include "filebase/dispatcher.hpp"

using namespace boost::ut;
using namespace filebase;

suite notification_buffer_tests = [] {
    "take_drains_in_order"_test = [] {
        NotificationBuffer buffer(4);
        buffer.add(Error(ErrorCode::FileDeleted, "first"));
        buffer.add(Error(ErrorCode::Watch, "second"));
        expect(buffer.size() == 2_ul);

        auto taken = buffer.take();
        expect(taken.size() == 2_ul);
        expect(taken[0].error.message() == "first");
        expect(taken[0].error.code() == ErrorCode::FileDeleted);
        expect(taken[1].error.message() == "second");
        expect(buffer.size() == 0_ul);
        expect(!taken[0].timestamp.empty());
    };

    "oldest_entries_are_dropped"_test = [] {
        NotificationBuffer buffer(2);
        buffer.add(Error("a"));
        buffer.add(Error("b"));
        buffer.add(Error("c"));
        auto entries = buffer.entries();
        expect(entries.size() == 2_ul);
        expect(entries[0].error.message() == "b");
        expect(entries[1].error.message() == "c");

        buffer.set_max_size(1);
        expect(buffer.size() == 1_ul);
        expect(buffer.entries()[0].error.message() == "c");
    };

    "identity_is_kept"_test = [] {
        NotificationBuffer buffer;
        buffer.add(Error(ErrorCode::FileDeleted, "gone"), FileIdentity::derive_from_path("/tmp/x/Foo.bar"));
        auto taken = buffer.take();
        expect(taken.size() == 1_ul);
        expect(taken[0].identity.file_name() == "Foo.bar");
    };
};

suite dispatcher_tests = [] {
    "dispatch_to_exact_and_wildcard_handlers"_test = [] {
        auto disp_res = Dispatcher::create();
        expect(disp_res.has_value());
        auto disp = *disp_res;

        int exact = 0;
        int wildcard = 0;
        expect(disp->register_event_handler("file-handle/saved", [&](const Dict&) { ++exact; return Ok(); }).has_value());
        expect(disp->register_event_handler("*/saved", [&](const Dict&) { ++wildcard; return Ok(); }).has_value());

        auto res = disp->dispatch_event(Dict{{"source", Value(std::string("file-handle"))},
                                             {"name", Value(std::string("saved"))}});
        expect(res.has_value());
        expect(res.value_or(0) == 2_ul);
        expect(exact == 1_i);
        expect(wildcard == 1_i);

        expect(disp->unregister_event_handler("file-handle/saved").has_value());
        res = disp->dispatch_event(Dict{{"source", Value(std::string("file-handle"))},
                                        {"name", Value(std::string("saved"))}});
        expect(res.value_or(0) == 1_ul);
    };

    "failing_handler_does_not_stop_others"_test = [] {
        auto disp = *Dispatcher::create();
        int called = 0;
        expect(disp->register_event_handler("a/b", [&](const Dict&) -> Result<void> { return Err<void>("nope"); }).has_value());
        expect(disp->register_event_handler("a/b", [&](const Dict&) { ++called; return Ok(); }).has_value());
        auto res = disp->dispatch_event(Dict{{"source", Value(std::string("a"))}, {"name", Value(std::string("b"))}});
        expect(res.has_value());
        expect(called == 1_i);
    };

    "bad_key_and_nameless_event_are_rejected"_test = [] {
        auto disp = *Dispatcher::create();
        expect(!disp->register_event_handler("no-slash", [](const Dict&) { return Ok(); }).has_value());
        expect(!disp->dispatch_event(Dict{{"source", Value(std::string("a"))}}).has_value());
    };
};

int main() {
    return 0;
}
