// YamlSerializer unit tests
#include <boost/ut.hpp>
#include "filebase/yaml_serializer.hpp"
#include <cmath>
#include <limits>

using namespace boost::ut;
using namespace filebase;

namespace {

Value round_trip(const Value& v) {
    YamlSerializer serializer;
    auto bytes = serializer.encode(v);
    expect(bytes.has_value()) << "encode failed: " << error_msg(bytes);
    auto decoded = serializer.decode(bytes.value_or(""));
    expect(decoded.has_value()) << "decode failed: " << error_msg(decoded);
    return decoded.value_or(Value{});
}

} // namespace

suite yaml_serializer_tests = [] {
    "string_survives"_test = [] {
        auto v = round_trip(Value(std::string("SOME BOGUS DATA")));
        expect(get_as<std::string>(v) == std::optional<std::string>("SOME BOGUS DATA"));
    };

    "strings_that_look_like_other_types_stay_strings"_test = [] {
        for (const std::string s : {"42", "true", "3.5", "", "null", "~", "False"}) {
            auto v = round_trip(Value(s));
            auto back = get_as<std::string>(v);
            expect(back.has_value()) << "'" << s << "' did not come back as a string";
            expect(back.value_or("<none>") == s) << "'" << s << "' came back as '" << back.value_or("<none>") << "'";
        }
    };

    "empty_value_is_null"_test = [] {
        YamlSerializer serializer;
        auto bytes = serializer.encode(Value{});
        expect(bytes.has_value());
        auto v = round_trip(Value{});
        expect(!v.has_value());
    };

    "scalars_keep_their_types"_test = [] {
        expect(get_as<int>(round_trip(Value(7))) == std::optional<int>(7));
        expect(get_as<bool>(round_trip(Value(false))) == std::optional<bool>(false));
        expect(get_as<double>(round_trip(Value(1.0))) == std::optional<double>(1.0)) << "1.0 must stay a double";
        expect(get_as<double>(round_trip(Value(-0.25))) == std::optional<double>(-0.25));
        expect(get_as<long long>(round_trip(Value(5000000000LL))) == std::optional<long long>(5000000000LL));
    };

    "infinity_survives"_test = [] {
        auto v = get_as<double>(round_trip(Value(std::numeric_limits<double>::infinity())));
        expect(v.has_value() && std::isinf(*v) && *v > 0);
    };

    "nested_containers"_test = [] {
        Dict inner{{"enabled", Value(true)}, {"ratio", Value(0.5)}};
        List items{Value(1), Value(std::string("two")), Value(inner)};
        Dict root{{"title", Value(std::string("demo"))}, {"items", Value(items)}};

        auto v = round_trip(Value(root));
        auto dict = get_as<Dict>(v);
        expect(dict.has_value()) << "root is not a Dict";
        if (!dict) return;

        expect(get_as<std::string>(dict->at("title")) == std::optional<std::string>("demo"));
        auto list = get_as<List>(dict->at("items"));
        expect(list.has_value() && list->size() == 3u);
        if (!list || list->size() != 3u) return;

        expect(get_as<int>((*list)[0]) == std::optional<int>(1));
        expect(get_as<std::string>((*list)[1]) == std::optional<std::string>("two"));
        auto nested = get_as<Dict>((*list)[2]);
        expect(nested.has_value());
        if (nested) {
            expect(get_as<bool>(nested->at("enabled")) == std::optional<bool>(true));
            expect(get_as<double>(nested->at("ratio")) == std::optional<double>(0.5));
        }
    };

    "unsupported_type_fails_with_encode_error"_test = [] {
        YamlSerializer serializer;
        auto res = serializer.encode(Value(std::vector<int>{1, 2}));
        expect(!res.has_value());
        expect(error_code(res) == ErrorCode::Encode);
    };

    "unsupported_nested_type_fails_with_encode_error"_test = [] {
        YamlSerializer serializer;
        auto res = serializer.encode(Value(Dict{{"bad", Value(std::vector<int>{1})}}));
        expect(!res.has_value());
        expect(error_code(res) == ErrorCode::Encode);
    };

    "malformed_yaml_fails_with_decode_error"_test = [] {
        YamlSerializer serializer;
        auto res = serializer.decode("key: [unclosed\n  - {");
        expect(!res.has_value());
        expect(error_code(res) == ErrorCode::Decode);
    };

    "hand_written_yaml_is_typed"_test = [] {
        YamlSerializer serializer;
        auto res = serializer.decode("count: 3\nname: demo\nquoted: \"3\"\n");
        expect(res.has_value());
        auto dict = get_as<Dict>(res.value_or(Value{}));
        expect(dict.has_value());
        if (!dict) return;
        expect(get_as<int>(dict->at("count")) == std::optional<int>(3));
        expect(get_as<std::string>(dict->at("name")) == std::optional<std::string>("demo"));
        expect(get_as<std::string>(dict->at("quoted")) == std::optional<std::string>("3"));
    };
};

int main() {
    return 0;
}
