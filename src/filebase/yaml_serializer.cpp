#include "yaml_serializer.hpp"
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>

namespace filebase {

Result<SerializerPtr> YamlSerializer::create() {
    return Ok<SerializerPtr>(std::make_shared<YamlSerializer>());
}

Result<std::string> YamlSerializer::encode(const Value& value) {
    YAML::Emitter out;
    if (auto res = _emit(out, value); !res) {
        return Err<std::string>("YamlSerializer::encode failed", res);
    }
    if (!out.good()) {
        return Err<std::string>(ErrorCode::Encode,
            "YamlSerializer::encode: emitter error: " + out.GetLastError());
    }
    std::string text = out.c_str();
    text += "\n";
    return Ok(std::move(text));
}

Result<Value> YamlSerializer::decode(const std::string& bytes) {
    YAML::Node root;
    try {
        root = YAML::Load(bytes);
    } catch (const YAML::Exception& e) {
        return Err<Value>(ErrorCode::Decode,
            "YamlSerializer::decode: YAML parse error: " + std::string(e.what()));
    }
    return Ok(_node_to_value(root));
}

Result<void> YamlSerializer::_emit(YAML::Emitter& out, const Value& value) {
    if (!value.has_value()) {
        out << YAML::Null;
        return Ok();
    }

    const auto& type = value.type();
    if (type == typeid(std::string) || type == typeid(const char*)) {
        std::string str = type == typeid(std::string)
            ? std::any_cast<const std::string&>(value)
            : std::string(std::any_cast<const char*>(value));
        // Keep strings like "42" or "true" from loading back as numbers or bools
        auto reread = _plain_scalar(str);
        bool ambiguous = str.empty() || reread.type() != typeid(std::string) ||
                         str == "~" || str == "null" || str == "Null" || str == "NULL";
        if (ambiguous) {
            out << YAML::DoubleQuoted << str;
        } else {
            out << str;
        }
    } else if (type == typeid(bool)) {
        out << YAML::TrueFalseBool << std::any_cast<bool>(value);
    } else if (type == typeid(int)) {
        out << std::any_cast<int>(value);
    } else if (type == typeid(long)) {
        out << std::any_cast<long>(value);
    } else if (type == typeid(long long)) {
        out << std::any_cast<long long>(value);
    } else if (type == typeid(unsigned int)) {
        out << std::any_cast<unsigned int>(value);
    } else if (type == typeid(unsigned long)) {
        out << std::any_cast<unsigned long>(value);
    } else if (type == typeid(unsigned long long)) {
        out << std::any_cast<unsigned long long>(value);
    } else if (type == typeid(double)) {
        out << _format_double(std::any_cast<double>(value));
    } else if (type == typeid(float)) {
        out << _format_double(static_cast<double>(std::any_cast<float>(value)));
    } else if (type == typeid(List)) {
        const auto& list = std::any_cast<const List&>(value);
        out << YAML::BeginSeq;
        for (const auto& item : list) {
            if (auto res = _emit(out, item); !res) {
                return res;
            }
        }
        out << YAML::EndSeq;
    } else if (type == typeid(Dict)) {
        const auto& dict = std::any_cast<const Dict&>(value);
        out << YAML::BeginMap;
        for (const auto& [key, item] : dict) {
            out << YAML::Key << key << YAML::Value;
            if (auto res = _emit(out, item); !res) {
                return res;
            }
        }
        out << YAML::EndMap;
    } else {
        return Err<void>(ErrorCode::Encode,
            std::string("YamlSerializer: unsupported value type '") + type.name() + "'");
    }
    return Ok();
}

Value YamlSerializer::_node_to_value(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) {
        return Value{};
    }

    if (node.IsScalar()) {
        // Quoted scalars carry the non-specific "!" tag
        if (node.Tag() == "!") {
            return Value(node.Scalar());
        }
        return _plain_scalar(node.Scalar());
    }

    if (node.IsSequence()) {
        List list;
        for (const auto& item : node) {
            list.push_back(_node_to_value(item));
        }
        return Value(list);
    }

    if (node.IsMap()) {
        return Value(_node_to_dict(node));
    }

    return Value{};
}

Dict YamlSerializer::_node_to_dict(const YAML::Node& node) {
    Dict result;
    if (!node.IsMap()) {
        return result;
    }

    for (const auto& kv : node) {
        result[kv.first.Scalar()] = _node_to_value(kv.second);
    }
    return result;
}

Value YamlSerializer::_plain_scalar(const std::string& str) {
    if (str == "true" || str == "True" || str == "TRUE") {
        return Value(true);
    }
    if (str == "false" || str == "False" || str == "FALSE") {
        return Value(false);
    }
    if (str == ".inf" || str == "+.inf") {
        return Value(std::numeric_limits<double>::infinity());
    }
    if (str == "-.inf") {
        return Value(-std::numeric_limits<double>::infinity());
    }
    if (str == ".nan") {
        return Value(std::numeric_limits<double>::quiet_NaN());
    }

    const char* first = str.data();
    const char* last = str.data() + str.size();
    if (!str.empty() && *first == '+') ++first;

    long long ll = 0;
    auto [int_end, int_ec] = std::from_chars(first, last, ll);
    if (int_ec == std::errc() && int_end == last && first != last) {
        if (ll >= std::numeric_limits<int>::min() && ll <= std::numeric_limits<int>::max()) {
            return Value(static_cast<int>(ll));
        }
        return Value(ll);
    }

    double d = 0.0;
    auto [dbl_end, dbl_ec] = std::from_chars(first, last, d);
    if (dbl_ec == std::errc() && dbl_end == last && first != last) {
        return Value(d);
    }

    return Value(str);
}

std::string YamlSerializer::_format_double(double d) {
    if (std::isnan(d)) return ".nan";
    if (std::isinf(d)) return d > 0 ? ".inf" : "-.inf";

    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    std::string text(buf, ec == std::errc() ? end : buf);
    // 1.0 must not read back as int
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

} // namespace filebase
