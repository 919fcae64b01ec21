#pragma once

#include "serializer.hpp"
#include <yaml-cpp/yaml.h>

namespace filebase {

/**
 * YamlSerializer - stores a Value as a YAML document
 *
 * Scalars are typed on load: true/false -> bool, integers -> int (long long
 * when out of int range), decimals -> double, everything else -> std::string.
 * Strings that would read back as another type are written double-quoted,
 * and quoted scalars always load as strings.
 */
class YamlSerializer : public Serializer {
public:
    static Result<SerializerPtr> create();

    Result<std::string> encode(const Value& value) override;
    Result<Value> decode(const std::string& bytes) override;
    std::string name() const override { return "yaml"; }

private:
    static Value _node_to_value(const YAML::Node& node);
    static Dict _node_to_dict(const YAML::Node& node);
    static Result<void> _emit(YAML::Emitter& out, const Value& value);
    static Value _plain_scalar(const std::string& str);
    static std::string _format_double(double d);
};

} // namespace filebase
