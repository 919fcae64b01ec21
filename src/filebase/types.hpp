#pragma once

#include "result.hpp"
#include <string>
#include <vector>
#include <map>
#include <any>
#include <optional>
#include <memory>

namespace filebase {

// Value type for the data owned by a file handle
using Value = std::any;
using Dict = std::map<std::string, Value>;
using List = std::vector<Value>;

// Helper to get value from std::any
template<typename T>
std::optional<T> get_as(const Value& v) {
    try {
        return std::any_cast<T>(v);
    } catch (const std::bad_any_cast&) {
        return std::nullopt;
    }
}

} // namespace filebase
