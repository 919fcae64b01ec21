#pragma once

#include "result.hpp"
#include "types.hpp"
#include <memory>
#include <string>

namespace filebase {

// Serializer - turns the owned data into bytes and back.
// encode() fails with ErrorCode::Encode, decode() with ErrorCode::Decode.
class Serializer {
public:
    virtual ~Serializer() = default;

    virtual Result<std::string> encode(const Value& value) = 0;
    virtual Result<Value> decode(const std::string& bytes) = 0;

    // Short format name for log lines
    virtual std::string name() const = 0;
};

using SerializerPtr = std::shared_ptr<Serializer>;

} // namespace filebase
