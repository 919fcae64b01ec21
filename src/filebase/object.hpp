#pragma once

#include "result.hpp"
#include <atomic>
#include <cstdint>
#include <string>

namespace filebase {

// Base class for library objects with a create/init/dispose lifecycle
class Object {
public:
    Object() : _uid(next_uid()) {}
    virtual ~Object() = default;

    // "#<n>", unique per process, tags log lines
    const std::string& uid() const { return _uid; }

    virtual Result<void> init() { return Ok(); }
    virtual Result<void> dispose() { return Ok(); }

private:
    static std::string next_uid() {
        static std::atomic<uint64_t> counter{0};
        return "#" + std::to_string(++counter);
    }

    std::string _uid;
};

} // namespace filebase
