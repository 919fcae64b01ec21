// Shared helpers for the filebase unit tests
#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <sstream>
#include <string>
#include <thread>

namespace filebase::test {

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::ostringstream name;
        name << "filebase-test-" << std::hex << rd() << rd();
        _path = std::filesystem::temp_directory_path() / name.str();
        std::filesystem::create_directories(_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return _path; }

    std::string file(const std::string& name) const { return (_path / name).string(); }

    std::string subdir(const std::string& name) const {
        auto dir = _path / name;
        std::filesystem::create_directories(dir);
        return dir.string();
    }

private:
    std::filesystem::path _path;
};

inline std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline void write_text(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

// Polls `pred` until it holds or the timeout passes
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace filebase::test
