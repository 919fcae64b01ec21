#include "file_identity.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace filebase {

namespace {

std::optional<std::string> non_empty(std::string s) {
    if (s.empty()) return std::nullopt;
    return s;
}

} // namespace

FileIdentity FileIdentity::derive_from_path(const std::string& path) {
    FileIdentity identity;

    fs::path p(path);
    identity.directory = non_empty(p.parent_path().string());

    // "/a/b/" names a directory, there is no file component
    if (!p.has_filename()) {
        return identity;
    }

    std::string file_name = p.filename().string();
    auto dot = file_name.find('.');
    if (dot == std::string::npos) {
        identity.name = non_empty(file_name);
    } else {
        identity.name = non_empty(file_name.substr(0, dot));
        identity.extension = non_empty(file_name.substr(dot));
    }
    return identity;
}

std::vector<std::string> FileIdentity::missing_fields() const {
    std::vector<std::string> missing;
    if (!name) missing.emplace_back("name");
    if (!extension) missing.emplace_back("extension");
    if (!directory) missing.emplace_back("directory");
    return missing;
}

std::string FileIdentity::describe_missing() const {
    auto missing = missing_fields();
    std::string result;
    for (size_t i = 0; i < missing.size(); ++i) {
        if (i > 0) {
            result += (i + 1 == missing.size()) ? " and " : ", ";
        }
        result += missing[i];
    }
    return result;
}

Result<std::string> FileIdentity::to_absolute_path() const {
    if (!is_complete()) {
        return Err<std::string>(ErrorCode::IncompleteIdentity,
            "The file " + describe_missing() + " is not set");
    }
    return Ok((fs::path(*directory) / (*name + *extension)).string());
}

std::string FileIdentity::file_name() const {
    return name.value_or("") + extension.value_or("");
}

} // namespace filebase
