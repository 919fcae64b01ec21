#pragma once

#include "result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace filebase {

/**
 * FileIdentity - where a handle lives on disk: (directory, base name, extension)
 *
 * Each component is either set (non-empty) or unset. The base name is the
 * filename text before its first '.', the extension is the rest of the
 * filename from that dot on, so "/a/b/report.v2.csv" gives
 *   directory "/a/b", name "report", extension ".v2.csv"
 * and to_absolute_path() reproduces the original path.
 */
struct FileIdentity {
    std::optional<std::string> directory;
    std::optional<std::string> name;
    std::optional<std::string> extension;

    // Pure string parsing, no I/O
    static FileIdentity derive_from_path(const std::string& path);

    bool is_complete() const { return directory && name && extension; }
    bool is_empty() const { return !directory && !name && !extension; }

    // Missing components in fixed order: name, extension, directory
    std::vector<std::string> missing_fields() const;

    // "name and extension", "name, extension and directory", ...
    std::string describe_missing() const;

    // Fails with IncompleteIdentity naming the missing fields
    Result<std::string> to_absolute_path() const;

    // "Foo.bar", empty components are skipped
    std::string file_name() const;

    bool operator==(const FileIdentity& other) const = default;
};

} // namespace filebase
