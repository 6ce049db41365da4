#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace uisync {

// Local filesystem operations used by the tree serializer and builder.
// Stateless; safe to share between record tasks.
class FileStore {
public:
    // mkdir -p; an existing directory is not an error.
    Result EnsureDirectory(const std::string& dir) const;

    // Creates `dir` if needed, then creates or truncates dir/name.
    Result WriteFile(const std::string& dir, const std::string& name, std::string_view content) const;

    Expected<std::string> ReadFile(const std::string& path) const;

    bool Exists(const std::string& path) const;
    bool IsDirectory(const std::string& path) const;
    bool IsRegularFile(const std::string& path) const;

    // Names of the immediate subdirectories of `dir`, sorted.
    Expected<std::vector<std::string>> ListDirectories(const std::string& dir) const;
};

} // namespace uisync
