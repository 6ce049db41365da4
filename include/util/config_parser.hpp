#pragma once

#include "util/result.hpp"

#include <optional>
#include <string>

namespace uisync::config {

constexpr const char* kDefaultConfigPath = "uisync.conf";
constexpr const char* kDefaultSourcePath = "source";
constexpr const char* kDefaultFolderName = "velo_product_models";

// Values read from the JSON config file. Every key is optional; command line
// flags override what is set here.
struct SyncConfigFromFile {
    std::optional<std::string> source_path;
    std::optional<std::string> store_path;
    std::optional<std::string> folder_name;
    std::optional<std::string> log_level;
    std::optional<std::string> members;

    void Reset();
    Result LoadFile(const std::string& path);
};

} // namespace uisync::config
