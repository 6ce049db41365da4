#include "util/config_json_utils.hpp"

#include "util/logger.hpp"

#include <fstream>

namespace uisync::config::detail {

namespace {

bool GetStringIfPresent(const nlohmann::json& j,
                        const char* key,
                        std::optional<std::string>& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, SyncConfigFromFile& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "SourcePath", cfg.source_path, err)) return false;
    if (!GetStringIfPresent(j, "StorePath", cfg.store_path, err)) return false;
    if (!GetStringIfPresent(j, "FolderName", cfg.folder_name, err)) return false;
    if (!GetStringIfPresent(j, "LogLevel", cfg.log_level, err)) return false;
    if (!GetStringIfPresent(j, "Members", cfg.members, err)) return false;

    if (cfg.source_path && cfg.source_path->empty()) {
        err = "SourcePath must not be empty";
        return false;
    }
    if (cfg.folder_name && cfg.folder_name->empty()) {
        err = "FolderName must not be empty";
        return false;
    }
    if (cfg.log_level && !ParseLogLevel(*cfg.log_level)) {
        err = "unknown LogLevel: " + *cfg.log_level;
        return false;
    }

    for (const auto& [key, val] : j.items()) {
        (void)val;
        if (key != "SourcePath" && key != "StorePath" && key != "FolderName" &&
            key != "LogLevel" && key != "Members") {
            LogWarn("Config: ignoring unknown key '%s'", key.c_str());
        }
    }

    return true;
}

} // namespace uisync::config::detail
