#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace uisync::config {

void SyncConfigFromFile::Reset() {
    source_path.reset();
    store_path.reset();
    folder_name.reset();
    log_level.reset();
    members.reset();
}

Result SyncConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail("Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail("Config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace uisync::config
