#pragma once

#include <nlohmann/json.hpp>

namespace uisync {

enum class DefinitionFormat {
    Modern,
    Legacy,
    Unrecognized,
};

// Legacy: array "tabs" and array "sections". Modern: array "children".
// An object carrying both shapes, or neither, is Unrecognized.
DefinitionFormat DetectDefinitionFormat(const nlohmann::json& def);

inline bool IsLegacyDefinition(const nlohmann::json& def) {
    return DetectDefinitionFormat(def) == DefinitionFormat::Legacy;
}

const char* ToString(DefinitionFormat format);

} // namespace uisync
