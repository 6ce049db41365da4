#include "ui/definition_format.hpp"

namespace uisync {

namespace {

bool HasArray(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_array();
}

} // namespace

DefinitionFormat DetectDefinitionFormat(const nlohmann::json& def) {
    if (!def.is_object()) return DefinitionFormat::Unrecognized;

    const bool legacy = HasArray(def, "tabs") && HasArray(def, "sections");
    const bool modern = HasArray(def, "children");
    if (legacy == modern) return DefinitionFormat::Unrecognized;
    return legacy ? DefinitionFormat::Legacy : DefinitionFormat::Modern;
}

const char* ToString(DefinitionFormat format) {
    switch (format) {
        case DefinitionFormat::Modern:       return "modern";
        case DefinitionFormat::Legacy:       return "legacy";
        case DefinitionFormat::Unrecognized: return "unrecognized";
    }
    return "unrecognized";
}

} // namespace uisync
