#pragma once

#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace uisync {

// Element of a modern definition. Its name is not stored: it is declared in the
// decorator inside the (base64) script.
struct UiElement {
    std::optional<std::string> script;
    std::optional<std::string> styles;
    std::optional<std::string> template_text;
    std::vector<UiElement> children;
    nlohmann::json extra = nlohmann::json::object();

    bool operator==(const UiElement&) const = default;
};

struct UiDefinition {
    std::string name;
    nlohmann::json attributes = nlohmann::json::object();
    std::vector<UiElement> children;

    bool operator==(const UiDefinition&) const = default;
};

struct LegacyTab {
    nlohmann::json id;
    std::string name;
    nlohmann::json extra = nlohmann::json::object();

    bool operator==(const LegacyTab&) const = default;
};

// Sections form a tree through parentId -> id links inside a flat list.
struct LegacySection {
    nlohmann::json id;
    std::optional<nlohmann::json> parent_id;   // nullopt: field absent
    nlohmann::json page;
    std::string label;
    std::optional<std::string> script;
    std::optional<std::string> styles;
    std::optional<std::string> template_text;
    std::optional<nlohmann::json> properties;
    nlohmann::json extra = nlohmann::json::object();

    bool IsRoot() const { return !parent_id || parent_id->is_null(); }

    bool operator==(const LegacySection&) const = default;
};

struct LegacyUiDefinition {
    std::string name;
    std::vector<LegacyTab> tabs;
    std::vector<LegacySection> sections;
    nlohmann::json attributes = nlohmann::json::object();

    bool operator==(const LegacyUiDefinition&) const = default;
};

using UiDef = std::variant<UiDefinition, LegacyUiDefinition>;

const std::string& UiDefName(const UiDef& def);

// JSON mapping. Blob fields ("script", "styles", "template") that are null or
// empty are not content and stay in `extra` so they survive a round trip.
Expected<UiElement> UiElementFromJson(const nlohmann::json& j);
nlohmann::json UiElementToJson(const UiElement& el);

Expected<LegacySection> LegacySectionFromJson(const nlohmann::json& j);
nlohmann::json LegacySectionToJson(const LegacySection& section);

Expected<LegacyUiDefinition> LegacyUiDefinitionFromJson(const nlohmann::json& j);
Expected<UiDefinition> UiDefinitionFromJson(const nlohmann::json& j);

// Dispatches on the definition shape; an unrecognized shape is an error.
Expected<UiDef> UiDefFromJson(const nlohmann::json& j);
nlohmann::json UiDefToJson(const UiDef& def);
nlohmann::json UiDefsToJson(const std::vector<UiDef>& defs);

// Two-space indented JSON with a trailing newline. Invalid UTF-8 is replaced
// rather than thrown on.
std::string ToPrettyJson(const nlohmann::json& j);

// Parses the plain JSON text of a UI-definitions document. The root must be an
// array; its entries are converted one by one by the caller.
Expected<nlohmann::json> ParseUiDefsDocument(std::string_view text);

} // namespace uisync
