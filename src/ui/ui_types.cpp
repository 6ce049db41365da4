#include "ui/ui_types.hpp"

#include "ui/definition_format.hpp"
#include "util/path_utils.hpp"

namespace uisync {

using json = nlohmann::json;

namespace {

constexpr const char* kScript = "script";
constexpr const char* kStyles = "styles";
constexpr const char* kTemplate = "template";

// Moves a blob field out of `obj` into `out` when it carries content. Null and
// empty strings are left in place.
Result TakeBlob(json& obj, const char* key, std::optional<std::string>& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return Result::Ok();
    if (!it->is_string())
        return Result::Fail(std::string("'") + key + "' must be a string");
    if (it->get_ref<const std::string&>().empty())
        return Result::Ok();
    out = it->get<std::string>();
    obj.erase(it);
    return Result::Ok();
}

void PutBlob(json& obj, const char* key, const std::optional<std::string>& value) {
    if (value) obj[key] = *value;
}

bool IsKey(const json& v) {
    return v.is_string() || v.is_number();
}

Expected<std::string> TakeName(json& obj, const char* what) {
    auto it = obj.find("name");
    if (it == obj.end() || !it->is_string())
        return std::unexpected(std::string(what) + " has no string 'name'");
    std::string name = it->get<std::string>();
    if (!IsSafePathComponent(name))
        return std::unexpected(std::string(what) + " name is not a valid directory name: '" + name + "'");
    obj.erase(it);
    return name;
}

Expected<LegacyTab> LegacyTabFromJson(const json& j) {
    if (!j.is_object())
        return std::unexpected("tab must be an object");
    LegacyTab tab;
    tab.extra = j;
    auto id = tab.extra.find("id");
    if (id == tab.extra.end() || !IsKey(*id))
        return std::unexpected("tab has no 'id'");
    tab.id = *id;
    tab.extra.erase(id);
    auto name = tab.extra.find("name");
    if (name == tab.extra.end() || !name->is_string())
        return std::unexpected("tab " + tab.id.dump() + " has no string 'name'");
    tab.name = name->get<std::string>();
    tab.extra.erase(name);
    return tab;
}

json LegacyTabToJson(const LegacyTab& tab) {
    json j = tab.extra;
    j["id"] = tab.id;
    j["name"] = tab.name;
    return j;
}

} // namespace

const std::string& UiDefName(const UiDef& def) {
    return std::visit([](const auto& d) -> const std::string& { return d.name; }, def);
}

Expected<UiElement> UiElementFromJson(const json& j) {
    if (!j.is_object())
        return std::unexpected("element must be an object");

    UiElement el;
    el.extra = j;
    for (auto [key, field] : {std::pair{kScript, &el.script},
                              std::pair{kStyles, &el.styles},
                              std::pair{kTemplate, &el.template_text}}) {
        auto r = TakeBlob(el.extra, key, *field);
        if (!r.is_ok())
            return std::unexpected("element: " + r.msg);
    }

    auto children = el.extra.find("children");
    if (children != el.extra.end()) {
        if (!children->is_array())
            return std::unexpected("element 'children' must be an array");
        el.children.reserve(children->size());
        for (const auto& c : *children) {
            auto child = UiElementFromJson(c);
            if (!child)
                return std::unexpected(child.error());
            el.children.push_back(std::move(*child));
        }
        el.extra.erase(children);
    }
    return el;
}

json UiElementToJson(const UiElement& el) {
    json j = el.extra;
    PutBlob(j, kScript, el.script);
    PutBlob(j, kStyles, el.styles);
    PutBlob(j, kTemplate, el.template_text);
    json children = json::array();
    for (const auto& c : el.children) {
        children.push_back(UiElementToJson(c));
    }
    j["children"] = std::move(children);
    return j;
}

Expected<LegacySection> LegacySectionFromJson(const json& j) {
    if (!j.is_object())
        return std::unexpected("section must be an object");

    LegacySection s;
    s.extra = j;

    auto id = s.extra.find("id");
    if (id == s.extra.end() || !IsKey(*id))
        return std::unexpected("section has no 'id'");
    s.id = *id;
    s.extra.erase(id);

    const std::string where = "section " + s.id.dump();

    auto parent = s.extra.find("parentId");
    if (parent != s.extra.end()) {
        if (!parent->is_null() && !IsKey(*parent))
            return std::unexpected(where + ": 'parentId' must be a string, number or null");
        s.parent_id = *parent;
        s.extra.erase(parent);
    }

    auto page = s.extra.find("page");
    if (page == s.extra.end() || !IsKey(*page))
        return std::unexpected(where + " has no 'page'");
    s.page = *page;
    s.extra.erase(page);

    auto label = s.extra.find("label");
    if (label == s.extra.end() || !label->is_string())
        return std::unexpected(where + " has no string 'label'");
    s.label = label->get<std::string>();
    s.extra.erase(label);

    for (auto [key, field] : {std::pair{kScript, &s.script},
                              std::pair{kStyles, &s.styles},
                              std::pair{kTemplate, &s.template_text}}) {
        auto r = TakeBlob(s.extra, key, *field);
        if (!r.is_ok())
            return std::unexpected(where + ": " + r.msg);
    }

    auto props = s.extra.find("properties");
    if (props != s.extra.end() && !props->is_null()) {
        s.properties = *props;
        s.extra.erase(props);
    }
    return s;
}

json LegacySectionToJson(const LegacySection& section) {
    json j = section.extra;
    j["id"] = section.id;
    if (section.parent_id) j["parentId"] = *section.parent_id;
    j["page"] = section.page;
    j["label"] = section.label;
    PutBlob(j, kScript, section.script);
    PutBlob(j, kStyles, section.styles);
    PutBlob(j, kTemplate, section.template_text);
    if (section.properties) j["properties"] = *section.properties;
    return j;
}

Expected<LegacyUiDefinition> LegacyUiDefinitionFromJson(const json& j) {
    if (DetectDefinitionFormat(j) != DefinitionFormat::Legacy)
        return std::unexpected("not a legacy definition");

    LegacyUiDefinition def;
    def.attributes = j;
    auto name = TakeName(def.attributes, "legacy definition");
    if (!name)
        return std::unexpected(name.error());
    def.name = std::move(*name);

    for (const auto& t : def.attributes["tabs"]) {
        auto tab = LegacyTabFromJson(t);
        if (!tab)
            return std::unexpected(def.name + ": " + tab.error());
        def.tabs.push_back(std::move(*tab));
    }
    for (const auto& s : def.attributes["sections"]) {
        auto section = LegacySectionFromJson(s);
        if (!section)
            return std::unexpected(def.name + ": " + section.error());
        def.sections.push_back(std::move(*section));
    }
    def.attributes.erase("tabs");
    def.attributes.erase("sections");
    return def;
}

Expected<UiDefinition> UiDefinitionFromJson(const json& j) {
    if (DetectDefinitionFormat(j) != DefinitionFormat::Modern)
        return std::unexpected("not a modern definition");

    UiDefinition def;
    def.attributes = j;
    auto name = TakeName(def.attributes, "definition");
    if (!name)
        return std::unexpected(name.error());
    def.name = std::move(*name);

    for (const auto& c : def.attributes["children"]) {
        auto child = UiElementFromJson(c);
        if (!child)
            return std::unexpected(def.name + ": " + child.error());
        def.children.push_back(std::move(*child));
    }
    def.attributes.erase("children");
    return def;
}

Expected<UiDef> UiDefFromJson(const json& j) {
    switch (DetectDefinitionFormat(j)) {
        case DefinitionFormat::Legacy: {
            auto def = LegacyUiDefinitionFromJson(j);
            if (!def) return std::unexpected(def.error());
            return UiDef{std::move(*def)};
        }
        case DefinitionFormat::Modern: {
            auto def = UiDefinitionFromJson(j);
            if (!def) return std::unexpected(def.error());
            return UiDef{std::move(*def)};
        }
        case DefinitionFormat::Unrecognized:
            break;
    }
    std::string name = "<unnamed>";
    if (j.is_object() && j.contains("name") && j["name"].is_string()) {
        name = j["name"].get<std::string>();
    }
    return std::unexpected("unrecognized definition shape: " + name);
}

json UiDefToJson(const UiDef& def) {
    if (const auto* modern = std::get_if<UiDefinition>(&def)) {
        json j = modern->attributes;
        j["name"] = modern->name;
        json children = json::array();
        for (const auto& c : modern->children) {
            children.push_back(UiElementToJson(c));
        }
        j["children"] = std::move(children);
        return j;
    }

    const auto& legacy = std::get<LegacyUiDefinition>(def);
    json j = legacy.attributes;
    j["name"] = legacy.name;
    json tabs = json::array();
    for (const auto& t : legacy.tabs) {
        tabs.push_back(LegacyTabToJson(t));
    }
    json sections = json::array();
    for (const auto& s : legacy.sections) {
        sections.push_back(LegacySectionToJson(s));
    }
    j["tabs"] = std::move(tabs);
    j["sections"] = std::move(sections);
    return j;
}

json UiDefsToJson(const std::vector<UiDef>& defs) {
    json out = json::array();
    for (const auto& d : defs) {
        out.push_back(UiDefToJson(d));
    }
    return out;
}

std::string ToPrettyJson(const json& j) {
    return j.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

Expected<json> ParseUiDefsDocument(std::string_view text) {
    try {
        if (text.find_first_not_of(" \t\n\r") == std::string_view::npos) {
            return std::unexpected("Empty document");
        }
        auto j = json::parse(text);
        if (!j.is_array()) {
            return std::unexpected("UI definitions document root must be an array");
        }
        return j;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    }
}

} // namespace uisync
