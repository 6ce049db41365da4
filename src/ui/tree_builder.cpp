#include "ui/tree_builder.hpp"

#include "codec/base64.hpp"
#include "ui/element_metadata.hpp"
#include "ui/tree_layout.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <unordered_set>

namespace uisync {

using json = nlohmann::json;

namespace {

std::string BaseNameOf(const std::string& dir) {
    return std::filesystem::path(TrimTrailingSlash(dir)).filename().string();
}

} // namespace

TreeBuilder::TreeBuilder(const FileStore& files) : files_(files) {}

Expected<json> TreeBuilder::ReadJsonFile(const std::string& path) const {
    auto text = files_.ReadFile(path);
    if (!text) return std::unexpected(text.error());
    try {
        return json::parse(*text);
    } catch (const json::parse_error& e) {
        return std::unexpected("invalid JSON in " + path + ": " + e.what());
    }
}

Expected<std::vector<std::string>> TreeBuilder::ChildNames(const json& meta, const std::string& where) const {
    auto it = meta.find("children");
    if (it == meta.end() || !it->is_array())
        return std::unexpected(where + ": metadata has no 'children' array");

    std::vector<std::string> names;
    for (const auto& c : *it) {
        if (!c.is_string() || !IsSafePathComponent(c.get_ref<const std::string&>()))
            return std::unexpected(where + ": invalid child name " + c.dump());
        names.push_back(c.get<std::string>());
    }
    return names;
}

Expected<UiElement> TreeBuilder::BuildElement(const std::string& dir) const {
    const std::string script_path = JoinPath(dir, layout::kScriptFile);
    if (!files_.IsRegularFile(script_path))
        return std::unexpected("element has no " + std::string(layout::kScriptFile) + ": " + dir);

    auto script = files_.ReadFile(script_path);
    if (!script) return std::unexpected(script.error());

    const std::string dir_name = BaseNameOf(dir);
    auto declared = ExtractElementName(*script);
    if (!declared) {
        LogWarn("Element %s: script declares no name, it will be skipped on the next pull", dir.c_str());
    } else if (*declared != dir_name) {
        LogWarn("Element %s: script declares name '%s'", dir.c_str(), declared->c_str());
    }

    UiElement el;
    el.script = Base64Encode(*script);

    const std::string styles_path = JoinPath(dir, layout::kStylesFile);
    if (files_.IsRegularFile(styles_path)) {
        auto styles = files_.ReadFile(styles_path);
        if (!styles) return std::unexpected(styles.error());
        el.styles = Base64Encode(*styles);
    }
    const std::string template_path = JoinPath(dir, layout::kTemplateFile);
    if (files_.IsRegularFile(template_path)) {
        auto tpl = files_.ReadFile(template_path);
        if (!tpl) return std::unexpected(tpl.error());
        el.template_text = Base64Encode(*tpl);
    }

    std::vector<std::string> children;
    const std::string meta_path = JoinPath(dir, layout::kMetadataFile);
    if (files_.IsRegularFile(meta_path)) {
        auto meta = ReadJsonFile(meta_path);
        if (!meta) return std::unexpected(meta.error());
        if (!meta->is_object()) return std::unexpected(meta_path + ": root must be JSON object");
        auto names = ChildNames(*meta, meta_path);
        if (!names) return std::unexpected(names.error());
        children = std::move(*names);
        meta->erase("children");
        el.extra = std::move(*meta);
    } else {
        // hand-made element: every subdirectory holding a script, by name
        auto dirs = files_.ListDirectories(dir);
        if (!dirs) return std::unexpected(dirs.error());
        for (auto& d : *dirs) {
            if (files_.IsRegularFile(JoinPath(JoinPath(dir, d), layout::kScriptFile))) {
                children.push_back(std::move(d));
            }
        }
    }

    for (const auto& name : children) {
        auto child = BuildElement(JoinPath(dir, name));
        if (!child) return std::unexpected(child.error());
        el.children.push_back(std::move(*child));
    }
    return el;
}

Expected<UiDefinition> TreeBuilder::BuildUiDefinition(const std::string& dir) const {
    const std::string meta_path = JoinPath(dir, layout::kMetadataFile);
    auto meta = ReadJsonFile(meta_path);
    if (!meta) return std::unexpected(meta.error());
    if (!meta->is_object()) return std::unexpected(meta_path + ": root must be JSON object");

    auto names = ChildNames(*meta, meta_path);
    if (!names) return std::unexpected(names.error());

    UiDefinition def;
    auto name = meta->find("name");
    if (name != meta->end() && name->is_string()) {
        def.name = name->get<std::string>();
    } else {
        def.name = BaseNameOf(dir);
    }
    meta->erase("name");
    meta->erase("children");
    def.attributes = std::move(*meta);

    for (const auto& child_name : *names) {
        auto el = BuildElement(JoinPath(dir, child_name));
        if (!el) return std::unexpected(def.name + ": " + el.error());
        def.children.push_back(std::move(*el));
    }
    return def;
}

std::string TreeBuilder::ResolveUrl(const std::string& record_dir, const std::string& url) const {
    if (!url.empty() && url.front() == '/') return url;
    const std::string in_record = JoinPath(record_dir, NormalizeRelativePath(url));
    if (files_.Exists(in_record)) return in_record;
    // trees written by older tools store paths relative to the working directory
    if (files_.Exists(url)) return url;
    return in_record;
}

Result TreeBuilder::InlineSectionFiles(json& section, const std::string& record_dir) const {
    struct UrlField {
        const char* url_key;
        const char* field;
    };
    const UrlField blobs[] = {
        {layout::kScriptUrl, "script"},
        {layout::kStylesUrl, "styles"},
        {layout::kTemplateUrl, "template"},
    };

    for (const auto& b : blobs) {
        auto it = section.find(b.url_key);
        if (it == section.end()) continue;
        if (!it->is_string()) return Result::Fail(std::string("'") + b.url_key + "' must be a string");
        auto content = files_.ReadFile(ResolveUrl(record_dir, it->get<std::string>()));
        if (!content) return Result::Fail(content.error());
        section.erase(it);
        section[b.field] = Base64Encode(*content);
    }

    auto props = section.find(layout::kPropertiesUrl);
    if (props != section.end()) {
        if (!props->is_string()) return Result::Fail(std::string("'") + layout::kPropertiesUrl + "' must be a string");
        auto parsed = ReadJsonFile(ResolveUrl(record_dir, props->get<std::string>()));
        if (!parsed) return Result::Fail(parsed.error());
        section.erase(props);
        section["properties"] = std::move(*parsed);
    }
    return Result::Ok();
}

Expected<std::vector<LegacyUiDefinition>> TreeBuilder::BuildLegacyUiDefinitions(const std::string& record_dir) const {
    std::vector<LegacyUiDefinition> out;
    const std::string meta_path = JoinPath(record_dir, layout::kMetadataFile);
    if (!files_.IsRegularFile(meta_path)) return out;

    auto meta = ReadJsonFile(meta_path);
    if (!meta) return std::unexpected(meta.error());
    if (!meta->is_array()) return std::unexpected(meta_path + ": root must be JSON array");

    for (auto& entry : *meta) {
        if (!entry.is_object() || !entry.contains("sections") || !entry["sections"].is_array())
            return std::unexpected(meta_path + ": legacy entry has no 'sections' array");

        for (auto& section : entry["sections"]) {
            if (!section.is_object())
                return std::unexpected(meta_path + ": section must be an object");
            auto r = InlineSectionFiles(section, record_dir);
            if (!r.is_ok()) return std::unexpected(meta_path + ": " + r.msg);
        }

        auto def = LegacyUiDefinitionFromJson(entry);
        if (!def) return std::unexpected(meta_path + ": " + def.error());
        out.push_back(std::move(*def));
    }
    return out;
}

Expected<std::vector<UiDef>> TreeBuilder::BuildRecord(const std::string& record_dir) const {
    if (!files_.IsDirectory(record_dir))
        return std::unexpected("not a directory: " + record_dir);

    std::vector<UiDef> defs;
    std::unordered_set<std::string> legacy_names;

    auto legacy = BuildLegacyUiDefinitions(record_dir);
    if (!legacy) return std::unexpected(legacy.error());
    for (auto& def : *legacy) {
        legacy_names.insert(def.name);
        defs.emplace_back(std::move(def));
    }

    auto dirs = files_.ListDirectories(record_dir);
    if (!dirs) return std::unexpected(dirs.error());
    for (const auto& name : *dirs) {
        if (legacy_names.count(name)) continue;
        const std::string dir = JoinPath(record_dir, name);
        if (!files_.IsRegularFile(JoinPath(dir, layout::kMetadataFile))) {
            LogDebug("BuildRecord: %s has no %s, not a definition", dir.c_str(), layout::kMetadataFile);
            continue;
        }
        auto def = BuildUiDefinition(dir);
        if (!def) return std::unexpected(def.error());
        defs.emplace_back(std::move(*def));
    }

    auto r = ApplyDefinitionOrder(defs, record_dir);
    if (!r.is_ok()) return std::unexpected(r.msg);
    return defs;
}

Result TreeBuilder::ApplyDefinitionOrder(std::vector<UiDef>& defs, const std::string& record_dir) const {
    const std::string index_path = JoinPath(record_dir, layout::kDefinitionsFile);
    if (!files_.IsRegularFile(index_path)) return Result::Ok();

    auto index = ReadJsonFile(index_path);
    if (!index) return Result::Fail(index.error());
    if (!index->is_array()) return Result::Fail(index_path + ": root must be JSON array");

    std::vector<UiDef> ordered;
    ordered.reserve(defs.size());
    std::vector<bool> taken(defs.size(), false);
    for (const auto& entry : *index) {
        if (!entry.is_string()) return Result::Fail(index_path + ": invalid definition name " + entry.dump());
        const auto& name = entry.get_ref<const std::string&>();
        bool found = false;
        for (size_t i = 0; i < defs.size(); ++i) {
            if (!taken[i] && UiDefName(defs[i]) == name) {
                ordered.push_back(std::move(defs[i]));
                taken[i] = true;
                found = true;
                break;
            }
        }
        if (!found) {
            LogDebug("BuildRecord: %s lists %s, not present", index_path.c_str(), name.c_str());
        }
    }
    for (size_t i = 0; i < defs.size(); ++i) {
        if (!taken[i]) ordered.push_back(std::move(defs[i]));
    }
    defs = std::move(ordered);
    return Result::Ok();
}

} // namespace uisync
