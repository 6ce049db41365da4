#include "ui/tree_serializer.hpp"

#include "codec/base64.hpp"
#include "ui/definition_format.hpp"
#include "ui/element_metadata.hpp"
#include "ui/tree_layout.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <tuple>
#include <unordered_map>
#include <unordered_set>

namespace uisync {

using json = nlohmann::json;

namespace {

std::string KeyOf(const json& id) {
    return id.dump();
}

// Element directories sit next to the element's own files.
bool IsReservedName(const std::string& name) {
    return name == layout::kMetadataFile || name == layout::kScriptFile ||
           name == layout::kStylesFile || name == layout::kTemplateFile;
}

// Definition directories sit next to the record's own files.
bool IsReservedDefinitionName(const std::string& name) {
    return name == layout::kMetadataFile || name == layout::kDefinitionsFile;
}

Result WriteDecodedBlob(const FileStore& files,
                        const std::string& dir,
                        const std::string& file_name,
                        const std::string& blob) {
    auto text = Base64Decode(blob);
    if (!text)
        return Result::Fail("cannot decode " + JoinPath(dir, file_name) + ": " + text.error());
    return files.WriteFile(dir, file_name, *text);
}

// Lays out the sections of one legacy definition. Sections are a flat list
// linked by parentId; each tab's tree is walked from its roots through a
// parent -> children index.
class LegacySectionWriter {
public:
    LegacySectionWriter(const FileStore& files, json& sections_meta, SerializeStats& stats)
        : files_(files), sections_meta_(sections_meta), stats_(stats) {}

    Result WriteTab(const LegacyUiDefinition& def,
                    const LegacyTab& tab,
                    const std::string& tab_dir,
                    const std::string& tab_rel) {
        std::vector<const LegacySection*> roots;
        children_of_.clear();
        for (const auto& s : def.sections) {
            if (s.page != tab.id) continue;
            if (s.IsRoot()) {
                roots.push_back(&s);
            } else {
                children_of_[KeyOf(*s.parent_id)].push_back(&s);
            }
        }
        return WriteLevel(roots, tab_dir, tab_rel);
    }

    std::size_t Visited() const { return visited_.size(); }

private:
    // Sections that are not written (unsafe label, undecodable blob) stay out
    // of visited_ with their subtrees and are counted as dropped.
    Result WriteLevel(const std::vector<const LegacySection*>& level,
                      const std::string& dir,
                      const std::string& rel) {
        for (const LegacySection* s : level) {
            if (visited_.count(s)) continue;

            if (!IsSafePathComponent(s->label)) {
                LogWarn("Legacy section %s: label '%s' is not a valid directory name, subtree skipped",
                        s->id.dump().c_str(), s->label.c_str());
                continue;
            }
            auto blobs = DecodeBlobs(*s);
            if (!blobs) {
                LogWarn("Legacy section %s (%s): %s, subtree skipped",
                        s->id.dump().c_str(), s->label.c_str(), blobs.error().c_str());
                continue;
            }
            visited_.insert(s);

            const std::string child_dir = JoinPath(dir, s->label);
            const std::string child_rel = JoinPath(rel, s->label);
            auto r = WriteSection(*s, *blobs, child_dir, child_rel);
            if (!r.is_ok()) return r;

            auto it = children_of_.find(KeyOf(s->id));
            if (it != children_of_.end()) {
                auto cr = WriteLevel(it->second, child_dir, child_rel);
                if (!cr.is_ok()) return cr;
            }
        }
        return Result::Ok();
    }

    struct DecodedBlobs {
        std::optional<std::string> script;
        std::optional<std::string> styles;
        std::optional<std::string> template_text;
    };

    // Decodes every blob before anything is written, so a bad section leaves
    // no files behind.
    static Expected<DecodedBlobs> DecodeBlobs(const LegacySection& s) {
        DecodedBlobs out;
        for (auto [field, blob, decoded] : {std::tuple{"script", &s.script, &out.script},
                                            std::tuple{"styles", &s.styles, &out.styles},
                                            std::tuple{"template", &s.template_text, &out.template_text}}) {
            if (!*blob) continue;
            auto text = Base64Decode(**blob);
            if (!text) return std::unexpected(std::string(field) + " is not base64 (" + text.error() + ")");
            *decoded = std::move(*text);
        }
        return out;
    }

    Result WriteSection(const LegacySection& s,
                        const DecodedBlobs& decoded,
                        const std::string& dir,
                        const std::string& rel) {
        json meta = LegacySectionToJson(s);

        struct BlobFile {
            const std::optional<std::string>& content;
            const char* field;
            const char* ext;
            const char* url_key;
        };
        const BlobFile blobs[] = {
            {decoded.script, "script", layout::kLegacyScriptExt, layout::kScriptUrl},
            {decoded.styles, "styles", layout::kLegacyStylesExt, layout::kStylesUrl},
            {decoded.template_text, "template", layout::kLegacyTemplateExt, layout::kTemplateUrl},
        };
        for (const auto& b : blobs) {
            if (!b.content) continue;
            const std::string file_name = s.label + b.ext;
            auto r = files_.WriteFile(dir, file_name, *b.content);
            if (!r.is_ok()) return r;
            meta.erase(b.field);
            meta[b.url_key] = JoinPath(rel, file_name);
        }

        if (s.properties) {
            const std::string file_name = s.label + layout::kLegacyPropertiesExt;
            auto r = files_.WriteFile(dir, file_name, ToPrettyJson(*s.properties));
            if (!r.is_ok()) return r;
            meta.erase("properties");
            meta[layout::kPropertiesUrl] = JoinPath(rel, file_name);
        }

        sections_meta_.push_back(std::move(meta));
        ++stats_.sections;
        return Result::Ok();
    }

    const FileStore& files_;
    json& sections_meta_;
    SerializeStats& stats_;
    std::unordered_map<std::string, std::vector<const LegacySection*>> children_of_;
    std::unordered_set<const LegacySection*> visited_;
};

} // namespace

void SerializeStats::Add(const SerializeStats& other) {
    definitions += other.definitions;
    legacy_definitions += other.legacy_definitions;
    filtered_definitions += other.filtered_definitions;
    skipped_definitions += other.skipped_definitions;
    elements += other.elements;
    skipped_elements += other.skipped_elements;
    sections += other.sections;
    dropped_sections += other.dropped_sections;
}

TreeSerializer::TreeSerializer(const FileStore& files) : files_(files) {}

Expected<std::optional<std::string>> TreeSerializer::SaveElement(const UiElement& el,
                                                                 const std::string& parent_dir,
                                                                 std::unordered_set<std::string>& taken,
                                                                 SerializeStats& stats) const {
    // name is declared in the decorator inside the element script
    if (!el.script) {
        ++stats.skipped_elements;
        LogDebug("Element without script under %s skipped", parent_dir.c_str());
        return std::optional<std::string>{};
    }
    auto script = Base64Decode(*el.script);
    if (!script) {
        ++stats.skipped_elements;
        LogWarn("Element under %s skipped: script is not base64 (%s)",
                parent_dir.c_str(), script.error().c_str());
        return std::optional<std::string>{};
    }
    auto name = ExtractElementName(*script);
    if (!name || !IsSafePathComponent(*name) || IsReservedName(*name)) {
        ++stats.skipped_elements;
        LogWarn("Element under %s skipped: no usable name in script%s%s",
                parent_dir.c_str(), name ? ": " : "", name ? name->c_str() : "");
        return std::optional<std::string>{};
    }
    if (!taken.insert(*name).second) {
        ++stats.skipped_elements;
        LogWarn("Element %s skipped: a sibling already uses the name", JoinPath(parent_dir, *name).c_str());
        return std::optional<std::string>{};
    }

    const std::string el_dir = JoinPath(parent_dir, *name);
    auto r = files_.WriteFile(el_dir, layout::kScriptFile, *script);
    if (!r.is_ok()) return std::unexpected(r.msg);

    if (el.styles) {
        r = WriteDecodedBlob(files_, el_dir, layout::kStylesFile, *el.styles);
        if (!r.is_ok()) return std::unexpected(r.msg);
    }
    if (el.template_text) {
        r = WriteDecodedBlob(files_, el_dir, layout::kTemplateFile, *el.template_text);
        if (!r.is_ok()) return std::unexpected(r.msg);
    }

    json child_names = json::array();
    std::unordered_set<std::string> child_taken;
    for (const auto& child : el.children) {
        auto child_name = SaveElement(child, el_dir, child_taken, stats);
        if (!child_name) return std::unexpected(child_name.error());
        if (*child_name) child_names.push_back(**child_name);
    }

    json meta = el.extra;
    meta["children"] = std::move(child_names);
    r = files_.WriteFile(el_dir, layout::kMetadataFile, ToPrettyJson(meta));
    if (!r.is_ok()) return std::unexpected(r.msg);

    ++stats.elements;
    return name;
}

Result TreeSerializer::SaveUiDefinition(const UiDefinition& def,
                                        const std::string& dir,
                                        SerializeStats& stats) const {
    auto r = files_.EnsureDirectory(dir);
    if (!r.is_ok()) return r;

    json child_names = json::array();
    std::unordered_set<std::string> taken;
    for (const auto& child : def.children) {
        auto name = SaveElement(child, dir, taken, stats);
        if (!name) return Result::Fail(name.error());
        if (*name) child_names.push_back(**name);
    }

    json meta = def.attributes;
    meta["name"] = def.name;
    meta["children"] = std::move(child_names);
    r = files_.WriteFile(dir, layout::kMetadataFile, ToPrettyJson(meta));
    if (!r.is_ok()) return r;

    ++stats.definitions;
    return Result::Ok();
}

Result TreeSerializer::SaveLegacyUiDefinition(const LegacyUiDefinition& def,
                                              const std::string& record_dir,
                                              json& legacy_metadata,
                                              SerializeStats& stats) const {
    json meta = UiDefToJson(def);
    meta["sections"] = json::array();

    const std::string def_dir = JoinPath(record_dir, def.name);
    LegacySectionWriter writer(files_, meta["sections"], stats);
    for (const auto& tab : def.tabs) {
        if (!IsSafePathComponent(tab.name)) {
            LogWarn("Legacy definition %s: tab name '%s' is not a valid directory name, tab skipped",
                    def.name.c_str(), tab.name.c_str());
            continue;
        }
        auto r = writer.WriteTab(def, tab, JoinPath(def_dir, tab.name), JoinPath(def.name, tab.name));
        if (!r.is_ok()) return r;
    }

    const std::size_t dropped = def.sections.size() - writer.Visited();
    if (dropped > 0) {
        stats.dropped_sections += dropped;
        LogWarn("Legacy definition %s: %zu section(s) not reachable from a tab root were dropped",
                def.name.c_str(), dropped);
    }

    legacy_metadata.push_back(std::move(meta));
    ++stats.definitions;
    ++stats.legacy_definitions;
    return Result::Ok();
}

Result TreeSerializer::SaveDefinition(const UiDef& def,
                                      const std::string& record_dir,
                                      json& legacy_metadata,
                                      SerializeStats& stats) const {
    if (const auto* legacy = std::get_if<LegacyUiDefinition>(&def)) {
        return SaveLegacyUiDefinition(*legacy, record_dir, legacy_metadata, stats);
    }
    const auto& modern = std::get<UiDefinition>(def);
    return SaveUiDefinition(modern, JoinPath(record_dir, modern.name), stats);
}

Result TreeSerializer::SaveRecord(const json& defs,
                                  const std::string& record_dir,
                                  const DefinitionFilter& filter,
                                  SerializeStats& stats) const {
    if (!defs.is_array()) return Result::Fail("UI definitions must be an array");

    std::vector<UiDef> parsed;
    parsed.reserve(defs.size());
    for (const auto& entry : defs) {
        auto def = UiDefFromJson(entry);
        if (!def) {
            ++stats.skipped_definitions;
            LogWarn("Record %s: %s definition skipped: %s", record_dir.c_str(),
                    ToString(DetectDefinitionFormat(entry)), def.error().c_str());
            continue;
        }
        parsed.push_back(std::move(*def));
    }
    return SaveRecord(parsed, record_dir, filter, stats);
}

Result TreeSerializer::SaveRecord(const std::vector<UiDef>& defs,
                                  const std::string& record_dir,
                                  const DefinitionFilter& filter,
                                  SerializeStats& stats) const {
    // legacy definitions share one metadata.json per record
    json legacy_metadata = json::array();
    // document order, filtered definitions included
    json order = json::array();

    for (const auto& def : defs) {
        const std::string& name = UiDefName(def);
        if (IsReservedDefinitionName(name)) {
            ++stats.skipped_definitions;
            LogWarn("Record %s: definition name %s is reserved, skipped", record_dir.c_str(), name.c_str());
            continue;
        }
        order.push_back(name);

        if (filter && !filter(name)) {
            ++stats.filtered_definitions;
            LogDebug("Record %s: definition %s filtered out", record_dir.c_str(), name.c_str());
            continue;
        }

        auto r = SaveDefinition(def, record_dir, legacy_metadata, stats);
        if (!r.is_ok()) {
            ++stats.skipped_definitions;
            LogWarn("Record %s: definition %s not written: %s",
                    record_dir.c_str(), name.c_str(), r.msg.c_str());
        }
    }

    if (!order.empty()) {
        auto r = files_.WriteFile(record_dir, layout::kDefinitionsFile, ToPrettyJson(order));
        if (!r.is_ok()) return r;
    }
    if (!legacy_metadata.empty()) {
        auto r = files_.WriteFile(record_dir, layout::kMetadataFile, ToPrettyJson(legacy_metadata));
        if (!r.is_ok()) return r;
    }
    return Result::Ok();
}

} // namespace uisync
