#pragma once

#include "io/file_store.hpp"
#include "ui/ui_types.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace uisync {

// Rebuilds UI definitions from the source tree written by TreeSerializer.
// Child order always comes from metadata.json, never from directory listing
// order; the listing is only a fallback for element directories without
// metadata, and is sorted.
class TreeBuilder {
public:
    explicit TreeBuilder(const FileStore& files);

    Expected<UiDefinition> BuildUiDefinition(const std::string& dir) const;

    // Entries of <record_dir>/metadata.json with their files inlined again. No
    // metadata file means no legacy definitions.
    Expected<std::vector<LegacyUiDefinition>> BuildLegacyUiDefinitions(const std::string& record_dir) const;

    // Definitions in the order of <record_dir>/definitions.json. Definitions
    // it does not list follow, legacy ones in metadata order, then modern ones
    // by name.
    Expected<std::vector<UiDef>> BuildRecord(const std::string& record_dir) const;

private:
    Expected<UiElement> BuildElement(const std::string& dir) const;
    Expected<nlohmann::json> ReadJsonFile(const std::string& path) const;
    Expected<std::vector<std::string>> ChildNames(const nlohmann::json& meta, const std::string& where) const;
    Result ApplyDefinitionOrder(std::vector<UiDef>& defs, const std::string& record_dir) const;
    Result InlineSectionFiles(nlohmann::json& section, const std::string& record_dir) const;
    std::string ResolveUrl(const std::string& record_dir, const std::string& url) const;

    const FileStore& files_;
};

} // namespace uisync
