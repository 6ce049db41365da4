#pragma once

#include "io/file_store.hpp"
#include "ui/ui_types.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace uisync {

struct SerializeStats {
    std::size_t definitions = 0;          // modern and legacy definitions written
    std::size_t legacy_definitions = 0;
    std::size_t filtered_definitions = 0; // excluded by the definition filter
    std::size_t skipped_definitions = 0;  // unrecognized shape or write failure
    std::size_t elements = 0;
    std::size_t skipped_elements = 0;     // no derivable name, subtree not written
    std::size_t sections = 0;
    std::size_t dropped_sections = 0;     // not reachable from a tab root

    void Add(const SerializeStats& other);
};

// Returns true for definition names that should be written.
using DefinitionFilter = std::function<bool(const std::string& definition_name)>;

// Writes UI definitions as a source tree.
//
// Modern definition <dir>:
//   <dir>/metadata.json                 attributes + ordered child names
//   <dir>/<element>/script.ts           decoded script (names the element)
//   <dir>/<element>/styles.css          when present
//   <dir>/<element>/template.html       when present
//   <dir>/<element>/metadata.json       other fields + ordered child names
//
// Legacy definitions of a record <record>:
//   <record>/<def>/<tab>/<label>/.../<label>/<label>.{js,css,html,json}
//   <record>/metadata.json              all legacy definitions of the record,
//                                       blobs replaced by record-relative URLs
//
// Every record gets <record>/definitions.json, the definition names in
// document order.
class TreeSerializer {
public:
    explicit TreeSerializer(const FileStore& files);

    Result SaveUiDefinition(const UiDefinition& def, const std::string& dir, SerializeStats& stats) const;

    // Writes the definition's files under <record_dir>/<def.name> and appends its
    // metadata entry to `legacy_metadata` (a JSON array).
    Result SaveLegacyUiDefinition(const LegacyUiDefinition& def,
                                  const std::string& record_dir,
                                  nlohmann::json& legacy_metadata,
                                  SerializeStats& stats) const;

    // Entries of a parsed UI-definitions document. An entry with an unrecognized
    // shape is skipped; the other entries are still written.
    Result SaveRecord(const nlohmann::json& defs,
                      const std::string& record_dir,
                      const DefinitionFilter& filter,
                      SerializeStats& stats) const;

    Result SaveRecord(const std::vector<UiDef>& defs,
                      const std::string& record_dir,
                      const DefinitionFilter& filter,
                      SerializeStats& stats) const;

private:
    // Returns the element's name, std::nullopt when it was skipped. `taken`
    // holds the names already used by its siblings.
    Expected<std::optional<std::string>> SaveElement(const UiElement& el,
                                                     const std::string& parent_dir,
                                                     std::unordered_set<std::string>& taken,
                                                     SerializeStats& stats) const;

    Result SaveDefinition(const UiDef& def,
                          const std::string& record_dir,
                          nlohmann::json& legacy_metadata,
                          SerializeStats& stats) const;

    const FileStore& files_;
};

} // namespace uisync
