#pragma once

// File names used in a record's source tree.
namespace uisync::layout {

constexpr const char* kMetadataFile = "metadata.json";

// record directory: definition names in document order
constexpr const char* kDefinitionsFile = "definitions.json";

// modern element directory
constexpr const char* kScriptFile = "script.ts";
constexpr const char* kStylesFile = "styles.css";
constexpr const char* kTemplateFile = "template.html";

// legacy section files: <label><ext>
constexpr const char* kLegacyScriptExt = ".js";
constexpr const char* kLegacyStylesExt = ".css";
constexpr const char* kLegacyTemplateExt = ".html";
constexpr const char* kLegacyPropertiesExt = ".json";

// legacy section metadata keys replacing the inline blobs
constexpr const char* kScriptUrl = "scriptUrl";
constexpr const char* kStylesUrl = "stylesUrl";
constexpr const char* kTemplateUrl = "templateUrl";
constexpr const char* kPropertiesUrl = "propertiesUrl";

} // namespace uisync::layout
