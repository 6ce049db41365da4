#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace uisync {

// Literal properties of the decorator that declares an element, e.g.
//
//   @ElementDefinition({ name: 'Header', type: 'REGION' })
//   export class Script extends ElementRuntime { ... }
struct ElementMetadata {
    std::string decorator;
    std::string name;
    // Other top-level literal properties: strings unquoted, numbers and
    // booleans as written.
    std::map<std::string, std::string> properties;
};

// Returns the first decorator that precedes a class and declares a non-empty
// string `name`; std::nullopt when there is none.
std::optional<ElementMetadata> ExtractElementMetadata(std::string_view script);

std::optional<std::string> ExtractElementName(std::string_view script);

} // namespace uisync
