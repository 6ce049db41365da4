#pragma once

#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace uisync {

// One product model: the unit of synchronization. `name` is the record's
// directory name under the source path.
struct ProductModelRecord {
    std::string id;
    std::string name;
    std::string content_id;         // PML content document
    std::string version;
    std::string reference_id;
    std::string ui_definitions_id;  // UI definitions document
};

Expected<ProductModelRecord> ProductModelFromJson(const nlohmann::json& j);

// Identity written next to the pulled PML (no document references besides
// the content id).
nlohmann::json ProductModelIdentityJson(const ProductModelRecord& record);

nlohmann::json ProductModelToJson(const ProductModelRecord& record);

} // namespace uisync
