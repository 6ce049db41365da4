#include "sync/product_model.hpp"

#include "util/path_utils.hpp"

namespace uisync {

using json = nlohmann::json;

namespace {

bool GetString(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return true;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

} // namespace

Expected<ProductModelRecord> ProductModelFromJson(const json& j) {
    if (!j.is_object())
        return std::unexpected("product model must be an object");

    ProductModelRecord r;
    const std::pair<const char*, std::string*> fields[] = {
        {"id", &r.id},
        {"name", &r.name},
        {"contentId", &r.content_id},
        {"version", &r.version},
        {"referenceId", &r.reference_id},
        {"uiDefinitionsId", &r.ui_definitions_id},
    };
    for (const auto& [key, out] : fields) {
        if (!GetString(j, key, *out))
            return std::unexpected(std::string("product model '") + key + "' must be a string");
    }

    if (r.id.empty())
        return std::unexpected("product model has no id");
    if (!IsSafePathComponent(r.name))
        return std::unexpected("product model " + r.id + " has no usable name: '" + r.name + "'");
    return r;
}

json ProductModelIdentityJson(const ProductModelRecord& record) {
    return json{
        {"id", record.id},
        {"name", record.name},
        {"contentId", record.content_id},
        {"version", record.version},
        {"referenceId", record.reference_id},
    };
}

json ProductModelToJson(const ProductModelRecord& record) {
    json j = ProductModelIdentityJson(record);
    j["uiDefinitionsId"] = record.ui_definitions_id;
    return j;
}

} // namespace uisync
