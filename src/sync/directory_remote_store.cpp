#include "sync/directory_remote_store.hpp"

#include "codec/base64.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cstdio>
#include <nlohmann/json.hpp>
#include <unordered_set>

namespace uisync {

using json = nlohmann::json;

namespace {

constexpr const char* kRecordsFile = "records.json";
constexpr const char* kDocumentsDir = "documents";
constexpr const char* kFoldersDir = "folders";
constexpr const char* kMetaSuffix = ".meta.json";

bool IsValidDocumentId(const std::string& id) {
    return IsSafePathComponent(id) && id.find(kMetaSuffix) == std::string::npos;
}

} // namespace

DirectoryRemoteStore::DirectoryRemoteStore(std::string root) : root_(TrimTrailingSlash(std::move(root))) {}

std::string DirectoryRemoteStore::DocumentPath(const std::string& document_id) const {
    return JoinPath(JoinPath(root_, kDocumentsDir), document_id);
}

Expected<std::vector<ProductModelRecord>> DirectoryRemoteStore::QueryRecords(const std::vector<std::string>& names) {
    std::lock_guard<std::mutex> lk(mu_);

    const std::string path = JoinPath(root_, kRecordsFile);
    auto text = files_.ReadFile(path);
    if (!text) return std::unexpected(text.error());

    json j;
    try {
        j = json::parse(*text);
    } catch (const json::parse_error& e) {
        return std::unexpected("invalid JSON in " + path + ": " + e.what());
    }
    if (!j.is_array()) return std::unexpected(path + ": root must be JSON array");

    const std::unordered_set<std::string> wanted(names.begin(), names.end());
    std::vector<ProductModelRecord> out;
    for (const auto& entry : j) {
        auto record = ProductModelFromJson(entry);
        if (!record) return std::unexpected(path + ": " + record.error());
        if (!wanted.empty() && !wanted.count(record->name)) continue;
        out.push_back(std::move(*record));
    }
    return out;
}

Expected<std::string> DirectoryRemoteStore::FetchDocumentBody(const std::string& document_id) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!IsValidDocumentId(document_id))
        return std::unexpected("Document not found: '" + document_id + "'");
    const std::string path = DocumentPath(document_id);
    if (!files_.IsRegularFile(path))
        return std::unexpected("Document not found: " + document_id);
    return files_.ReadFile(path);
}

Expected<std::optional<DocumentRef>> DirectoryRemoteStore::FetchDocumentByExternalRef(const std::string& ref) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!IsValidDocumentId(ref) || !files_.IsRegularFile(DocumentPath(ref)))
        return std::optional<DocumentRef>{};
    return std::optional<DocumentRef>{DocumentRef{ref}};
}

Result DirectoryRemoteStore::StoreBody(const std::string& document_id, const std::string& body) {
    // the transport decodes the request body once
    auto stored = Base64Decode(body);
    if (!stored)
        return Result::Fail("document body is not base64: " + stored.error());
    return files_.WriteFile(JoinPath(root_, kDocumentsDir), document_id, *stored);
}

Expected<std::string> DirectoryRemoteStore::NextDocumentId() const {
    const std::string dir = JoinPath(root_, kDocumentsDir);
    for (unsigned n = 1; n < 1000000; ++n) {
        char id[16];
        std::snprintf(id, sizeof(id), "doc%06u", n);
        if (!files_.Exists(JoinPath(dir, id))) return std::string(id);
    }
    return std::unexpected("no free document id in " + dir);
}

Expected<DocumentRef> DirectoryRemoteStore::CreateDocument(const std::string& folder_id,
                                                           const std::string& name,
                                                           const std::string& body) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!files_.IsDirectory(JoinPath(JoinPath(root_, kFoldersDir), folder_id)))
        return std::unexpected("Folder not found: " + folder_id);

    auto id = NextDocumentId();
    if (!id) return std::unexpected(id.error());

    auto r = StoreBody(*id, body);
    if (!r.is_ok()) return std::unexpected(r.msg);

    const json meta = {{"name", name}, {"folderId", folder_id}};
    r = files_.WriteFile(JoinPath(root_, kDocumentsDir), *id + kMetaSuffix, meta.dump(2) + "\n");
    if (!r.is_ok()) return std::unexpected(r.msg);

    LogDebug("DirectoryRemoteStore: created document %s (%s) in %s", id->c_str(), name.c_str(), folder_id.c_str());
    return DocumentRef{*id};
}

Result DirectoryRemoteStore::UpdateDocument(const std::string& document_id, const std::string& body) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!IsValidDocumentId(document_id) || !files_.IsRegularFile(DocumentPath(document_id)))
        return Result::Fail("Document not found: " + document_id);
    return StoreBody(document_id, body);
}

Expected<FolderRef> DirectoryRemoteStore::EnsureFolder(const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!IsSafePathComponent(name))
        return std::unexpected("invalid folder name: '" + name + "'");
    auto r = files_.EnsureDirectory(JoinPath(JoinPath(root_, kFoldersDir), name));
    if (!r.is_ok()) return std::unexpected(r.msg);
    return FolderRef{name, name};
}

} // namespace uisync
