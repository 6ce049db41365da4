#pragma once

#include "io/file_store.hpp"
#include "sync/remote_store.hpp"

#include <mutex>
#include <string>

namespace uisync {

// IRemoteStore over a local directory:
//
//   <root>/records.json             array of product models
//   <root>/documents/<id>           stored document bodies
//   <root>/documents/<id>.meta.json name and folder of created documents
//   <root>/folders/<name>/          folders
//
// Like the platform, it removes one base64 layer from a body on write and
// returns the stored text on read.
class DirectoryRemoteStore final : public IRemoteStore {
public:
    explicit DirectoryRemoteStore(std::string root);

    Expected<std::vector<ProductModelRecord>> QueryRecords(const std::vector<std::string>& names) override;
    Expected<std::string> FetchDocumentBody(const std::string& document_id) override;
    Expected<std::optional<DocumentRef>> FetchDocumentByExternalRef(const std::string& ref) override;
    Expected<DocumentRef> CreateDocument(const std::string& folder_id,
                                         const std::string& name,
                                         const std::string& body) override;
    Result UpdateDocument(const std::string& document_id, const std::string& body) override;
    Expected<FolderRef> EnsureFolder(const std::string& name) override;

private:
    std::string DocumentPath(const std::string& document_id) const;
    Result StoreBody(const std::string& document_id, const std::string& body);
    Expected<std::string> NextDocumentId() const;

    std::string root_;
    FileStore files_;
    std::mutex mu_;
};

} // namespace uisync
