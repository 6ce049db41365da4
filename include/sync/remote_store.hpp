#pragma once

#include "sync/product_model.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace uisync {

struct DocumentRef {
    std::string id;
};

struct FolderRef {
    std::string id;
    std::string name;
};

// Remote document store holding product models and their documents.
// Implementations must be safe to call from concurrent record tasks.
class IRemoteStore {
public:
    virtual ~IRemoteStore() = default;

    // Records with the given names; every record when `names` is empty.
    virtual Expected<std::vector<ProductModelRecord>> QueryRecords(const std::vector<std::string>& names) = 0;

    // Body as the transport returns it (one text layer already removed).
    virtual Expected<std::string> FetchDocumentBody(const std::string& document_id) = 0;

    virtual Expected<std::optional<DocumentRef>> FetchDocumentByExternalRef(const std::string& ref) = 0;

    virtual Expected<DocumentRef> CreateDocument(const std::string& folder_id,
                                                 const std::string& name,
                                                 const std::string& body) = 0;
    virtual Result UpdateDocument(const std::string& document_id, const std::string& body) = 0;

    // Get-or-create.
    virtual Expected<FolderRef> EnsureFolder(const std::string& name) = 0;
};

} // namespace uisync
