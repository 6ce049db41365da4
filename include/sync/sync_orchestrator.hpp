#pragma once

#include "io/file_store.hpp"
#include "sync/member_filter.hpp"
#include "sync/product_model.hpp"
#include "sync/remote_store.hpp"
#include "ui/tree_serializer.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace uisync {

struct SyncOptions {
    std::string source_path = "source";
    std::string folder_name = "velo_product_models";
};

enum class RecordStatus {
    Ok,
    Skipped,
    Failed,
};

const char* ToString(RecordStatus status);

struct RecordOutcome {
    std::string record;
    RecordStatus status = RecordStatus::Ok;
    std::string message;
    SerializeStats stats;
};

struct SyncReport {
    std::vector<RecordOutcome> outcomes;  // in record query order

    std::size_t Count(RecordStatus status) const;
    bool HasFailures() const { return Count(RecordStatus::Failed) > 0; }
    std::vector<std::string> FailedRecords() const;
};

// Runs pull and push over the records selected by a MemberFilter. Each record
// is handled by its own task; a failing record never stops the others.
class SyncOrchestrator {
public:
    SyncOrchestrator(IRemoteStore& store, const FileStore& files, SyncOptions options);

    // Remote -> <source>/<record>/...
    Expected<SyncReport> Pull(const MemberFilter& filter);

    // <source>/<record>/... -> remote UI definitions documents.
    Expected<SyncReport> Push(const MemberFilter& filter);

private:
    RecordOutcome PullRecord(const ProductModelRecord& record, const MemberFilter& filter) const;
    Result PullUiDefinitions(const ProductModelRecord& record,
                             const MemberFilter& filter,
                             const std::string& record_dir,
                             SerializeStats& stats) const;
    Result PullPml(const ProductModelRecord& record, const std::string& record_dir) const;

    RecordOutcome PushRecord(const ProductModelRecord& record, const FolderRef& folder) const;

    std::string RecordDir(const ProductModelRecord& record) const;

    IRemoteStore& store_;
    const FileStore& files_;
    SyncOptions options_;
};

} // namespace uisync
