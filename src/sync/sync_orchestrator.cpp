#include "sync/sync_orchestrator.hpp"

#include "codec/content_codec.hpp"
#include "ui/tree_builder.hpp"
#include "ui/ui_types.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <future>
#include <utility>

namespace uisync {

namespace {

RecordOutcome Outcome(const ProductModelRecord& record, RecordStatus status, std::string message = {}) {
    RecordOutcome o;
    o.record = record.name;
    o.status = status;
    o.message = std::move(message);
    return o;
}

// One task per record; every future is joined before returning. Exceptions
// escaping a task become a Failed outcome of that record.
template <typename Task>
SyncReport RunPerRecord(const std::vector<ProductModelRecord>& records, Task task) {
    std::vector<std::future<RecordOutcome>> futures;
    futures.reserve(records.size());
    for (const auto& record : records) {
        futures.push_back(std::async(std::launch::async, [&task, &record]() {
            try {
                return task(record);
            } catch (const std::exception& e) {
                return Outcome(record, RecordStatus::Failed, std::string("unexpected error: ") + e.what());
            }
        }));
    }

    SyncReport report;
    report.outcomes.reserve(futures.size());
    for (auto& f : futures) {
        report.outcomes.push_back(f.get());
    }
    return report;
}

void LogReport(const char* what, const SyncReport& report) {
    LogInfo("%s: done ok=%zu skipped=%zu failed=%zu", what,
            report.Count(RecordStatus::Ok),
            report.Count(RecordStatus::Skipped),
            report.Count(RecordStatus::Failed));
    for (const auto& o : report.outcomes) {
        if (o.status == RecordStatus::Failed) {
            LogError("%s: model=%s failed: %s", what, o.record.c_str(), o.message.c_str());
        }
    }
}

std::string DescribeModels(const std::vector<std::string>& names) {
    if (names.empty()) return "All";
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ',';
        out += n;
    }
    return out;
}

} // namespace

const char* ToString(RecordStatus status) {
    switch (status) {
        case RecordStatus::Ok:      return "ok";
        case RecordStatus::Skipped: return "skipped";
        case RecordStatus::Failed:  return "failed";
    }
    return "unknown";
}

std::size_t SyncReport::Count(RecordStatus status) const {
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [status](const RecordOutcome& o) { return o.status == status; }));
}

std::vector<std::string> SyncReport::FailedRecords() const {
    std::vector<std::string> names;
    for (const auto& o : outcomes) {
        if (o.status == RecordStatus::Failed) names.push_back(o.record);
    }
    return names;
}

SyncOrchestrator::SyncOrchestrator(IRemoteStore& store, const FileStore& files, SyncOptions options)
    : store_(store), files_(files), options_(std::move(options)) {
    options_.source_path = TrimTrailingSlash(options_.source_path);
}

std::string SyncOrchestrator::RecordDir(const ProductModelRecord& record) const {
    return JoinPath(options_.source_path, record.name);
}

Expected<SyncReport> SyncOrchestrator::Pull(const MemberFilter& filter) {
    const auto names = filter.ModelNames();
    LogInfo("Pull: models=%s", DescribeModels(names).c_str());

    auto records = store_.QueryRecords(names);
    if (!records) return std::unexpected("cannot query product models: " + records.error());
    LogInfo("Pull: %zu product model(s) found", records->size());

    SyncReport report = RunPerRecord(*records, [this, &filter](const ProductModelRecord& record) {
        return PullRecord(record, filter);
    });
    LogReport("Pull", report);
    return report;
}

RecordOutcome SyncOrchestrator::PullRecord(const ProductModelRecord& record, const MemberFilter& filter) const {
    const bool want_ui = filter.IncludesRecord(MemberKind::Ui, record.name);
    const bool want_pml = filter.IncludesRecord(MemberKind::Pml, record.name);
    if (!want_ui && !want_pml) {
        return Outcome(record, RecordStatus::Skipped, "not selected");
    }

    const std::string record_dir = RecordDir(record);
    RecordOutcome outcome = Outcome(record, RecordStatus::Ok);
    bool did_work = false;
    std::vector<std::string> errors;

    // the two documents are independent: one failing does not stop the other
    if (want_pml) {
        if (record.content_id.empty()) {
            LogDebug("Pull: model=%s has no PML content", record.name.c_str());
        } else {
            auto r = PullPml(record, record_dir);
            if (r.is_ok()) {
                did_work = true;
            } else {
                errors.push_back("pml: " + r.msg);
            }
        }
    }

    if (want_ui) {
        if (record.ui_definitions_id.empty()) {
            LogDebug("Pull: model=%s has no UI definitions", record.name.c_str());
        } else {
            auto r = PullUiDefinitions(record, filter, record_dir, outcome.stats);
            if (r.is_ok()) {
                did_work = true;
            } else {
                errors.push_back("ui: " + r.msg);
            }
        }
    }

    if (!errors.empty()) {
        outcome.status = RecordStatus::Failed;
        for (const auto& e : errors) {
            if (!outcome.message.empty()) outcome.message += "; ";
            outcome.message += e;
        }
    } else if (!did_work) {
        outcome.status = RecordStatus::Skipped;
        outcome.message = "nothing to pull";
    }
    return outcome;
}

Result SyncOrchestrator::PullPml(const ProductModelRecord& record, const std::string& record_dir) const {
    auto body = store_.FetchDocumentBody(record.content_id);
    if (!body) return Result::Fail("cannot fetch document " + record.content_id + ": " + body.error());

    auto pml = ContentCodec::Decode(*body);
    if (!pml) return Result::Fail("cannot decode document " + record.content_id + ": " + pml.error());

    auto r = files_.WriteFile(record_dir, record.name + ".pml", *pml);
    if (!r.is_ok()) return r;
    r = files_.WriteFile(record_dir, record.name + ".pml.json", ToPrettyJson(ProductModelIdentityJson(record)));
    if (!r.is_ok()) return r;

    LogInfo("Pull: model=%s pml bytes=%zu", record.name.c_str(), pml->size());
    return Result::Ok();
}

Result SyncOrchestrator::PullUiDefinitions(const ProductModelRecord& record,
                                           const MemberFilter& filter,
                                           const std::string& record_dir,
                                           SerializeStats& stats) const {
    auto body = store_.FetchDocumentBody(record.ui_definitions_id);
    if (!body) return Result::Fail("cannot fetch document " + record.ui_definitions_id + ": " + body.error());

    auto text = ContentCodec::Decode(*body);
    if (!text) return Result::Fail("cannot decode document " + record.ui_definitions_id + ": " + text.error());

    auto defs = ParseUiDefsDocument(*text);
    if (!defs) return Result::Fail(defs.error());

    const std::string& model = record.name;
    DefinitionFilter keep = [&filter, &model](const std::string& def) {
        return filter.IncludesDefinition(model, def);
    };

    auto r = TreeSerializer(files_).SaveRecord(*defs, record_dir, keep, stats);
    if (!r.is_ok()) return r;

    LogInfo("Pull: model=%s definitions=%zu legacy=%zu elements=%zu sections=%zu skipped=%zu",
            record.name.c_str(), stats.definitions, stats.legacy_definitions,
            stats.elements, stats.sections, stats.skipped_definitions + stats.skipped_elements);
    return Result::Ok();
}

Expected<SyncReport> SyncOrchestrator::Push(const MemberFilter& filter) {
    // only the model part of a member applies to push
    for (const auto& m : filter.Members()) {
        if (m.definition) {
            LogWarn("Push: definition '%s' of model %s ignored, the whole record is pushed",
                    m.definition->c_str(), m.model.c_str());
        }
    }

    std::vector<std::string> names;
    for (const auto& m : filter.Members()) {
        if (static_cast<unsigned>(m.kind) & static_cast<unsigned>(MemberKind::Ui)) {
            if (std::find(names.begin(), names.end(), m.model) == names.end()) names.push_back(m.model);
        }
    }
    if (!filter.Empty() && names.empty()) {
        LogInfo("Push: no UI members selected");
        return SyncReport{};
    }
    LogInfo("Push: models=%s", DescribeModels(names).c_str());

    auto records = store_.QueryRecords(names);
    if (!records) return std::unexpected("cannot query product models: " + records.error());
    LogInfo("Push: %zu product model(s) found", records->size());

    auto folder = store_.EnsureFolder(options_.folder_name);
    if (!folder) return std::unexpected("cannot resolve folder " + options_.folder_name + ": " + folder.error());

    const FolderRef folder_ref = *folder;
    SyncReport report = RunPerRecord(*records, [this, &folder_ref](const ProductModelRecord& record) {
        return PushRecord(record, folder_ref);
    });
    LogReport("Push", report);
    return report;
}

RecordOutcome SyncOrchestrator::PushRecord(const ProductModelRecord& record, const FolderRef& folder) const {
    const std::string record_dir = RecordDir(record);
    if (!files_.IsDirectory(record_dir)) {
        LogDebug("Push: model=%s has no directory %s", record.name.c_str(), record_dir.c_str());
        return Outcome(record, RecordStatus::Skipped, "no source directory");
    }

    auto defs = TreeBuilder(files_).BuildRecord(record_dir);
    if (!defs) return Outcome(record, RecordStatus::Failed, defs.error());

    const std::string plain = UiDefsToJson(*defs).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    auto body = ContentCodec::Encode(plain);
    if (!body) return Outcome(record, RecordStatus::Failed, "cannot encode: " + body.error());

    auto existing = store_.FetchDocumentByExternalRef(record.ui_definitions_id);
    if (!existing) return Outcome(record, RecordStatus::Failed, existing.error());

    RecordOutcome outcome = Outcome(record, RecordStatus::Ok);
    outcome.stats.definitions = defs->size();

    if (*existing) {
        auto r = store_.UpdateDocument((*existing)->id, *body);
        if (!r.is_ok()) return Outcome(record, RecordStatus::Failed, r.msg);
        outcome.message = "updated " + (*existing)->id;
    } else {
        auto created = store_.CreateDocument(folder.id, record.name, *body);
        if (!created) return Outcome(record, RecordStatus::Failed, created.error());
        outcome.message = "created " + created->id;
    }

    LogInfo("Push: model=%s definitions=%zu %s", record.name.c_str(), defs->size(), outcome.message.c_str());
    return outcome;
}

} // namespace uisync
