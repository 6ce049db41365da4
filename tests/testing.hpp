#pragma once

#include "codec/base64.hpp"
#include "codec/content_codec.hpp"
#include "sync/remote_store.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/uisync_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        // Best-effort cleanup. Keep it simple: rely on "rm -rf".
        if (!path_.empty()) {
            std::string cmd = "rm -rf '" + path_ + "'";
            (void)::system(cmd.c_str());
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

    std::string operator/(const std::string& rel) const { return uisync::JoinPath(path_, rel); }

  private:
    std::string path_;
};

inline bool PathExists(const std::string& path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0;
}

inline std::string ReadFileOrEmpty(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return {};
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline nlohmann::json ReadJson(const std::string& path) {
    return nlohmann::json::parse(ReadFileOrEmpty(path));
}

inline void MakeDirs(const std::string& path) {
    std::string cmd = "mkdir -p '" + path + "'";
    if (::system(cmd.c_str()) != 0) {
        throw std::runtime_error("mkdir -p failed: " + path);
    }
}

inline void WriteText(const std::string& dir, const std::string& name, const std::string& content) {
    MakeDirs(dir);
    std::ofstream out(uisync::JoinPath(dir, name), std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot write " + uisync::JoinPath(dir, name));
    }
    out << content;
}

// Script declaring an element the way element scripts do.
inline std::string ElementScript(const std::string& name, const std::string& extra_props = "") {
    return "import { ElementDefinition, ElementRuntime } from '@veloce/elements';\n"
           "\n"
           "@ElementDefinition({\n"
           "  name: '" + name + "',\n" +
           (extra_props.empty() ? std::string() : "  " + extra_props + ",\n") +
           "})\n"
           "export class Script extends ElementRuntime {}\n";
}

inline std::string B64(const std::string& s) {
    return uisync::Base64Encode(s);
}

// Element JSON as stored remotely: base64 blobs, nested children.
inline nlohmann::json ElementJson(const std::string& name,
                                  const std::vector<nlohmann::json>& children = {},
                                  const std::string& styles = "",
                                  const std::string& html = "") {
    nlohmann::json el = {{"script", B64(ElementScript(name))}, {"type", "REGION"}};
    if (!styles.empty()) el["styles"] = B64(styles);
    if (!html.empty()) el["template"] = B64(html);
    el["children"] = children;
    return el;
}

// Body as the platform returns it for a document written with
// ContentCodec::Encode: one base64 layer stripped.
inline std::string StoredBody(const std::string& plain) {
    auto wire = uisync::ContentCodec::Encode(plain);
    if (!wire) {
        throw std::runtime_error(wire.error());
    }
    auto stored = uisync::Base64Decode(*wire);
    if (!stored) {
        throw std::runtime_error(stored.error());
    }
    return *stored;
}

// In-memory IRemoteStore. Stores bodies with one base64 layer removed, like
// the platform, and counts calls.
class FakeRemoteStore final : public uisync::IRemoteStore {
  public:
    std::vector<uisync::ProductModelRecord> records;
    std::map<std::string, std::string> documents;  // id -> stored body
    std::map<std::string, std::string> created;    // id -> name
    std::vector<std::string> folders;
    bool fail_query = false;
    int ensure_folder_calls = 0;
    int update_calls = 0;

    uisync::Expected<std::vector<uisync::ProductModelRecord>>
    QueryRecords(const std::vector<std::string>& names) override {
        std::lock_guard<std::mutex> lk(mu_);
        if (fail_query) return std::unexpected(std::string("query refused"));
        std::vector<uisync::ProductModelRecord> out;
        for (const auto& r : records) {
            if (names.empty() || std::find(names.begin(), names.end(), r.name) != names.end()) {
                out.push_back(r);
            }
        }
        return out;
    }

    uisync::Expected<std::string> FetchDocumentBody(const std::string& id) override {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = documents.find(id);
        if (it == documents.end()) return std::unexpected("Document not found: " + id);
        return it->second;
    }

    uisync::Expected<std::optional<uisync::DocumentRef>>
    FetchDocumentByExternalRef(const std::string& ref) override {
        std::lock_guard<std::mutex> lk(mu_);
        if (!documents.count(ref)) return std::optional<uisync::DocumentRef>{};
        return std::optional<uisync::DocumentRef>{uisync::DocumentRef{ref}};
    }

    uisync::Expected<uisync::DocumentRef> CreateDocument(const std::string& folder_id,
                                                         const std::string& name,
                                                         const std::string& body) override {
        std::lock_guard<std::mutex> lk(mu_);
        if (std::find(folders.begin(), folders.end(), folder_id) == folders.end())
            return std::unexpected("Folder not found: " + folder_id);
        auto stored = uisync::Base64Decode(body);
        if (!stored) return std::unexpected(stored.error());
        const std::string id = "new-" + name;
        documents[id] = *stored;
        created[id] = name;
        return uisync::DocumentRef{id};
    }

    uisync::Result UpdateDocument(const std::string& id, const std::string& body) override {
        std::lock_guard<std::mutex> lk(mu_);
        if (!documents.count(id)) return uisync::Result::Fail("Document not found: " + id);
        auto stored = uisync::Base64Decode(body);
        if (!stored) return uisync::Result::Fail(stored.error());
        documents[id] = *stored;
        ++update_calls;
        return uisync::Result::Ok();
    }

    uisync::Expected<uisync::FolderRef> EnsureFolder(const std::string& name) override {
        std::lock_guard<std::mutex> lk(mu_);
        ++ensure_folder_calls;
        if (std::find(folders.begin(), folders.end(), name) == folders.end()) folders.push_back(name);
        return uisync::FolderRef{name, name};
    }

  private:
    std::mutex mu_;
};

inline uisync::ProductModelRecord Record(const std::string& name,
                                         const std::string& ui_doc,
                                         const std::string& content_doc = "") {
    uisync::ProductModelRecord r;
    r.id = "id-" + name;
    r.name = name;
    r.ui_definitions_id = ui_doc;
    r.content_id = content_doc;
    r.version = "1";
    return r;
}

} // namespace testutil
