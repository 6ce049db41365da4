#include "io/file_store.hpp"

#include "io/fd.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace uisync {

namespace fs = std::filesystem;

namespace {

std::string ErrnoText() {
    return std::string(std::strerror(errno));
}

Result WriteAll(const Fd& fd, std::string_view in, const std::string& path) {
    size_t rem = in.size();
    const char* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return Result::Fail(errno, "Write failed: " + path + " (" + ErrnoText() + ")");
    }

    return Result::Ok();
}

} // namespace

Result FileStore::EnsureDirectory(const std::string& dir) const {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "create_directories failed: " + dir + ": " + ec.message());
    }
    if (!fs::is_directory(dir, ec)) {
        return Result::Fail(-1, "not a directory: " + dir);
    }
    return Result::Ok();
}

Result FileStore::WriteFile(const std::string& dir,
                            const std::string& name,
                            std::string_view content) const {
    auto dir_res = EnsureDirectory(dir);
    if (!dir_res.is_ok()) return dir_res;

    const std::string path = JoinPath(dir, name);
    Fd fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.Valid()) {
        return Result::Fail(errno, "Failed to open output: " + path + " (" + ErrnoText() + ")");
    }

    auto write_res = WriteAll(fd, content, path);
    if (!write_res.is_ok()) return write_res;

    auto close_res = fd.CloseChecked();
    if (!close_res.is_ok()) {
        return Result::Fail(close_res.err, path + ": " + close_res.msg);
    }
    return Result::Ok();
}

Expected<std::string> FileStore::ReadFile(const std::string& path) const {
    Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) {
        return std::unexpected("Failed to open input: " + path + " (" + ErrnoText() + ")");
    }

    std::string out;
    struct stat st{};
    if (::fstat(fd.Get(), &st) == 0 && st.st_size > 0) {
        out.reserve(static_cast<size_t>(st.st_size));
    }

    char buf[64 * 1024];
    while (true) {
        ssize_t n = ::read(fd.Get(), buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) break;
        if (errno == EINTR) continue;
        return std::unexpected("Read failed: " + path + " (" + ErrnoText() + ")");
    }
    return out;
}

bool FileStore::Exists(const std::string& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool FileStore::IsDirectory(const std::string& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool FileStore::IsRegularFile(const std::string& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

Expected<std::vector<std::string>> FileStore::ListDirectories(const std::string& dir) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return std::unexpected("cannot list " + dir + ": " + ec.message());
    }

    std::vector<std::string> names;
    for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        return std::unexpected("cannot list " + dir + ": " + ec.message());
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace uisync
