#pragma once

#include <string>
#include <string_view>

namespace uisync {

// "source/" -> "source"; a lone "/" is kept.
inline std::string TrimTrailingSlash(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

inline std::string JoinPath(std::string_view dir, std::string_view name) {
    if (dir.empty()) return std::string(name);
    if (name.empty()) return std::string(dir);
    std::string out(dir);
    if (out.back() != '/') out.push_back('/');
    out.append(name);
    return out;
}

// A name used as a single directory or file name component.
inline bool IsSafePathComponent(std::string_view s) {
    if (s.empty() || s == "." || s == "..") return false;
    return s.find('/') == std::string_view::npos && s.find('\0') == std::string_view::npos;
}

// Normalize a relative path stored in metadata:
// - strip leading "./"
// - collapse duplicate slashes
inline std::string NormalizeRelativePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

} // namespace uisync
