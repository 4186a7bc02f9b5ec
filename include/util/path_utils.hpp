#pragma once

#include <string>
#include <string_view>

namespace rbp {

// Normalize an archive member path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

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

// Relative, no "..", no backslashes.
inline bool IsSafeRelativePath(std::string_view p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;
    if (p.find('\\') != std::string_view::npos) return false;

    while (!p.empty()) {
        while (!p.empty() && p.front() == '/') p.remove_prefix(1);
        const auto pos = p.find('/');
        const auto seg = p.substr(0, pos);
        if (seg == "..") return false;
        if (pos == std::string_view::npos) break;
        p.remove_prefix(pos);
    }
    return true;
}

// Last path component; empty for "" or a path ending in '/'.
inline std::string FileNameOf(std::string_view p) {
    const auto pos = p.find_last_of('/');
    if (pos == std::string_view::npos) return std::string(p);
    return std::string(p.substr(pos + 1));
}

} // namespace rbp
