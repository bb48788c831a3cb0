#pragma once

#include <string>
#include <string_view>

namespace hotswap {

// Normalize archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
// - drop a trailing slash (directory entries)
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
    if (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

// First path segment of a normalized relative path ("" for an empty path).
inline std::string_view FirstSegment(std::string_view rel) {
    const auto pos = rel.find('/');
    return pos == std::string_view::npos ? rel : rel.substr(0, pos);
}

inline bool StartsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace hotswap
