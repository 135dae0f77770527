#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace relay {

// Normalize an archive entry path to a clean relative form:
// - backslashes become slashes
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeArchivePath(std::string s) {
    for (char& c : s) {
        if (c == '\\') c = '/';
    }
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

// Last path segment, ignoring a trailing slash.
inline std::string_view LastSegment(std::string_view p) {
    while (!p.empty() && p.back() == '/') p.remove_suffix(1);
    const auto pos = p.rfind('/');
    return pos == std::string_view::npos ? p : p.substr(pos + 1);
}

// "a.tar.gz" -> {"a.tar", ".gz"}; dotfiles keep their name as stem.
inline std::pair<std::string, std::string> SplitExtension(std::string_view name) {
    const auto pos = name.rfind('.');
    if (pos == std::string_view::npos || pos == 0) return {std::string(name), std::string()};
    return {std::string(name.substr(0, pos)), std::string(name.substr(pos))};
}

} // namespace relay
