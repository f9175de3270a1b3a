#pragma once

#include <string>
#include <string_view>

namespace forge {

// Reduce a submitted file name to its last path component. Directory parts
// (including "..") are dropped rather than rejected; names that reduce to
// nothing usable fall back to `fallback`.
inline std::string SanitizeFileName(std::string_view name, std::string_view fallback = "main.c") {
    while (!name.empty() && (name.back() == '/' || name.back() == '\\')) {
        name.remove_suffix(1);
    }
    const auto pos = name.find_last_of("/\\");
    if (pos != std::string_view::npos) {
        name.remove_prefix(pos + 1);
    }
    if (name.empty() || name == "." || name == "..") {
        return std::string(fallback);
    }
    return std::string(name);
}

inline bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool IsHeaderFile(std::string_view name) {
    return EndsWith(name, ".h") || EndsWith(name, ".hpp");
}

} // namespace forge
