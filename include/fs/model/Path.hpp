#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <string>
#include <utility>

namespace fw::fs::model {

/// Component-wise containment check on already-normalized absolute paths.
/// A path is considered inside itself; "/a/bc" is not inside "/a/b".
inline bool isWithin(const std::filesystem::path& path, const std::filesystem::path& root) {
    auto pit = path.begin();
    for (auto rit = root.begin(); rit != root.end(); ++rit, ++pit) {
        if (rit->empty()) continue; // trailing separator yields an empty element
        if (pit == path.end() || *pit != *rit) return false;
    }
    return true;
}

inline std::string toLower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string toUpper(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

inline bool isHidden(const std::string& name) { return !name.empty() && name.front() == '.'; }

/// True for a plain file name: non-empty, no separator, not "." or "..".
inline bool isSingleComponent(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

/// Splits "stem.ext" at the last dot. A leading dot (".bashrc") or a trailing
/// dot ("notes.") does not start an extension. The extension keeps its dot.
inline std::pair<std::string, std::string> splitExtension(const std::string& name) {
    const auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) return {name, ""};
    return {name.substr(0, dot), name.substr(dot)};
}

inline std::time_t toTimeT(const std::filesystem::file_time_type ft) {
    const auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(std::chrono::file_clock::to_sys(ft));
    return std::chrono::system_clock::to_time_t(sys);
}

inline std::filesystem::path relativeTo(const std::filesystem::path& path, const std::filesystem::path& base) {
    auto rel = path.lexically_relative(base);
    if (rel.empty()) return ".";
    return rel;
}

}
