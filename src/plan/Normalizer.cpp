#include "plan/Normalizer.hpp"
#include "fs/model/Path.hpp"

#include <cctype>

using namespace fw::fs::model;

namespace {

std::string normalizeStem(const std::string& stem) {
    std::string out;
    out.reserve(stem.size());

    for (const unsigned char c : stem) {
        const char mapped = std::isspace(c) || c == '-' ? '_' : static_cast<char>(std::tolower(c));
        if (mapped == '_' && (out.empty() || out.back() == '_')) continue;
        out.push_back(mapped);
    }

    while (!out.empty() && out.back() == '_') out.pop_back();

    if (out.empty() || out.front() == '.') return stem;
    return out;
}

}

std::string fw::plan::normalizeName(const std::string& name, const EntryKind kind) {
    if (kind == EntryKind::Directory) return normalizeStem(name);
    const auto [stem, ext] = splitExtension(name);
    return normalizeStem(stem) + toLower(ext);
}
