#include "fs/model/DuplicateGroup.hpp"

#include <cmath>
#include <nlohmann/json.hpp>

using namespace fw::fs::model;

std::size_t DuplicatesResult::totalDuplicateFiles() const {
    std::size_t total = 0;
    for (const auto& g : groups) total += g.count();
    return total;
}

uintmax_t DuplicatesResult::totalWastedBytes() const {
    uintmax_t total = 0;
    for (const auto& g : groups) total += g.wasted_bytes;
    return total;
}

void fw::fs::model::to_json(nlohmann::json& j, const DuplicateMember& m) {
    j = m.entry;
    j["path"] = m.path.string();
    j["relative_path"] = m.relative_path.string();
}

void fw::fs::model::to_json(nlohmann::json& j, const DuplicateGroup& g) {
    j = {
        {"hash", g.content_hash},
        {"size", g.representative_size},
        {"count", g.count()},
        {"wasted_bytes", g.wasted_bytes},
        {"files", g.members}
    };
}

void fw::fs::model::to_json(nlohmann::json& j, const UnreadableFile& u) {
    j = {
        {"relative_path", u.relative_path.string()},
        {"reason", u.reason}
    };
}

void fw::fs::model::to_json(nlohmann::json& j, const DuplicatesResult& r) {
    const auto wasted = r.totalWastedBytes();
    j = {
        {"folder_path", r.folder.string()},
        {"recursive", r.recursive},
        {"cancelled", r.cancelled},
        {"files_scanned", r.files_scanned},
        {"duplicates", r.groups},
        {"total_duplicate_groups", r.groups.size()},
        {"total_duplicate_files", r.totalDuplicateFiles()},
        {"wasted_space_bytes", wasted},
        {"wasted_space_mb", std::round(static_cast<double>(wasted) / (1024.0 * 1024.0) * 100.0) / 100.0},
        {"unreadable", r.unreadable}
    };
}
