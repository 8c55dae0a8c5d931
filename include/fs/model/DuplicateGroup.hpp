#pragma once

#include "fs/model/Entry.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fw::fs::model {

struct DuplicateMember {
    Entry entry;
    std::filesystem::path path;            // absolute, sandbox-resolved
    std::filesystem::path relative_path;   // relative to the scanned folder
};

// Every member has byte-identical content (same BLAKE2b digest).
struct DuplicateGroup {
    std::string content_hash;
    uintmax_t representative_size{0};
    std::vector<DuplicateMember> members;
    uintmax_t wasted_bytes{0};   // representative_size * (members - 1)

    [[nodiscard]] std::size_t count() const { return members.size(); }
};

struct UnreadableFile {
    std::filesystem::path relative_path;
    std::string reason;
};

struct DuplicatesResult {
    std::filesystem::path folder;
    bool recursive{false};
    bool cancelled{false};
    std::size_t files_scanned{0};
    std::vector<DuplicateGroup> groups;
    std::vector<UnreadableFile> unreadable;

    [[nodiscard]] std::size_t totalDuplicateFiles() const;
    [[nodiscard]] uintmax_t totalWastedBytes() const;
};

void to_json(nlohmann::json& j, const DuplicateMember& m);
void to_json(nlohmann::json& j, const DuplicateGroup& g);
void to_json(nlohmann::json& j, const UnreadableFile& u);
void to_json(nlohmann::json& j, const DuplicatesResult& r);

}
