#pragma once

#include "fs/model/Entry.hpp"

#include <filesystem>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fw::fs::model {

struct ListResult {
    std::filesystem::path folder;          // resolved absolute path
    std::filesystem::path relative_path;   // relative to the root that contains it
    std::filesystem::path allowed_root;
    std::vector<Entry> items;              // sorted by name, hidden entries excluded
    std::size_t skipped{0};                // entries dropped because they could not be read

    [[nodiscard]] std::size_t totalCount() const { return items.size(); }
};

void to_json(nlohmann::json& j, const ListResult& r);

}
