#pragma once

#include "fs/model/Entry.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fw::plan::model {

// needs_change == false implies current_name == proposed_name.
struct RenameItem {
    std::string current_name{}, proposed_name{}, reason{};
    bool needs_change{true};
    fs::model::EntryKind kind{fs::model::EntryKind::File};
};

struct PlanResult {
    std::filesystem::path folder;
    std::vector<RenameItem> items;

    [[nodiscard]] std::size_t changesCount() const;
    [[nodiscard]] bool needsChanges() const { return changesCount() > 0; }
};

void to_json(nlohmann::json& j, const RenameItem& item);
void from_json(const nlohmann::json& j, RenameItem& item);
void to_json(nlohmann::json& j, const PlanResult& plan);

}
