#pragma once

#include "plan/model/ExecutionResult.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fw::plan::model {

inline constexpr auto NO_EXTENSION_FOLDER = "NO_EXTENSION";

struct MoveProposal {
    std::string file{};
    std::filesystem::path current_path{}, target_path{};
    std::string target_folder{}, reason{};
};

struct OrganizeByTypeResult : PlanExecutionResult {
    std::vector<MoveProposal> plan;
    std::vector<std::filesystem::path> created_folders;   // would-be folders on a dry run

    [[nodiscard]] std::vector<std::string> targetFolders() const;
};

void to_json(nlohmann::json& j, const MoveProposal& p);
void to_json(nlohmann::json& j, const OrganizeByTypeResult& r);

}
