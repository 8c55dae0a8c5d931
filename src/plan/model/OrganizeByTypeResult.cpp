#include "plan/model/OrganizeByTypeResult.hpp"

#include <set>
#include <nlohmann/json.hpp>

using namespace fw::plan::model;

std::vector<std::string> OrganizeByTypeResult::targetFolders() const {
    std::set<std::string> folders;
    for (const auto& p : plan) folders.insert(p.target_folder);
    return {folders.begin(), folders.end()};
}

void fw::plan::model::to_json(nlohmann::json& j, const MoveProposal& p) {
    j = {
        {"file", p.file},
        {"current_path", p.current_path.string()},
        {"target_folder", p.target_folder},
        {"target_path", p.target_path.string()},
        {"action", "move"},
        {"reason", p.reason}
    };
}

void fw::plan::model::to_json(nlohmann::json& j, const OrganizeByTypeResult& r) {
    to_json(j, static_cast<const PlanExecutionResult&>(r));

    std::vector<std::string> created;
    created.reserve(r.created_folders.size());
    for (const auto& f : r.created_folders) created.push_back(f.string());

    j["plan"] = r.plan;
    j["created_folders"] = created;
    j["summary"] = {
        {"total_files_considered", r.plan.size()},
        {"files_moved", r.applied.size()},
        {"files_skipped", r.skipped.size()},
        {"target_folders", r.targetFolders()},
        {"dry_run", r.dry_run}
    };
}
