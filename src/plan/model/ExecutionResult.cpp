#include "plan/model/ExecutionResult.hpp"

#include <nlohmann/json.hpp>

using namespace fw::plan::model;
using namespace fw::fs::model;

std::string fw::plan::model::to_string(const ItemErrorKind kind) {
    switch (kind) {
        case ItemErrorKind::Security: return "security";
        case ItemErrorKind::NotFound: return "not_found";
        case ItemErrorKind::Conflict: return "conflict";
        case ItemErrorKind::IOFailure: return "io_failure";
        case ItemErrorKind::InvalidName: return "invalid_name";
        default: return "unknown";
    }
}

std::string fw::plan::model::to_string(const PlanState state) {
    switch (state) {
        case PlanState::Proposed: return "proposed";
        case PlanState::Validated: return "validated";
        case PlanState::Committed: return "committed";
        case PlanState::PartiallyCommitted: return "partially_committed";
        default: return "unknown";
    }
}

void PlanExecutionResult::finalizeState() {
    if (dry_run) state = PlanState::Validated;
    else state = errors.empty() ? PlanState::Committed : PlanState::PartiallyCommitted;
}

void fw::plan::model::to_json(nlohmann::json& j, const AppliedItem& item) {
    j = {
        {"current_name", item.current_name},
        {"proposed_name", item.proposed_name},
        {"type", to_string(item.kind)}
    };
    if (item.target_folder) j["target_folder"] = *item.target_folder;
}

void fw::plan::model::to_json(nlohmann::json& j, const SkippedItem& item) {
    j = {
        {"name", item.name},
        {"reason", item.reason}
    };
}

void fw::plan::model::to_json(nlohmann::json& j, const ItemError& err) {
    j = {
        {"current_name", err.current_name},
        {"proposed_name", err.proposed_name},
        {"kind", to_string(err.kind)},
        {"error", err.message}
    };
}

void fw::plan::model::to_json(nlohmann::json& j, const PlanExecutionResult& r) {
    j = {
        {"dry_run", r.dry_run},
        {"folder_path", r.folder.string()},
        {"state", to_string(r.state)},
        {"success", r.success()},
        {"applied", r.applied},
        {"skipped", r.skipped},
        {"errors", r.errors},
        {"total_items", r.total()}
    };
}
