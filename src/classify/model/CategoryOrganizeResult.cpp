#include "classify/model/CategoryOrganizeResult.hpp"

#include <nlohmann/json.hpp>

using namespace fw::classify::model;

void fw::classify::model::to_json(nlohmann::json& j, const CategoryDecision& d) {
    j = {
        {"file", d.file},
        {"include", d.include},
        {"reasoning", d.rationale}
    };
}

void fw::classify::model::to_json(nlohmann::json& j, const CategoryMove& m) {
    j = {
        {"file", m.file},
        {"destination", m.destination.string()},
        {"renamed", m.renamed},
        {"replaced", m.replaced}
    };
}

void fw::classify::model::to_json(nlohmann::json& j, const CategoryOrganizeResult& r) {
    j = {
        {"success", r.success()},
        {"category", r.category},
        {"folder_path", r.folder.string()},
        {"target_path", r.target_folder.string()},
        {"target_created", r.target_created},
        {"dry_run", r.dry_run},
        {"copy", r.copy},
        {"recursive", r.recursive},
        {"files_moved", r.moved},
        {"files_skipped", r.skipped},
        {"errors", r.errors},
        {"reasoning", r.decisions},
        {"total_evaluated", r.total_evaluated}
    };
}
