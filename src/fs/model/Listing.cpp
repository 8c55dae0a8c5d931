#include "fs/model/Listing.hpp"

#include <nlohmann/json.hpp>

void fw::fs::model::to_json(nlohmann::json& j, const ListResult& r) {
    j = {
        {"items", r.items},
        {"total_count", r.totalCount()},
        {"skipped_count", r.skipped},
        {"folder_path", r.folder.string()},
        {"relative_path", r.relative_path.string()},
        {"allowed_folder", r.allowed_root.string()}
    };
}
