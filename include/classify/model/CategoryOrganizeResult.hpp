#pragma once

#include "plan/model/ExecutionResult.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fw::classify::model {

struct CategoryDecision {
    std::string file{};
    bool include{false};
    std::string rationale{};
};

struct CategoryMove {
    std::string file{};
    std::filesystem::path destination{};
    bool renamed{false}, replaced{false};
};

// Every evaluated file ends up in exactly one of moved, skipped or errors.
struct CategoryOrganizeResult {
    std::string category;
    std::filesystem::path folder, target_folder;
    bool dry_run{true}, copy{false}, recursive{false}, target_created{false};
    std::vector<CategoryMove> moved;
    std::vector<plan::model::SkippedItem> skipped;
    std::vector<plan::model::ItemError> errors;
    std::vector<CategoryDecision> decisions;
    std::size_t total_evaluated{0};

    [[nodiscard]] bool success() const { return errors.empty(); }
};

void to_json(nlohmann::json& j, const CategoryDecision& d);
void to_json(nlohmann::json& j, const CategoryMove& m);
void to_json(nlohmann::json& j, const CategoryOrganizeResult& r);

}
