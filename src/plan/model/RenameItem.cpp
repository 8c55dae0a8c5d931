#include "plan/model/RenameItem.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using namespace fw::plan::model;
using namespace fw::fs::model;

std::size_t PlanResult::changesCount() const {
    return static_cast<std::size_t>(std::ranges::count_if(items, &RenameItem::needs_change));
}

void fw::plan::model::to_json(nlohmann::json& j, const RenameItem& item) {
    j = {
        {"current_name", item.current_name},
        {"proposed_name", item.proposed_name},
        {"reason", item.reason},
        {"needs_change", item.needs_change},
        {"type", to_string(item.kind)}
    };
}

// needs_change defaults to true so a hand-written plan item is never silently ignored
void fw::plan::model::from_json(const nlohmann::json& j, RenameItem& item) {
    item.current_name = j.at("current_name").get<std::string>();
    item.proposed_name = j.at("proposed_name").get<std::string>();
    item.reason = j.value("reason", "");
    item.needs_change = j.value("needs_change", true);
    item.kind = kindFromString(j.value("type", "file"));
}

void fw::plan::model::to_json(nlohmann::json& j, const PlanResult& plan) {
    const auto changes = plan.changesCount();
    j = {
        {"plan", plan.items},
        {"needs_changes", changes > 0},
        {"total_items", plan.items.size()},
        {"changes_count", changes},
        {"folder_path", plan.folder.string()}
    };
}
