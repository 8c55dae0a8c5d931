#include "plan/NormalizationPlanner.hpp"
#include "plan/Normalizer.hpp"
#include "fs/Lister.hpp"
#include "log/Registry.hpp"

using namespace fw::plan;
using namespace fw::plan::model;

PlanResult NormalizationPlanner::planAlpha(const std::filesystem::path& resolvedFolder) const {
    const auto listing = fs::Lister(guard_).list(resolvedFolder);

    PlanResult plan;
    plan.folder = resolvedFolder;
    plan.items.reserve(listing.items.size());

    for (const auto& entry : listing.items) {
        RenameItem item;
        item.current_name = entry.name;
        item.proposed_name = normalizeName(entry.name, entry.kind);
        item.kind = entry.kind;
        item.needs_change = item.current_name != item.proposed_name;
        item.reason = item.needs_change ? "Normalized to lowercase with underscores" : "Already normalized";
        plan.items.push_back(std::move(item));
    }

    log::Registry::plan()->info("[NormalizationPlanner] Generated plan with {} items, {} changes for {}",
                                plan.items.size(), plan.changesCount(), resolvedFolder.string());
    return plan;
}
