#include "protocols/rpc/handler/Folders.hpp"
#include "protocols/rpc/Router.hpp"
#include "engine/Engine.hpp"

#include <nlohmann/json.hpp>

using namespace fw::engine;
using namespace fw::plan::model;

namespace fw::protocols::rpc::handler {

namespace {

template <typename T>
json unwrap(const Outcome<T>& outcome) {
    if (!outcome) throw EngineError(outcome.error().type, outcome.error().message);
    return outcome.value();
}

OptPath folderOf(const json& payload) {
    if (!payload.contains("folder_path") || payload["folder_path"].is_null()) return std::nullopt;
    return std::filesystem::path(payload["folder_path"].get<std::string>());
}

std::string requireString(const json& payload, const char* key) {
    if (!payload.contains(key) || !payload[key].is_string())
        throw InvalidRequestError(std::string("payload requires a string '") + key + "'");
    return payload[key].get<std::string>();
}

}

json Folders::check(const json& payload) const {
    return unwrap(engine_.checkSandbox(requireString(payload, "path")));
}

json Folders::list(const json& payload) const {
    return unwrap(engine_.list(folderOf(payload)));
}

json Folders::findDuplicates(const json& payload) const {
    return unwrap(engine_.findDuplicates(folderOf(payload), payload.value("recursive", false)));
}

json Folders::planAlpha(const json& payload) const {
    return unwrap(engine_.planAlpha(folderOf(payload)));
}

json Folders::applyPlan(const json& payload) const {
    if (!payload.contains("plan") || !payload["plan"].is_array())
        throw InvalidRequestError("payload requires a 'plan' list");
    const auto plan = payload["plan"].get<std::vector<RenameItem>>();
    return unwrap(engine_.applyPlan(plan, folderOf(payload), payload.value("dry_run", true)));
}

json Folders::organizeByType(const json& payload) const {
    return unwrap(engine_.organizeByType(folderOf(payload), payload.value("dry_run", true)));
}

json Folders::organizeByCategory(const json& payload) const {
    classify::CategoryOptions opts;
    opts.copy = payload.value("copy", false);
    opts.recursive = payload.value("recursive", false);
    opts.dry_run = payload.value("dry_run", true);

    return unwrap(engine_.organizeByCategory(requireString(payload, "category"),
                                             requireString(payload, "target_folder"),
                                             folderOf(payload), opts));
}

void Folders::registerAll(Router& router) const {
    router.registerPayload("check", this, &Folders::check);
    router.registerPayload("list", this, &Folders::list);
    router.registerPayload("find_duplicates", this, &Folders::findDuplicates);
    router.registerPayload("plan_alpha", this, &Folders::planAlpha);
    router.registerPayload("apply_plan", this, &Folders::applyPlan);
    router.registerPayload("organize_by_type", this, &Folders::organizeByType);
    router.registerPayload("organize_by_category", this, &Folders::organizeByCategory);
}

}
