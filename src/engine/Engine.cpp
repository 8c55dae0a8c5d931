#include "engine/Engine.hpp"
#include "fs/Lister.hpp"
#include "fs/DuplicateDetector.hpp"
#include "plan/NormalizationPlanner.hpp"
#include "plan/Applier.hpp"
#include "plan/TypeOrganizer.hpp"
#include "classify/Classifier.hpp"
#include "classify/ConflictResolver.hpp"
#include "log/Registry.hpp"

using namespace fw::engine;
using namespace fw::fs::model;
using namespace fw::plan::model;
using namespace fw::classify::model;

namespace stdfs = std::filesystem;

Engine::Engine(EngineConfig cfg)
    : cfg_(std::move(cfg)), guard_(cfg_.roots) {
    if (!cfg_.classifier) cfg_.classifier = std::make_shared<classify::RejectAllClassifier>();
    if (!cfg_.conflict_resolver) cfg_.conflict_resolver = std::make_shared<classify::SkipConflictResolver>();

    log::Registry::folderwarden()->info("[Engine] Ready with {} allowed root(s), primary {}",
                                        guard_.roots().size(), guard_.primaryRoot().string());
}

Outcome<std::unique_ptr<Engine>> Engine::create(EngineConfig cfg) {
    try {
        return std::make_unique<Engine>(std::move(cfg));
    } catch (const EngineError& e) {
        log::Registry::folderwarden()->error("[Engine] Cannot start: {}", e.what());
        return e.toError();
    } catch (const std::exception& e) {
        log::Registry::folderwarden()->error("[Engine] Cannot start: {}", e.what());
        return Error{ErrorType::InternalError, e.what()};
    }
}

template <typename Fn>
auto Engine::run(const char* op, Fn&& fn) const -> Outcome<decltype(fn())> {
    try {
        return fn();
    } catch (const SecurityError& e) {
        log::Registry::sandbox()->warn("[Engine] {} rejected: {}", op, e.what());
        return e.toError();
    } catch (const EngineError& e) {
        log::Registry::folderwarden()->warn("[Engine] {} failed: {}", op, e.what());
        return e.toError();
    } catch (const std::exception& e) {
        log::Registry::folderwarden()->error("[Engine] {} failed unexpectedly: {}", op, e.what());
        return Error{ErrorType::InternalError, e.what()};
    }
}

stdfs::path Engine::resolveFolder(const OptPath& folder) const {
    return guard_.validate(folder.value_or(guard_.primaryRoot()));
}

Outcome<fw::sandbox::Check> Engine::checkSandbox(const stdfs::path& path) const {
    return run("check_sandbox", [&] { return guard_.check(path); });
}

Outcome<ListResult> Engine::list(const OptPath& folder) const {
    return run("list", [&] { return fs::Lister(guard_).list(resolveFolder(folder)); });
}

Outcome<DuplicatesResult> Engine::findDuplicates(const OptPath& folder, const bool recursive,
                                                 const std::atomic<bool>* cancel) const {
    return run("find_duplicates", [&] {
        return fs::DuplicateDetector(guard_, cfg_.hash_chunk_bytes).findDuplicates(resolveFolder(folder), recursive, cancel);
    });
}

Outcome<PlanResult> Engine::planAlpha(const OptPath& folder) const {
    return run("plan_alpha", [&] { return plan::NormalizationPlanner(guard_).planAlpha(resolveFolder(folder)); });
}

Outcome<PlanExecutionResult> Engine::applyPlan(const std::vector<RenameItem>& plan, const OptPath& folder,
                                               const bool dryRun) const {
    return run("apply_plan", [&] { return plan::Applier(guard_).apply(plan, resolveFolder(folder), dryRun); });
}

Outcome<OrganizeByTypeResult> Engine::organizeByType(const OptPath& folder, const bool dryRun) const {
    return run("organize_by_type", [&] { return plan::TypeOrganizer(guard_).planOrApply(resolveFolder(folder), dryRun); });
}

Outcome<CategoryOrganizeResult> Engine::organizeByCategory(const std::string& category,
                                                           const stdfs::path& targetFolder,
                                                           const OptPath& folder,
                                                           const classify::CategoryOptions& opts) const {
    return run("organize_by_category", [&] {
        const classify::CategoryOrganizer organizer(guard_, *cfg_.classifier, *cfg_.conflict_resolver, cfg_.allow_replace);
        return organizer.organize(resolveFolder(folder), category, targetFolder, opts);
    });
}
