#pragma once

#include "engine/EngineConfig.hpp"
#include "engine/Outcome.hpp"
#include "sandbox/Guard.hpp"
#include "fs/model/Listing.hpp"
#include "fs/model/DuplicateGroup.hpp"
#include "plan/model/RenameItem.hpp"
#include "plan/model/ExecutionResult.hpp"
#include "plan/model/OrganizeByTypeResult.hpp"
#include "classify/model/CategoryOrganizeResult.hpp"
#include "classify/CategoryOrganizer.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fw::engine {

using OptPath = std::optional<std::filesystem::path>;

// Facade over every folder operation. Owns the guard for its roots; an omitted folder
// means the primary root. No exception leaves an Engine operation.
class Engine {
public:
    /// Throws SecurityError when none of the configured roots is usable.
    explicit Engine(EngineConfig cfg);

    static Outcome<std::unique_ptr<Engine>> create(EngineConfig cfg);

    [[nodiscard]] Outcome<sandbox::Check> checkSandbox(const std::filesystem::path& path) const;

    [[nodiscard]] Outcome<fs::model::ListResult> list(const OptPath& folder = std::nullopt) const;

    [[nodiscard]] Outcome<fs::model::DuplicatesResult> findDuplicates(const OptPath& folder = std::nullopt,
                                                                      bool recursive = false,
                                                                      const std::atomic<bool>* cancel = nullptr) const;

    [[nodiscard]] Outcome<plan::model::PlanResult> planAlpha(const OptPath& folder = std::nullopt) const;

    [[nodiscard]] Outcome<plan::model::PlanExecutionResult> applyPlan(const std::vector<plan::model::RenameItem>& plan,
                                                                      const OptPath& folder = std::nullopt,
                                                                      bool dryRun = true) const;

    [[nodiscard]] Outcome<plan::model::OrganizeByTypeResult> organizeByType(const OptPath& folder = std::nullopt,
                                                                            bool dryRun = true) const;

    [[nodiscard]] Outcome<classify::model::CategoryOrganizeResult> organizeByCategory(
        const std::string& category,
        const std::filesystem::path& targetFolder,
        const OptPath& folder = std::nullopt,
        const classify::CategoryOptions& opts = {}) const;

    [[nodiscard]] const sandbox::Guard& guard() const { return guard_; }
    [[nodiscard]] const EngineConfig& config() const { return cfg_; }

private:
    EngineConfig cfg_;
    sandbox::Guard guard_;

    [[nodiscard]] std::filesystem::path resolveFolder(const OptPath& folder) const;

    template <typename Fn>
    auto run(const char* op, Fn&& fn) const -> Outcome<decltype(fn())>;
};

}
