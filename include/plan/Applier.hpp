#pragma once

#include "plan/model/RenameItem.hpp"
#include "plan/model/ExecutionResult.hpp"
#include "plan/Overlay.hpp"

#include <filesystem>
#include <vector>

namespace fw::sandbox {
class Guard;
}

namespace fw::plan {

class Applier {
public:
    explicit Applier(const sandbox::Guard& guard) : guard_(guard) {}

    /// Executes (or, for a dry run, validates) a rename plan inside a guard-validated folder.
    /// Items are independent; a failed item never stops the rest and nothing is rolled back.
    [[nodiscard]] model::PlanExecutionResult apply(const std::vector<model::RenameItem>& plan,
                                                   const std::filesystem::path& resolvedFolder,
                                                   bool dryRun) const;

private:
    const sandbox::Guard& guard_;
};

}
