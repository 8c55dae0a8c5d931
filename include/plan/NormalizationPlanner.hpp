#pragma once

#include "plan/model/RenameItem.hpp"

#include <filesystem>

namespace fw::sandbox {
class Guard;
}

namespace fw::plan {

// Read-only: proposes normalized names for the immediate children of a folder.
class NormalizationPlanner {
public:
    explicit NormalizationPlanner(const sandbox::Guard& guard) : guard_(guard) {}

    [[nodiscard]] model::PlanResult planAlpha(const std::filesystem::path& resolvedFolder) const;

private:
    const sandbox::Guard& guard_;
};

}
