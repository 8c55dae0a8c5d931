#pragma once

#include "plan/model/OrganizeByTypeResult.hpp"

#include <filesystem>
#include <string>

namespace fw::sandbox {
class Guard;
}

namespace fw::plan {

// "report.PDF" -> "PDF", "Makefile" -> "NO_EXTENSION"
std::string typeFolderFor(const std::string& fileName);

// Moves top-level files into subfolders named after their extension.
// Directories are never moved and existing destinations are never overwritten.
class TypeOrganizer {
public:
    explicit TypeOrganizer(const sandbox::Guard& guard) : guard_(guard) {}

    [[nodiscard]] model::OrganizeByTypeResult planOrApply(const std::filesystem::path& resolvedFolder, bool dryRun) const;

private:
    const sandbox::Guard& guard_;
};

}
