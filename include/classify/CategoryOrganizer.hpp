#pragma once

#include "classify/model/CategoryOrganizeResult.hpp"

#include <filesystem>
#include <string>

namespace fw::sandbox {
class Guard;
}

namespace fw::classify {

class Classifier;
class ConflictResolver;

struct CategoryOptions {
    bool copy{false};
    bool recursive{false};
    bool dry_run{true};
};

// Moves (or copies) the files a Classifier picks for a category into a target folder.
// Anything the classifier does not positively include stays where it is.
class CategoryOrganizer {
public:
    CategoryOrganizer(const sandbox::Guard& guard, Classifier& classifier, ConflictResolver& resolver, bool allowReplace)
        : guard_(guard), classifier_(classifier), resolver_(resolver), allowReplace_(allowReplace) {}

    /// A relative target folder is taken relative to resolvedFolder; it must validate through the guard.
    [[nodiscard]] model::CategoryOrganizeResult organize(const std::filesystem::path& resolvedFolder,
                                                         const std::string& category,
                                                         const std::filesystem::path& targetFolder,
                                                         const CategoryOptions& opts) const;

private:
    const sandbox::Guard& guard_;
    Classifier& classifier_;
    ConflictResolver& resolver_;
    bool allowReplace_;
};

}
