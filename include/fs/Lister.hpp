#pragma once

#include "fs/model/Listing.hpp"

#include <filesystem>

namespace fw::sandbox {
class Guard;
}

namespace fw::fs {

class Lister {
public:
    explicit Lister(const sandbox::Guard& guard) : guard_(guard) {}

    /// Non-recursive listing of a guard-validated folder, sorted by name, hidden entries excluded.
    /// Throws NotFoundError / NotADirectoryError for a bad folder; unreadable entries are skipped.
    [[nodiscard]] model::ListResult list(const std::filesystem::path& resolvedFolder) const;

    /// Shared precondition for every folder-level operation.
    static void requireDirectory(const std::filesystem::path& resolvedFolder, const std::filesystem::path& requested);

private:
    const sandbox::Guard& guard_;
};

}
