#pragma once

#include "fs/model/DuplicateGroup.hpp"
#include "config/Config.hpp"

#include <atomic>
#include <filesystem>

namespace fw::sandbox {
class Guard;
}

namespace fw::fs {

// Groups files by BLAKE2b digest of their full contents. Name and size never stand in for the hash.
class DuplicateDetector {
public:
    DuplicateDetector(const sandbox::Guard& guard, std::size_t chunkSize = config::DEFAULT_HASH_CHUNK_BYTES)
        : guard_(guard), chunkSize_(chunkSize) {}

    /// Groups are ordered by wasted bytes (desc), members by name then relative path.
    /// The cancel flag is polled between files; a cancelled scan returns what it has.
    [[nodiscard]] model::DuplicatesResult findDuplicates(const std::filesystem::path& resolvedFolder,
                                                         bool recursive,
                                                         const std::atomic<bool>* cancel = nullptr) const;

private:
    const sandbox::Guard& guard_;
    std::size_t chunkSize_;
};

}
