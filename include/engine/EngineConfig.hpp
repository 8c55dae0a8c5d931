#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <vector>

namespace fw::classify {
class Classifier;
class ConflictResolver;
}

namespace fw::engine {

// Everything an Engine needs, passed in explicitly. Roots are immutable once the Engine exists.
struct EngineConfig {
    std::vector<std::filesystem::path> roots;
    std::size_t hash_chunk_bytes = config::DEFAULT_HASH_CHUNK_BYTES;
    bool allow_replace = false;

    // Null means the conservative defaults (reject everything, skip every conflict).
    std::shared_ptr<classify::Classifier> classifier;
    std::shared_ptr<classify::ConflictResolver> conflict_resolver;

    // Wires HTTP collaborators for the configured endpoints.
    static EngineConfig fromConfig(const config::Config& cfg);
};

}
