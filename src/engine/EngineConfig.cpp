#include "engine/EngineConfig.hpp"
#include "classify/HttpClassifier.hpp"

using namespace fw::engine;

EngineConfig EngineConfig::fromConfig(const config::Config& cfg) {
    EngineConfig ec;
    ec.roots = cfg.sandbox.roots;
    ec.hash_chunk_bytes = cfg.duplicates.chunk_size_bytes;
    ec.allow_replace = cfg.organize.allow_replace;

    const auto& c = cfg.classifier;
    if (!c.endpoint.empty())
        ec.classifier = std::make_shared<classify::HttpClassifier>(c.endpoint, c.timeout_seconds);
    if (!c.conflict_endpoint.empty())
        ec.conflict_resolver = std::make_shared<classify::HttpConflictResolver>(c.conflict_endpoint, c.timeout_seconds);

    return ec;
}
