#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace fw::config {

constexpr static std::size_t DEFAULT_HASH_CHUNK_BYTES = 64 * 1024;
constexpr static std::size_t MIN_HASH_CHUNK_BYTES = 4 * 1024;
constexpr static std::size_t MAX_HASH_CHUNK_BYTES = 16 * 1024 * 1024;

struct SandboxConfig {
    std::vector<std::filesystem::path> roots;
};

struct DuplicatesConfig {
    std::size_t chunk_size_bytes = DEFAULT_HASH_CHUNK_BYTES;
};

struct OrganizeConfig {
    bool allow_replace = false;
};

struct ClassifierConfig {
    std::string endpoint;
    std::string conflict_endpoint;
    unsigned int timeout_seconds = 30;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum folderwarden = spdlog::level::info;   // Startup, config, top-level operations
    spdlog::level::level_enum sandbox      = spdlog::level::warn;   // Rejected paths
    spdlog::level::level_enum fs           = spdlog::level::warn;   // Unreadable entries, listing failures
    spdlog::level::level_enum crypto       = spdlog::level::warn;   // Hash failures
    spdlog::level::level_enum plan         = spdlog::level::info;   // Rename / move execution
    spdlog::level::level_enum classify     = spdlog::level::warn;   // Collaborator timeouts, malformed decisions
    spdlog::level::level_enum shell        = spdlog::level::warn;   // CLI parsing
    spdlog::level::level_enum rpc          = spdlog::level::warn;   // Malformed requests
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;   // empty: console only, no audit file
    LogLevelsConfig levels;
};

struct Config {
    SandboxConfig sandbox;
    DuplicatesConfig duplicates;
    OrganizeConfig organize;
    ClassifierConfig classifier;
    LoggingConfig logging;
};

// Throws engine::ConfigError when the file is missing or malformed.
Config loadConfig(const std::filesystem::path& path);

std::filesystem::path expandUser(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const SandboxConfig& c);
void to_json(nlohmann::json& j, const DuplicatesConfig& c);
void to_json(nlohmann::json& j, const OrganizeConfig& c);
void to_json(nlohmann::json& j, const ClassifierConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

} // namespace fw::config
