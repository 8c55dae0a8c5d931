#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "engine/errors.hpp"

#include <cstdlib>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace fw::config {

namespace {

template <typename T>
void decodeSection(const YAML::Node& root, const char* key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw engine::ConfigError(std::string("Invalid '") + key + "' section");
}

std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

}

std::filesystem::path expandUser(const std::filesystem::path& path) {
    const auto s = path.string();
    if (s.empty() || s.front() != '~') return path;
    if (s.size() > 1 && s[1] != '/') return path;   // "~user" is left alone

    const char* home = std::getenv("HOME");
    if (!home || !*home) return path;
    if (s.size() <= 2) return home;
    return std::filesystem::path(home) / s.substr(2);
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        throw engine::ConfigError("Config file not found or unreadable: " + path.string());
    } catch (const YAML::Exception& e) {
        throw engine::ConfigError("Malformed config " + path.string() + ": " + e.what());
    }

    if (root.IsNull()) return cfg;
    if (!root.IsMap()) throw engine::ConfigError("Config root must be a mapping: " + path.string());

    try {
        decodeSection(root, "sandbox", cfg.sandbox);
        decodeSection(root, "duplicates", cfg.duplicates);
        decodeSection(root, "organize", cfg.organize);
        decodeSection(root, "classifier", cfg.classifier);
        decodeSection(root, "logging", cfg.logging);
    } catch (const YAML::Exception& e) {
        throw engine::ConfigError("Malformed config " + path.string() + ": " + e.what());
    }

    for (auto& r : cfg.sandbox.roots) r = expandUser(r);
    cfg.logging.log_dir = expandUser(cfg.logging.log_dir);

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"sandbox", c.sandbox},
        {"duplicates", c.duplicates},
        {"organize", c.organize},
        {"classifier", c.classifier},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const SandboxConfig& c) {
    std::vector<std::string> roots;
    for (const auto& r : c.roots) roots.push_back(r.string());
    j = {{"roots", roots}};
}

void to_json(nlohmann::json& j, const DuplicatesConfig& c) {
    j = {{"chunk_size_bytes", c.chunk_size_bytes}};
}

void to_json(nlohmann::json& j, const OrganizeConfig& c) {
    j = {{"allow_replace", c.allow_replace}};
}

void to_json(nlohmann::json& j, const ClassifierConfig& c) {
    j = {
        {"endpoint", c.endpoint},
        {"conflict_endpoint", c.conflict_endpoint},
        {"timeout_seconds", c.timeout_seconds}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    const auto& s = c.levels.subsystem_levels;
    j = {
        {"log_dir", c.log_dir.string()},
        {"console_log_level", levelName(c.levels.console_log_level)},
        {"file_log_level", levelName(c.levels.file_log_level)},
        {"subsystem_levels", {
            {"folderwarden", levelName(s.folderwarden)},
            {"sandbox", levelName(s.sandbox)},
            {"fs", levelName(s.fs)},
            {"crypto", levelName(s.crypto)},
            {"plan", levelName(s.plan)},
            {"classify", levelName(s.classify)},
            {"shell", levelName(s.shell)},
            {"rpc", levelName(s.rpc)}
        }}
    };
}

}
