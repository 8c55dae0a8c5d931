#pragma once

#include "config/Config.hpp"
#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace fw::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SandboxConfig> {
    static Node encode(const SandboxConfig& rhs) {
        Node node;
        for (const auto& root : rhs.roots) node["roots"].push_back(root.string());
        return node;
    }

    static bool decode(const Node& node, SandboxConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.roots.clear();
        if (const auto roots = node["roots"]) {
            if (!roots.IsSequence()) return false;
            for (const auto& r : roots) rhs.roots.emplace_back(r.as<std::string>());
        }
        return true;
    }
};

template<>
struct convert<DuplicatesConfig> {
    static Node encode(const DuplicatesConfig& rhs) {
        Node node;
        node["chunk_size_bytes"] = rhs.chunk_size_bytes;
        return node;
    }

    static bool decode(const Node& node, DuplicatesConfig& rhs) {
        if (!node.IsMap()) return false;
        const auto requested = node["chunk_size_bytes"].as<std::size_t>(DEFAULT_HASH_CHUNK_BYTES);
        rhs.chunk_size_bytes = std::clamp(requested, MIN_HASH_CHUNK_BYTES, MAX_HASH_CHUNK_BYTES);
        return true;
    }
};

template<>
struct convert<OrganizeConfig> {
    static Node encode(const OrganizeConfig& rhs) {
        Node node;
        node["allow_replace"] = rhs.allow_replace;
        return node;
    }

    static bool decode(const Node& node, OrganizeConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.allow_replace = node["allow_replace"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<ClassifierConfig> {
    static Node encode(const ClassifierConfig& rhs) {
        Node node;
        node["endpoint"] = rhs.endpoint;
        node["conflict_endpoint"] = rhs.conflict_endpoint;
        node["timeout_seconds"] = rhs.timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, ClassifierConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.endpoint = node["endpoint"].as<std::string>("");
        rhs.conflict_endpoint = node["conflict_endpoint"].as<std::string>("");
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(30);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["folderwarden"] = to_std_string(spdlog::level::to_string_view(rhs.folderwarden));
        node["sandbox"]      = to_std_string(spdlog::level::to_string_view(rhs.sandbox));
        node["fs"]           = to_std_string(spdlog::level::to_string_view(rhs.fs));
        node["crypto"]       = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["plan"]         = to_std_string(spdlog::level::to_string_view(rhs.plan));
        node["classify"]     = to_std_string(spdlog::level::to_string_view(rhs.classify));
        node["shell"]        = to_std_string(spdlog::level::to_string_view(rhs.shell));
        node["rpc"]          = to_std_string(spdlog::level::to_string_view(rhs.rpc));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.folderwarden = spdlog::level::from_str(node["folderwarden"].as<std::string>("info"));
        rhs.sandbox = spdlog::level::from_str(node["sandbox"].as<std::string>("warn"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("warn"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.plan = spdlog::level::from_str(node["plan"].as<std::string>("info"));
        rhs.classify = spdlog::level::from_str(node["classify"].as<std::string>("warn"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        rhs.rpc = spdlog::level::from_str(node["rpc"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node = convert<LogLevelsConfig>::encode(rhs.levels);
        node["log_dir"] = rhs.log_dir.string();
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        return convert<LogLevelsConfig>::decode(node, rhs.levels);
    }
};

}
