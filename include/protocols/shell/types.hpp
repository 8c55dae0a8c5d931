#pragma once

#include <atomic>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace fw::engine { class Engine; }

namespace fw::protocols::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;              // in argv order; repeatable flags keep every occurrence
    std::vector<std::string> positionals;

    const engine::Engine* engine = nullptr;   // null for commands that run without roots (help)
    std::istream* in = nullptr;               // streaming commands (rpc) read and write here
    std::ostream* out = nullptr;
    const std::atomic<bool>* cancel = nullptr; // set by SIGINT
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success, 1 = operation failed, 2 = usage error
    std::string stdout_text;           // CLI stdout
    std::string stderr_text;           // CLI stderr
    nlohmann::json data;               // optional machine-readable payload
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string synopsis;                    // "dupes [PATH] [--recursive]"
    std::string description;
    CommandHandler handler;
    bool needs_engine = true;
    std::unordered_set<std::string> aliases;
};

}
