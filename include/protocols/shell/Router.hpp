#pragma once

#include "protocols/shell/types.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fw::protocols::shell {

class Router {
public:
    void registerCommand(const std::string& name, CommandInfo info);

    /// Dispatches a parsed call. An empty name or an unknown command yields a usage error.
    CommandResult execute(const CommandCall& call) const;

    // Scripted form: "fwctl list ~/Documents --json"
    CommandResult executeLine(const std::string& line, const CommandCall& context) const;

    /// Canonical command name, or the normalized input when nothing matches.
    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;
    [[nodiscard]] bool needsEngine(const std::string& nameOrAlias) const;

    [[nodiscard]] std::string usage() const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical
    std::vector<std::string> order_;                        // registration order for help

    static std::string normalize(const std::string& s);
    static std::string joinAliases(const std::unordered_set<std::string>& aliases);
};

}
