#include "protocols/shell/Router.hpp"
#include "protocols/shell/Token.hpp"
#include "protocols/shell/Parser.hpp"
#include "protocols/shell/Table.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "protocols/shell/util/lineHelpers.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <cctype>

using namespace fw::protocols::shell;

void Router::registerCommand(const std::string& name, CommandInfo info) {
    const std::string key = normalize(name);
    if (info.description.empty()) info.description = "No description provided.";

    std::unordered_set<std::string> kept;
    for (const auto& alias : info.aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            log::Registry::shell()->warn("[Router] Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                         a, aliasMap_.at(a), key);
            continue;
        }
        kept.insert(a);
        aliasMap_[a] = key;
    }
    info.aliases = std::move(kept);

    if (!commands_.contains(key)) order_.push_back(key);
    commands_[key] = std::move(info);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n;
}

bool Router::needsEngine(const std::string& nameOrAlias) const {
    const auto it = commands_.find(canonicalFor(nameOrAlias));
    return it != commands_.end() && it->second.needs_engine;
}

CommandResult Router::execute(const CommandCall& call) const {
    if (call.name.empty()) {
        auto r = invalid("No command provided.");
        r.stdout_text = usage();
        return r;
    }

    const auto canonical = canonicalFor(call.name);
    const auto it = commands_.find(canonical);
    if (it == commands_.end()) {
        auto r = invalid(fmt::format("Unknown command or alias: {}", call.name));
        r.stdout_text = usage();
        return r;
    }

    if (it->second.needs_engine && !call.engine)
        return {1, "", fmt::format("Command '{}' needs at least one allowed root\n", canonical)};

    log::Registry::shell()->debug("[Router] Executing command: '{}'", canonical);
    return it->second.handler(call);
}

CommandResult Router::executeLine(const std::string& line, const CommandCall& context) const {
    log::Registry::shell()->debug("[Router] Executing line: '{}'", line);
    auto call = parseTokens(tokenize(line));
    call.engine = context.engine;
    call.in = context.in;
    call.out = context.out;
    call.cancel = context.cancel;
    return execute(call);
}

std::string Router::usage() const {
    std::string out = "usage: fwctl [-c CONFIG] [--root DIR]... [--json] <command> [args]\n\ncommands:\n";

    Table t({
        {"COMMAND", Align::Left, 8, 48},
        {"ALIASES", Align::Left, 7, 16},
        {"DESCRIPTION", Align::Left, 11}
    }, term_width());

    for (const auto& key : order_) {
        const auto& info = commands_.at(key);
        t.add_row({info.synopsis.empty() ? key : info.synopsis, joinAliases(info.aliases), info.description});
    }

    out += t.render();
    out += "\nMutating commands only report what they would do unless --commit is given.\n";
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) if (c != '-' || !out.empty()) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string Router::joinAliases(const std::unordered_set<std::string>& aliases) {
    if (aliases.empty()) return "-";
    std::vector v(aliases.begin(), aliases.end());
    std::ranges::sort(v);
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) { if (i) out += ", "; out += v[i]; }
    return out;
}
