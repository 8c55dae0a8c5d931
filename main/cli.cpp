#include "protocols/shell/Router.hpp"
#include "protocols/shell/Parser.hpp"
#include "protocols/shell/Token.hpp"
#include "protocols/shell/commands.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "engine/Engine.hpp"
#include "engine/EngineConfig.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace fw;
using namespace fw::protocols::shell;

namespace {

std::atomic<bool> g_cancel{false};

extern "C" void onInterrupt(int) { g_cancel.store(true); }

std::string ensureNewLine(const std::string& s) {
    if (s.empty() || s.back() == '\n') return s;
    return s + '\n';
}

int emit(const CommandResult& r) {
    if (!r.stdout_text.empty()) fmt::print("{}", ensureNewLine(r.stdout_text));
    if (!r.stderr_text.empty()) fmt::print(stderr, "{}", ensureNewLine(r.stderr_text));
    std::fflush(stdout);
    return r.exit_code;
}

std::filesystem::path defaultConfigPath() {
    return config::expandUser("~/.config/folderwarden/config.yaml");
}

// Explicit -c wins; otherwise the per-user file is used when present, else built-in defaults.
config::Config resolveConfig(const CommandCall& call) {
    if (const auto explicitPath = optVal(call, std::vector<std::string>{"c", "config"})) {
        if (explicitPath->empty()) throw engine::ConfigError("-c/--config requires a FILE");
        return config::loadConfig(config::expandUser(*explicitPath));
    }

    std::error_code ec;
    if (const auto fallback = defaultConfigPath(); std::filesystem::is_regular_file(fallback, ec))
        return config::loadConfig(fallback);

    return {};
}

CommandResult engineFailure(const CommandCall& call, const engine::Error& err) {
    if (hasFlag(call, "json")) return {1, nlohmann::json(err).dump(2), ""};
    return {1, "", fmt::format("{}: {}", engine::to_string(err.type), err.message)};
}

}

int main(const int argc, char** argv) {
    std::vector<std::string> args;
    args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0);
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    auto call = parseTokens(tokenizeArgs(args));
    if (call.name.empty() || hasFlag(call, std::vector<std::string>{"help", "h"})) call.name = "help";

    Router router;
    registerAllCommands(router);

    call.in = &std::cin;
    call.out = &std::cout;
    call.cancel = &g_cancel;

    if (!router.needsEngine(call.name)) return emit(router.execute(call));

    config::Config cfg;
    try {
        cfg = resolveConfig(call);
    } catch (const engine::EngineError& e) {
        return emit(engineFailure(call, e.toError()));
    }

    if (hasFlag(call, "root")) {
        const auto roots = optVals(call, "root");
        if (roots.empty() || std::ranges::any_of(roots, [](const auto& r) { return r.empty(); }))
            return emit(invalid("--root requires a DIR"));
        cfg.sandbox.roots.clear();
        for (const auto& r : roots) cfg.sandbox.roots.emplace_back(config::expandUser(r));
    }

    try {
        log::Registry::init(cfg.logging);
    } catch (const std::exception& e) {
        return emit({1, "", fmt::format("Cannot initialize logging: {}", e.what())});
    }

    auto engine = engine::Engine::create(engine::EngineConfig::fromConfig(cfg));
    if (!engine) return emit(engineFailure(call, engine.error()));

    call.engine = engine.value().get();

    std::signal(SIGINT, onInterrupt);

    return emit(router.execute(call));
}
