#include "log/Registry.hpp"

#include <stdexcept>
#include <vector>

using namespace fw::log;
using namespace fw::config;

void Registry::init(const LoggingConfig& cfg) {
    std::scoped_lock lock(mutex_);
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }
    initLocked(cfg);
}

void Registry::initLocked(const LoggingConfig& cfg) {
    namespace fs = std::filesystem;

    const auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(cfg.levels.console_log_level);
    consoleSink->set_color_mode(spdlog::color_mode::automatic);
    consoleSink->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    std::vector<spdlog::sink_ptr> auditSinks;

    if (!cfg.log_dir.empty()) {
        if (!fs::exists(cfg.log_dir)) fs::create_directories(cfg.log_dir);

        const auto rotatingSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (cfg.log_dir / "folderwarden.log").string(), main_max_bytes_, main_max_files_);
        rotatingSink->set_level(cfg.levels.file_log_level);
        rotatingSink->set_pattern(LOG_FORMAT);
        sinks.push_back(rotatingSink);

        // Audit trail: append-only, no rotation
        const auto auditSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>((cfg.log_dir / "audit.log").string(), false);
        auditSink->set_pattern(AUDIT_FORMAT);
        auditSinks.push_back(auditSink);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub = cfg.levels.subsystem_levels;

    makeLogger("folderwarden", sub.folderwarden);
    makeLogger("sandbox", sub.sandbox);
    makeLogger("fs", sub.fs);
    makeLogger("crypto", sub.crypto);
    makeLogger("plan", sub.plan);
    makeLogger("classify", sub.classify);
    makeLogger("shell", sub.shell);
    makeLogger("rpc", sub.rpc);

    {
        if (spdlog::get("audit")) spdlog::drop("audit");
        const auto logger = std::make_shared<spdlog::logger>("audit", auditSinks.begin(), auditSinks.end());
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    spdlog::get("folderwarden")->debug("[Registry] Initialized (log_dir: '{}')", cfg.log_dir.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    {
        std::scoped_lock lock(mutex_);
        if (!initialized_) initLocked(LoggingConfig{});
    }

    auto logger = spdlog::get(name);
    if (!logger) throw std::runtime_error("[Registry] Logger not found: " + name);
    return logger;
}

bool Registry::isInitialized() {
    std::scoped_lock lock(mutex_);
    return initialized_;
}
