#pragma once

#include "config/Config.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

namespace fw::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels. A second call is ignored.
    static void init(const config::LoggingConfig& cfg);

    // Generic access by name. Falls back to a console-only default setup if init() was never called.
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> folderwarden() { return get("folderwarden"); }
    static std::shared_ptr<spdlog::logger> sandbox()      { return get("sandbox"); }
    static std::shared_ptr<spdlog::logger> fs()           { return get("fs"); }
    static std::shared_ptr<spdlog::logger> crypto()       { return get("crypto"); }
    static std::shared_ptr<spdlog::logger> plan()         { return get("plan"); }
    static std::shared_ptr<spdlog::logger> classify()     { return get("classify"); }
    static std::shared_ptr<spdlog::logger> shell()        { return get("shell"); }
    static std::shared_ptr<spdlog::logger> rpc()          { return get("rpc"); }
    static std::shared_ptr<spdlog::logger> audit()        { return get("audit"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr const auto* AUDIT_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] %v";

    static inline std::mutex mutex_;
    static inline bool initialized_ = false;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static void initLocked(const config::LoggingConfig& cfg);
};

}
