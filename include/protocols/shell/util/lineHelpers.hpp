#pragma once

#include <sys/ioctl.h>
#include <unistd.h>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <string>
#include <fmt/core.h>

namespace fw::protocols::shell {

inline int term_width() {
    if (!isatty(STDOUT_FILENO)) return 100;
    winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) return ws.ws_col;
    if (const char* c = std::getenv("COLUMNS"); c) {
        char* c_end{};
        if (const auto n = std::strtol(c, &c_end, 10); n > 0) return static_cast<int>(n);
    }
    return 100;
}

inline std::string human_bytes(const uint64_t b) {
    static const char* kUnits[] = {"B","KiB","MiB","GiB","TiB","PiB"};
    int u = 0;
    auto v = static_cast<double>(b);
    while (v >= 1024.0 && u < 5) { v /= 1024.0; ++u; }
    if (u == 0) return fmt::format("{} B", b);
    return fmt::format("{:.1f} {}", v, kUnits[u]);
}

// Local time, minute precision
inline std::string short_time(const std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm) == 0) return "-";
    return buf;
}

}
