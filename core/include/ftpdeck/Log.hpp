// Minimal logging utility (header-only) for the ftpdeck core.
// Enabled with FTPDECK_LOG=1; FTPDECK_LOG_FILE=<path> appends to a file instead of stderr,
// which is the only useful target while the terminal UI owns the screen.
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>
#include <ctime>
#include <mutex>

namespace ftpdeck {

inline bool logEnabled() {
    static const bool enabled = [] {
        const char* v = std::getenv("FTPDECK_LOG");
        return v && *v && *v != '0';
    }();
    return enabled;
}

inline std::FILE* logSink() {
    static std::FILE* sink = [] {
        const char* path = std::getenv("FTPDECK_LOG_FILE");
        if (path && *path) {
            if (std::FILE* f = std::fopen(path, "a")) return f;
        }
        return stderr;
    }();
    return sink;
}

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    // worker and UI thread both log
    static std::mutex mtx;
    std::lock_guard<std::mutex> lk(mtx);
    std::FILE* out = logSink();
    char stamp[32];
    std::time_t now = std::time(nullptr);
    std::tm tmv{};
    localtime_r(&now, &tmv);
    std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tmv);
    std::fprintf(out, "%s [ftpdeck][%s] ", stamp, level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(out, fmt, ap);
    va_end(ap);
    std::fprintf(out, "\n");
    std::fflush(out);
}

} // namespace ftpdeck

#define LOGI(fmt, ...) \
    do { \
        if (ftpdeck::logEnabled()) \
            ftpdeck::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGW(fmt, ...) \
    do { \
        if (ftpdeck::logEnabled()) \
            ftpdeck::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (ftpdeck::logEnabled()) \
            ftpdeck::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
