#include "util/log.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace skyline {

static std::atomic<LogLevel> g_level{LogLevel::Info};
static std::mutex g_out_mutex;

void log_set_level(LogLevel level) { g_level.store(level); }

LogLevel log_level() { return g_level.load(); }

static unsigned thread_tag() {
    /* Fold the opaque thread id into 4 hex digits */
    uint64_t h = std::hash<std::thread::id>()(std::this_thread::get_id());
    return static_cast<unsigned>((h ^ (h >> 16) ^ (h >> 32)) & 0xFFFF);
}

void log_msg(LogLevel level, const char* fmt, ...) {
    if (level < g_level.load()) return;

    const char* prefix = "";
    FILE* out = stdout;
    switch (level) {
        case LogLevel::Debug: prefix = "[DEBUG] "; break;
        case LogLevel::Info:  prefix = "[INFO]  "; break;
        case LogLevel::Warn:  prefix = "[WARN]  "; out = stderr; break;
        case LogLevel::Error: prefix = "[ERROR] "; out = stderr; break;
    }

    char buf[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(g_out_mutex);
    fprintf(out, "%s(%04x) %s\n", prefix, thread_tag(), buf);
    fflush(out);
}

} // namespace skyline
