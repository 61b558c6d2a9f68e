#pragma once

#include <atomic>
#include <array>
#include <chrono>
#include <cstdarg>
#include <cstddef>
#include <cstdio>

namespace segue {

// One slot of the render-thread ring; formatted text, fixed size.
struct RtLogEntry {
    int level = 0;
    char text[512] = {};
};

enum class LogLevel : int { off = 0, error = 1, warn = 2, info = 3, debug = 4, trace = 5 };

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Accepts "off", "error", "warn", "info", "debug", "trace".
    // Returns false (level untouched) for anything else.
    static bool setLevelByName(const char* name);
    static const char* levelName(LogLevel level);

    // Control-thread logging: formatted immediately, sent to stderr or the callback
    static void log(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Render-thread logging: lock-free push into the ring, flushed by drain().
    // Drops the entry when the ring is full.
    static void logRT(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Flush render-thread entries (control thread only)
    static void drain();

    // Host log capture. Pass nullptr to go back to stderr.
    using LogCallback = void(*)(int level, const char* message, void* userData);
    static void setCallback(LogCallback callback, void* userData);

private:
    // "[elapsed][tag][level] file:line text" into out, truncated to size.
    static void format(char* out, size_t size, const char* tag, LogLevel level,
                       const char* file, int line, const char* fmt, va_list args);
    static void emit(int level, const char* message);

    static std::atomic<int> level_;

    static constexpr int kRingSlots = 1024;
    static std::array<RtLogEntry, kRingSlots + 1> ring_;
    static std::atomic<int> ringHead_; // next slot drain() reads
    static std::atomic<int> ringTail_; // next slot logRT() writes

    static const std::chrono::steady_clock::time_point kStart;
    static std::atomic<LogCallback> callback_;
    static std::atomic<void*> callbackUserData_;
};

} // namespace segue

// --- Macros ---

#define SG_LOG_AT(lvl, fmt, ...) \
    do { if (segue::Logger::getLevel() >= segue::LogLevel::lvl) \
        segue::Logger::log(segue::LogLevel::lvl, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define SG_LOG_AT_RT(lvl, fmt, ...) \
    do { if (segue::Logger::getLevel() >= segue::LogLevel::lvl) \
        segue::Logger::logRT(segue::LogLevel::lvl, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define SG_ERROR(fmt, ...)    SG_LOG_AT(error, fmt, ##__VA_ARGS__)
#define SG_WARN(fmt, ...)     SG_LOG_AT(warn, fmt, ##__VA_ARGS__)
#define SG_INFO(fmt, ...)     SG_LOG_AT(info, fmt, ##__VA_ARGS__)
#define SG_DEBUG(fmt, ...)    SG_LOG_AT(debug, fmt, ##__VA_ARGS__)
#define SG_TRACE(fmt, ...)    SG_LOG_AT(trace, fmt, ##__VA_ARGS__)

#define SG_ERROR_RT(fmt, ...) SG_LOG_AT_RT(error, fmt, ##__VA_ARGS__)
#define SG_WARN_RT(fmt, ...)  SG_LOG_AT_RT(warn, fmt, ##__VA_ARGS__)
#define SG_INFO_RT(fmt, ...)  SG_LOG_AT_RT(info, fmt, ##__VA_ARGS__)
#define SG_DEBUG_RT(fmt, ...) SG_LOG_AT_RT(debug, fmt, ##__VA_ARGS__)
#define SG_TRACE_RT(fmt, ...) SG_LOG_AT_RT(trace, fmt, ##__VA_ARGS__)
