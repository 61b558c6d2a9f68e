#include "core/Logger.h"

#include <cstring>

namespace segue {

std::atomic<int> Logger::level_{static_cast<int>(LogLevel::warn)};

std::array<RtLogEntry, Logger::kRingSlots + 1> Logger::ring_;
std::atomic<int> Logger::ringHead_{0};
std::atomic<int> Logger::ringTail_{0};

const std::chrono::steady_clock::time_point Logger::kStart = std::chrono::steady_clock::now();

std::atomic<Logger::LogCallback> Logger::callback_{nullptr};
std::atomic<void*> Logger::callbackUserData_{nullptr};

static const char* fileName(const char* path)
{
    const char* slash = std::strrchr(path, '/');
    const char* backslash = std::strrchr(path, '\\');
    const char* sep = slash > backslash ? slash : backslash;
    return sep ? sep + 1 : path;
}

static int nextSlot(int slot, int slots)
{
    return slot + 1 == slots ? 0 : slot + 1;
}

void Logger::format(char* out, size_t size, const char* tag, LogLevel level,
                    const char* file, int line, const char* fmt, va_list args)
{
    long ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - kStart).count());

    int prefix = snprintf(out, size, "[%06ld][%s][%s] %s:%d ",
                          ms, tag, levelName(level), fileName(file), line);
    if (prefix < 0 || static_cast<size_t>(prefix) >= size)
        return;
    vsnprintf(out + prefix, size - static_cast<size_t>(prefix), fmt, args);
}

void Logger::emit(int level, const char* message)
{
    if (LogCallback cb = callback_.load(std::memory_order_acquire))
    {
        cb(level, message, callbackUserData_.load(std::memory_order_acquire));
        return;
    }
    fprintf(stderr, "%s\n", message);
}

// ═══════════════════════════════════════════════════════════════════
// Level
// ═══════════════════════════════════════════════════════════════════

void Logger::setLevel(LogLevel level)
{
    level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::getLevel()
{
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

const char* Logger::levelName(LogLevel level)
{
    static const char* const kNames[] = {"off", "error", "warn", "info", "debug", "trace"};
    int i = static_cast<int>(level);
    return i >= 0 && i <= static_cast<int>(LogLevel::trace) ? kNames[i] : "???";
}

bool Logger::setLevelByName(const char* name)
{
    if (!name)
        return false;

    for (int i = static_cast<int>(LogLevel::off); i <= static_cast<int>(LogLevel::trace); ++i)
    {
        auto level = static_cast<LogLevel>(i);
        if (std::strcmp(name, levelName(level)) == 0)
        {
            setLevel(level);
            return true;
        }
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════
// Output
// ═══════════════════════════════════════════════════════════════════

void Logger::log(LogLevel level, const char* file, int line, const char* fmt, ...)
{
    char text[512];
    va_list args;
    va_start(args, fmt);
    format(text, sizeof(text), "CT", level, file, line, fmt, args);
    va_end(args);

    emit(static_cast<int>(level), text);
}

void Logger::logRT(LogLevel level, const char* file, int line, const char* fmt, ...)
{
    int tail = ringTail_.load(std::memory_order_relaxed);
    int next = nextSlot(tail, kRingSlots + 1);
    if (next == ringHead_.load(std::memory_order_acquire))
        return; // full, drop

    RtLogEntry& slot = ring_[tail];
    va_list args;
    va_start(args, fmt);
    format(slot.text, sizeof(slot.text), "RT", level, file, line, fmt, args);
    va_end(args);
    slot.level = static_cast<int>(level);

    ringTail_.store(next, std::memory_order_release);
}

void Logger::drain()
{
    int head = ringHead_.load(std::memory_order_relaxed);
    while (head != ringTail_.load(std::memory_order_acquire))
    {
        emit(ring_[head].level, ring_[head].text);
        head = nextSlot(head, kRingSlots + 1);
        ringHead_.store(head, std::memory_order_release);
    }
}

void Logger::setCallback(LogCallback callback, void* userData)
{
    callbackUserData_.store(userData, std::memory_order_release);
    callback_.store(callback, std::memory_order_release);
}

} // namespace segue
