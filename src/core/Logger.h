#pragma once

#include <atomic>
#include <array>
#include <chrono>
#include <cstdarg>
#include <cstddef>
#include <cstdio>

namespace ensemble {

struct LogEntry {
    char message[512];
    int level;
};

enum class LogLevel : int { off = 0, error = 1, warn = 2, info = 3, debug = 4, trace = 5 };

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Actor-thread logging: formats and emits immediately
    static void log(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Audio-callback logging: lock-free push into the RT ring.
    // vsnprintf is allocation-free for %d, %s, %x, %p on mainstream platforms
    // but not guaranteed by POSIX; keep RT format strings simple.
    static void logRT(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Broken pipeline invariant. Logs regardless of level, drains the RT ring
    // and aborts the process.
    [[noreturn]] static void fatal(const char* file, int line, const char* fmt, ...);

    // Emits queued RT entries, then one warning if any were dropped on a full
    // ring. Never call from the audio callback.
    static void drain();

    using LogCallback = void(*)(int level, const char* message, void* userData);
    static void setCallback(LogCallback callback, void* userData);

private:
    static long elapsedMs();
    static void format(char* out, std::size_t size, const char* thread, const char* tag,
                       const char* file, int line, const char* fmt, va_list args);
    static void emit(int level, const char* message);

    static std::atomic<int> level_;

    static constexpr int kRingCapacity = 1024;
    static std::array<LogEntry, kRingCapacity + 1> ringBuffer_;
    static std::atomic<int> readPos_;
    static std::atomic<int> writePos_;
    static std::atomic<int> dropped_;

    static std::chrono::steady_clock::time_point startTime_;
    static LogCallback callback_;
    static void* callbackUserData_;
};

} // namespace ensemble

// --- Macros ---

#define EN_ERROR(fmt, ...) \
    do { if (ensemble::Logger::getLevel() >= ensemble::LogLevel::error) \
        ensemble::Logger::log(ensemble::LogLevel::error, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define EN_WARN(fmt, ...) \
    do { if (ensemble::Logger::getLevel() >= ensemble::LogLevel::warn) \
        ensemble::Logger::log(ensemble::LogLevel::warn, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define EN_WARN_RT(fmt, ...) \
    do { if (ensemble::Logger::getLevel() >= ensemble::LogLevel::warn) \
        ensemble::Logger::logRT(ensemble::LogLevel::warn, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define EN_INFO(fmt, ...) \
    do { if (ensemble::Logger::getLevel() >= ensemble::LogLevel::info) \
        ensemble::Logger::log(ensemble::LogLevel::info, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define EN_INFO_RT(fmt, ...) \
    do { if (ensemble::Logger::getLevel() >= ensemble::LogLevel::info) \
        ensemble::Logger::logRT(ensemble::LogLevel::info, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define EN_DEBUG(fmt, ...) \
    do { if (ensemble::Logger::getLevel() >= ensemble::LogLevel::debug) \
        ensemble::Logger::log(ensemble::LogLevel::debug, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define EN_DEBUG_RT(fmt, ...) \
    do { if (ensemble::Logger::getLevel() >= ensemble::LogLevel::debug) \
        ensemble::Logger::logRT(ensemble::LogLevel::debug, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define EN_TRACE(fmt, ...) \
    do { if (ensemble::Logger::getLevel() >= ensemble::LogLevel::trace) \
        ensemble::Logger::log(ensemble::LogLevel::trace, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define EN_PROTOCOL_VIOLATION(fmt, ...) \
    ensemble::Logger::fatal(__FILE__, __LINE__, fmt, ##__VA_ARGS__)
