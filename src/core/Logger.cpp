#include "core/Logger.h"

#include <cstdlib>
#include <cstring>

namespace ensemble {

std::atomic<int> Logger::level_{static_cast<int>(LogLevel::warn)};

std::array<LogEntry, Logger::kRingCapacity + 1> Logger::ringBuffer_;
std::atomic<int> Logger::readPos_{0};
std::atomic<int> Logger::writePos_{0};
std::atomic<int> Logger::dropped_{0};

std::chrono::steady_clock::time_point Logger::startTime_ = std::chrono::steady_clock::now();

Logger::LogCallback Logger::callback_ = nullptr;
void* Logger::callbackUserData_ = nullptr;

namespace {

const char* fileName(const char* path)
{
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

const char* levelTag(LogLevel level)
{
    switch (level) {
        case LogLevel::error: return "error";
        case LogLevel::warn:  return "warn";
        case LogLevel::info:  return "info";
        case LogLevel::debug: return "debug";
        case LogLevel::trace: return "trace";
        case LogLevel::off:   break;
    }
    return "???";
}

} // namespace

long Logger::elapsedMs()
{
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime_).count());
}

void Logger::format(char* out, std::size_t size, const char* thread, const char* tag,
                    const char* file, int line, const char* fmt, va_list args)
{
    char body[320];
    vsnprintf(body, sizeof(body), fmt, args);
    snprintf(out, size, "[%06ld][%s][%s] %s:%d %s", elapsedMs(), thread, tag, fileName(file),
             line, body);
}

void Logger::emit(int level, const char* message)
{
    if (callback_)
        callback_(level, message, callbackUserData_);
    else
        fprintf(stderr, "%s\n", message);
}

void Logger::setLevel(LogLevel level)
{
    level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::getLevel()
{
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

void Logger::log(LogLevel level, const char* file, int line, const char* fmt, ...)
{
    char message[sizeof(LogEntry::message)];
    va_list args;
    va_start(args, fmt);
    format(message, sizeof(message), "CT", levelTag(level), file, line, fmt, args);
    va_end(args);
    emit(static_cast<int>(level), message);
}

void Logger::logRT(LogLevel level, const char* file, int line, const char* fmt, ...)
{
    int w = writePos_.load(std::memory_order_relaxed);
    int nextW = (w + 1) % (kRingCapacity + 1);
    if (nextW == readPos_.load(std::memory_order_acquire)) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    va_list args;
    va_start(args, fmt);
    format(ringBuffer_[w].message, sizeof(LogEntry::message), "RT", levelTag(level), file, line,
           fmt, args);
    va_end(args);
    ringBuffer_[w].level = static_cast<int>(level);

    writePos_.store(nextW, std::memory_order_release);
}

void Logger::fatal(const char* file, int line, const char* fmt, ...)
{
    char body[320];
    va_list args;
    va_start(args, fmt);
    vsnprintf(body, sizeof(body), fmt, args);
    va_end(args);

    char message[sizeof(LogEntry::message)];
    snprintf(message, sizeof(message), "[%06ld][CT][error] %s:%d protocol violation: %s",
             elapsedMs(), fileName(file), line, body);

    drain();
    emit(static_cast<int>(LogLevel::error), message);
    fflush(stderr);
    std::abort();
}

void Logger::drain()
{
    for (int r = readPos_.load(std::memory_order_relaxed);
         r != writePos_.load(std::memory_order_acquire);
         r = readPos_.load(std::memory_order_relaxed)) {
        emit(ringBuffer_[r].level, ringBuffer_[r].message);
        readPos_.store((r + 1) % (kRingCapacity + 1), std::memory_order_release);
    }

    int dropped = dropped_.exchange(0, std::memory_order_relaxed);
    if (dropped > 0) {
        char message[96];
        snprintf(message, sizeof(message), "[%06ld][RT][warn] ring full, %d entries dropped",
                 elapsedMs(), dropped);
        emit(static_cast<int>(LogLevel::warn), message);
    }
}

void Logger::setCallback(LogCallback callback, void* userData)
{
    callback_ = callback;
    callbackUserData_ = userData;
}

} // namespace ensemble
