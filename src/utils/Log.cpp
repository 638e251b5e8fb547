#include <fxvol/utils/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
    std::mutex& logMutex() {
        static std::mutex mutex;
        return mutex;
    }

    LogSink& currentSink() {
        static LogSink sink;
        return sink;
    }

    LogLevel& currentLevel() {
        static LogLevel level = LogLevel::Info;
        return level;
    }

    // "MM-DD HH:MM:SS"
    std::string formatTime() {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);
        std::ostringstream os;
        os << std::put_time(&tm, "%m-%d %H:%M:%S");
        return os.str();
    }
}

void Log::setSink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(logMutex());
    currentSink() = std::move(sink);
}

void Log::setLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(logMutex());
    currentLevel() = level;
}

LogLevel Log::level()
{
    std::lock_guard<std::mutex> lock(logMutex());
    return currentLevel();
}

void Log::write(LogLevel level, const std::string& source, const std::string& message)
{
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(logMutex());
        if (static_cast<int>(level) < static_cast<int>(currentLevel()) || level == LogLevel::Disabled) {
            return;
        }
        sink = currentSink();
    }

    // called unlocked: a sink may itself log or swap the sink
    LogRecord record{level, source, message};
    if (sink) {
        sink(record);
    } else {
        defaultSink(record);
    }
}

std::string Log::levelToString(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Disabled: return "DISABLED";
    }
    return "UNKNOWN";
}

void Log::defaultSink(const LogRecord& record)
{
    static std::mutex outputMutex;
    std::lock_guard<std::mutex> lock(outputMutex);
    std::cerr << formatTime() << " | " << levelToString(record.level)
              << " | " << record.source << " | " << record.message << std::endl;
}
