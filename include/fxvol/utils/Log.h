#ifndef FXVOL_LOG_H
#define FXVOL_LOG_H

#include <functional>
#include <string>

/**
 * Process-wide log facility
 * - numeric levels (DEBUG=10 ... CRITICAL=50), DISABLED suppresses everything
 * - replaceable sink; the default sink prints "MM-DD HH:MM:SS | LEVEL | source | msg" to stderr
 * - the sink is invoked outside the facility's lock, so it may log in turn; a custom
 *   sink called from worker threads of the resilience layer must be thread-safe
 */

enum class LogLevel : int { Debug = 10, Info = 20, Warning = 30, Error = 40, Critical = 50, Disabled = 99 };

struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string source;   // component name, e.g. "CircuitBreaker"
    std::string message;
};

using LogSink = std::function<void(const LogRecord&)>;

class Log
{
public:
    static void setSink(LogSink sink);   // empty sink restores the default
    static void setLevel(LogLevel level); // only records with level >= this are emitted
    static LogLevel level();

    static void write(LogLevel level, const std::string& source, const std::string& message);

    static void debug(const std::string& source, const std::string& message)   { write(LogLevel::Debug, source, message); }
    static void info(const std::string& source, const std::string& message)    { write(LogLevel::Info, source, message); }
    static void warning(const std::string& source, const std::string& message) { write(LogLevel::Warning, source, message); }
    static void error(const std::string& source, const std::string& message)   { write(LogLevel::Error, source, message); }

    static std::string levelToString(LogLevel level);
    static void defaultSink(const LogRecord& record);

private:
    Log() = delete;
};

#endif //FXVOL_LOG_H
