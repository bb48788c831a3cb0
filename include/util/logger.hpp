#pragma once

#include <cstdarg>
#include <string>
#include <string_view>

namespace hotswap {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

bool ParseLogLevel(std::string_view s, LogLevel& out);

// Receives every emitted line (without timestamp/source prefix) so a host can
// mirror update progress into its own console. Called with the logger lock
// held, so implementations must not log.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void OnLogLine(LogLevel lvl, std::string_view line) = 0;
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Not owned. Pass nullptr to detach.
    void SetSink(ILogSink* sink);

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void VLog(LogLevel lvl, const char* fmt, va_list ap);
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::hotswap::Logger::Instance().LogWithSource(::hotswap::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::hotswap::Logger::Instance().LogWithSource(::hotswap::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::hotswap::Logger::Instance().LogWithSource(::hotswap::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::hotswap::Logger::Instance().LogWithSource(::hotswap::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace hotswap
