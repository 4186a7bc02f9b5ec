#pragma once

#include <cstdarg>
#include <string>

namespace rbp {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn"/"warning", "error", "none" (case-insensitive).
bool ParseLogLevel(const std::string& s, LogLevel& out);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // printf-style logging; the Log* macros supply file and line.
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

#define LogDebug(...) ::rbp::Logger::Instance().LogWithSource(::rbp::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::rbp::Logger::Instance().LogWithSource(::rbp::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::rbp::Logger::Instance().LogWithSource(::rbp::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::rbp::Logger::Instance().LogWithSource(::rbp::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace rbp
