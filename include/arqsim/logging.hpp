#pragma once

#include <cstdio>
#include <string>

namespace arqsim {

enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5,
};

// Global sink configuration (thread-safe)
void setLogLevel(LogLevel level);
LogLevel getLogLevel();
void setLogFile(FILE* file);   // nullptr = stderr

bool isLogEnabled(LogLevel level);

// printf-style message tagged with a category ("SIM", "LINK", ...)
void log(LogLevel level, const char* category, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

const char* logLevelToString(LogLevel level);

// "trace", "debug", "info", "warn", "error", "off" (case-insensitive).
// Unrecognized names leave `fallback`.
LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::WARN);

// Apply ARQSIM_LOG / ARQSIM_LOG_FILE from the environment
void configureLoggingFromEnv();

} // namespace arqsim

#define ARQSIM_LOG_CAT(cat, level, ...)                                        \
    do {                                                                       \
        if (::arqsim::isLogEnabled(::arqsim::LogLevel::level)) {               \
            ::arqsim::log(::arqsim::LogLevel::level, cat, __VA_ARGS__);        \
        }                                                                      \
    } while (0)

#define LOG_SIM(level, ...)  ARQSIM_LOG_CAT("SIM", level, __VA_ARGS__)
#define LOG_CHAN(level, ...) ARQSIM_LOG_CAT("CHAN", level, __VA_ARGS__)
#define LOG_LINK(level, ...) ARQSIM_LOG_CAT("LINK", level, __VA_ARGS__)
#define LOG_APP(level, ...)  ARQSIM_LOG_CAT("APP", level, __VA_ARGS__)
