#include "arqsim/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdlib>
#include <mutex>

namespace arqsim {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::WARN)};
std::mutex g_sink_mutex;
FILE* g_sink = nullptr;  // nullptr = stderr
FILE* g_owned_sink = nullptr;

const auto g_start = std::chrono::steady_clock::now();

} // namespace

void setLogLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_level.load());
}

void setLogFile(FILE* file) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = file;
}

bool isLogEnabled(LogLevel level) {
    return level != LogLevel::OFF && static_cast<int>(level) >= g_level.load();
}

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF";
        default: return "?";
    }
}

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "trace") return LogLevel::TRACE;
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "info") return LogLevel::INFO;
    if (s == "warn" || s == "warning") return LogLevel::WARN;
    if (s == "error") return LogLevel::ERROR;
    if (s == "off" || s == "none") return LogLevel::OFF;
    return fallback;
}

void log(LogLevel level, const char* category, const char* fmt, ...) {
    if (!isLogEnabled(level)) {
        return;
    }

    char msg[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    double elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - g_start).count();

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    FILE* out = g_sink ? g_sink : stderr;
    std::fprintf(out, "[%9.3f] %-5s [%s] %s\n", elapsed, logLevelToString(level), category, msg);
    std::fflush(out);
}

void configureLoggingFromEnv() {
    if (const char* level = std::getenv("ARQSIM_LOG")) {
        setLogLevel(parseLogLevel(level, getLogLevel()));
    }

    const char* path = std::getenv("ARQSIM_LOG_FILE");
    if (path && path[0] != '\0') {
        FILE* f = std::fopen(path, "a");
        if (!f) {
            log(LogLevel::WARN, "APP", "Cannot open log file %s, using stderr", path);
            return;
        }
        std::lock_guard<std::mutex> lock(g_sink_mutex);
        if (g_owned_sink) {
            std::fclose(g_owned_sink);
        }
        g_owned_sink = f;
        g_sink = f;
    }
}

} // namespace arqsim
