#pragma once

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace screenier {

enum class LogLevel { Info, Warn, Error, Debug };

inline bool g_debug_enabled = false;
inline FILE* g_log_file = nullptr;

inline void setDebugLogging(bool enabled) {
    g_debug_enabled = enabled;
}

inline bool debugLoggingEnabled() {
    return g_debug_enabled;
}

inline void initFileLogging() {
    const char* logPath = std::getenv("SCREENIER_LOG_FILE");
    if (logPath && logPath[0] != '\0') {
        g_log_file = std::fopen(logPath, "a");
        if (g_log_file) {
            std::fprintf(g_log_file, "\n=== screenier started ===\n");
            std::fflush(g_log_file);
        }
    }
}

inline void closeFileLogging() {
    if (g_log_file) {
        std::fclose(g_log_file);
        g_log_file = nullptr;
    }
}

inline const char* logLevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Debug:
            return "DEBUG";
    }
    return "INFO";
}

inline void logMessageV(LogLevel level, const char* fmt, va_list args) {
    const char* tag = logLevelTag(level);

    std::fprintf(stderr, "[%s] ", tag);
    va_list args_copy;
    va_copy(args_copy, args);
    std::vfprintf(stderr, fmt, args_copy);
    va_end(args_copy);
    std::fprintf(stderr, "\n");

    if (g_log_file) {
        std::fprintf(g_log_file, "[%s] ", tag);
        va_copy(args_copy, args);
        std::vfprintf(g_log_file, fmt, args_copy);
        va_end(args_copy);
        std::fprintf(g_log_file, "\n");
        std::fflush(g_log_file);
    }
}

inline void logMessage(LogLevel level, const char* fmt, ...) {
    if (level == LogLevel::Debug && !g_debug_enabled) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    logMessageV(level, fmt, args);
    va_end(args);
}

// Debug output gated by a caller-owned flag instead of the process-wide
// switch. Capture runs pass their own CaptureConfig::debug here.
inline void logDebugIf(bool enabled, const char* fmt, ...) {
    if (!enabled) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    logMessageV(LogLevel::Debug, fmt, args);
    va_end(args);
}

}  // namespace screenier

#define LOG_INFO(...) \
    ::screenier::logMessage(::screenier::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...) \
    ::screenier::logMessage(::screenier::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) \
    ::screenier::logMessage(::screenier::LogLevel::Error, __VA_ARGS__)
#define LOG_DEBUG(...) \
    ::screenier::logMessage(::screenier::LogLevel::Debug, __VA_ARGS__)
#define LOG_DEBUG_IF(enabled, ...) ::screenier::logDebugIf((enabled), __VA_ARGS__)
