//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide leveled logger with {fmt}-style formatting; console output defaults to stderr.
//==========================================================================================================
#pragma once

#include <atomic>
#include <string>
#include <fmt/format.h>

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL
};

//==========================================================================================================
// Logger
// Purpose: One sink shared by every thread (stream readers, stderr drains, io threads, callers).
//          Lines look like "2025-01-01 12:00:00.123 [INFO] t:1a2b StdioTransport.cpp:42: message".
// Environment:
//   TOOLHOST_LOG_LEVEL   debug|info|warn|error (initial level, default info)
//   TOOLHOST_LOG_FILE    also append every line to this file
//   TOOLHOST_LOG_STDOUT  1 to log to stdout instead of stderr
//   TOOLHOST_LOG_COLOR   1 to colorize the level label
//==========================================================================================================
class Logger {
public:
    // Case-insensitive; "warning" is accepted. Unknown strings map to fallback.
    static LogLevel levelFromString(const std::string& lvl, LogLevel fallback = LogLevel::LOG_INFO_LEVEL);
    static const char* levelName(LogLevel level);

    static void setLogLevel(LogLevel level) { sLogLevel.store(level, std::memory_order_relaxed); }
    static LogLevel getLogLevel() { return sLogLevel.load(std::memory_order_relaxed); }
    static bool enabled(LogLevel level) { return getLogLevel() <= level; }

    // Applies TOOLHOST_LOG_LEVEL and TOOLHOST_LOG_FILE when set; returns the effective level.
    static LogLevel configureFromEnv();

    // Appends to filePath in addition to the console. Returns false when the file cannot be opened.
    static bool setLogFile(const std::string& filePath);
    static void closeLogFile();

    template <typename... Args>
    static void logf(LogLevel level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = fmt::vformat(fmt, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            buffer = fmt::format("Format error: {} (in \"{}\")", e.what(), fmt);
        }
        write(level, buffer, file, line);
    }

    static void write(LogLevel level, const std::string& msg, const char* file, unsigned int line);

private:
    static std::atomic<LogLevel> sLogLevel;
};

#define TOOLHOST_LOG_AT(level, fmt, ...) \
    do { if (Logger::enabled(level)) Logger::logf(level, fmt, __FILE__, __LINE__, ##__VA_ARGS__); } while (0)

#define LOG_DEBUG(fmt, ...) TOOLHOST_LOG_AT(LogLevel::LOG_DEBUG_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  TOOLHOST_LOG_AT(LogLevel::LOG_INFO_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  TOOLHOST_LOG_AT(LogLevel::LOG_WARN_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) TOOLHOST_LOG_AT(LogLevel::LOG_ERROR_LEVEL, fmt, ##__VA_ARGS__)

// Function scope tracing in _DEBUG builds
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
