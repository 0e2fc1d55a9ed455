//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sinks, level parsing and line formatting
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <thread>

#include "env/EnvVars.h"

namespace {

std::mutex& sinkMutex() {
    static std::mutex m;
    return m;
}

std::ofstream& logFile() {
    static std::ofstream f;
    return f;
}

const char* baseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    ::localtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return fmt::format("{}.{:03}", buf, ms);
}

// Short stable tag for the calling thread
unsigned threadTag() {
    return static_cast<unsigned>(std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xffff);
}

} // namespace

std::atomic<LogLevel> Logger::sLogLevel{
    Logger::levelFromString(GetEnvOrDefault("TOOLHOST_LOG_LEVEL", "INFO"))};

LogLevel Logger::levelFromString(const std::string& lvl, LogLevel fallback) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) {
        s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    }
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "INFO") return LogLevel::LOG_INFO_LEVEL;
    if (s == "WARN" || s == "WARNING") return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    return fallback;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG_LEVEL: return "DEBUG";
        case LogLevel::LOG_INFO_LEVEL: return "INFO";
        case LogLevel::LOG_WARN_LEVEL: return "WARN";
        case LogLevel::LOG_ERROR_LEVEL: return "ERROR";
    }
    return "?";
}

LogLevel Logger::configureFromEnv() {
    const std::string lvl = GetEnvOrDefault("TOOLHOST_LOG_LEVEL", "");
    if (!lvl.empty()) {
        setLogLevel(levelFromString(lvl, getLogLevel()));
    }
    const std::string file = GetEnvOrDefault("TOOLHOST_LOG_FILE", "");
    if (!file.empty()) {
        (void)setLogFile(file);
    }
    return getLogLevel();
}

bool Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sinkMutex());
    auto& f = logFile();
    if (f.is_open()) {
        f.close();
    }
    f.open(filePath, std::ios::out | std::ios::app);
    if (!f.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (" << std::strerror(errno) << ")\n";
        return false;
    }
    f << "=== " << timestamp() << " log opened ===\n";
    f.flush();
    return true;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(sinkMutex());
    if (logFile().is_open()) {
        logFile().close();
    }
}

void Logger::write(LogLevel level, const std::string& msg, const char* file, unsigned int line) {
    static const bool colorEnabled = GetEnvBool("TOOLHOST_LOG_COLOR", false);
    // stdout may carry CLI output
    static const bool useStdout = GetEnvBool("TOOLHOST_LOG_STDOUT", false);

    const char* label = levelName(level);
    const std::string prefix = timestamp();
    const unsigned tag = threadTag();
    const std::string plain = fmt::format("{} [{}] t:{:04x} {}:{}: {}\n", prefix, label, tag, baseName(file), line, msg);

    std::lock_guard<std::mutex> lock(sinkMutex());
    std::ostream& console = useStdout ? std::cout : std::cerr;
    if (colorEnabled) {
        const char* color = level >= LogLevel::LOG_ERROR_LEVEL ? "\033[38;5;88m"
                          : level == LogLevel::LOG_WARN_LEVEL ? "\033[33m" : "\033[35m";
        console << fmt::format("{} [{}{}\033[0m] t:{:04x} {}:{}: {}\n", prefix, color, label, tag, baseName(file), line, msg);
    } else {
        console << plain;
    }
    console.flush();

    auto& f = logFile();
    if (f.is_open()) {
        f << plain;
        f.flush();
    }
}
