//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_logger.cpp
// Purpose: Logger level parsing, filtering and file sink
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "logging/Logger.h"
#include "support/TestSupport.h"

using toolhost::test_support::TempDir;
using toolhost::test_support::readFile;

TEST(Logger, LevelFromStringIsCaseInsensitive) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::LOG_DEBUG_LEVEL);
    EXPECT_EQ(Logger::levelFromString("Warning"), LogLevel::LOG_WARN_LEVEL);
    EXPECT_EQ(Logger::levelFromString("ERROR"), LogLevel::LOG_ERROR_LEVEL);
    EXPECT_EQ(Logger::levelFromString("loud", LogLevel::LOG_WARN_LEVEL), LogLevel::LOG_WARN_LEVEL);
}

TEST(Logger, FileSinkHonoursLevel) {
    TempDir dir;
    const std::string path = dir.file("toolhost.log");
    const LogLevel saved = Logger::getLogLevel();
    ASSERT_TRUE(Logger::setLogFile(path));
    Logger::setLogLevel(LogLevel::LOG_WARN_LEVEL);

    LOG_INFO("hidden {}", 1);
    LOG_WARN("server '{}' restarted {} time(s)", "echo", 2);
    Logger::closeLogFile();
    Logger::setLogLevel(saved);

    const std::string text = readFile(path);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[WARN]"), std::string::npos);
    EXPECT_NE(text.find("server 'echo' restarted 2 time(s)"), std::string::npos);
    EXPECT_NE(text.find("test_logger.cpp:"), std::string::npos);
}

TEST(Logger, BadFormatStringIsReportedNotThrown) {
    TempDir dir;
    const std::string path = dir.file("bad.log");
    ASSERT_TRUE(Logger::setLogFile(path));
    EXPECT_NO_THROW(Logger::logf(LogLevel::LOG_ERROR_LEVEL, "missing {} {}", __FILE__, __LINE__, 1));
    Logger::closeLogFile();
    EXPECT_NE(readFile(path).find("Format error"), std::string::npos);
}
