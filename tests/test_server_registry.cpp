//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_registry.cpp
// Purpose: Server registry loading, custom server persistence and id derivation
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolhost/ServerRegistry.h"
#include "toolhost/errors/Errors.h"
#include "support/TestSupport.h"

using namespace toolhost;
using toolhost::test_support::TempDir;
using toolhost::test_support::readFile;
using toolhost::test_support::writeFile;

namespace {
const char* kStaticConfig = R"({
  "servers": {
    "echo": {
      "name": "Echo",
      "description": "echo server",
      "command": "python3",
      "args": ["echo_server.py", "--quiet"],
      "env": {"ECHO_MODE": "fast"},
      "timeout_seconds": 12
    },
    "off": {"command": "true", "enabled": false},
    "remote": {"url": "https://tools.example.com/mcp", "bearer_token": "abc"},
    "broken": {"name": "no transport"}
  }
})";

RegistryOptions optionsIn(const TempDir& dir) {
    RegistryOptions o;
    o.configPath = dir.file("tool_servers.json");
    o.customServersPath = dir.file("custom/custom_servers.json");
    return o;
}
} // namespace

TEST(ServerRegistry, LoadsStdioAndHttpBuiltins) {
    TempDir dir;
    writeFile(dir.file("tool_servers.json"), kStaticConfig);
    ServerRegistry reg(optionsIn(dir));
    reg.Load();

    auto all = reg.ListConfigs();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, "echo");
    EXPECT_EQ(all[1].id, "off");
    EXPECT_EQ(all[2].id, "remote");
    EXPECT_FALSE(reg.Contains("broken"));

    auto echo = reg.Find("echo");
    ASSERT_TRUE(echo.has_value());
    EXPECT_EQ(echo->Kind(), TransportKind::Stdio);
    EXPECT_EQ(echo->timeoutSeconds, 12);
    EXPECT_FALSE(echo->isCustom);
    const auto& stdio = std::get<StdioConfig>(echo->transport);
    EXPECT_EQ(stdio.command, "python3");
    ASSERT_EQ(stdio.args.size(), 2u);
    EXPECT_EQ(stdio.args[1], "--quiet");
    EXPECT_EQ(stdio.env.at("ECHO_MODE"), "fast");

    EXPECT_FALSE(reg.Find("off")->enabled);

    auto remote = reg.Find("remote");
    ASSERT_TRUE(remote.has_value());
    EXPECT_EQ(remote->Kind(), TransportKind::Http);
    EXPECT_EQ(std::get<HttpConfig>(remote->transport).bearerToken, "abc");
    EXPECT_EQ(remote->timeoutSeconds, DefaultTimeoutSeconds);
}

TEST(ServerRegistry, MissingOrInvalidFilesYieldEmptyCatalog) {
    TempDir dir;
    ServerRegistry missing(optionsIn(dir));
    EXPECT_NO_THROW(missing.Load());
    EXPECT_TRUE(missing.ListConfigs().empty());

    writeFile(dir.file("tool_servers.json"), "{ not json");
    ServerRegistry invalid(optionsIn(dir));
    EXPECT_NO_THROW(invalid.Load());
    EXPECT_TRUE(invalid.ListConfigs().empty());
}

TEST(ServerRegistry, CustomServerSurvivesReload) {
    TempDir dir;
    writeFile(dir.file("tool_servers.json"), kStaticConfig);
    {
        ServerRegistry reg(optionsIn(dir));
        reg.Load();
        auto cfg = reg.AddCustomServer("search", "Search", "http://localhost:8931/mcp", "web search", 45, "tok");
        EXPECT_TRUE(cfg.isCustom);
        EXPECT_EQ(cfg.Kind(), TransportKind::Http);
    }

    const std::string onDisk = readFile(dir.file("custom/custom_servers.json"));
    JSONValue root = ParseJSON(onDisk);
    const JSONValue* servers = root.Find("servers");
    ASSERT_TRUE(servers && servers->IsObject());
    EXPECT_EQ(std::get<JSONValue::Object>(servers->value).size(), 1u) << "builtins must not be persisted";
    const JSONValue* search = servers->Find("search");
    ASSERT_TRUE(search != nullptr);
    EXPECT_EQ(search->GetString("url"), "http://localhost:8931/mcp");
    EXPECT_EQ(search->GetInt("timeout_seconds", 0), 45);
    EXPECT_EQ(search->GetString("bearer_token"), "tok");

    ServerRegistry reloaded(optionsIn(dir));
    reloaded.Load();
    auto found = reloaded.Find("search");
    ASSERT_TRUE(found.has_value());
    EXPECT_TRUE(found->isCustom);
    EXPECT_EQ(found->name, "Search");
    EXPECT_EQ(found->description, "web search");
    EXPECT_EQ(found->timeoutSeconds, 45);
    EXPECT_EQ(std::get<HttpConfig>(found->transport).url, "http://localhost:8931/mcp");
    EXPECT_EQ(reloaded.ListConfigs().size(), 4u);
}

TEST(ServerRegistry, AddRejectsDuplicatesAndBadInput) {
    TempDir dir;
    writeFile(dir.file("tool_servers.json"), kStaticConfig);
    ServerRegistry reg(optionsIn(dir));
    reg.Load();

    EXPECT_THROW(reg.AddCustomServer("echo", "x", "http://h:1/"), errors::DuplicateServerError);
    EXPECT_THROW(reg.AddCustomServer("", "x", "http://h:1/"), errors::InvalidOperationError);
    EXPECT_THROW(reg.AddCustomServer("ftp", "x", "ftp://h/"), errors::InvalidOperationError);
    EXPECT_THROW(reg.AddCustomServer("nohost", "x", "http:///path"), errors::InvalidOperationError);
    EXPECT_THROW(reg.AddCustomServer("t", "x", "http://h/", "", 0), errors::InvalidOperationError);
    EXPECT_EQ(reg.ListConfigs().size(), 3u);
}

TEST(ServerRegistry, DeleteRulesAndPersistence) {
    TempDir dir;
    writeFile(dir.file("tool_servers.json"), kStaticConfig);
    ServerRegistry reg(optionsIn(dir));
    reg.Load();

    EXPECT_THROW(reg.DeleteCustomServer("nope"), errors::NotFoundError);
    EXPECT_THROW(reg.DeleteCustomServer("echo"), errors::InvalidOperationError);

    reg.AddCustomServer("a", "A", "http://a.example.com/");
    reg.AddCustomServer("b", "B", "http://b.example.com/");
    reg.DeleteCustomServer("a");
    EXPECT_FALSE(reg.Contains("a"));

    JSONValue root = ParseJSON(readFile(dir.file("custom/custom_servers.json")));
    const JSONValue* servers = root.Find("servers");
    ASSERT_TRUE(servers != nullptr);
    EXPECT_EQ(servers->Find("a"), nullptr);
    EXPECT_NE(servers->Find("b"), nullptr);
}

TEST(ServerRegistry, FailedWriteRollsBack) {
    TempDir dir;
    // A regular file where the custom servers directory should be
    writeFile(dir.file("blocker"), "x");
    RegistryOptions o;
    o.configPath = dir.file("tool_servers.json");
    o.customServersPath = dir.file("blocker/custom_servers.json");
    ServerRegistry reg(o);
    reg.Load();

    EXPECT_THROW(reg.AddCustomServer("x", "X", "http://x.example.com/"), errors::ConfigError);
    EXPECT_FALSE(reg.Contains("x"));
}

TEST(ServerRegistry, CustomEntriesCannotShadowBuiltins) {
    TempDir dir;
    writeFile(dir.file("tool_servers.json"), kStaticConfig);
    std::filesystem::create_directories(dir.path() / "custom");
    writeFile(dir.file("custom/custom_servers.json"),
              R"({"servers":{"echo":{"url":"http://evil/"},"extra":{"url":"http://extra:9000/mcp"},"cmd":{"command":"ls"}}})");
    ServerRegistry reg(optionsIn(dir));
    reg.Load();

    EXPECT_EQ(reg.Find("echo")->Kind(), TransportKind::Stdio);
    EXPECT_FALSE(reg.Find("echo")->isCustom);
    ASSERT_TRUE(reg.Contains("extra"));
    EXPECT_TRUE(reg.Find("extra")->isCustom);
    EXPECT_FALSE(reg.Contains("cmd"));
}

TEST(ServerRegistry, MakeServerIdFromUrl) {
    EXPECT_EQ(ServerRegistry::MakeServerIdFromUrl("http://localhost:8931/mcp"), "localhost-8931");
    EXPECT_EQ(ServerRegistry::MakeServerIdFromUrl("https://tools.example.com/mcp"), "tools-example-com-443");
    EXPECT_EQ(ServerRegistry::MakeServerIdFromUrl("http://10.0.0.5/"), "10-0-0-5-80");
    EXPECT_THROW(ServerRegistry::MakeServerIdFromUrl("not a url"), errors::InvalidOperationError);
}

TEST(ServerRegistry, OutOfRangeTimeoutFallsBackToDefault) {
    auto wrapped = ServerConfigFromJSON("s", ParseJSON(R"({"command":"x","timeout_seconds":4294967297})"), false);
    ASSERT_TRUE(wrapped.has_value());
    EXPECT_EQ(wrapped->timeoutSeconds, DefaultTimeoutSeconds);

    auto huge = ServerConfigFromJSON("s", ParseJSON(R"({"command":"x","timeout_seconds":1e20})"), false);
    ASSERT_TRUE(huge.has_value());
    EXPECT_EQ(huge->timeoutSeconds, DefaultTimeoutSeconds);

    auto exact = ServerConfigFromJSON("s", ParseJSON(R"({"command":"x","timeout_seconds":2147483647})"), false);
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(exact->timeoutSeconds, 2147483647);

    EXPECT_EQ(ParseJSON(R"({"n":1e20})").GetInt("n", -1), -1);
    EXPECT_EQ(ParseJSON(R"({"n":42.0})").GetInt("n", -1), 42);
}
