//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_transport.cpp
// Purpose: StdioTransport + Connection against /bin/sh scripted child processes
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <future>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>

#include "toolhost/ChildProcess.hpp"
#include "toolhost/Connection.h"
#include "toolhost/StdioTransport.hpp"
#include "toolhost/errors/Errors.h"
#include "support/TestSupport.h"

using namespace toolhost;
using toolhost::test_support::TempDir;
using toolhost::test_support::readFile;
using toolhost::test_support::waitFor;

namespace {

StdioConfig shell(const std::string& script) {
    StdioConfig cfg;
    cfg.command = "/bin/sh";
    cfg.args = {"-c", script};
    return cfg;
}

std::unique_ptr<StdioTransport> startShell(const std::string& script, const std::string& id = "sh") {
    auto t = std::make_unique<StdioTransport>(shell(script), id);
    t->SetStopGracePeriod(std::chrono::milliseconds(500));
    t->Start().get();
    return t;
}

bool processGone(pid_t pid) {
    return ::kill(pid, 0) != 0 && errno == ESRCH;
}

} // namespace

TEST(StdioTransport, ResponsesAreMatchedByIdOutOfOrder) {
    // Answers only after both requests arrived, and in reverse order
    auto t = startShell(
        "read a; read b; "
        "printf '{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":\"second\"}\\n{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":\"first\"}\\n'; "
        "cat > /dev/null");

    auto f1 = t->SendRequest(std::make_unique<JSONRPCRequest>(int64_t{1}, "a"));
    auto f2 = t->SendRequest(std::make_unique<JSONRPCRequest>(int64_t{2}, "b"));
    ASSERT_EQ(f1.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ASSERT_EQ(f2.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto r1 = f1.get();
    auto r2 = f2.get();
    EXPECT_EQ(std::get<std::string>(r1->result->value), "first");
    EXPECT_EQ(std::get<std::string>(r2->result->value), "second");
    EXPECT_EQ(t->PendingRequestCount(), 0u);
    t->Close().get();
}

TEST(StdioTransport, SkipsMalformedLinesAndDeliversNotifications) {
    auto t = std::make_unique<StdioTransport>(shell(
        "read a; "
        "printf 'this is not json\\n\\n{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\",\"params\":{\"level\":\"info\"}}\\n'; "
        "printf '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":42}\\r\\n'; "
        "cat > /dev/null"), "noisy");
    std::promise<std::string> gotNotification;
    auto notified = gotNotification.get_future();
    t->SetNotificationHandler([&gotNotification](std::unique_ptr<JSONRPCNotification> n) {
        gotNotification.set_value(n->method);
    });
    t->SetStopGracePeriod(std::chrono::milliseconds(500));
    t->Start().get();

    Connection conn("noisy", TransportKind::Stdio, std::move(t), std::chrono::seconds(5));
    JSONValue result = conn.Request("tools/list");
    EXPECT_EQ(std::get<int64_t>(result.value), 42);
    ASSERT_EQ(notified.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(notified.get(), "notifications/message");
}

TEST(StdioTransport, TimeoutRemovesSlotAndLateReplyIsDiscarded) {
    // First reply arrives after the caller gave up; second request still gets its own answer
    auto t = startShell(
        "read a; sleep 0.4; printf '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":\"late\"}\\n'; "
        "read b; printf '{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":\"fresh\"}\\n'; "
        "cat > /dev/null");
    Connection conn("slow", TransportKind::Stdio, std::move(t), std::chrono::seconds(5));

    EXPECT_THROW(conn.Request("slow/op", std::nullopt, std::chrono::milliseconds(100)), errors::RequestTimeoutError);
    EXPECT_EQ(conn.PendingRequests(), 0u);

    JSONValue second = conn.Request("fast/op");
    EXPECT_EQ(std::get<std::string>(second.value), "fresh");
    EXPECT_EQ(conn.PendingRequests(), 0u);
    EXPECT_TRUE(conn.IsAlive());
}

TEST(StdioTransport, CloseFailsEveryPendingRequestAndKillsProcess) {
    auto t = startShell("cat > /dev/null");
    const pid_t pid = *t->ProcessId();
    Connection conn("idle", TransportKind::Stdio, std::move(t), std::chrono::seconds(30));

    std::atomic<int> disconnected{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < 2; ++i) {
        callers.emplace_back([&conn, &disconnected]() {
            try {
                conn.Request("tools/call");
            } catch (const errors::ServerDisconnectedError&) {
                ++disconnected;
            }
        });
    }
    ASSERT_TRUE(waitFor([&conn]() { return conn.PendingRequests() == 2; }));
    conn.Close();
    for (auto& c : callers) {
        c.join();
    }
    EXPECT_EQ(disconnected.load(), 2);
    EXPECT_FALSE(conn.IsAlive());
    EXPECT_TRUE(processGone(pid));
}

TEST(StdioTransport, ChildExitFailsPendingAndReportsError) {
    auto t = std::make_unique<StdioTransport>(shell("read a; exit 3"), "crashy");
    std::promise<std::string> errorSeen;
    auto errorFuture = errorSeen.get_future();
    std::atomic<bool> reported{false};
    t->SetErrorHandler([&](const std::string& e) {
        if (!reported.exchange(true)) {
            errorSeen.set_value(e);
        }
    });
    t->Start().get();
    auto f = t->SendRequest(std::make_unique<JSONRPCRequest>(int64_t{1}, "tools/list"));
    ASSERT_EQ(f.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_THROW(f.get(), errors::ServerDisconnectedError);
    ASSERT_EQ(errorFuture.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(waitFor([&t]() { return !t->IsConnected(); }));

    auto after = t->SendRequest(std::make_unique<JSONRPCRequest>(int64_t{2}, "tools/list"));
    EXPECT_THROW(after.get(), errors::ServerDisconnectedError);
    t->Close().get();
}

TEST(StdioTransport, AnswersServerPingAndRejectsOtherServerRequests) {
    TempDir dir;
    const std::string out = dir.file("replies.txt");
    auto t = startShell(
        "printf '{\"jsonrpc\":\"2.0\",\"id\":\"srv-1\",\"method\":\"ping\"}\\n'; read r1; "
        "printf '{\"jsonrpc\":\"2.0\",\"id\":\"srv-2\",\"method\":\"sampling/createMessage\"}\\n'; read r2; "
        "printf '%s\\n%s\\n' \"$r1\" \"$r2\" > '" + out + "'; cat > /dev/null");

    ASSERT_TRUE(waitFor([&out]() { return std::filesystem::exists(out) && readFile(out).size() > 0; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    const std::string text = readFile(out);
    const auto nl = text.find('\n');
    ASSERT_NE(nl, std::string::npos);

    JSONRPCResponse pong;
    ASSERT_TRUE(pong.Deserialize(text.substr(0, nl)));
    EXPECT_EQ(JSONRPCIdToString(pong.id), "srv-1");
    ASSERT_TRUE(pong.result.has_value());
    EXPECT_TRUE(pong.result->IsObject());

    JSONRPCResponse rejected;
    ASSERT_TRUE(rejected.Deserialize(text.substr(nl + 1, text.find('\n', nl + 1) - nl - 1)));
    EXPECT_EQ(JSONRPCIdToString(rejected.id), "srv-2");
    ASSERT_TRUE(rejected.IsError());
    EXPECT_EQ(rejected.error->GetInt("code", 0), JSONRPCErrorCodes::MethodNotFound);
    t->Close().get();
}

TEST(StdioTransport, SpawnFailureSurfacesFromStart) {
    StdioConfig cfg;
    cfg.command = "/nonexistent/tool-server";
    StdioTransport t(cfg, "missing");
    auto f = t.Start();
    EXPECT_THROW(f.get(), std::runtime_error);
    EXPECT_FALSE(t.IsConnected());
}

TEST(StdioTransport, EnvironmentIsMergedOverInherited) {
    TempDir dir;
    const std::string out = dir.file("env.txt");
    StdioConfig cfg = shell("printf '%s|%s' \"$TOOLHOST_TEST_VAR\" \"${PATH:+has-path}\" > '" + out + "'; cat > /dev/null");
    cfg.env["TOOLHOST_TEST_VAR"] = "from-config";
    StdioTransport t(cfg, "env");
    t.SetStopGracePeriod(std::chrono::milliseconds(500));
    t.Start().get();
    ASSERT_TRUE(waitFor([&out]() { return readFile(out).find('|') != std::string::npos; }));
    EXPECT_EQ(readFile(out), "from-config|has-path");
    t.Close().get();
}

TEST(StdioTransport, ProcessIgnoringSigtermIsKilledAfterGrace) {
    auto t = std::make_unique<StdioTransport>(shell("trap '' TERM; while :; do sleep 1; done"), "stubborn");
    t->SetStopGracePeriod(std::chrono::milliseconds(200));
    t->Start().get();
    const pid_t pid = *t->ProcessId();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    const auto begin = std::chrono::steady_clock::now();
    t->Close().get();
    const auto elapsed = std::chrono::steady_clock::now() - begin;
    EXPECT_GE(elapsed, std::chrono::milliseconds(200));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_TRUE(processGone(pid));
}

TEST(ChildProcess, DestructorReapsRunningChild) {
    auto child = ChildProcess::Spawn("/bin/sleep", {"30"}, {});
    const pid_t pid = child->Pid();
    ASSERT_TRUE(child->IsAlive());
    child.reset();
    EXPECT_TRUE(processGone(pid));
}
