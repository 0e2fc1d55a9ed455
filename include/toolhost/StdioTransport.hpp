//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Transport that spawns a tool server subprocess and speaks newline-delimited JSON-RPC to it
//==========================================================================================================
#pragma once

#include "toolhost/Transport.h"
#include "toolhost/ServerConfig.h"
#include <sys/types.h>
#include <chrono>
#include <memory>
#include <optional>
#include <cstdint>

namespace toolhost {

//==========================================================================================================
// StdioTransport
// Purpose: Owns the child process, a stream reader thread (child stdout) and a stderr drain thread.
//          Requests are written one JSON document per line under a write mutex; responses are matched to
//          pending promises by id. Handlers must be registered before Start().
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    // Lines longer than this from the child's stdout are dropped.
    static constexpr std::size_t MaxLineBytes = 16u * 1024u * 1024u;

    StdioTransport(StdioConfig config, std::string serverId);
    virtual ~StdioTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Spawns the process and starts the reader threads.
    // Returns:
    //   Ready future; holds std::runtime_error when the process cannot be spawned.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the reader, fails pending requests with ServerDisconnectedError, closes the child's stdin,
    // then SIGTERM / grace period / SIGKILL.
    //==========================================================================================================
    std::future<void> Close() override;

    // Connected while the reader runs and the process has not exited.
    bool IsConnected() const override;

    // "stdio-<pid>" once started.
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;
    bool CancelRequest(const JSONRPCId& id) override;
    std::size_t PendingRequestCount() const override;

    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetStopGracePeriod
    // Purpose: Time allowed between SIGTERM and SIGKILL in Close() (default 5 s).
    //==========================================================================================================
    void SetStopGracePeriod(std::chrono::milliseconds grace);

    // Pid of the running child, if any.
    std::optional<pid_t> ProcessId() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost
