//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-process transport whose "server" is a C++ callback (tests and embedding)
//==========================================================================================================
#pragma once

#include "toolhost/Transport.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace toolhost {

//==========================================================================================================
// InMemoryTransport
// Purpose: Serializes every request, queues it, and answers it on a worker thread by calling the
//          registered ServerHandler with the decoded request. A handler returning nullptr holds the
//          reply back; the test delivers it later (in any order) through Reply().
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    using ServerHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;

    explicit InMemoryTransport(ServerHandler handler, std::string sessionId = "memory");
    virtual ~InMemoryTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the worker and fails pending requests with ServerDisconnectedError.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;
    bool CancelRequest(const JSONRPCId& id) override;
    std::size_t PendingRequestCount() const override;

    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    ////////////////////////////////////////// Test hooks //////////////////////////////////////////
    //==========================================================================================================
    // Reply
    // Purpose: Resolves the pending request matching response->id, as if the server had answered.
    // Returns:
    //   false when no request with that id is pending (late or unknown reply, discarded).
    //==========================================================================================================
    bool Reply(std::unique_ptr<JSONRPCResponse> response);

    // Delivers a server notification to the registered notification handler.
    void Notify(std::unique_ptr<JSONRPCNotification> notification);

    //==========================================================================================================
    // SimulateDisconnect
    // Purpose: Behaves like a server crash: pending requests fail, IsConnected() turns false and the
    //          error handler is told.
    //==========================================================================================================
    void SimulateDisconnect(const std::string& reason);

    // Number of requests seen with the given method (all methods when empty).
    std::size_t RequestCount(const std::string& method = std::string()) const;

    // Methods of the notifications sent by the client, in order.
    std::vector<std::string> SentNotifications() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost
