//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces shared by the stdio, HTTP and in-memory tool server transports
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>
#include <cstdint>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

struct ServerConfig;

//==========================================================================================================
// ITransport
// Purpose: One session with one tool server. Requests are correlated to responses by id inside the
//          transport; failures reach the waiting caller as exceptions set on the returned future
//          (ServerDisconnectedError, TransportError, ...).
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport (spawns the process and reader for stdio; prepares the I/O thread for HTTP).
    // Returns:
    //   A future that completes when the transport is running, or holds the start failure.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport. Every pending request fails with ServerDisconnectedError. Idempotent.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the transport is usable (stdio: process alive and stdout open).
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics (stdio-<pid>, or the Mcp-Session-Id header).
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Sends a JSON-RPC request and returns a future for the response. The caller's id is kept as-is and
    // a pending slot is registered under it until a response arrives, the slot is cancelled, or the
    // transport closes.
    // Args:
    //   request: Unique pointer to a JSONRPCRequest with its id already assigned.
    // Returns:
    //   Future resolving to the response envelope (which may carry a JSON-RPC error object).
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) = 0;

    //==========================================================================================================
    // Drops the pending slot for id without resolving it.
    // Returns:
    //   true when a slot was removed; false when it was already resolved or never existed.
    //==========================================================================================================
    virtual bool CancelRequest(const JSONRPCId& id) = 0;

    // Number of requests still waiting for a response.
    virtual std::size_t PendingRequestCount() const = 0;

    //==========================================================================================================
    // Sends a JSON-RPC notification (no response expected).
    // Returns:
    //   Future completing when the notification has been written to the transport.
    //==========================================================================================================
    virtual std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    // Incoming notifications from the server.
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    // Transport-level events (EOF, read errors, stderr overflow).
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

// Concrete transports are declared in their respective headers:
//  - toolhost/StdioTransport.hpp
//  - toolhost/HTTPTransport.hpp
//  - toolhost/InMemoryTransport.hpp

//==========================================================================================================
// ITransportFactory
// Purpose: Creates a transport for a server configuration. The ServerManager takes one so tests can
//          substitute in-process transports.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance (not yet started) for the given server.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const ServerConfig& config) = 0;
};

//==========================================================================================================
// DefaultTransportFactory
// Purpose: StdioTransport for StdioConfig, HTTPTransport for HttpConfig.
//==========================================================================================================
class DefaultTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const ServerConfig& config) override;
};

} // namespace toolhost
