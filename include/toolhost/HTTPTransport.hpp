//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.hpp
// Purpose: Coroutine-based HTTP/HTTPS JSON-RPC client transport using Boost.Beast (one POST per call)
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <future>

#include "toolhost/Transport.h"

namespace toolhost {

//==========================================================================================================
// HTTPTransport
// Purpose: Posts each JSON-RPC envelope to the configured URL on a dedicated io_context thread.
//          Non-2xx statuses and socket/TLS failures fail the request future with TransportError.
//          Responses sent as text/event-stream are unwrapped from their data: lines.
//==========================================================================================================
class HTTPTransport : public ITransport {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   serverId: Used in log lines and error messages.
    //   url: Absolute http:// or https:// endpoint receiving every POST.
    //   bearerToken: Sent as "Authorization: Bearer <token>" when non-empty.
    //   caFile/caPath: Optional trust store overrides for https (system defaults otherwise).
    //   connectTimeoutMs: Resolve + connect + TLS handshake budget.
    //   requestTimeoutSeconds: Upper bound for one request/response exchange on the socket.
    //==========================================================================================================
    struct Options {
        std::string serverId;
        std::string url;
        std::string bearerToken;
        std::string caFile;
        std::string caPath;
        unsigned int connectTimeoutMs{10000};
        int requestTimeoutSeconds{30};
    };

    explicit HTTPTransport(const Options& opts);
    ~HTTPTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Validates the URL, prepares TLS when https, and starts the I/O thread. No network traffic happens
    // until the first request.
    // Returns:
    //   Ready future; holds TransportError when the URL is invalid or the CA files cannot be loaded.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the I/O thread; in-flight requests fail with ServerDisconnectedError.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;

    // The Mcp-Session-Id issued by the server, or "http-<serverId>" before one is issued.
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;
    bool CancelRequest(const JSONRPCId& id) override;
    std::size_t PendingRequestCount() const override;

    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    // Notifications arrive only inside event-stream responses.
    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost
