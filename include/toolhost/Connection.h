//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.h
// Purpose: One live session with a tool server: id allocation, handshake, request/response with timeouts
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "toolhost/Protocol.h"
#include "toolhost/ServerConfig.h"
#include "toolhost/Transport.h"

namespace toolhost {

//==========================================================================================================
// Connection
// Purpose: Wraps a started ITransport for one server. Request ids come from a per-connection counter
//          starting at 1 and are never reused. Thread-safe: any number of threads may issue requests
//          concurrently; the transport correlates replies by id.
//==========================================================================================================
class Connection {
public:
    Connection(std::string serverId, TransportKind kind, std::unique_ptr<ITransport> transport,
               std::chrono::milliseconds defaultTimeout);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    //==========================================================================================================
    // Initialize
    // Purpose: Sends initialize {protocolVersion, capabilities: {}, clientInfo} and waits for the result.
    //          stdio connections then send notifications/initialized.
    // Returns:
    //   The server's initialize result.
    // Throws:
    //   RequestTimeoutError, RPCError, ServerDisconnectedError, TransportError.
    //==========================================================================================================
    JSONValue Initialize(const Implementation& clientInfo,
                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    //==========================================================================================================
    // Request
    // Purpose: Sends {jsonrpc, id, method, params?} and blocks until the matching response, the timeout or
    //          a stop request on stopToken.
    // Args:
    //   timeout: Defaults to the server's configured timeout.
    // Returns:
    //   The result member (JSON null when absent).
    // Throws:
    //   RequestTimeoutError (slot removed), RequestCancelledError (slot removed), RPCError for an error
    //   response, ServerDisconnectedError / TransportError from the transport.
    //==========================================================================================================
    JSONValue Request(const std::string& method,
                      std::optional<JSONValue> params = std::nullopt,
                      std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                      std::stop_token stopToken = {});

    // Fire-and-forget notification; throws when the transport refuses it.
    void Notify(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    // Closes the transport; pending requests fail with ServerDisconnectedError. Idempotent.
    void Close();

    bool IsAlive() const;

    const std::string& ServerId() const { return serverId_; }
    TransportKind Kind() const { return kind_; }
    std::string GetSessionId() const;
    std::size_t PendingRequests() const;
    std::chrono::milliseconds DefaultTimeout() const { return defaultTimeout_; }

    // Underlying transport (diagnostics and tests).
    ITransport& Transport() { return *transport_; }

private:
    std::string serverId_;
    TransportKind kind_;
    std::unique_ptr<ITransport> transport_;
    std::chrono::milliseconds defaultTimeout_;
    std::atomic<int64_t> nextRequestId_{1};
    std::atomic<bool> closed_{false};
};

} // namespace toolhost
