//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed exception hierarchy for toolhost operations and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace errors {

// Categorization of every failure a public toolhost operation can surface.
enum class ErrorKind {
    UnknownServer,
    DuplicateServer,
    NotFound,
    InvalidOperation,
    Config,
    ServerStart,
    RequestTimeout,
    RequestCancelled,
    Rpc,
    ServerDisconnected,
    Transport,
    UnknownTool
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownServer: return "UnknownServer";
        case ErrorKind::DuplicateServer: return "DuplicateServer";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::InvalidOperation: return "InvalidOperation";
        case ErrorKind::Config: return "Config";
        case ErrorKind::ServerStart: return "ServerStart";
        case ErrorKind::RequestTimeout: return "RequestTimeout";
        case ErrorKind::RequestCancelled: return "RequestCancelled";
        case ErrorKind::Rpc: return "Rpc";
        case ErrorKind::ServerDisconnected: return "ServerDisconnected";
        case ErrorKind::Transport: return "Transport";
        case ErrorKind::UnknownTool: return "UnknownTool";
    }
    return "Unknown";
}

//==========================================================================================================
// ToolHostError
// Purpose: Common base for all toolhost exceptions. Callers that only need the category can catch this
//          and switch on kind().
//==========================================================================================================
class ToolHostError : public std::runtime_error {
public:
    ToolHostError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    ErrorKind kind() const noexcept { return kind_; }
private:
    ErrorKind kind_;
};

// Server id not present in the registry.
class UnknownServerError : public ToolHostError {
public:
    explicit UnknownServerError(const std::string& serverId)
        : ToolHostError(ErrorKind::UnknownServer, "Unknown server: " + serverId), serverId_(serverId) {}
    const std::string& serverId() const noexcept { return serverId_; }
private:
    std::string serverId_;
};

class DuplicateServerError : public ToolHostError {
public:
    explicit DuplicateServerError(const std::string& serverId)
        : ToolHostError(ErrorKind::DuplicateServer, "Server already exists: " + serverId) {}
};

class NotFoundError : public ToolHostError {
public:
    explicit NotFoundError(const std::string& message)
        : ToolHostError(ErrorKind::NotFound, message) {}
};

class InvalidOperationError : public ToolHostError {
public:
    explicit InvalidOperationError(const std::string& message)
        : ToolHostError(ErrorKind::InvalidOperation, message) {}
};

// Persisting the custom servers file failed.
class ConfigError : public ToolHostError {
public:
    explicit ConfigError(const std::string& message)
        : ToolHostError(ErrorKind::Config, message) {}
};

// Spawn, resolution or handshake failure. Nothing is left registered when this is raised.
class ServerStartError : public ToolHostError {
public:
    ServerStartError(const std::string& serverId, const std::string& reason)
        : ToolHostError(ErrorKind::ServerStart, "Failed to start server '" + serverId + "': " + reason) {}
};

class RequestTimeoutError : public ToolHostError {
public:
    RequestTimeoutError(const std::string& method, long long timeoutMs)
        : ToolHostError(ErrorKind::RequestTimeout,
                        "Request '" + method + "' timed out after " + std::to_string(timeoutMs) + " ms") {}
};

class RequestCancelledError : public ToolHostError {
public:
    explicit RequestCancelledError(const std::string& method)
        : ToolHostError(ErrorKind::RequestCancelled, "Request '" + method + "' was cancelled") {}
};

//==========================================================================================================
// RPCError
// Purpose: The peer answered with a JSON-RPC error object; code, message and data are kept verbatim.
//==========================================================================================================
class RPCError : public ToolHostError {
public:
    RPCError(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : ToolHostError(ErrorKind::Rpc, "RPC error " + std::to_string(code) + ": " + message),
          code_(code), rpcMessage_(message), data_(std::move(data)) {}
    int code() const noexcept { return code_; }
    const std::string& rpcMessage() const noexcept { return rpcMessage_; }
    const std::optional<JSONValue>& data() const noexcept { return data_; }
private:
    int code_;
    std::string rpcMessage_;
    std::optional<JSONValue> data_;
};

// The transport closed (EOF, crash, explicit stop) while a request was outstanding.
class ServerDisconnectedError : public ToolHostError {
public:
    explicit ServerDisconnectedError(const std::string& message)
        : ToolHostError(ErrorKind::ServerDisconnected, message) {}
};

// HTTP-layer failure. httpStatus is 0 when no status line was received.
class TransportError : public ToolHostError {
public:
    explicit TransportError(const std::string& message, int httpStatus = 0)
        : ToolHostError(ErrorKind::Transport, message), httpStatus_(httpStatus) {}
    int httpStatus() const noexcept { return httpStatus_; }
private:
    int httpStatus_;
};

class UnknownToolError : public ToolHostError {
public:
    UnknownToolError(const std::string& serverId, const std::string& toolName)
        : ToolHostError(ErrorKind::UnknownTool, "Tool '" + toolName + "' not found on server '" + serverId + "'") {}
};

// Convert a JSON-RPC error object (shape: { code, message, data? }) to RPCError.
// Returns std::nullopt when the input is not a valid error object.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<RPCError> populated when shape is valid.
inline std::optional<RPCError> rpcErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = errVal.Find("code");
    const JSONValue* msg = errVal.Find("message");
    if (!code || !msg || !std::holds_alternative<int64_t>(code->value) || !msg->IsString()) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = errVal.Find("data")) {
        data = *d;
    }
    return RPCError(static_cast<int>(std::get<int64_t>(code->value)),
                    std::get<std::string>(msg->value), std::move(data));
}

// Build the RPCError for a response carrying an error. Malformed error objects map to InternalError
// with the raw payload as data so nothing the peer sent is lost.
inline RPCError rpcErrorFromResponse(const JSONRPCResponse& response) {
    if (response.error.has_value()) {
        if (auto e = rpcErrorFromErrorValue(response.error.value())) {
            return *e;
        }
        return RPCError(JSONRPCErrorCodes::InternalError, "Malformed error object", response.error);
    }
    return RPCError(JSONRPCErrorCodes::InternalError, "Response carries no error");
}

} // namespace errors
} // namespace toolhost
