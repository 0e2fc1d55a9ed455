//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Tool server configuration (stdio | http tagged union), status and listing row types
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

// Launch a subprocess and talk newline-delimited JSON-RPC over its stdin/stdout.
struct StdioConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    bool operator==(const StdioConfig&) const = default;
};

// POST one JSON-RPC envelope per call to a remote endpoint.
struct HttpConfig {
    std::string url;
    std::string bearerToken; // empty: no Authorization header

    bool operator==(const HttpConfig&) const = default;
};

using TransportConfig = std::variant<StdioConfig, HttpConfig>;

enum class TransportKind { Stdio, Http };

constexpr int DefaultTimeoutSeconds = 30;

//==========================================================================================================
// ServerConfig
// Purpose: Identity of a tool server and how to reach it.
// Fields:
//   id: Unique registry key.
//   transport: StdioConfig or HttpConfig; only the fields of the active kind exist.
//   enabled: Disabled servers are listed but refuse to start.
//   timeoutSeconds: Handshake and default per-request timeout.
//   isCustom: User-added entries (persisted to the custom servers file); builtins are read-only.
//==========================================================================================================
struct ServerConfig {
    std::string id;
    std::string name;
    std::string description;
    TransportConfig transport;
    bool enabled = true;
    int timeoutSeconds = DefaultTimeoutSeconds;
    bool isCustom = false;

    TransportKind Kind() const {
        return std::holds_alternative<StdioConfig>(transport) ? TransportKind::Stdio : TransportKind::Http;
    }

    bool operator==(const ServerConfig&) const = default;
};

const char* ToString(TransportKind kind);

enum class ServerStatus { Stopped, Running, Error };

const char* ToString(ServerStatus status);

// One row of ListServers(); status is computed live by the ServerManager.
struct ServerInfo {
    std::string id;
    std::string name;
    std::string description;
    TransportKind transport = TransportKind::Stdio;
    bool enabled = true;
    ServerStatus status = ServerStatus::Stopped;
    bool isCustom = false;
    std::optional<std::string> url;
};

//==========================================================================================================
// ServerConfigFromJSON
// Purpose: Builds a config from one "servers" entry of a config file. Entries with "command" are stdio;
//          entries with "url" and no "command" are http.
// Returns:
//   The config, or std::nullopt (with a warning logged) when the entry is not an object or names neither
//   a command nor a url.
//==========================================================================================================
std::optional<ServerConfig> ServerConfigFromJSON(const std::string& id, const JSONValue& entry, bool isCustom);

// Serializes an http config in the custom servers file shape {name, description, url, timeout_seconds,
// bearer_token?}.
JSONValue CustomServerToJSON(const ServerConfig& config);

} // namespace toolhost
