//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol constants, method names and tool descriptor shared by the connection and catalog layers
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>

namespace toolhost {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol version announced in the initialize handshake
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Method names
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Client implementation information sent as clientInfo
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// One callable capability advertised by a tool server in tools/list
struct ToolDescriptor {
    std::string name;
    std::string description;
    JSONValue inputSchema;

    ToolDescriptor() = default;
    ToolDescriptor(std::string name, std::string description, JSONValue inputSchema = JSONValue(JSONValue::Object{}))
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(inputSchema)) {}

    bool operator==(const ToolDescriptor& other) const {
        return name == other.name && description == other.description && inputSchema == other.inputSchema;
    }
};

} // namespace toolhost
