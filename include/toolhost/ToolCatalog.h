//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCatalog.h
// Purpose: Tool discovery and per-server tool list cache
//==========================================================================================================

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/Protocol.h"
#include "toolhost/ServerManager.h"

namespace toolhost {

//==========================================================================================================
// ToolCatalog
// Purpose: Caches tools/list results and the Connection they came from, per server id. The cache for a
//          server is dropped whenever the manager stops it.
//==========================================================================================================
class ToolCatalog {
public:
    explicit ToolCatalog(ServerManager& manager);

    //==========================================================================================================
    // DiscoverTools
    // Purpose: Returns the cached tool list, or starts the server (if needed), pages through tools/list
    //          following nextCursor, and caches the result.
    // Throws:
    //   UnknownServerError, ServerStartError and any request error.
    //==========================================================================================================
    std::vector<ToolDescriptor> DiscoverTools(const std::string& serverId);

    //==========================================================================================================
    // CallTool
    // Purpose: tools/call {name, arguments} on the cached Connection. Object members whose value is null
    //          are removed from arguments before sending.
    // Returns:
    //   The raw tools/call result.
    // Throws:
    //   UnknownToolError when the server does not advertise toolName; request errors otherwise.
    //==========================================================================================================
    JSONValue CallTool(const std::string& serverId, const std::string& toolName, const JSONValue& arguments,
                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Drops cached tools and connections for one server, or for all when serverId is empty.
    void ClearCache(const std::optional<std::string>& serverId = std::nullopt);

    bool IsCached(const std::string& serverId) const;

    //==========================================================================================================
    // FormatToolResult
    // Purpose: Renders content[] as text: text items verbatim, "[Image: <mimeType>]", "[Resource: <uri>]",
    //          one item per line. Results without content[] are serialized as JSON.
    //==========================================================================================================
    static std::string FormatToolResult(const JSONValue& result);

    // Names listed in inputSchema.required that are absent (or null) in arguments.
    static std::vector<std::string> MissingRequiredArguments(const ToolDescriptor& tool, const JSONValue& arguments);

private:
    struct Entry {
        std::vector<ToolDescriptor> tools;
        std::shared_ptr<Connection> connection;
    };

    // Shared with the manager's stop listener, which may outlive the catalog.
    struct Cache {
        std::mutex mutex;
        std::map<std::string, Entry> entries;
    };

    static std::vector<ToolDescriptor> fetchTools(Connection& connection);
    Entry discover(const std::string& serverId);

    ServerManager& manager_;
    std::shared_ptr<Cache> cache_;
};

} // namespace toolhost
