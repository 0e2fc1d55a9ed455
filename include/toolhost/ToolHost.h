//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolHost.h
// Purpose: Facade bundling the registry, connection manager and tool catalog
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/ServerManager.h"
#include "toolhost/ServerRegistry.h"
#include "toolhost/ToolCatalog.h"

namespace toolhost {

//==========================================================================================================
// ToolHost
// Purpose: The operational surface of the library. Construct once, call Load(), pass by reference.
//          Shutdown() (also run by the destructor) stops every server.
//==========================================================================================================
class ToolHost {
public:
    explicit ToolHost(RegistryOptions registryOptions = RegistryOptions::FromEnv(),
                      std::shared_ptr<ITransportFactory> factory = std::make_shared<DefaultTransportFactory>(),
                      ManagerOptions managerOptions = ManagerOptions::FromEnv());
    ~ToolHost();

    ToolHost(const ToolHost&) = delete;
    ToolHost& operator=(const ToolHost&) = delete;

    void Load();

    std::vector<ServerInfo> ListServers() const;
    void StartServer(const std::string& id);
    void StopServer(const std::string& id);
    ServerStatus GetServerStatus(const std::string& id) const;

    std::vector<ToolDescriptor> DiscoverTools(const std::string& id);
    JSONValue CallTool(const std::string& id, const std::string& toolName, const JSONValue& arguments);

    // Raw request against a running server.
    JSONValue SendRequest(const std::string& id, const std::string& method,
                          std::optional<JSONValue> params = std::nullopt);

    ServerConfig AddCustomServer(const std::string& id, const std::string& name, const std::string& url,
                                 const std::string& description = std::string(),
                                 int timeoutSeconds = DefaultTimeoutSeconds,
                                 const std::string& bearerToken = std::string());

    // Stops the server first when it is running.
    void DeleteCustomServer(const std::string& id);

    void Shutdown();

    ServerRegistry& Registry() { return registry_; }
    ServerManager& Manager() { return manager_; }
    ToolCatalog& Catalog() { return catalog_; }

private:
    ServerRegistry registry_;
    ServerManager manager_;
    ToolCatalog catalog_;
};

} // namespace toolhost
