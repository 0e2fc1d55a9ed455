//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolHost.cpp
// Purpose: Facade implementation
//==========================================================================================================

#include "toolhost/ToolHost.h"

#include "logging/Logger.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

ToolHost::ToolHost(RegistryOptions registryOptions, std::shared_ptr<ITransportFactory> factory,
                   ManagerOptions managerOptions)
    : registry_(std::move(registryOptions)),
      manager_(registry_, std::move(factory), std::move(managerOptions)),
      catalog_(manager_) {
    FUNC_SCOPE();
}

ToolHost::~ToolHost() {
    FUNC_SCOPE();
    Shutdown();
}

void ToolHost::Load() {
    registry_.Load();
}

std::vector<ServerInfo> ToolHost::ListServers() const {
    return manager_.ListServers();
}

void ToolHost::StartServer(const std::string& id) {
    (void)manager_.StartServer(id);
}

void ToolHost::StopServer(const std::string& id) {
    manager_.StopServer(id);
}

ServerStatus ToolHost::GetServerStatus(const std::string& id) const {
    return manager_.GetServerStatus(id);
}

std::vector<ToolDescriptor> ToolHost::DiscoverTools(const std::string& id) {
    return catalog_.DiscoverTools(id);
}

JSONValue ToolHost::CallTool(const std::string& id, const std::string& toolName, const JSONValue& arguments) {
    return catalog_.CallTool(id, toolName, arguments);
}

JSONValue ToolHost::SendRequest(const std::string& id, const std::string& method, std::optional<JSONValue> params) {
    return manager_.SendRequest(id, method, std::move(params));
}

ServerConfig ToolHost::AddCustomServer(const std::string& id, const std::string& name, const std::string& url,
                                       const std::string& description, int timeoutSeconds,
                                       const std::string& bearerToken) {
    return registry_.AddCustomServer(id, name, url, description, timeoutSeconds, bearerToken);
}

void ToolHost::DeleteCustomServer(const std::string& id) {
    FUNC_SCOPE();
    auto config = registry_.Find(id);
    if (!config) {
        throw errors::NotFoundError("Server not found: " + id);
    }
    if (!config->isCustom) {
        throw errors::InvalidOperationError("Cannot delete builtin server: " + id);
    }
    if (manager_.GetServerStatus(id) != ServerStatus::Stopped) {
        LOG_INFO("ToolHost: stopping '{}' before deleting it", id);
        manager_.StopServer(id);
    }
    registry_.DeleteCustomServer(id);
}

void ToolHost::Shutdown() {
    FUNC_SCOPE();
    manager_.StopAll();
    catalog_.ClearCache();
}

} // namespace toolhost
