//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerManager.cpp
// Purpose: Connection manager implementation
//==========================================================================================================

#include "toolhost/ServerManager.h"

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/StdioTransport.hpp"
#include "toolhost/errors/Errors.h"
#include "toolhost/version.h"

namespace toolhost {

ManagerOptions ManagerOptions::FromEnv() {
    ManagerOptions opts;
    opts.clientInfo = Implementation(getClientName(), getVersionString());
    opts.stopGracePeriod = std::chrono::milliseconds(GetEnvInt("TOOLHOST_STOP_GRACE_MS", 5000));
    return opts;
}

ServerManager::ServerManager(ServerRegistry& registry, std::shared_ptr<ITransportFactory> factory,
                             ManagerOptions options)
    : registry_(registry), factory_(std::move(factory)), options_(std::move(options)) {
    FUNC_SCOPE();
    if (!factory_) {
        factory_ = std::make_shared<DefaultTransportFactory>();
    }
    if (options_.clientInfo.name.empty()) {
        options_.clientInfo = Implementation(getClientName(), getVersionString());
    }
}

ServerManager::~ServerManager() {
    FUNC_SCOPE();
    StopAll();
}

std::shared_ptr<Connection> ServerManager::StartServer(const std::string& id) {
    FUNC_SCOPE();
    auto config = registry_.Find(id);
    if (!config) {
        throw errors::UnknownServerError(id);
    }
    if (!config->enabled) {
        throw errors::ServerStartError(id, "server is disabled");
    }

    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    std::shared_ptr<Connection> stale;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        auto it = connections_.find(id);
        if (it != connections_.end()) {
            if (it->second->IsAlive()) {
                LOG_DEBUG("ServerManager: '{}' already running", id);
                return it->second;
            }
            stale = std::move(it->second);
            connections_.erase(it);
        }
    }
    if (stale) {
        LOG_WARN("ServerManager: '{}' connection is dead; restarting", id);
        closeAndNotify(id, stale);
    }
    return startLocked(*config);
}

std::shared_ptr<Connection> ServerManager::startLocked(const ServerConfig& config) {
    LOG_INFO("ServerManager: starting '{}' ({})", config.id, ToString(config.Kind()));
    const std::chrono::milliseconds timeout = std::chrono::seconds(config.timeoutSeconds);

    std::unique_ptr<ITransport> transport;
    try {
        transport = factory_->CreateTransport(config);
    } catch (const std::exception& e) {
        throw errors::ServerStartError(config.id, e.what());
    }
    if (!transport) {
        throw errors::ServerStartError(config.id, "no transport for this configuration");
    }
    if (auto* stdio = dynamic_cast<StdioTransport*>(transport.get())) {
        stdio->SetStopGracePeriod(options_.stopGracePeriod);
    }
    const std::string serverId = config.id;
    transport->SetErrorHandler([serverId](const std::string& error) {
        LOG_WARN("ServerManager: '{}' transport error: {}", serverId, error);
    });
    transport->SetNotificationHandler([serverId](std::unique_ptr<JSONRPCNotification> n) {
        LOG_DEBUG("ServerManager: '{}' notification {}", serverId, n ? n->method : std::string());
    });

    auto connection = std::make_shared<Connection>(config.id, config.Kind(), std::move(transport), timeout);
    try {
        connection->Transport().Start().get();
        connection->Initialize(options_.clientInfo, timeout);
    } catch (const std::exception& e) {
        LOG_ERROR("ServerManager: failed to start '{}': {}", config.id, e.what());
        connection->Close();
        throw errors::ServerStartError(config.id, e.what());
    }

    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        connections_[config.id] = connection;
    }
    LOG_INFO("ServerManager: '{}' running (session={})", config.id, connection->GetSessionId());
    return connection;
}

void ServerManager::StopServer(const std::string& id) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        auto it = connections_.find(id);
        if (it == connections_.end()) {
            LOG_DEBUG("ServerManager: '{}' is not running", id);
            return;
        }
        connection = std::move(it->second);
        connections_.erase(it);
    }
    LOG_INFO("ServerManager: stopping '{}'", id);
    closeAndNotify(id, connection);
}

void ServerManager::StopAll() {
    FUNC_SCOPE();
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (const auto& [id, conn] : connections_) {
            ids.push_back(id);
        }
    }
    for (const auto& id : ids) {
        StopServer(id);
    }
}

void ServerManager::closeAndNotify(const std::string& id, const std::shared_ptr<Connection>& connection) {
    connection->Close();
    std::vector<StopListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners = stopListeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener(id);
        } catch (const std::exception& e) {
            LOG_ERROR("ServerManager: stop listener for '{}' threw: {}", id, e.what());
        }
    }
}

ServerStatus ServerManager::GetServerStatus(const std::string& id) const {
    if (!registry_.Contains(id)) {
        throw errors::UnknownServerError(id);
    }
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return ServerStatus::Stopped;
    }
    return it->second->IsAlive() ? ServerStatus::Running : ServerStatus::Error;
}

std::vector<ServerInfo> ServerManager::ListServers() const {
    std::vector<ServerInfo> out;
    for (const auto& cfg : registry_.ListConfigs()) {
        ServerInfo info;
        info.id = cfg.id;
        info.name = cfg.name;
        info.description = cfg.description;
        info.transport = cfg.Kind();
        info.enabled = cfg.enabled;
        info.isCustom = cfg.isCustom;
        if (const auto* http = std::get_if<HttpConfig>(&cfg.transport)) {
            info.url = http->url;
        }
        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            auto it = connections_.find(cfg.id);
            if (it != connections_.end()) {
                info.status = it->second->IsAlive() ? ServerStatus::Running : ServerStatus::Error;
            }
        }
        out.push_back(std::move(info));
    }
    return out;
}

std::shared_ptr<Connection> ServerManager::GetConnection(const std::string& id) const {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    auto it = connections_.find(id);
    return it == connections_.end() ? nullptr : it->second;
}

std::shared_ptr<Connection> ServerManager::requireRunning(const std::string& id) const {
    if (!registry_.Contains(id)) {
        throw errors::UnknownServerError(id);
    }
    auto connection = GetConnection(id);
    if (!connection || !connection->IsAlive()) {
        throw errors::ServerDisconnectedError("Server '" + id + "' is not running");
    }
    return connection;
}

JSONValue ServerManager::SendRequest(const std::string& id, const std::string& method,
                                     std::optional<JSONValue> params,
                                     std::optional<std::chrono::milliseconds> timeout,
                                     std::stop_token stopToken) {
    FUNC_SCOPE();
    return requireRunning(id)->Request(method, std::move(params), timeout, std::move(stopToken));
}

void ServerManager::SendNotification(const std::string& id, const std::string& method,
                                     std::optional<JSONValue> params) {
    FUNC_SCOPE();
    requireRunning(id)->Notify(method, std::move(params));
}

void ServerManager::AddStopListener(StopListener listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    stopListeners_.push_back(std::move(listener));
}

} // namespace toolhost
