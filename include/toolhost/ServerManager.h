//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerManager.h
// Purpose: Connection manager: starts, supervises and stops tool server connections
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "toolhost/Connection.h"
#include "toolhost/Protocol.h"
#include "toolhost/ServerRegistry.h"
#include "toolhost/Transport.h"

namespace toolhost {

//==========================================================================================================
// ManagerOptions
// Fields:
//   clientInfo: Sent in the initialize handshake (default: toolhost / library version).
//   stopGracePeriod: SIGTERM to SIGKILL delay for stdio servers (TOOLHOST_STOP_GRACE_MS, default 5000).
//==========================================================================================================
struct ManagerOptions {
    Implementation clientInfo;
    std::chrono::milliseconds stopGracePeriod{5000};

    static ManagerOptions FromEnv();
};

//==========================================================================================================
// ServerManager
// Purpose: Owns at most one Connection per server id. Start and stop are serialized by a lifecycle mutex;
//          the connection map has its own short-held mutex so status queries never wait for a start.
//==========================================================================================================
class ServerManager {
public:
    using StopListener = std::function<void(const std::string& serverId)>;

    explicit ServerManager(ServerRegistry& registry,
                           std::shared_ptr<ITransportFactory> factory = std::make_shared<DefaultTransportFactory>(),
                           ManagerOptions options = ManagerOptions::FromEnv());
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    //==========================================================================================================
    // StartServer
    // Purpose: Creates the transport, starts it and completes the initialize handshake. Idempotent while the
    //          existing Connection is alive; a dead Connection is torn down and replaced.
    // Throws:
    //   UnknownServerError when id is not registered; ServerStartError for a disabled server or any spawn,
    //   transport or handshake failure (the transport is closed and nothing is registered).
    //==========================================================================================================
    std::shared_ptr<Connection> StartServer(const std::string& id);

    //==========================================================================================================
    // StopServer
    // Purpose: Removes and closes the Connection; pending requests fail with ServerDisconnectedError.
    //          No-op when the server is not running. Stop listeners run afterwards.
    //==========================================================================================================
    void StopServer(const std::string& id);

    void StopAll();

    // Throws UnknownServerError for ids not in the registry.
    ServerStatus GetServerStatus(const std::string& id) const;

    // Registry configs sorted by id, with live status.
    std::vector<ServerInfo> ListServers() const;

    // The registered Connection, if any (alive or not).
    std::shared_ptr<Connection> GetConnection(const std::string& id) const;

    //==========================================================================================================
    // SendRequest / SendNotification
    // Throws:
    //   UnknownServerError for unknown ids; ServerDisconnectedError when the server is not running; plus
    //   everything Connection::Request raises.
    //==========================================================================================================
    JSONValue SendRequest(const std::string& id, const std::string& method,
                          std::optional<JSONValue> params = std::nullopt,
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                          std::stop_token stopToken = {});
    void SendNotification(const std::string& id, const std::string& method,
                          std::optional<JSONValue> params = std::nullopt);

    void AddStopListener(StopListener listener);

    ServerRegistry& Registry() { return registry_; }
    const ManagerOptions& Options() const { return options_; }

private:
    std::shared_ptr<Connection> requireRunning(const std::string& id) const;
    std::shared_ptr<Connection> startLocked(const ServerConfig& config);
    void closeAndNotify(const std::string& id, const std::shared_ptr<Connection>& connection);

    ServerRegistry& registry_;
    std::shared_ptr<ITransportFactory> factory_;
    ManagerOptions options_;

    std::mutex lifecycleMutex_;
    mutable std::mutex connectionsMutex_;
    std::map<std::string, std::shared_ptr<Connection>> connections_;

    std::mutex listenersMutex_;
    std::vector<StopListener> stopListeners_;
};

} // namespace toolhost
