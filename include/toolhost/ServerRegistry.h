//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerRegistry.h
// Purpose: Catalog of builtin (static file) and custom (persisted) tool server configurations
//==========================================================================================================

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/ServerConfig.h"

namespace toolhost {

//==========================================================================================================
// RegistryOptions
// Fields:
//   configPath: Static (builtin) config file. Default: TOOLHOST_CONFIG_PATH or ./tool_servers.json.
//   customServersPath: User-writable custom servers file. Default: TOOLHOST_CUSTOM_SERVERS_PATH or
//                      $HOME/.toolhost/custom_servers.json.
//==========================================================================================================
struct RegistryOptions {
    std::string configPath;
    std::string customServersPath;

    static RegistryOptions FromEnv();
};

//==========================================================================================================
// ServerRegistry
// Purpose: Single source of truth for server identities. Thread-safe; every method takes the registry
//          mutex for the duration of the call only.
//==========================================================================================================
class ServerRegistry {
public:
    explicit ServerRegistry(RegistryOptions options = RegistryOptions::FromEnv());

    //======================================================================================================
    // Load
    // Purpose: Replaces the catalog with the static config file followed by the custom servers file.
    //          A missing file logs a warning; invalid JSON logs an error and contributes nothing.
    //          Custom entries whose id collides with a builtin are ignored.
    //======================================================================================================
    void Load();

    // All configs sorted by id.
    std::vector<ServerConfig> ListConfigs() const;
    std::optional<ServerConfig> Find(const std::string& id) const;
    bool Contains(const std::string& id) const;

    //======================================================================================================
    // AddCustomServer
    // Purpose: Registers an http server as a custom entry and rewrites the custom servers file.
    // Throws:
    //   DuplicateServerError when id exists; InvalidOperationError for an empty id, bad URL or
    //   non-positive timeout; ConfigError when the file cannot be written (the entry is rolled back).
    //======================================================================================================
    ServerConfig AddCustomServer(const std::string& id, const std::string& name, const std::string& url,
                                 const std::string& description = std::string(),
                                 int timeoutSeconds = DefaultTimeoutSeconds,
                                 const std::string& bearerToken = std::string());

    //======================================================================================================
    // DeleteCustomServer
    // Throws:
    //   NotFoundError when absent; InvalidOperationError for builtins; ConfigError when the file cannot
    //   be written (the entry is restored).
    //======================================================================================================
    void DeleteCustomServer(const std::string& id);

    // "<host>-<port>" with dots replaced by dashes; the default port follows the scheme.
    // Throws InvalidOperationError when the URL cannot be parsed.
    static std::string MakeServerIdFromUrl(const std::string& url);

    const RegistryOptions& Options() const { return options_; }

private:
    void loadFile(const std::string& path, bool isCustom);
    void persistCustomLocked() const;

    RegistryOptions options_;
    mutable std::mutex mutex_;
    std::map<std::string, ServerConfig> servers_;
};

} // namespace toolhost
