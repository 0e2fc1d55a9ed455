//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerRegistry.cpp
// Purpose: Config file loading, custom server persistence (atomic rewrite) and id derivation
//==========================================================================================================

#include "toolhost/ServerRegistry.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/Url.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {
constexpr const char* DefaultConfigPath = "./tool_servers.json";

std::string parentDirectory(const std::string& path) {
    std::size_t slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return std::string();
    }
    if (slash == 0) {
        return std::string("/");
    }
    return path.substr(0, slash);
}

void validateHttpUrl(const std::string& url) {
    if (!ParseUrl(url).has_value()) {
        throw errors::InvalidOperationError("URL must be an http:// or https:// URL with a host: " + url);
    }
}
} // namespace

RegistryOptions RegistryOptions::FromEnv() {
    RegistryOptions o;
    o.configPath = GetEnvOrDefault("TOOLHOST_CONFIG_PATH", DefaultConfigPath);
    const std::string home = GetEnvOrDefault("HOME", ".");
    o.customServersPath = GetEnvOrDefault("TOOLHOST_CUSTOM_SERVERS_PATH", home + "/.toolhost/custom_servers.json");
    return o;
}

ServerRegistry::ServerRegistry(RegistryOptions options) : options_(std::move(options)) {}

void ServerRegistry::Load() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(mutex_);
    servers_.clear();
    loadFile(options_.configPath, false);
    if (!options_.customServersPath.empty()) {
        loadFile(options_.customServersPath, true);
    }
    LOG_INFO("Loaded {} tool server configuration(s)", servers_.size());
}

void ServerRegistry::loadFile(const std::string& path, bool isCustom) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (isCustom) {
            LOG_DEBUG("No custom servers file at {}", path);
        } else {
            LOG_WARN("Config file not found: {}", path);
        }
        return;
    }
    std::stringstream buf;
    buf << in.rdbuf();

    JSONValue root;
    try {
        root = ParseJSON(buf.str());
    } catch (const JSONParseError& e) {
        LOG_ERROR("Invalid JSON in {}: {}", path, e.what());
        return;
    }
    const JSONValue* servers = root.Find("servers");
    if (!servers || !servers->IsObject()) {
        LOG_WARN("{} has no \"servers\" object", path);
        return;
    }
    for (const auto& [id, entry] : std::get<JSONValue::Object>(servers->value)) {
        if (!entry) {
            continue;
        }
        auto cfg = ServerConfigFromJSON(id, *entry, isCustom);
        if (!cfg) {
            continue;
        }
        if (isCustom) {
            if (servers_.count(id) != 0) {
                LOG_WARN("Custom server '{}' collides with a builtin; ignored", id);
                continue;
            }
            if (cfg->Kind() != TransportKind::Http) {
                LOG_WARN("Custom server '{}' is not an http server; ignored", id);
                continue;
            }
        }
        servers_[id] = std::move(*cfg);
    }
}

std::vector<ServerConfig> ServerRegistry::ListConfigs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServerConfig> out;
    out.reserve(servers_.size());
    for (const auto& [id, cfg] : servers_) {
        out.push_back(cfg);
    }
    return out;
}

std::optional<ServerConfig> ServerRegistry::Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ServerRegistry::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.count(id) != 0;
}

ServerConfig ServerRegistry::AddCustomServer(const std::string& id, const std::string& name,
                                             const std::string& url, const std::string& description,
                                             int timeoutSeconds, const std::string& bearerToken) {
    FUNC_SCOPE();
    if (id.empty()) {
        throw errors::InvalidOperationError("Server id must not be empty");
    }
    if (timeoutSeconds <= 0) {
        throw errors::InvalidOperationError("timeout_seconds must be positive");
    }
    validateHttpUrl(url);

    std::lock_guard<std::mutex> lock(mutex_);
    if (servers_.count(id) != 0) {
        throw errors::DuplicateServerError(id);
    }
    ServerConfig cfg;
    cfg.id = id;
    cfg.name = name.empty() ? id : name;
    cfg.description = description;
    cfg.transport = HttpConfig{url, bearerToken};
    cfg.timeoutSeconds = timeoutSeconds;
    cfg.isCustom = true;
    servers_[id] = cfg;
    try {
        persistCustomLocked();
    } catch (const errors::ConfigError&) {
        servers_.erase(id);
        throw;
    }
    LOG_INFO("Added custom server '{}' ({})", id, url);
    return cfg;
}

void ServerRegistry::DeleteCustomServer(const std::string& id) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) {
        throw errors::NotFoundError("Server not found: " + id);
    }
    if (!it->second.isCustom) {
        throw errors::InvalidOperationError("Server '" + id + "' is builtin and cannot be deleted");
    }
    ServerConfig removed = std::move(it->second);
    servers_.erase(it);
    try {
        persistCustomLocked();
    } catch (const errors::ConfigError&) {
        servers_[id] = std::move(removed);
        throw;
    }
    LOG_INFO("Deleted custom server '{}'", id);
}

void ServerRegistry::persistCustomLocked() const {
    const std::string& path = options_.customServersPath;
    if (path.empty()) {
        throw errors::ConfigError("No custom servers path configured");
    }
    JSONValue::Object servers;
    for (const auto& [id, cfg] : servers_) {
        if (cfg.isCustom) {
            servers[id] = std::make_shared<JSONValue>(CustomServerToJSON(cfg));
        }
    }
    JSONValue::Object root;
    root["servers"] = std::make_shared<JSONValue>(std::move(servers));
    const std::string text = SerializeJSON(JSONValue(std::move(root)), 2) + "\n";

    const std::string dir = parentDirectory(path);
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw errors::ConfigError("Cannot create directory " + dir + ": " + ec.message());
        }
    }
    const std::string tmp = path + ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw errors::ConfigError("Cannot write " + tmp + ": " + std::strerror(errno));
        }
        out << text;
        out.flush();
        if (!out.good()) {
            out.close();
            std::remove(tmp.c_str());
            throw errors::ConfigError("Short write to " + tmp);
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        std::remove(tmp.c_str());
        throw errors::ConfigError("Cannot replace " + path + ": " + std::strerror(err));
    }
    LOG_DEBUG("Wrote custom servers file {}", path);
}

std::string ServerRegistry::MakeServerIdFromUrl(const std::string& url) {
    auto parts = ParseUrl(url);
    if (!parts) {
        throw errors::InvalidOperationError("Cannot derive a server id from URL: " + url);
    }
    std::string id = parts->host + "-" + parts->port;
    std::replace(id.begin(), id.end(), '.', '-');
    std::replace(id.begin(), id.end(), ':', '-');
    return id;
}

} // namespace toolhost
