//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Config file entry decoding/encoding and enum names
//==========================================================================================================

#include "toolhost/ServerConfig.h"

#include <cstdint>
#include <limits>

#include "logging/Logger.h"

namespace toolhost {

const char* ToString(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http: return "http";
    }
    return "unknown";
}

const char* ToString(ServerStatus status) {
    switch (status) {
        case ServerStatus::Stopped: return "stopped";
        case ServerStatus::Running: return "running";
        case ServerStatus::Error: return "error";
    }
    return "unknown";
}

namespace {
std::vector<std::string> stringArray(const JSONValue* v, const std::string& id) {
    std::vector<std::string> out;
    if (!v || !v->IsArray()) {
        return out;
    }
    for (const auto& item : std::get<JSONValue::Array>(v->value)) {
        if (item && item->IsString()) {
            out.push_back(std::get<std::string>(item->value));
        } else {
            LOG_WARN("Server '{}': ignoring non-string argument", id);
        }
    }
    return out;
}

std::map<std::string, std::string> stringMap(const JSONValue* v, const std::string& id) {
    std::map<std::string, std::string> out;
    if (!v || !v->IsObject()) {
        return out;
    }
    for (const auto& [key, val] : std::get<JSONValue::Object>(v->value)) {
        if (val && val->IsString()) {
            out[key] = std::get<std::string>(val->value);
        } else {
            LOG_WARN("Server '{}': ignoring non-string env value for {}", id, key);
        }
    }
    return out;
}
} // namespace

std::optional<ServerConfig> ServerConfigFromJSON(const std::string& id, const JSONValue& entry, bool isCustom) {
    if (!entry.IsObject()) {
        LOG_WARN("Server '{}': entry is not an object; skipped", id);
        return std::nullopt;
    }
    ServerConfig cfg;
    cfg.id = id;
    cfg.name = entry.GetString("name", id);
    cfg.description = entry.GetString("description");
    cfg.enabled = entry.GetBool("enabled", true);
    const int64_t timeout = entry.GetInt("timeout_seconds", DefaultTimeoutSeconds);
    if (timeout <= 0 || timeout > std::numeric_limits<int>::max()) {
        LOG_WARN("Server '{}': timeout_seconds must be in [1, {}], got {}; using {}",
                 id, std::numeric_limits<int>::max(), static_cast<long long>(timeout), DefaultTimeoutSeconds);
        cfg.timeoutSeconds = DefaultTimeoutSeconds;
    } else {
        cfg.timeoutSeconds = static_cast<int>(timeout);
    }
    cfg.isCustom = isCustom;

    const std::string command = entry.GetString("command");
    const std::string url = entry.GetString("url");
    if (!command.empty()) {
        StdioConfig stdio;
        stdio.command = command;
        stdio.args = stringArray(entry.Find("args"), id);
        stdio.env = stringMap(entry.Find("env"), id);
        cfg.transport = std::move(stdio);
    } else if (!url.empty()) {
        HttpConfig http;
        http.url = url;
        http.bearerToken = entry.GetString("bearer_token");
        cfg.transport = std::move(http);
    } else {
        LOG_WARN("Server '{}': neither command nor url given; skipped", id);
        return std::nullopt;
    }
    return cfg;
}

JSONValue CustomServerToJSON(const ServerConfig& config) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(config.name);
    obj["description"] = std::make_shared<JSONValue>(config.description);
    obj["timeout_seconds"] = std::make_shared<JSONValue>(static_cast<int64_t>(config.timeoutSeconds));
    std::visit([&obj](const auto& t) {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, HttpConfig>) {
            obj["url"] = std::make_shared<JSONValue>(t.url);
            if (!t.bearerToken.empty()) {
                obj["bearer_token"] = std::make_shared<JSONValue>(t.bearerToken);
            }
        } else {
            obj["command"] = std::make_shared<JSONValue>(t.command);
            JSONValue::Array args;
            for (const auto& a : t.args) {
                args.push_back(std::make_shared<JSONValue>(a));
            }
            obj["args"] = std::make_shared<JSONValue>(std::move(args));
            JSONValue::Object env;
            for (const auto& [k, v] : t.env) {
                env[k] = std::make_shared<JSONValue>(v);
            }
            obj["env"] = std::make_shared<JSONValue>(std::move(env));
        }
    }, config.transport);
    if (!config.enabled) {
        obj["enabled"] = std::make_shared<JSONValue>(false);
    }
    return JSONValue(std::move(obj));
}

} // namespace toolhost
