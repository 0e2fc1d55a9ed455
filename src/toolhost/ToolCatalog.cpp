//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCatalog.cpp
// Purpose: Tool discovery and cache implementation
//==========================================================================================================

#include "toolhost/ToolCatalog.h"

#include <set>
#include <sstream>

#include "logging/Logger.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {
// Guards against servers that keep returning a cursor.
constexpr int MaxListPages = 1000;

ToolDescriptor toolFromJSON(const JSONValue& v) {
    ToolDescriptor tool;
    tool.name = v.GetString("name");
    tool.description = v.GetString("description");
    if (const JSONValue* schema = v.Find("inputSchema")) {
        tool.inputSchema = *schema;
    }
    return tool;
}

const ToolDescriptor* findTool(const std::vector<ToolDescriptor>& tools, const std::string& name) {
    for (const auto& t : tools) {
        if (t.name == name) {
            return &t;
        }
    }
    return nullptr;
}

JSONValue dropNullMembers(const JSONValue& arguments) {
    if (!arguments.IsObject()) {
        return arguments;
    }
    JSONValue::Object out;
    for (const auto& [k, v] : std::get<JSONValue::Object>(arguments.value)) {
        if (v && !v->IsNull()) {
            out[k] = v;
        }
    }
    return JSONValue{out};
}
} // namespace

ToolCatalog::ToolCatalog(ServerManager& manager)
    : manager_(manager), cache_(std::make_shared<Cache>()) {
    FUNC_SCOPE();
    std::weak_ptr<Cache> weak = cache_;
    manager_.AddStopListener([weak](const std::string& serverId) {
        if (auto cache = weak.lock()) {
            std::lock_guard<std::mutex> lock(cache->mutex);
            if (cache->entries.erase(serverId) != 0) {
                LOG_DEBUG("ToolCatalog: cleared cache for stopped server '{}'", serverId);
            }
        }
    });
}

std::vector<ToolDescriptor> ToolCatalog::fetchTools(Connection& connection) {
    std::vector<ToolDescriptor> tools;
    std::set<std::string> seenCursors;
    std::optional<std::string> cursor;
    for (int page = 0; page < MaxListPages; ++page) {
        std::optional<JSONValue> params;
        if (cursor) {
            JSONValue::Object p;
            p["cursor"] = std::make_shared<JSONValue>(*cursor);
            params = JSONValue{p};
        }
        JSONValue result = connection.Request(Methods::ListTools, std::move(params));
        if (const JSONValue* list = result.Find("tools"); list && list->IsArray()) {
            for (const auto& item : std::get<JSONValue::Array>(list->value)) {
                if (item && item->IsObject()) {
                    tools.push_back(toolFromJSON(*item));
                }
            }
        } else {
            LOG_WARN("ToolCatalog: '{}' tools/list result has no tools array", connection.ServerId());
        }
        const JSONValue* next = result.Find("nextCursor");
        if (!next || !next->IsString() || std::get<std::string>(next->value).empty()) {
            return tools;
        }
        cursor = std::get<std::string>(next->value);
        if (!seenCursors.insert(*cursor).second) {
            LOG_WARN("ToolCatalog: '{}' repeated cursor '{}'; stopping pagination", connection.ServerId(), *cursor);
            return tools;
        }
    }
    LOG_WARN("ToolCatalog: '{}' exceeded {} tools/list pages", connection.ServerId(), MaxListPages);
    return tools;
}

ToolCatalog::Entry ToolCatalog::discover(const std::string& serverId) {
    auto connection = manager_.StartServer(serverId);
    Entry entry{fetchTools(*connection), connection};
    LOG_INFO("ToolCatalog: '{}' advertises {} tool(s)", serverId, entry.tools.size());
    std::lock_guard<std::mutex> lock(cache_->mutex);
    // A stop that landed after the listing came back has already run the listener
    if (!connection->IsAlive()) {
        LOG_DEBUG("ToolCatalog: '{}' stopped during discovery; listing not cached", serverId);
        return entry;
    }
    cache_->entries[serverId] = entry;
    return entry;
}

std::vector<ToolDescriptor> ToolCatalog::DiscoverTools(const std::string& serverId) {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(cache_->mutex);
        auto it = cache_->entries.find(serverId);
        if (it != cache_->entries.end()) {
            if (it->second.connection->IsAlive()) {
                return it->second.tools;
            }
            LOG_WARN("ToolCatalog: cached connection for '{}' is gone; rediscovering", serverId);
            cache_->entries.erase(it);
        }
    }
    return discover(serverId).tools;
}

JSONValue ToolCatalog::CallTool(const std::string& serverId, const std::string& toolName, const JSONValue& arguments,
                                std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    std::optional<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(cache_->mutex);
        auto it = cache_->entries.find(serverId);
        if (it != cache_->entries.end()) {
            entry = it->second;
        }
    }
    if (entry && !entry->connection->IsAlive()) {
        LOG_WARN("ToolCatalog: cached connection for '{}' is gone; rediscovering", serverId);
        ClearCache(serverId);
        entry.reset();
    }
    if (!entry) {
        entry = discover(serverId);
    }
    if (!findTool(entry->tools, toolName)) {
        throw errors::UnknownToolError(serverId, toolName);
    }

    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(toolName);
    params["arguments"] = std::make_shared<JSONValue>(dropNullMembers(arguments));
    return entry->connection->Request(Methods::CallTool, JSONValue{params}, timeout);
}

void ToolCatalog::ClearCache(const std::optional<std::string>& serverId) {
    std::lock_guard<std::mutex> lock(cache_->mutex);
    if (serverId) {
        cache_->entries.erase(*serverId);
    } else {
        cache_->entries.clear();
    }
}

bool ToolCatalog::IsCached(const std::string& serverId) const {
    std::lock_guard<std::mutex> lock(cache_->mutex);
    return cache_->entries.count(serverId) != 0;
}

std::string ToolCatalog::FormatToolResult(const JSONValue& result) {
    const JSONValue* content = result.Find("content");
    if (!content || !content->IsArray()) {
        return SerializeJSON(result);
    }
    std::ostringstream oss;
    bool first = true;
    for (const auto& item : std::get<JSONValue::Array>(content->value)) {
        if (!item) {
            continue;
        }
        if (!first) {
            oss << "\n";
        }
        first = false;
        const std::string type = item->GetString("type");
        if (type == "text") {
            oss << item->GetString("text");
        } else if (type == "image") {
            oss << "[Image: " << item->GetString("mimeType", "unknown") << "]";
        } else if (type == "resource") {
            std::string uri = item->GetString("uri");
            if (const JSONValue* res = item->Find("resource")) {
                uri = res->GetString("uri", uri);
            }
            oss << "[Resource: " << uri << "]";
        } else {
            oss << SerializeJSON(*item);
        }
    }
    return oss.str();
}

std::vector<std::string> ToolCatalog::MissingRequiredArguments(const ToolDescriptor& tool, const JSONValue& arguments) {
    std::vector<std::string> missing;
    const JSONValue* required = tool.inputSchema.Find("required");
    if (!required || !required->IsArray()) {
        return missing;
    }
    for (const auto& name : std::get<JSONValue::Array>(required->value)) {
        if (!name || !name->IsString()) {
            continue;
        }
        const std::string& key = std::get<std::string>(name->value);
        const JSONValue* v = arguments.Find(key);
        if (!v || v->IsNull()) {
            missing.push_back(key);
        }
    }
    return missing;
}

} // namespace toolhost
