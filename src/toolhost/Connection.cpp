//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.cpp
// Purpose: Request multiplexer over an ITransport
//==========================================================================================================

#include <future>
#include <thread>

#include "logging/Logger.h"
#include "toolhost/Connection.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {
// Upper bound for one wait slice while a stop_token is being watched.
constexpr std::chrono::milliseconds StopPollInterval{20};
}

Connection::Connection(std::string serverId, TransportKind kind, std::unique_ptr<ITransport> transport,
                       std::chrono::milliseconds defaultTimeout)
    : serverId_(std::move(serverId)), kind_(kind), transport_(std::move(transport)),
      defaultTimeout_(defaultTimeout) {
    FUNC_SCOPE();
}

Connection::~Connection() {
    FUNC_SCOPE();
    Close();
}

JSONValue Connection::Initialize(const Implementation& clientInfo,
                                 std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    JSONValue::Object params;
    params["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
    params["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
    JSONValue::Object ci;
    ci["name"] = std::make_shared<JSONValue>(clientInfo.name);
    ci["version"] = std::make_shared<JSONValue>(clientInfo.version);
    params["clientInfo"] = std::make_shared<JSONValue>(ci);

    JSONValue result = Request(Methods::Initialize, JSONValue{params}, timeout);
    const JSONValue* serverInfo = result.Find("serverInfo");
    LOG_INFO("Connection[{}]: initialized (server={} protocol={})", serverId_,
             serverInfo ? serverInfo->GetString("name", "?") : std::string("?"),
             result.GetString("protocolVersion", "?"));

    if (kind_ == TransportKind::Stdio) {
        Notify(Methods::Initialized);
    }
    return result;
}

JSONValue Connection::Request(const std::string& method, std::optional<JSONValue> params,
                              std::optional<std::chrono::milliseconds> timeout, std::stop_token stopToken) {
    FUNC_SCOPE();
    if (closed_.load()) {
        throw errors::ServerDisconnectedError("Connection to '" + serverId_ + "' is closed");
    }
    const JSONRPCId id = nextRequestId_.fetch_add(1);
    const auto budget = timeout.value_or(defaultTimeout_);
    auto request = std::make_unique<JSONRPCRequest>(id, method, std::move(params));
    LOG_DEBUG("Connection[{}]: -> {} id={}", serverId_, method, JSONRPCIdToString(id));

    auto future = transport_->SendRequest(std::move(request));

    const auto deadline = std::chrono::steady_clock::now() + budget;
    std::future_status status = std::future_status::timeout;
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto slice = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (stopToken.stop_possible() && slice > StopPollInterval) {
            slice = StopPollInterval;
        }
        status = future.wait_for(slice);
        if (status == std::future_status::ready) {
            break;
        }
        if (stopToken.stop_requested()) {
            if (transport_->CancelRequest(id)) {
                LOG_DEBUG("Connection[{}]: {} id={} cancelled by caller", serverId_, method, JSONRPCIdToString(id));
                throw errors::RequestCancelledError(method);
            }
            // The reply won the race; deliver it
            future.wait();
            status = std::future_status::ready;
            break;
        }
    }

    if (status != std::future_status::ready) {
        if (transport_->CancelRequest(id)) {
            LOG_WARN("Connection[{}]: {} id={} timed out after {} ms", serverId_, method, JSONRPCIdToString(id),
                     static_cast<long long>(budget.count()));
            throw errors::RequestTimeoutError(method, static_cast<long long>(budget.count()));
        }
        future.wait();
    }

    std::unique_ptr<JSONRPCResponse> response = future.get();
    if (!response) {
        throw errors::TransportError("Empty response to '" + method + "' from '" + serverId_ + "'");
    }
    if (response->error.has_value()) {
        throw errors::rpcErrorFromResponse(*response);
    }
    if (!response->result.has_value()) {
        return JSONValue(nullptr);
    }
    return std::move(*response->result);
}

void Connection::Notify(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    if (closed_.load()) {
        throw errors::ServerDisconnectedError("Connection to '" + serverId_ + "' is closed");
    }
    LOG_DEBUG("Connection[{}]: -> notification {}", serverId_, method);
    transport_->SendNotification(std::make_unique<JSONRPCNotification>(method, std::move(params))).get();
}

void Connection::Close() {
    FUNC_SCOPE();
    if (closed_.exchange(true)) {
        return;
    }
    try {
        transport_->Close().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Connection[{}]: error while closing transport: {}", serverId_, e.what());
    }
}

bool Connection::IsAlive() const {
    return !closed_.load() && transport_->IsConnected();
}

std::string Connection::GetSessionId() const {
    return transport_->GetSessionId();
}

std::size_t Connection::PendingRequests() const {
    return transport_->PendingRequestCount();
}

} // namespace toolhost
