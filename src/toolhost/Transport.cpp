//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.cpp
// Purpose: Default transport factory dispatching on the configured transport kind
//==========================================================================================================

#include "toolhost/Transport.h"

#include "logging/Logger.h"
#include "toolhost/HTTPTransport.hpp"
#include "toolhost/ServerConfig.h"
#include "toolhost/StdioTransport.hpp"

namespace toolhost {

std::unique_ptr<ITransport> DefaultTransportFactory::CreateTransport(const ServerConfig& config) {
    FUNC_SCOPE();
    return std::visit([&config](const auto& t) -> std::unique_ptr<ITransport> {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, StdioConfig>) {
            return std::make_unique<StdioTransport>(t, config.id);
        } else {
            HTTPTransport::Options opts;
            opts.serverId = config.id;
            opts.url = t.url;
            opts.bearerToken = t.bearerToken;
            opts.requestTimeoutSeconds = config.timeoutSeconds;
            return std::make_unique<HTTPTransport>(opts);
        }
    }, config.transport);
}

} // namespace toolhost
