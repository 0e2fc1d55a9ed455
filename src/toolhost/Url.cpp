//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Url.cpp
// Purpose: http(s) URL splitting
//==========================================================================================================

#include "toolhost/Url.h"

#include <cctype>

namespace toolhost {

std::optional<UrlParts> ParseUrl(const std::string& url) {
    UrlParts parts;

    std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }
    for (char c : url.substr(0, schemeEnd)) {
        parts.scheme.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    }
    if (parts.scheme != "http" && parts.scheme != "https") {
        return std::nullopt;
    }
    std::size_t pos = schemeEnd + 3;

    std::size_t pathStart = url.find_first_of("/?#", pos);
    std::string hostPort;
    if (pathStart == std::string::npos) {
        hostPort = url.substr(pos);
        parts.path = "/";
    } else {
        hostPort = url.substr(pos, pathStart - pos);
        parts.path = url.substr(pathStart);
        std::size_t fragment = parts.path.find('#');
        if (fragment != std::string::npos) {
            parts.path.erase(fragment);
        }
        if (parts.path.empty() || parts.path[0] != '/') {
            parts.path.insert(0, "/");
        }
    }

    // Userinfo is not supported; credentials travel as a bearer token instead
    if (hostPort.find('@') != std::string::npos) {
        return std::nullopt;
    }

    std::size_t colon = std::string::npos;
    if (!hostPort.empty() && hostPort[0] == '[') {
        std::size_t close = hostPort.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        parts.host = hostPort.substr(1, close - 1);
        if (close + 1 < hostPort.size()) {
            if (hostPort[close + 1] != ':') {
                return std::nullopt;
            }
            colon = close + 1;
        }
    } else {
        colon = hostPort.find(':');
        parts.host = hostPort.substr(0, colon);
    }
    if (parts.host.empty()) {
        return std::nullopt;
    }

    if (colon == std::string::npos) {
        parts.port = parts.scheme == "https" ? "443" : "80";
    } else {
        parts.port = hostPort.substr(colon + 1);
        if (parts.port.empty() || parts.port.size() > 5) {
            return std::nullopt;
        }
        for (char c : parts.port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
        }
        int port = std::stoi(parts.port);
        if (port < 1 || port > 65535) {
            return std::nullopt;
        }
    }
    return parts;
}

} // namespace toolhost
