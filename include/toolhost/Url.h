//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Url.h
// Purpose: Minimal http(s) URL splitting used by the HTTP transport and the registry
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

namespace toolhost {

//==========================================================================================================
// UrlParts
// Fields:
//   scheme: "http" or "https" (lower-cased).
//   host: Host name or address without brackets.
//   port: Explicit port, or "80"/"443" derived from the scheme.
//   path: Request target including query; "/" when absent.
//==========================================================================================================
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

//==========================================================================================================
// ParseUrl
// Purpose: Splits an absolute http:// or https:// URL.
// Returns:
//   UrlParts, or std::nullopt when the scheme is missing/unsupported, the host is empty, or the port is
//   not a number in 1..65535.
//==========================================================================================================
std::optional<UrlParts> ParseUrl(const std::string& url);

} // namespace toolhost
