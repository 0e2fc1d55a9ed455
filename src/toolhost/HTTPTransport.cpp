//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.cpp
// Purpose: HTTP/HTTPS JSON-RPC client transport using Boost.Beast coroutines
//==========================================================================================================

#include <utility>
#include <thread>
#include <atomic>
#include <sstream>
#include <mutex>
#include <unordered_map>
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/HTTPTransport.hpp"
#include "toolhost/Url.h"
#include "toolhost/errors/Errors.h"

#include <openssl/ssl.h>

namespace toolhost {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
constexpr const char* SessionHeader = "Mcp-Session-Id";

std::string toStdString(boost::beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

// Splits an event-stream body into the data payload of each event (multi-line data joined with '\n').
std::vector<std::string> sseEventData(const std::string& body) {
    std::vector<std::string> events;
    std::string current;
    bool haveData = false;
    std::istringstream in(body);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            if (haveData) {
                events.push_back(current);
            }
            current.clear();
            haveData = false;
            continue;
        }
        if (line.rfind("data:", 0) == 0) {
            std::string data = line.substr(5);
            if (!data.empty() && data[0] == ' ') {
                data.erase(0, 1);
            }
            if (haveData) {
                current.push_back('\n');
            }
            current += data;
            haveData = true;
        }
    }
    if (haveData) {
        events.push_back(current);
    }
    return events;
}
} // namespace

class HTTPTransport::Impl {
public:
    struct HttpResult {
        int status{0};
        std::string body;
        std::string contentType;
        std::string sessionId;
    };

    HTTPTransport::Options opts;
    UrlParts url;
    std::atomic<bool> connected{false};
    std::atomic<bool> started{false};

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx; // present when https
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;

    HTTPTransport::ErrorHandler errorHandler;
    HTTPTransport::NotificationHandler notificationHandler;
    mutable std::mutex requestMutex;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;
    // Notifications still on the wire, keyed by a local sequence number; failed on Close
    std::uint64_t nextNotificationSeq{0};
    std::unordered_map<std::uint64_t, std::promise<void>> pendingNotifications;

    mutable std::mutex sessionMutex;
    std::string sessionId;

    explicit Impl(const HTTPTransport::Options& o) : opts(o) {}

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    void initTls() {
        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_2_VERSION);
        const bool userProvidedCA = !opts.caFile.empty() || !opts.caPath.empty();
        try {
            if (userProvidedCA) {
                if (!opts.caFile.empty()) { sslCtx->load_verify_file(opts.caFile); }
                if (!opts.caPath.empty()) { sslCtx->add_verify_path(opts.caPath); }
            } else {
                sslCtx->set_default_verify_paths();
            }
        } catch (const boost::system::system_error& e) {
            if (userProvidedCA) {
                throw errors::TransportError("HTTPS: failed to load CA file/path: " + std::string(e.what()));
            }
            LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", e.what());
        }
        sslCtx->set_verify_mode(ssl::verify_peer);
    }

    std::string currentSessionId() const {
        std::lock_guard<std::mutex> lk(sessionMutex);
        return sessionId;
    }

    http::request<http::string_body> makeRequest(const std::string& body) const {
        http::request<http::string_body> req{http::verb::post, url.path, 11};
        const bool defaultPort = (url.scheme == "https" && url.port == "443") || (url.scheme == "http" && url.port == "80");
        req.set(http::field::host, defaultPort ? url.host : url.host + ":" + url.port);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json, text/event-stream");
        req.set(http::field::user_agent, "toolhost");
        req.set(http::field::connection, "close");
        if (!opts.bearerToken.empty()) {
            req.set(http::field::authorization, std::string("Bearer ") + opts.bearerToken);
        }
        const std::string sid = currentSessionId();
        if (!sid.empty()) {
            req.set(SessionHeader, sid);
        }
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    static HttpResult toResult(http::response<http::string_body>& res) {
        HttpResult out;
        out.status = static_cast<int>(res.result_int());
        out.body = std::move(res.body());
        out.contentType = toStdString(res[http::field::content_type]);
        out.sessionId = toStdString(res[SessionHeader]);
        return out;
    }

    // Coroutine: POST JSON and return status, headers of interest and body. Failures propagate as exceptions.
    net::awaitable<HttpResult> coPostJson(const std::string body) {
        http::request<http::string_body> req = makeRequest(body);
        const auto readTimeout = std::chrono::seconds(opts.requestTimeoutSeconds > 0 ? opts.requestTimeoutSeconds : 30);

        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(url.host, url.port, net::use_awaitable);

        if (url.scheme == "https") {
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
                throw errors::TransportError("HTTPS: failed to set SNI hostname " + url.host);
            }
            (void)::SSL_set1_host(stream.native_handle(), url.host.c_str());
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

            stream.next_layer().expires_after(readTimeout);
            co_await http::async_write(stream, req, net::use_awaitable);
            boost::beast::flat_buffer buffer;
            http::response<http::string_body> res;
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec; stream.shutdown(ec);
            co_return toResult(res);
        } else {
            boost::beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);

            stream.expires_after(readTimeout);
            co_await http::async_write(stream, req, net::use_awaitable);
            boost::beast::flat_buffer buffer;
            http::response<http::string_body> res;
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec; stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            co_return toResult(res);
        }
    }

    void rememberSession(const HttpResult& r) {
        if (r.sessionId.empty()) {
            return;
        }
        std::lock_guard<std::mutex> lk(sessionMutex);
        if (sessionId != r.sessionId) {
            LOG_DEBUG("HTTPTransport[{}]: session id {}", opts.serverId, r.sessionId);
            sessionId = r.sessionId;
        }
    }

    // Extracts the response for idStr from a JSON or event-stream body. Notifications carried in the
    // stream are dispatched to the notification handler.
    std::unique_ptr<JSONRPCResponse> decodeResponse(const HttpResult& r, const std::string& idStr) {
        const bool isStream = r.contentType.find("text/event-stream") != std::string::npos;
        if (!isStream) {
            auto resp = std::make_unique<JSONRPCResponse>();
            if (!resp->Deserialize(r.body)) {
                return nullptr;
            }
            if (JSONRPCIdToString(resp->id) != idStr) {
                LOG_WARN("HTTPTransport[{}]: discarding response for unexpected id {} (expected {})",
                         opts.serverId, JSONRPCIdToString(resp->id), idStr);
                return nullptr;
            }
            return resp;
        }
        std::unique_ptr<JSONRPCResponse> found;
        for (const auto& data : sseEventData(r.body)) {
            JSONValue msg;
            try {
                msg = ParseJSON(data);
            } catch (const JSONParseError& e) {
                LOG_WARN("HTTPTransport[{}]: malformed event data: {}", opts.serverId, e.what());
                continue;
            }
            if (msg.Find("method") && !msg.Find("id")) {
                JSONRPCNotification n;
                if (n.FromJSON(msg) && notificationHandler) {
                    notificationHandler(std::make_unique<JSONRPCNotification>(std::move(n)));
                }
                continue;
            }
            auto resp = std::make_unique<JSONRPCResponse>();
            if (resp->FromJSON(msg) && !found && JSONRPCIdToString(resp->id) == idStr) {
                found = std::move(resp);
            }
        }
        return found;
    }

    std::optional<std::promise<std::unique_ptr<JSONRPCResponse>>> takePending(const std::string& idStr) {
        std::lock_guard<std::mutex> lk(requestMutex);
        auto it = pendingRequests.find(idStr);
        if (it == pendingRequests.end()) {
            return std::nullopt;
        }
        auto p = std::move(it->second);
        pendingRequests.erase(it);
        return p;
    }

    std::optional<std::promise<void>> takePendingNotification(std::uint64_t seq) {
        std::lock_guard<std::mutex> lk(requestMutex);
        auto it = pendingNotifications.find(seq);
        if (it == pendingNotifications.end()) {
            return std::nullopt;
        }
        auto p = std::move(it->second);
        pendingNotifications.erase(it);
        return p;
    }
};

HTTPTransport::HTTPTransport(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPTransport::~HTTPTransport() {
    if (pImpl->started.load()) {
        Close().get();
    }
}

std::future<void> HTTPTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready; auto fut = ready.get_future();
    if (pImpl->started.exchange(true)) {
        ready.set_value();
        return fut;
    }
    auto parsed = ParseUrl(pImpl->opts.url);
    if (!parsed) {
        ready.set_exception(std::make_exception_ptr(errors::TransportError("Invalid URL: " + pImpl->opts.url)));
        return fut;
    }
    pImpl->url = *parsed;
    if (pImpl->url.scheme == "https") {
        try {
            pImpl->initTls();
        } catch (const errors::TransportError&) {
            ready.set_exception(std::current_exception());
            return fut;
        }
    }
    LOG_INFO("Starting HTTPTransport for '{}': {}", pImpl->opts.serverId, pImpl->opts.url);
    pImpl->connected.store(true);
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPTransport[{}]: io thread terminated: {}", pImpl->opts.serverId, e.what());
            pImpl->setError(e.what());
        }
    });
    ready.set_value();
    return fut;
}

std::future<void> HTTPTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done; auto fut = done.get_future();
    if (!pImpl->connected.exchange(false)) {
        done.set_value();
        return fut;
    }
    LOG_INFO("Closing HTTPTransport for '{}'", pImpl->opts.serverId);
    if (pImpl->workGuard) {
        pImpl->workGuard->reset(); pImpl->workGuard.reset();
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        for (auto& kv : pImpl->pendingRequests) {
            kv.second.set_exception(std::make_exception_ptr(
                errors::ServerDisconnectedError("Server '" + pImpl->opts.serverId + "' disconnected")));
        }
        pImpl->pendingRequests.clear();
        for (auto& kv : pImpl->pendingNotifications) {
            kv.second.set_exception(std::make_exception_ptr(
                errors::ServerDisconnectedError("Server '" + pImpl->opts.serverId + "' disconnected")));
        }
        pImpl->pendingNotifications.clear();
    }
    done.set_value();
    return fut;
}

bool HTTPTransport::IsConnected() const {
    return pImpl->connected.load();
}

std::string HTTPTransport::GetSessionId() const {
    std::string sid = pImpl->currentSessionId();
    return sid.empty() ? "http-" + pImpl->opts.serverId : sid;
}

std::future<std::unique_ptr<JSONRPCResponse>> HTTPTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto fut = promise.get_future();
    const std::string idStr = JSONRPCIdToString(request->id);
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        if (!pImpl->connected.load()) {
            promise.set_exception(std::make_exception_ptr(
                errors::ServerDisconnectedError("Server '" + pImpl->opts.serverId + "' is not connected")));
            return fut;
        }
        if (pImpl->pendingRequests.count(idStr) != 0) {
            promise.set_exception(std::make_exception_ptr(
                errors::InvalidOperationError("Request id " + idStr + " is already pending")));
            return fut;
        }
        pImpl->pendingRequests.emplace(idStr, std::move(promise));
    }
    std::string payload = request->Serialize();
    LOG_DEBUG("HTTPTransport[{}]: POST request {} ({} bytes)", pImpl->opts.serverId, idStr, payload.size());

    net::co_spawn(pImpl->ioc, pImpl->coPostJson(std::move(payload)),
        [this, idStr](std::exception_ptr eptr, Impl::HttpResult result) {
            auto pending = pImpl->takePending(idStr);
            if (!pending) {
                LOG_DEBUG("HTTPTransport[{}]: dropping reply for cancelled request {}", pImpl->opts.serverId, idStr);
                return;
            }
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const errors::ToolHostError&) {
                    pending->set_exception(std::current_exception());
                } catch (const std::exception& e) {
                    LOG_WARN("HTTPTransport[{}]: request {} failed: {}", pImpl->opts.serverId, idStr, e.what());
                    pending->set_exception(std::make_exception_ptr(
                        errors::TransportError("HTTP request to '" + pImpl->opts.serverId + "' failed: " + e.what())));
                }
                return;
            }
            pImpl->rememberSession(result);
            if (result.status < 200 || result.status >= 300) {
                LOG_WARN("HTTPTransport[{}]: HTTP {} for request {}", pImpl->opts.serverId, result.status, idStr);
                pending->set_exception(std::make_exception_ptr(
                    errors::TransportError("HTTP " + std::to_string(result.status) + " from '" + pImpl->opts.serverId + "'",
                                           result.status)));
                return;
            }
            auto resp = pImpl->decodeResponse(result, idStr);
            if (!resp) {
                pending->set_exception(std::make_exception_ptr(
                    errors::TransportError("Invalid JSON-RPC response from '" + pImpl->opts.serverId + "'", result.status)));
                return;
            }
            pending->set_value(std::move(resp));
        });

    return fut;
}

bool HTTPTransport::CancelRequest(const JSONRPCId& id) {
    std::lock_guard<std::mutex> lk(pImpl->requestMutex);
    return pImpl->pendingRequests.erase(JSONRPCIdToString(id)) != 0;
}

std::size_t HTTPTransport::PendingRequestCount() const {
    std::lock_guard<std::mutex> lk(pImpl->requestMutex);
    return pImpl->pendingRequests.size();
}

std::future<void> HTTPTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    std::uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        if (!pImpl->connected.load()) {
            done.set_exception(std::make_exception_ptr(
                errors::ServerDisconnectedError("Server '" + pImpl->opts.serverId + "' is not connected")));
            return fut;
        }
        seq = ++pImpl->nextNotificationSeq;
        pImpl->pendingNotifications.emplace(seq, std::move(done));
    }
    std::string payload = notification->Serialize();
    LOG_DEBUG("HTTPTransport[{}]: POST notification {}", pImpl->opts.serverId, notification->method);

    net::co_spawn(pImpl->ioc, pImpl->coPostJson(std::move(payload)),
        [this, seq](std::exception_ptr eptr, Impl::HttpResult result) {
            auto pending = pImpl->takePendingNotification(seq);
            if (!pending) {
                return;
            }
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& e) {
                    pending->set_exception(std::make_exception_ptr(
                        errors::TransportError("HTTP notification to '" + pImpl->opts.serverId + "' failed: " + e.what())));
                }
                return;
            }
            pImpl->rememberSession(result);
            if (result.status < 200 || result.status >= 300) {
                pending->set_exception(std::make_exception_ptr(
                    errors::TransportError("HTTP " + std::to_string(result.status) + " from '" + pImpl->opts.serverId + "'",
                                           result.status)));
                return;
            }
            pending->set_value();
        });

    return fut;
}

void HTTPTransport::SetNotificationHandler(NotificationHandler handler) {
    pImpl->notificationHandler = std::move(handler);
}

void HTTPTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

} // namespace toolhost
