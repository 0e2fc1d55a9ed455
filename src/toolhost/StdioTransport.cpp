//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Subprocess stdio transport: line framing, response correlation and process teardown
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <cstring>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "toolhost/ChildProcess.hpp"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"
#include "toolhost/StdioTransport.hpp"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {
constexpr std::size_t ReadChunkBytes = 64 * 1024;
constexpr std::size_t MaxStderrLineBytes = 64 * 1024;

bool isBlank(const std::string& s) {
    for (char c : s) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            return false;
        }
    }
    return true;
}

template <typename T, typename E>
std::future<T> readyFailure(E error) {
    std::promise<T> p;
    p.set_exception(std::make_exception_ptr(std::move(error)));
    return p.get_future();
}
} // namespace

class StdioTransport::Impl {
public:
    StdioConfig config;
    std::string serverId;
    std::unique_ptr<ChildProcess> child;
    std::string sessionId;

    std::atomic<bool> connected{false};
    std::atomic<bool> started{false};
    std::atomic<bool> closed{false};
    bool closing{false}; // guarded by requestMutex

    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;

    std::thread readerThread;
    std::thread stderrThread;
    mutable std::mutex requestMutex;
    std::mutex writeMutex;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;

    // Self-pipe: written once by Close() and never drained, so every poller sees it readable.
    int wakePipe[2]{-1, -1};
    std::chrono::milliseconds stopGrace{GetEnvInt("TOOLHOST_STOP_GRACE_MS", 5000)};

    Impl(StdioConfig cfg, std::string id) : config(std::move(cfg)), serverId(std::move(id)) {
        if (::pipe2(wakePipe, O_CLOEXEC | O_NONBLOCK) != 0) {
            LOG_ERROR("StdioTransport[{}]: failed to create self-pipe (errno={} msg={})", serverId, errno, ::strerror(errno));
        }
    }

    ~Impl() {
        if (wakePipe[0] >= 0) { ::close(wakePipe[0]); wakePipe[0] = -1; }
        if (wakePipe[1] >= 0) { ::close(wakePipe[1]); wakePipe[1] = -1; }
    }

    void wake() {
        if (wakePipe[1] < 0) {
            return;
        }
        char b = 'x';
        for (;;) {
            ssize_t w = ::write(wakePipe[1], &b, 1);
            if (w >= 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("StdioTransport[{}]: wake pipe write failed (errno={} msg={})", serverId, errno, ::strerror(errno));
            break;
        }
    }

    void reportError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    //////////////////////////////////////////// Writing ////////////////////////////////////////////
    // Writes one complete line; throws ServerDisconnectedError when the pipe is gone.
    void writeLine(const std::string& payload) {
        std::string line;
        line.reserve(payload.size() + 1);
        line.append(payload);
        line.push_back('\n');

        std::lock_guard<std::mutex> lk(writeMutex);
        int fd = child ? child->StdinFd() : -1;
        if (fd < 0) {
            throw errors::ServerDisconnectedError("Server '" + serverId + "' stdin is closed");
        }
        std::size_t total = 0;
        while (total < line.size()) {
            ssize_t w = ::write(fd, line.data() + total, line.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
            } else if (w < 0 && errno == EINTR) {
                continue;
            } else {
                int err = errno;
                LOG_ERROR("StdioTransport[{}]: write error (errno={} msg={})", serverId, err, ::strerror(err));
                throw errors::ServerDisconnectedError("Server '" + serverId + "' write failed: " + ::strerror(err));
            }
        }
    }

    //////////////////////////////////////////// Reading ////////////////////////////////////////////
    // Waits for fd or the wake pipe. Returns bytes read, 0 on EOF, -1 on error, -2 when woken.
    ssize_t pollRead(int fd, char* buf, std::size_t cap) {
        for (;;) {
            struct pollfd pfds[2];
            pfds[0].fd = fd; pfds[0].events = POLLIN; pfds[0].revents = 0;
            pfds[1].fd = wakePipe[0]; pfds[1].events = POLLIN; pfds[1].revents = 0;
            int nfds = wakePipe[0] >= 0 ? 2 : 1;
            int rc = ::poll(pfds, static_cast<nfds_t>(nfds), 250);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return -1;
            }
            if (nfds == 2 && (pfds[1].revents & POLLIN)) {
                return -2;
            }
            if (rc == 0) {
                if (closed.load()) {
                    return -2;
                }
                continue;
            }
            ssize_t n;
            do {
                n = ::read(fd, buf, cap);
            } while (n < 0 && errno == EINTR);
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                continue;
            }
            return n;
        }
    }

    void startReader() {
        readerThread = std::thread([this]() {
            std::string buffer;
            std::vector<char> tmp(ReadChunkBytes);
            bool discarding = false;
            bool woken = false;
            const int fd = child->StdoutFd();

            while (true) {
                ssize_t n = pollRead(fd, tmp.data(), tmp.size());
                if (n == -2) {
                    woken = true;
                    break;
                }
                if (n == 0) {
                    LOG_INFO("StdioTransport[{}]: EOF on server stdout", serverId);
                    reportError("StdioTransport: EOF on server stdout");
                    break;
                }
                if (n < 0) {
                    LOG_ERROR("StdioTransport[{}]: read error (errno={} msg={})", serverId, errno, ::strerror(errno));
                    reportError("StdioTransport: read error");
                    break;
                }

                std::size_t scanFrom = buffer.size();
                buffer.append(tmp.data(), static_cast<std::size_t>(n));
                std::size_t lineStart = 0;
                for (std::size_t nl = buffer.find('\n', scanFrom); nl != std::string::npos; nl = buffer.find('\n', lineStart)) {
                    if (discarding) {
                        discarding = false;
                    } else {
                        processLine(buffer.substr(lineStart, nl - lineStart));
                    }
                    lineStart = nl + 1;
                }
                buffer.erase(0, lineStart);
                if (buffer.size() > MaxLineBytes) {
                    if (!discarding) {
                        LOG_ERROR("StdioTransport[{}]: line exceeds {} bytes; dropping it", serverId, MaxLineBytes);
                    }
                    discarding = true;
                    buffer.clear();
                }
            }

            connected = false;
            if (!woken) {
                failAllPending("Server '" + serverId + "' closed its output stream");
            }
        });
    }

    void startStderrDrain() {
        stderrThread = std::thread([this]() {
            std::string buffer;
            std::vector<char> tmp(4096);
            const int fd = child->StderrFd();
            while (true) {
                ssize_t n = pollRead(fd, tmp.data(), tmp.size());
                if (n <= 0) {
                    break;
                }
                buffer.append(tmp.data(), static_cast<std::size_t>(n));
                std::size_t pos;
                while ((pos = buffer.find('\n')) != std::string::npos) {
                    std::string line = buffer.substr(0, pos);
                    if (!line.empty() && line.back() == '\r') {
                        line.pop_back();
                    }
                    LOG_DEBUG("[{} stderr] {}", serverId, line);
                    buffer.erase(0, pos + 1);
                }
                if (buffer.size() > MaxStderrLineBytes) {
                    LOG_DEBUG("[{} stderr] {}", serverId, buffer);
                    buffer.clear();
                }
            }
            if (!buffer.empty()) {
                LOG_DEBUG("[{} stderr] {}", serverId, buffer);
            }
        });
    }

    void processLine(std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (isBlank(line)) {
            return;
        }
        JSONValue msg;
        try {
            msg = ParseJSON(line);
        } catch (const JSONParseError& e) {
            LOG_WARN("StdioTransport[{}]: skipping malformed line ({}): {}", serverId, e.what(), line);
            return;
        }
        if (!msg.IsObject()) {
            LOG_WARN("StdioTransport[{}]: skipping non-object message: {}", serverId, line);
            return;
        }

        const bool hasId = msg.Find("id") != nullptr;
        if (const JSONValue* method = msg.Find("method"); method && method->IsString()) {
            if (hasId) {
                handleServerRequest(msg);
            } else {
                handleNotification(msg);
            }
            return;
        }
        if (hasId && (msg.Find("result") || msg.Find("error"))) {
            JSONRPCResponse response;
            if (response.FromJSON(msg)) {
                handleResponse(std::move(response));
                return;
            }
        }
        LOG_WARN("StdioTransport[{}]: unrecognized message: {}", serverId, line);
    }

    // Server-initiated requests: ping is answered, nothing else is supported by a tool host.
    void handleServerRequest(const JSONValue& msg) {
        JSONRPCRequest request;
        if (!request.FromJSON(msg)) {
            LOG_WARN("StdioTransport[{}]: invalid server request", serverId);
            return;
        }
        std::unique_ptr<JSONRPCResponse> resp;
        if (request.method == Methods::Ping) {
            resp = std::make_unique<JSONRPCResponse>(request.id, JSONValue(JSONValue::Object{}));
        } else {
            LOG_DEBUG("StdioTransport[{}]: rejecting server request '{}'", serverId, request.method);
            resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                       "Method not supported by client: " + request.method);
        }
        try {
            writeLine(resp->Serialize());
        } catch (const errors::ServerDisconnectedError& e) {
            LOG_WARN("StdioTransport[{}]: could not answer '{}': {}", serverId, request.method, e.what());
        }
    }

    void handleNotification(const JSONValue& msg) {
        JSONRPCNotification notification;
        if (!notification.FromJSON(msg)) {
            return;
        }
        LOG_DEBUG("StdioTransport[{}]: notification {}", serverId, notification.method);
        if (notificationHandler) {
            try {
                notificationHandler(std::make_unique<JSONRPCNotification>(std::move(notification)));
            } catch (const std::exception& e) {
                LOG_ERROR("StdioTransport[{}]: notification handler threw: {}", serverId, e.what());
            }
        }
    }

    void handleResponse(JSONRPCResponse response) {
        const std::string idStr = JSONRPCIdToString(response.id);
        std::lock_guard<std::mutex> lock(requestMutex);
        if (closing) {
            return;
        }
        auto it = pendingRequests.find(idStr);
        if (it == pendingRequests.end()) {
            LOG_WARN("StdioTransport[{}]: discarding response with unexpected id {}", serverId, idStr);
            return;
        }
        it->second.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
        pendingRequests.erase(it);
    }

    void failAllPending(const std::string& reason) {
        std::lock_guard<std::mutex> lock(requestMutex);
        if (!pendingRequests.empty()) {
            LOG_DEBUG("StdioTransport[{}]: failing {} pending request(s): {}", serverId, pendingRequests.size(), reason);
        }
        for (auto& [idStr, prom] : pendingRequests) {
            prom.set_exception(std::make_exception_ptr(errors::ServerDisconnectedError(reason)));
        }
        pendingRequests.clear();
    }
};

StdioTransport::StdioTransport(StdioConfig config, std::string serverId)
    : pImpl(std::make_unique<Impl>(std::move(config), std::move(serverId))) { FUNC_SCOPE(); }

StdioTransport::~StdioTransport() {
    FUNC_SCOPE();
    if (pImpl->started.load() && !pImpl->closed.load()) {
        Close().get();
    }
}

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    if (pImpl->started.exchange(true)) {
        promise.set_value();
        return promise.get_future();
    }
    LOG_INFO("Starting StdioTransport for '{}': {}", pImpl->serverId, pImpl->config.command);
    try {
        pImpl->child = ChildProcess::Spawn(pImpl->config.command, pImpl->config.args, pImpl->config.env);
    } catch (const std::exception& e) {
        LOG_ERROR("StdioTransport[{}]: spawn failed: {}", pImpl->serverId, e.what());
        pImpl->closed = true;
        promise.set_exception(std::current_exception());
        return promise.get_future();
    }
    pImpl->sessionId = "stdio-" + std::to_string(pImpl->child->Pid());
    pImpl->connected = true;
    pImpl->startReader();
    pImpl->startStderrDrain();
    promise.set_value();
    return promise.get_future();
}

std::future<void> StdioTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> promise;
    if (pImpl->closed.exchange(true)) {
        promise.set_value();
        return promise.get_future();
    }
    LOG_INFO("Closing StdioTransport for '{}'", pImpl->serverId);

    // Pending callers lose any race with the stop
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        pImpl->closing = true;
    }
    pImpl->failAllPending("Server '" + pImpl->serverId + "' disconnected");
    pImpl->connected = false;
    pImpl->wake();

    if (pImpl->readerThread.joinable()) {
        pImpl->readerThread.join();
    }
    if (pImpl->child) {
        {
            // A writer blocked on a full pipe keeps the lock; it is released by EPIPE once the child dies
            std::unique_lock<std::mutex> lk(pImpl->writeMutex, std::try_to_lock);
            if (lk.owns_lock()) {
                pImpl->child->CloseStdin();
            }
        }
        if (!pImpl->child->Terminate(pImpl->stopGrace)) {
            LOG_ERROR("StdioTransport[{}]: process {} could not be reaped", pImpl->serverId,
                      static_cast<int>(pImpl->child->Pid()));
        }
    }
    if (pImpl->stderrThread.joinable()) {
        pImpl->stderrThread.join();
    }
    promise.set_value();
    return promise.get_future();
}

bool StdioTransport::IsConnected() const {
    return pImpl->connected.load() && pImpl->child && pImpl->child->IsAlive();
}

std::string StdioTransport::GetSessionId() const { return pImpl->sessionId; }

std::optional<pid_t> StdioTransport::ProcessId() const {
    if (!pImpl->child) {
        return std::nullopt;
    }
    return pImpl->child->Pid();
}

std::future<std::unique_ptr<JSONRPCResponse>> StdioTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    using Result = std::unique_ptr<JSONRPCResponse>;
    const std::string idStr = JSONRPCIdToString(request->id);
    std::future<Result> future;
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        if (pImpl->closing || !pImpl->connected.load()) {
            return readyFailure<Result>(errors::ServerDisconnectedError("Server '" + pImpl->serverId + "' is not connected"));
        }
        if (pImpl->pendingRequests.count(idStr) != 0) {
            return readyFailure<Result>(errors::InvalidOperationError("Request id " + idStr + " is already pending"));
        }
        std::promise<Result> promise;
        future = promise.get_future();
        pImpl->pendingRequests.emplace(idStr, std::move(promise));
    }

    const std::string serialized = request->Serialize();
    LOG_DEBUG("StdioTransport[{}]: sending request {} ({} bytes)", pImpl->serverId, idStr, serialized.size());
    try {
        pImpl->writeLine(serialized);
    } catch (const errors::ServerDisconnectedError&) {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        auto it = pImpl->pendingRequests.find(idStr);
        if (it != pImpl->pendingRequests.end()) {
            it->second.set_exception(std::current_exception());
            pImpl->pendingRequests.erase(it);
        }
    }
    return future;
}

bool StdioTransport::CancelRequest(const JSONRPCId& id) {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    return pImpl->pendingRequests.erase(JSONRPCIdToString(id)) != 0;
}

std::size_t StdioTransport::PendingRequestCount() const {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    return pImpl->pendingRequests.size();
}

std::future<void> StdioTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    std::promise<void> promise;
    if (!pImpl->connected.load()) {
        promise.set_exception(std::make_exception_ptr(
            errors::ServerDisconnectedError("Server '" + pImpl->serverId + "' is not connected")));
        return promise.get_future();
    }
    try {
        pImpl->writeLine(notification->Serialize());
        promise.set_value();
    } catch (const errors::ServerDisconnectedError&) {
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

void StdioTransport::SetNotificationHandler(NotificationHandler handler) { pImpl->notificationHandler = std::move(handler); }
void StdioTransport::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }

void StdioTransport::SetStopGracePeriod(std::chrono::milliseconds grace) {
    pImpl->stopGrace = grace;
}

} // namespace toolhost
