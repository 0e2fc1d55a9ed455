//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-process transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>

#include "logging/Logger.h"
#include "toolhost/InMemoryTransport.hpp"
#include "toolhost/errors/Errors.h"

namespace toolhost {

class InMemoryTransport::Impl {
public:
    ServerHandler serverHandler;
    std::string sessionId;
    std::atomic<bool> connected{false};
    std::atomic<bool> started{false};
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;

    std::queue<std::string> messageQueue;
    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::jthread processingThread;

    mutable std::mutex requestMutex;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;
    std::unordered_map<std::string, std::size_t> methodCounts;
    std::size_t totalRequests{0};
    std::vector<std::string> notifications;

    Impl(ServerHandler handler, std::string id)
        : serverHandler(std::move(handler)), sessionId(std::move(id)) {}

    ~Impl() { stopProcessing(); }

    void startProcessing() {
        processingThread = std::jthread([this](std::stop_token st) {
            while (!st.stop_requested()) {
                std::unique_lock<std::mutex> lock(queueMutex);
                queueCondition.wait(lock, [this, &st]() { return !messageQueue.empty() || st.stop_requested(); });
                if (st.stop_requested()) {
                    break;
                }
                while (!messageQueue.empty() && !st.stop_requested()) {
                    std::string message = messageQueue.front();
                    messageQueue.pop();
                    lock.unlock();
                    processMessage(message);
                    lock.lock();
                }
            }
        });
    }

    void stopProcessing() {
        if (processingThread.joinable()) {
            processingThread.request_stop();
            {
                std::lock_guard<std::mutex> lock(queueMutex);
            }
            queueCondition.notify_all();
            if (processingThread.get_id() != std::this_thread::get_id()) {
                processingThread.join();
            } else {
                processingThread.detach();
            }
        }
    }

    void processMessage(const std::string& message) {
        JSONRPCRequest request;
        if (!request.Deserialize(message)) {
            LOG_WARN("InMemoryTransport[{}]: dropping undecodable request: {}", sessionId, message);
            return;
        }
        std::unique_ptr<JSONRPCResponse> response;
        try {
            response = serverHandler ? serverHandler(request) : nullptr;
        } catch (const std::exception& e) {
            LOG_ERROR("InMemoryTransport[{}]: handler threw for '{}': {}", sessionId, request.method, e.what());
            response = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
        }
        if (!response) {
            LOG_DEBUG("InMemoryTransport[{}]: reply to '{}' held back", sessionId, request.method);
            return;
        }
        response->id = request.id;
        (void)resolve(std::move(response));
    }

    bool resolve(std::unique_ptr<JSONRPCResponse> response) {
        const std::string key = JSONRPCIdToString(response->id);
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(key);
        if (it == pendingRequests.end()) {
            LOG_WARN("InMemoryTransport[{}]: discarding response for unexpected id {}", sessionId, key);
            return false;
        }
        it->second.set_value(std::move(response));
        pendingRequests.erase(it);
        return true;
    }

    void failAllPending(const std::string& reason) {
        std::lock_guard<std::mutex> lock(requestMutex);
        for (auto& [id, prom] : pendingRequests) {
            prom.set_exception(std::make_exception_ptr(errors::ServerDisconnectedError(reason)));
        }
        pendingRequests.clear();
    }

    void enqueueMessage(const std::string& message) {
        std::lock_guard<std::mutex> lock(queueMutex);
        messageQueue.push(message);
        queueCondition.notify_one();
    }
};

InMemoryTransport::InMemoryTransport(ServerHandler handler, std::string sessionId)
    : pImpl(std::make_unique<Impl>(std::move(handler), std::move(sessionId))) {
    FUNC_SCOPE();
}

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    if (pImpl->started.load()) {
        Close().get();
    }
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    LOG_DEBUG("Starting InMemoryTransport[{}]", pImpl->sessionId);
    pImpl->connected = true;
    if (!pImpl->started.exchange(true)) {
        pImpl->startProcessing();
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    LOG_DEBUG("Closing InMemoryTransport[{}]", pImpl->sessionId);
    pImpl->connected = false;
    pImpl->stopProcessing();
    pImpl->failAllPending("Transport closed");
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const { return pImpl->connected.load(); }
std::string InMemoryTransport::GetSessionId() const { return pImpl->sessionId; }

std::future<std::unique_ptr<JSONRPCResponse>> InMemoryTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    if (!pImpl->connected.load()) {
        promise.set_exception(std::make_exception_ptr(
            errors::ServerDisconnectedError("InMemoryTransport '" + pImpl->sessionId + "' is not connected")));
        return future;
    }
    const std::string key = JSONRPCIdToString(request->id);
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        if (pImpl->pendingRequests.count(key) != 0) {
            promise.set_exception(std::make_exception_ptr(
                errors::InvalidOperationError("Duplicate request id " + key)));
            return future;
        }
        pImpl->pendingRequests.emplace(key, std::move(promise));
        ++pImpl->methodCounts[request->method];
        ++pImpl->totalRequests;
    }
    std::string serialized = request->Serialize();
    LOG_DEBUG("InMemoryTransport[{}] -> {}", pImpl->sessionId, serialized);
    pImpl->enqueueMessage(serialized);
    return future;
}

bool InMemoryTransport::CancelRequest(const JSONRPCId& id) {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    return pImpl->pendingRequests.erase(JSONRPCIdToString(id)) != 0;
}

std::size_t InMemoryTransport::PendingRequestCount() const {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    return pImpl->pendingRequests.size();
}

std::future<void> InMemoryTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto future = promise.get_future();
    if (!pImpl->connected.load()) {
        promise.set_exception(std::make_exception_ptr(
            errors::ServerDisconnectedError("InMemoryTransport '" + pImpl->sessionId + "' is not connected")));
        return future;
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        pImpl->notifications.push_back(notification->method);
    }
    promise.set_value();
    return future;
}

void InMemoryTransport::SetNotificationHandler(NotificationHandler handler) {
    pImpl->notificationHandler = std::move(handler);
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

bool InMemoryTransport::Reply(std::unique_ptr<JSONRPCResponse> response) {
    return pImpl->resolve(std::move(response));
}

void InMemoryTransport::Notify(std::unique_ptr<JSONRPCNotification> notification) {
    if (pImpl->notificationHandler) {
        pImpl->notificationHandler(std::move(notification));
    }
}

void InMemoryTransport::SimulateDisconnect(const std::string& reason) {
    LOG_INFO("InMemoryTransport[{}]: simulated disconnect ({})", pImpl->sessionId, reason);
    pImpl->connected = false;
    if (pImpl->errorHandler) {
        pImpl->errorHandler(reason);
    }
    pImpl->failAllPending(reason);
}

std::size_t InMemoryTransport::RequestCount(const std::string& method) const {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    if (method.empty()) {
        return pImpl->totalRequests;
    }
    auto it = pImpl->methodCounts.find(method);
    return it == pImpl->methodCounts.end() ? 0 : it->second;
}

std::vector<std::string> InMemoryTransport::SentNotifications() const {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    return pImpl->notifications;
}

} // namespace toolhost
