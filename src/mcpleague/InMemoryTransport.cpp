//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <random>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "logging/Logger.h"
#include "mcpleague/JSONRPCTypes.h"
#include "mcpleague/InMemoryTransport.hpp"
#include "mcpleague/JsonRpcMessageRouter.h"
#include "mcpleague/errors/Errors.h"

namespace mcpleague {

class InMemoryTransport::Impl {
public:
    std::atomic<bool> connected{false};
    std::string sessionId;
    ITransport::NotificationHandler notificationHandler;
    RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;
    // Guards both peer pointers of a pair; whichever side is destroyed first unlinks the other.
    std::shared_ptr<std::mutex> linkMutex = std::make_shared<std::mutex>();
    InMemoryTransport::Impl* peer = nullptr;
    std::queue<std::string> messageQueue;
    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::jthread processingThread;
    std::mutex workersMutex;
    std::vector<std::jthread> requestWorkers;
    std::atomic<unsigned int> requestCounter{0u};
    std::mutex requestMutex;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;
    std::unique_ptr<IJsonRpcMessageRouter> router;

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
        router = MakeDefaultJsonRpcMessageRouter();
    }

    ~Impl() {
        unlink();
        connected = false;
        queueCondition.notify_all();
        if (processingThread.joinable()) {
            processingThread.request_stop();
            processingThread.join();
        }
        std::vector<std::jthread> workers;
        {
            std::lock_guard<std::mutex> lock(workersMutex);
            workers.swap(requestWorkers);
        }
        workers.clear();
        failPending("Transport destroyed");
    }

    void unlink() {
        std::lock_guard<std::mutex> lock(*linkMutex);
        if (peer) {
            peer->peer = nullptr;
            peer = nullptr;
        }
    }

    void startProcessing() {
        if (processingThread.joinable()) {
            return;
        }
        processingThread = std::jthread([this](std::stop_token st) {
            while (connected && !st.stop_requested()) {
                std::unique_lock<std::mutex> lock(queueMutex);
                queueCondition.wait(lock, [this, &st]() { return !messageQueue.empty() || !connected || st.stop_requested(); });
                if (st.stop_requested()) {
                    break;
                }
                while (!messageQueue.empty() && connected) {
                    std::string message = std::move(messageQueue.front());
                    messageQueue.pop();
                    lock.unlock();
                    processMessage(message);
                    lock.lock();
                }
            }
        });
    }

    void processMessage(const std::string& message) {
        LOG_DEBUG("Processing in-memory message: {}", message);

        if (router->Classify(message) == IJsonRpcMessageRouter::MessageKind::Request && requestHandler) {
            // Each request on its own thread so a slow handler never blocks notifications.
            std::lock_guard<std::mutex> lock(workersMutex);
            requestWorkers.emplace_back([this, message]() {
                RouterHandlers handlers;
                handlers.requestHandler = requestHandler;
                auto reply = router->Route(message, handlers);
                if (reply.has_value()) {
                    sendToPeer(*reply);
                }
            });
            return;
        }

        RouterHandlers handlers;
        handlers.responseHandler = [this](JSONRPCResponse&& response) { handleResponse(std::move(response)); };
        handlers.notificationHandler = notificationHandler;
        handlers.errorHandler = errorHandler;
        auto reply = router->Route(message, handlers);
        if (reply.has_value()) {
            sendToPeer(*reply);
        }
    }

    void handleResponse(JSONRPCResponse response) {
        const std::string idStr = JSONRPCIdToString(response.id);
        std::promise<std::unique_ptr<JSONRPCResponse>> promise;
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            auto it = pendingRequests.find(idStr);
            if (it == pendingRequests.end()) {
                LOG_DEBUG("InMemoryTransport: response for unknown id {}", idStr);
                return;
            }
            promise = std::move(it->second);
            pendingRequests.erase(it);
        }
        promise.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
    }

    void enqueueMessage(const std::string& message) {
        std::lock_guard<std::mutex> lock(queueMutex);
        messageQueue.push(message);
        queueCondition.notify_one();
    }

    bool sendToPeer(const std::string& message) {
        if (!connected.load()) {
            return false;
        }
        std::lock_guard<std::mutex> lock(*linkMutex);
        if (!peer || !peer->connected.load()) {
            LOG_WARN("InMemoryTransport: peer not connected; dropping message");
            return false;
        }
        peer->enqueueMessage(message);
        return true;
    }

    void failPending(const std::string& reason) {
        std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pending;
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            pending.swap(pendingRequests);
        }
        for (auto& [idStr, prom] : pending) {
            prom.set_exception(std::make_exception_ptr(errors::TransportError(reason)));
        }
    }

    std::string generateRequestId() { return "mem-req-" + std::to_string(++requestCounter); }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }
InMemoryTransport::~InMemoryTransport() { FUNC_SCOPE(); }

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto transport1 = std::make_unique<InMemoryTransport>();
    auto transport2 = std::make_unique<InMemoryTransport>();
    transport2->pImpl->linkMutex = transport1->pImpl->linkMutex;
    transport1->pImpl->peer = transport2->pImpl.get();
    transport2->pImpl->peer = transport1->pImpl.get();
    return std::make_pair(std::move(transport1), std::move(transport2));
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting InMemoryTransport {}", pImpl->sessionId);
    pImpl->connected = true;
    pImpl->startProcessing();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    LOG_INFO("Closing InMemoryTransport {}", pImpl->sessionId);
    pImpl->connected = false;
    pImpl->queueCondition.notify_all();
    pImpl->failPending("Transport closed");
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->connected; }
std::string InMemoryTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

std::future<std::unique_ptr<JSONRPCResponse>> InMemoryTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    // Preserve caller-provided id if set (string non-empty or int64); otherwise generate one.
    std::string requestId = JSONRPCIdToString(request->id);
    if (requestId.empty()) {
        requestId = pImpl->generateRequestId();
        request->id = requestId;
    }
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        pImpl->pendingRequests[requestId] = std::move(promise);
    }
    std::string serialized = request->Serialize();
    LOG_DEBUG("Sending in-memory request: {}", serialized);
    if (!pImpl->sendToPeer(serialized)) {
        std::promise<std::unique_ptr<JSONRPCResponse>> failed;
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(pImpl->requestMutex);
            auto it = pImpl->pendingRequests.find(requestId);
            if (it != pImpl->pendingRequests.end()) {
                failed = std::move(it->second);
                pImpl->pendingRequests.erase(it);
                found = true;
            }
        }
        if (found) {
            failed.set_exception(std::make_exception_ptr(errors::TransportError("Peer not connected")));
        }
    }
    return future;
}

std::future<void> InMemoryTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    std::string serialized = notification->Serialize();
    LOG_DEBUG("Sending in-memory notification: {}", serialized);
    if (!pImpl->sendToPeer(serialized)) {
        return errors::MakeFailedFuture<void>(errors::TransportError("Peer not connected"));
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::SendNotificationToPeer(const JSONRPCNotification& notification) {
    FUNC_SCOPE();
    return pImpl->sendToPeer(notification.Serialize());
}

void InMemoryTransport::SetNotificationHandler(NotificationHandler handler) {
    FUNC_SCOPE();
    pImpl->notificationHandler = std::move(handler);
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->errorHandler = std::move(handler);
}

void InMemoryTransport::SetRequestHandler(RequestHandler handler) {
    FUNC_SCOPE();
    pImpl->requestHandler = std::move(handler);
}

std::unique_ptr<ITransport> InMemoryTransportFactory::CreateTransport(const std::string& /*config*/) {
    return std::make_unique<InMemoryTransport>();
}

} // namespace mcpleague
