//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FakeTransport.h
// Purpose: Scripted ITransport for exercising dispatch, retry and breaker behaviour in tests
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "mcpleague/JSONRPCTypes.h"
#include "mcpleague/Transport.h"
#include "mcpleague/errors/Errors.h"

namespace mcpleague::fakes {

//==========================================================================================================
// FakeTransportState
// Purpose: Shared between a test and the FakeTransport it hands to a ConnectionManager.
//          The script decides each reply: return a response, return nullptr to leave the request
//          parked (silent server), or throw to fail the send future with that exception.
//==========================================================================================================
struct FakeTransportState {
    using Script = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;

    std::mutex mutex;
    Script script;
    std::vector<std::string> methods;
    std::vector<std::string> notificationsSent;
    std::vector<std::pair<JSONRPCId, std::promise<std::unique_ptr<JSONRPCResponse>>>> parked;
    ITransport::NotificationHandler notificationHandler;
    std::atomic<bool> started{false};
    std::atomic<bool> closed{false};
    // When valid, Start() blocks until it is ready.
    std::shared_future<void> startGate;

    void SetScript(Script s) {
        std::lock_guard<std::mutex> lock(mutex);
        script = std::move(s);
    }

    std::size_t RequestCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return methods.size();
    }

    std::vector<std::string> Methods() {
        std::lock_guard<std::mutex> lock(mutex);
        return methods;
    }

    std::size_t ParkedCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return parked.size();
    }

    // Answers every parked request with an empty object result.
    void ReleaseParked() {
        std::vector<std::pair<JSONRPCId, std::promise<std::unique_ptr<JSONRPCResponse>>>> toRelease;
        {
            std::lock_guard<std::mutex> lock(mutex);
            toRelease.swap(parked);
        }
        for (auto& [id, promise] : toRelease) {
            promise.set_value(std::make_unique<JSONRPCResponse>(id, JSONValue(JSONValue::Object{})));
        }
    }

    void FailParked(const std::string& reason) {
        std::vector<std::pair<JSONRPCId, std::promise<std::unique_ptr<JSONRPCResponse>>>> toFail;
        {
            std::lock_guard<std::mutex> lock(mutex);
            toFail.swap(parked);
        }
        for (auto& entry : toFail) {
            entry.second.set_exception(std::make_exception_ptr(errors::TransportError(reason)));
        }
    }

    // Simulates a server push.
    void Push(const JSONRPCNotification& notification) {
        ITransport::NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            handler = notificationHandler;
        }
        if (handler) {
            handler(std::make_unique<JSONRPCNotification>(notification));
        }
    }

    // Polls until RequestCount() reaches n or the timeout passes.
    bool WaitForRequests(std::size_t n, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (RequestCount() >= n) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return RequestCount() >= n;
    }
};

class FakeTransport : public ITransport {
public:
    explicit FakeTransport(std::shared_ptr<FakeTransportState> s) : state(std::move(s)) {}
    ~FakeTransport() override { state->FailParked("FakeTransport destroyed"); }

    std::future<void> Start() override {
        if (state->startGate.valid()) {
            state->startGate.wait();
        }
        state->started = true;
        std::promise<void> p; p.set_value(); return p.get_future();
    }

    std::future<void> Close() override {
        state->closed = true;
        state->FailParked("FakeTransport closed");
        std::promise<void> p; p.set_value(); return p.get_future();
    }

    bool IsConnected() const override { return state->started && !state->closed; }
    std::string GetSessionId() const override { return "fake"; }

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(std::unique_ptr<JSONRPCRequest> request) override {
        FakeTransportState::Script script;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->methods.push_back(request->method);
            script = state->script;
        }
        std::promise<std::unique_ptr<JSONRPCResponse>> promise;
        auto fut = promise.get_future();
        if (state->closed) {
            promise.set_exception(std::make_exception_ptr(errors::TransportError("FakeTransport closed")));
            return fut;
        }
        try {
            auto reply = script ? script(*request)
                                : std::make_unique<JSONRPCResponse>(request->id, JSONValue(JSONValue::Object{}));
            if (!reply) {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->parked.emplace_back(request->id, std::move(promise));
                return fut;
            }
            reply->id = request->id;
            promise.set_value(std::move(reply));
        } catch (const std::exception&) {
            promise.set_exception(std::current_exception());
        }
        return fut;
    }

    std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) override {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->notificationsSent.push_back(notification->method);
        }
        std::promise<void> p; p.set_value(); return p.get_future();
    }

    void SetNotificationHandler(NotificationHandler handler) override {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->notificationHandler = std::move(handler);
    }

    void SetErrorHandler(ErrorHandler) override {}

private:
    std::shared_ptr<FakeTransportState> state;
};

// Every transport it creates shares the same state, so reconnects keep the script.
class FakeTransportFactory : public ITransportFactory {
public:
    explicit FakeTransportFactory(std::shared_ptr<FakeTransportState> s) : state(std::move(s)) {}

    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            configs.push_back(config);
        }
        state->closed = false;
        return std::make_unique<FakeTransport>(state);
    }

    std::vector<std::string> Configs() {
        std::lock_guard<std::mutex> lock(mutex);
        return configs;
    }

private:
    std::shared_ptr<FakeTransportState> state;
    std::mutex mutex;
    std::vector<std::string> configs;
};

// Convenience replies for scripts.
inline std::unique_ptr<JSONRPCResponse> OkReply(const JSONRPCRequest& req, JSONValue result) {
    return std::make_unique<JSONRPCResponse>(req.id, std::move(result));
}

inline std::unique_ptr<JSONRPCResponse> ErrorReply(const JSONRPCRequest& req, int code, const std::string& message) {
    return CreateErrorResponse(req.id, code, message);
}

} // namespace mcpleague::fakes
