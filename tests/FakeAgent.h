//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FakeAgent.h
// Purpose: In-memory remote agent for client tests. Acts as an ITransportFactory: each transport it hands
//          out is one end of an InMemoryTransport pair whose other end serves the agent's methods.
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "mcpleague/InMemoryTransport.hpp"
#include "mcpleague/JSONRPCTypes.h"
#include "mcpleague/Protocol.h"
#include "mcpleague/Transport.h"

namespace mcpleague::fakes {

class FakeAgent : public ITransportFactory {
public:
    // Returns the result member; nullptr leaves the request unanswered.
    using MethodHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;

    explicit FakeAgent(std::string agentName) : name(std::move(agentName)) {
        On(Methods::Initialize, [this](const JSONRPCRequest& req) {
            return reply(req, MakeObject({
                {"protocolVersion", JSONValue(protocolVersion)},
                {"capabilities", MakeObject({{"tools", MakeObject({{"listChanged", JSONValue(true)}})},
                                             {"resources", MakeObject({{"subscribe", JSONValue(true)}})}})},
                {"serverInfo", MakeObject({{"name", JSONValue(name)}, {"version", JSONValue("1.0.0")}})},
            }));
        });
        On(Methods::Ping, [](const JSONRPCRequest& req) { return reply(req, MakeObject({})); });
        On(Methods::ListTools, [this](const JSONRPCRequest& req) {
            JSONValue::Array arr;
            for (const auto& t : Tools()) {
                arr.push_back(std::make_shared<JSONValue>(MakeObject({
                    {"name", JSONValue(t)},
                    {"description", JSONValue(name + " " + t)},
                    {"inputSchema", MakeObject({{"type", JSONValue("object")}})},
                })));
            }
            return reply(req, MakeObject({{"tools", JSONValue(std::move(arr))}}));
        });
        On(Methods::ListResources, [this](const JSONRPCRequest& req) {
            JSONValue::Array arr;
            for (const auto& uri : Resources()) {
                arr.push_back(std::make_shared<JSONValue>(MakeObject({{"uri", JSONValue(uri)}})));
            }
            return reply(req, MakeObject({{"resources", JSONValue(std::move(arr))}}));
        });
        On(Methods::ReadResource, [this](const JSONRPCRequest& req) {
            const std::string uri = GetStringMember(req.params.value_or(JSONValue{}), "uri").value_or("");
            return reply(req, MakeObject({{"contents", MakeObject({{"uri", JSONValue(uri)},
                                                                   {"text", JSONValue(name + ":" + uri)}})}}));
        });
        On(Methods::Subscribe, [](const JSONRPCRequest& req) { return reply(req, MakeObject({})); });
        On(Methods::Unsubscribe, [](const JSONRPCRequest& req) { return reply(req, MakeObject({})); });
        On(Methods::CallTool, [this](const JSONRPCRequest& req) {
            const JSONValue params = req.params.value_or(JSONValue{});
            JSONValue args = MakeObject({});
            if (const JSONValue* a = FindMember(params, "arguments")) {
                args = *a;
            }
            return reply(req, MakeObject({
                {"server", JSONValue(name)},
                {"tool", JSONValue(GetStringMember(params, "name").value_or(""))},
                {"arguments", args},
            }));
        });
        On(Methods::ProtocolMessage, [](const JSONRPCRequest& req) {
            JSONValue message;
            if (const JSONValue* m = FindMember(req.params.value_or(JSONValue{}), "message")) {
                message = *m;
            }
            return reply(req, MakeObject({{"ack", message}}));
        });
    }

    ~FakeAgent() override {
        std::vector<std::unique_ptr<InMemoryTransport>> ends;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ends.swap(serverEnds);
        }
        for (auto& e : ends) {
            e->Close().get();
        }
    }

    std::unique_ptr<ITransport> CreateTransport(const std::string&) override {
        auto pair = InMemoryTransport::CreatePair();
        pair.second->SetRequestHandler([this](const JSONRPCRequest& req) { return dispatch(req); });
        pair.second->SetNotificationHandler([this](std::unique_ptr<JSONRPCNotification> n) {
            std::lock_guard<std::mutex> lock(mutex);
            notificationsReceived.push_back(n->method);
        });
        pair.second->Start().get();
        {
            std::lock_guard<std::mutex> lock(mutex);
            serverEnds.push_back(std::move(pair.second));
        }
        return std::move(pair.first);
    }

    void On(const std::string& method, MethodHandler handler) {
        std::lock_guard<std::mutex> lock(mutex);
        if (handler) {
            handlers[method] = std::move(handler);
        } else {
            handlers.erase(method);
        }
    }

    void SetTools(std::vector<std::string> t) {
        std::lock_guard<std::mutex> lock(mutex);
        tools = std::move(t);
    }

    std::vector<std::string> Tools() {
        std::lock_guard<std::mutex> lock(mutex);
        return tools;
    }

    void SetResources(std::vector<std::string> r) {
        std::lock_guard<std::mutex> lock(mutex);
        resources = std::move(r);
    }

    std::vector<std::string> Resources() {
        std::lock_guard<std::mutex> lock(mutex);
        return resources;
    }

    // Pushes a notification to the most recently connected client.
    bool Push(const JSONRPCNotification& notification) {
        std::lock_guard<std::mutex> lock(mutex);
        return !serverEnds.empty() && serverEnds.back()->SendNotificationToPeer(notification);
    }

    std::vector<std::string> Received() {
        std::lock_guard<std::mutex> lock(mutex);
        return received;
    }

    std::size_t CountReceived(const std::string& method) {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (const auto& m : received) {
            n += m == method ? 1 : 0;
        }
        return n;
    }

    std::vector<std::string> NotificationsReceived() {
        std::lock_guard<std::mutex> lock(mutex);
        return notificationsReceived;
    }

    std::optional<JSONValue> LastParams(const std::string& method) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = lastParams.find(method);
        if (it == lastParams.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::string protocolVersion{PROTOCOL_VERSION};

    static std::unique_ptr<JSONRPCResponse> reply(const JSONRPCRequest& req, JSONValue result) {
        return std::make_unique<JSONRPCResponse>(req.id, std::move(result));
    }

private:
    std::unique_ptr<JSONRPCResponse> dispatch(const JSONRPCRequest& req) {
        MethodHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            received.push_back(req.method);
            lastParams[req.method] = req.params.value_or(JSONValue{});
            auto it = handlers.find(req.method);
            if (it != handlers.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        }
        return handler(req);
    }

    std::string name;
    std::mutex mutex;
    std::unordered_map<std::string, MethodHandler> handlers;
    std::vector<std::string> tools{"search", "translate"};
    std::vector<std::string> resources;
    std::vector<std::string> received;
    std::vector<std::string> notificationsReceived;
    std::unordered_map<std::string, JSONValue> lastParams;
    std::vector<std::unique_ptr<InMemoryTransport>> serverEnds;
};

// Polls pred every 5 ms until it holds or the timeout passes.
template <typename Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace mcpleague::fakes
