//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: Client core facade - the only surface agents use to reach other agents
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpleague/Config.h"
#include "mcpleague/ConnectionManager.h"
#include "mcpleague/JSONRPCTypes.h"
#include "mcpleague/Protocol.h"
#include "mcpleague/ResourceManager.h"
#include "mcpleague/SessionManager.h"
#include "mcpleague/ToolRegistry.h"

namespace mcpleague {

//==========================================================================================================
// SessionHandle
// Purpose: Result of Connect. `created` is false when the server was already connected.
//==========================================================================================================
struct SessionHandle {
    std::string sessionId;
    std::string serverName;
    std::string protocolVersion;
    Implementation serverInfo;
    std::size_t toolCount{0};
    bool created{false};
};

struct SubscribeOptions {
    // Defaults to ClientConfig::clientName.
    std::optional<std::string> subscriberId;
    // Defaults to the owner found in the resources/list catalog.
    std::optional<std::string> serverName;
};

//==========================================================================================================
// IClient
// Purpose: Client core interface. Every asynchronous operation reports failure by storing a typed
//          errors::Error in its future; rejections known immediately produce an already-ready future.
//==========================================================================================================
class IClient {
public:
    virtual ~IClient() = default;

    using NotificationHandler = std::function<void(const std::string& serverName, const JSONRPCNotification&)>;

    ////////////////////////////////////////// Connection management ///////////////////////////////////////////
    //==========================================================================================================
    // Connect
    // Purpose: Creates (or returns) the session for config.serverName, runs the initialize handshake,
    //          sends notifications/initialized and discovers tools and resources. Any failure tears the
    //          session down.
    // Returns:
    //   Future resolving to the session handle.
    //==========================================================================================================
    virtual std::future<SessionHandle> Connect(const ServerConfig& config) = 0;

    // Fails the session's pending calls with SessionClosedError; false when not connected.
    virtual bool Disconnect(const std::string& serverName) = 0;
    virtual void DisconnectAll() = 0;

    ////////////////////////////////////////// Tools ///////////////////////////////////////////
    virtual std::vector<ToolDescriptor> ListTools(const std::optional<std::string>& serverName = std::nullopt) const = 0;

    // Re-runs tools/list for one server and swaps its catalog.
    virtual std::future<std::vector<ToolDescriptor>> RefreshTools(const std::string& serverName) = 0;

    //==========================================================================================================
    // CallTool
    // Purpose: Resolves name (qualified "server.tool" or an unambiguous raw name) and sends tools/call
    //          {name: rawName, arguments} through that server's connection manager.
    // Returns:
    //   Future resolving to the tools/call result unchanged.
    //==========================================================================================================
    virtual std::future<JSONValue> CallTool(const std::string& name, const JSONValue& arguments,
                                            CallOptions options = {}) = 0;

    ////////////////////////////////////////// Resources ///////////////////////////////////////////
    //==========================================================================================================
    // SubscribeResource
    // Purpose: Idempotent per (subscriberId, uri). Blocks until the upstream subscribe completes.
    // Returns:
    //   Subscription handle. Throws ResourceNotFoundError when no server owns the uri, or the upstream
    //   error when resources/subscribe fails.
    //==========================================================================================================
    virtual SubscriptionHandle SubscribeResource(const std::string& uri, ResourceCallback callback,
                                                 const SubscribeOptions& options = {}) = 0;

    virtual bool UnsubscribeResource(const std::string& uri,
                                     const std::optional<std::string>& subscriberId = std::nullopt) = 0;

    // Read-through cache over resources/read; yields `contents` when the result carries it.
    virtual std::future<JSONValue> ReadResource(const std::string& uri, bool useCache = true) = 0;

    ////////////////////////////////////////// Protocol messages ///////////////////////////////////////////
    // Sends the opaque league envelope as protocol/message {message: envelope}.
    virtual std::future<JSONValue> SendProtocolMessage(const std::string& serverName, const JSONValue& envelope,
                                                       CallOptions options = {}) = 0;

    ////////////////////////////////////////// Observability ///////////////////////////////////////////
    virtual std::optional<SessionStatus> GetSessionStatus(const std::string& serverName) const = 0;
    virtual std::vector<std::string> ListSessions() const = 0;
    virtual JSONValue GetHealthReport() const = 0;

    // Receives server notifications the core does not consume itself.
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;
};

// Standard client core implementation
class Client : public IClient {
public:
    //==========================================================================================================
    // Args:
    //   config: Settings applied to every session.
    //   clock: Optional circuit breaker clock (tests).
    //==========================================================================================================
    explicit Client(const ClientConfig& config = ClientConfig{}, ConnectionManager::Clock clock = nullptr);
    virtual ~Client();

    ////////////////////////////////////////// IClient implementation //////////////////////////////////////////
    std::future<SessionHandle> Connect(const ServerConfig& config) override;
    bool Disconnect(const std::string& serverName) override;
    void DisconnectAll() override;

    std::vector<ToolDescriptor> ListTools(const std::optional<std::string>& serverName = std::nullopt) const override;
    std::future<std::vector<ToolDescriptor>> RefreshTools(const std::string& serverName) override;
    std::future<JSONValue> CallTool(const std::string& name, const JSONValue& arguments,
                                    CallOptions options = {}) override;

    SubscriptionHandle SubscribeResource(const std::string& uri, ResourceCallback callback,
                                         const SubscribeOptions& options = {}) override;
    bool UnsubscribeResource(const std::string& uri,
                             const std::optional<std::string>& subscriberId = std::nullopt) override;
    std::future<JSONValue> ReadResource(const std::string& uri, bool useCache = true) override;

    std::future<JSONValue> SendProtocolMessage(const std::string& serverName, const JSONValue& envelope,
                                               CallOptions options = {}) override;

    std::optional<SessionStatus> GetSessionStatus(const std::string& serverName) const override;
    std::vector<std::string> ListSessions() const override;
    JSONValue GetHealthReport() const override;

    void SetNotificationHandler(NotificationHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Client factory interface
class IClientFactory {
public:
    virtual ~IClientFactory() = default;
    virtual std::unique_ptr<IClient> CreateClient(const ClientConfig& config) = 0;
};

// Standard client factory
class ClientFactory : public IClientFactory {
public:
    std::unique_ptr<IClient> CreateClient(const ClientConfig& config) override;
};

} // namespace mcpleague
