//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: Client core facade - handshake, tool routing, resource subscriptions and health reporting
//==========================================================================================================

#include <chrono>
#include <mutex>
#include <utility>

#include "logging/Logger.h"
#include "mcpleague/Client.h"
#include "mcpleague/async/Task.h"
#include "mcpleague/errors/Errors.h"
#include "mcpleague/version.h"

namespace mcpleague {

namespace {

std::shared_ptr<JSONValue> boxed(JSONValue v) {
    return std::make_shared<JSONValue>(std::move(v));
}

JSONValue toJsonCount(uint64_t n) {
    return JSONValue(static_cast<int64_t>(n));
}

JSONValue toJsonTime(const std::optional<std::chrono::system_clock::time_point>& t) {
    if (!t.has_value()) {
        return JSONValue(nullptr);
    }
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t->time_since_epoch()).count();
    return JSONValue(static_cast<int64_t>(ms));
}

JSONValue statusToJson(const SessionStatus& s) {
    return MakeObject({
        {"sessionId", JSONValue(s.sessionId)},
        {"state", JSONValue(SessionStateToString(s.state))},
        {"circuitState", JSONValue(CircuitStateToString(s.circuitState))},
        {"lastHeartbeatAt", toJsonTime(s.lastHeartbeatAt)},
        {"connectedAt", toJsonTime(s.stats.connectedAt)},
        {"totalRequests", toJsonCount(s.stats.totalRequests)},
        {"totalErrors", toJsonCount(s.stats.totalErrors)},
        {"totalRetries", toJsonCount(s.stats.totalRetries)},
        {"totalTimeouts", toJsonCount(s.stats.totalTimeouts)},
        {"consecutiveFailures", toJsonCount(s.stats.consecutiveFailures)},
        {"pendingCount", toJsonCount(s.stats.pendingCount)},
        {"lastError", JSONValue(s.stats.lastErrorMessage)},
        {"queue", MakeObject({
            {"size", toJsonCount(s.queue.size)},
            {"maxSize", toJsonCount(s.queue.maxSize)},
            {"totalEnqueued", toJsonCount(s.queue.totalEnqueued)},
            {"totalDropped", toJsonCount(s.queue.totalDropped)},
            {"totalExpired", toJsonCount(s.queue.totalExpired)},
        })},
    });
}

// resources/read and resources/updated both carry the value under `contents`.
JSONValue resourceValueOf(const JSONValue& result) {
    if (const JSONValue* contents = FindMember(result, "contents")) {
        return *contents;
    }
    return result;
}

} // namespace

////////////////////////////////////////// Client::Impl //////////////////////////////////////////

class Client::Impl {
public:
    Impl(const ClientConfig& cfg, ConnectionManager::Clock clock)
        : config(cfg),
          resources(
              [this](const std::string& server, const std::string& method, const JSONValue& params) {
                  return callUpstream(server, method, params);
              },
              std::chrono::milliseconds(static_cast<int64_t>(cfg.resourceCacheTtlSeconds * 1000.0))),
          sessions(cfg, std::move(clock)) {
        sessions.SetNotificationRouter([this](const std::string& server, const JSONRPCNotification& n) {
            onNotification(server, n);
        });
        sessions.AddClosedListener([this](const std::string& server) {
            const std::size_t removed = tools.UnregisterServerTools(server);
            resources.DropServer(server);
            LOG_INFO("Dropped {} tool(s) and resource state of '{}'", removed, server);
        });
    }

    ~Impl() {
        sessions.DisconnectAll();
        std::vector<std::future<std::vector<ToolDescriptor>>> pending;
        {
            std::lock_guard<std::mutex> lock(refreshMutex);
            pending.swap(backgroundRefreshes);
        }
        // Sessions are closed, so every outstanding refresh fails promptly.
        for (auto& f : pending) {
            f.wait();
        }
    }

    ClientConfig config;
    ToolRegistry tools;
    ResourceManager resources;

    std::mutex handlerMutex;
    NotificationHandler userHandler;

    std::mutex refreshMutex;
    std::vector<std::future<std::vector<ToolDescriptor>>> backgroundRefreshes;

    // Declared last: sessions are torn down before the registries their callbacks touch.
    SessionManager sessions;

    std::future<JSONValue> callUpstream(const std::string& server, const std::string& method, const JSONValue& params) {
        auto session = sessions.GetSession(server);
        if (!session) {
            return errors::MakeFailedFuture<JSONValue>(errors::SessionNotFoundError("No session for '" + server + "'"));
        }
        CallOptions options;
        options.priority = Priority::High;
        return session->GetConnection().Call(method, params, options);
    }

    JSONValue buildInitializeParams() const {
        return MakeObject({
            {"protocolVersion", JSONValue(PROTOCOL_VERSION)},
            {"capabilities", MakeObject({{"resources", MakeObject({{"subscribe", JSONValue(true)}})}})},
            {"clientInfo", MakeObject({
                {"name", JSONValue(config.clientName)},
                {"version", JSONValue(getVersionString())},
            })},
        });
    }

    SessionHandle makeHandle(Session& session, bool created) {
        SessionHandle h;
        h.sessionId = session.GetId();
        h.serverName = session.GetServerName();
        h.protocolVersion = session.GetProtocolVersion();
        h.serverInfo = session.GetServerInfo();
        h.toolCount = tools.ListTools(h.serverName).size();
        h.created = created;
        return h;
    }

    void applyInitializeResult(Session& session, const JSONValue& result) {
        std::string version = GetStringMember(result, "protocolVersion").value_or(std::string());
        if (version != PROTOCOL_VERSION) {
            LOG_WARN("Server '{}' negotiated protocol version '{}' (client speaks {})",
                     session.GetServerName(), version, PROTOCOL_VERSION);
        }
        JSONValue capabilities = MakeObject({});
        if (const JSONValue* caps = FindMember(result, "capabilities")) {
            capabilities = *caps;
        }
        Implementation info;
        if (const JSONValue* si = FindMember(result, "serverInfo")) {
            info.name = GetStringMember(*si, "name").value_or(std::string());
            info.version = GetStringMember(*si, "version").value_or(std::string());
        }
        session.SetServerInfo(std::move(version), std::move(capabilities), std::move(info));
    }

    ////////////////////////////////////////// Coroutines //////////////////////////////////////////

    async::Task<SessionHandle> coConnect(ServerConfig serverConfig) {
        FUNC_SCOPE();
        auto result = sessions.Connect(serverConfig);
        auto session = result.session;
        if (!result.created) {
            co_return makeHandle(*session, false);
        }
        const std::string name = session->GetServerName();
        try {
            auto& conn = session->GetConnection();
            CallOptions urgent;
            urgent.priority = Priority::High;

            auto initResult = co_await async::makeFutureAwaitable(
                conn.Call(Methods::Initialize, buildInitializeParams(), urgent));
            applyInitializeResult(*session, initResult);
            co_await async::makeFutureAwaitable(conn.Notify(Methods::Initialized, std::nullopt));

            if (config.discoverOnConnect) {
                auto toolsResult = co_await async::makeFutureAwaitable(
                    conn.Call(Methods::ListTools, std::nullopt, urgent));
                tools.RegisterServerTools(name, ToolRegistry::ParseToolsListResult(name, toolsResult));

                try {
                    auto resResult = co_await async::makeFutureAwaitable(
                        conn.Call(Methods::ListResources, std::nullopt, urgent));
                    resources.RegisterServerResources(name, ResourceManager::ParseResourcesListResult(resResult));
                } catch (const errors::ProtocolError& e) {
                    if (e.Category() != errors::ErrorCategory::JsonRpcMethodNotFound) {
                        throw;
                    }
                    LOG_INFO("Server '{}' does not list resources", name);
                }
            }
            session->MarkReady();
        } catch (const std::exception& e) {
            LOG_ERROR("Connect to '{}' failed: {}", name, e.what());
            sessions.Disconnect(name);
            throw;
        }
        LOG_INFO("Connected to '{}' (session {}, {} tools)", name, session->GetId(), tools.ListTools(name).size());
        co_return makeHandle(*session, true);
    }

    async::Task<std::vector<ToolDescriptor>> coRefreshTools(std::string serverName) {
        FUNC_SCOPE();
        auto session = sessions.GetSession(serverName);
        if (!session) {
            throw errors::SessionNotFoundError("No session for '" + serverName + "'");
        }
        auto result = co_await async::makeFutureAwaitable(
            session->GetConnection().Call(Methods::ListTools, std::nullopt));
        // The session may have gone away while the call was in flight.
        if (sessions.GetSession(serverName) != session) {
            throw errors::SessionClosedError("Session to '" + serverName + "' closed during tool refresh");
        }
        tools.RegisterServerTools(serverName, ToolRegistry::ParseToolsListResult(serverName, result));
        co_return tools.ListTools(serverName);
    }

    async::Task<JSONValue> coReadResource(std::string uri, bool useCache) {
        FUNC_SCOPE();
        if (useCache) {
            if (auto cached = resources.GetCached(uri)) {
                co_return cached->value;
            }
        }
        auto owner = resources.FindOwner(uri);
        if (!owner) {
            throw errors::ResourceNotFoundError("No connected server lists resource '" + uri + "'");
        }
        auto result = co_await async::makeFutureAwaitable(
            callUpstream(*owner, Methods::ReadResource, MakeObject({{"uri", JSONValue(uri)}})));
        JSONValue value = resourceValueOf(result);
        resources.PutCached(uri, value);
        co_return value;
    }

    ////////////////////////////////////////// Notifications //////////////////////////////////////////

    void onNotification(const std::string& server, const JSONRPCNotification& n) {
        if (n.method == Methods::ToolListChanged) {
            LOG_INFO("Tool list of '{}' changed; refreshing", server);
            auto f = coRefreshTools(server).toFuture();
            std::lock_guard<std::mutex> lock(refreshMutex);
            pruneRefreshes();
            backgroundRefreshes.push_back(std::move(f));
            return;
        }
        if (n.method == Methods::ResourceUpdated) {
            resources.OnResourceUpdated(server, n.params.value_or(MakeObject({})));
            return;
        }
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = userHandler;
        }
        if (!handler) {
            LOG_DEBUG("Unhandled notification '{}' from '{}'", n.method, server);
            return;
        }
        try {
            handler(server, n);
        } catch (const std::exception& e) {
            LOG_ERROR("Notification handler threw for '{}' from '{}': {}", n.method, server, e.what());
        }
    }

    // Caller holds refreshMutex.
    void pruneRefreshes() {
        using namespace std::chrono_literals;
        auto it = backgroundRefreshes.begin();
        while (it != backgroundRefreshes.end()) {
            if (it->wait_for(0s) != std::future_status::ready) {
                ++it;
                continue;
            }
            try {
                it->get();
            } catch (const std::exception& e) {
                LOG_WARN("Background tool refresh failed: {}", e.what());
            }
            it = backgroundRefreshes.erase(it);
        }
    }
};

////////////////////////////////////////// Client //////////////////////////////////////////

Client::Client(const ClientConfig& config, ConnectionManager::Clock clock)
    : pImpl(std::make_unique<Impl>(config, std::move(clock))) {
    FUNC_SCOPE();
    LOG_INFO("mcpleague client '{}' v{} created", config.clientName, getVersionString());
}

Client::~Client() {
    FUNC_SCOPE();
}

std::future<SessionHandle> Client::Connect(const ServerConfig& config) {
    FUNC_SCOPE();
    return pImpl->coConnect(config).toFuture();
}

bool Client::Disconnect(const std::string& serverName) {
    FUNC_SCOPE();
    return pImpl->sessions.Disconnect(serverName);
}

void Client::DisconnectAll() {
    FUNC_SCOPE();
    pImpl->sessions.DisconnectAll();
}

std::vector<ToolDescriptor> Client::ListTools(const std::optional<std::string>& serverName) const {
    return pImpl->tools.ListTools(serverName);
}

std::future<std::vector<ToolDescriptor>> Client::RefreshTools(const std::string& serverName) {
    FUNC_SCOPE();
    return pImpl->coRefreshTools(serverName).toFuture();
}

std::future<JSONValue> Client::CallTool(const std::string& name, const JSONValue& arguments, CallOptions options) {
    FUNC_SCOPE();
    ToolDescriptor descriptor;
    try {
        descriptor = pImpl->tools.Resolve(name);
    } catch (const errors::Error&) {
        return errors::MakeFailedFutureFromPtr<JSONValue>(std::current_exception());
    }
    auto session = pImpl->sessions.GetSession(descriptor.serverName);
    if (!session) {
        return errors::MakeFailedFuture<JSONValue>(
            errors::SessionNotFoundError("No session for '" + descriptor.serverName + "'"));
    }
    pImpl->tools.RecordCall(descriptor.namespacedName);
    JSONValue params = MakeObject({
        {"name", JSONValue(descriptor.rawName)},
        {"arguments", arguments.IsNull() ? MakeObject({}) : arguments},
    });
    return session->GetConnection().Call(Methods::CallTool, std::move(params), std::move(options));
}

SubscriptionHandle Client::SubscribeResource(const std::string& uri, ResourceCallback callback,
                                             const SubscribeOptions& options) {
    FUNC_SCOPE();
    std::optional<std::string> server = options.serverName;
    if (!server) {
        server = pImpl->resources.FindOwner(uri);
    }
    if (!server) {
        throw errors::ResourceNotFoundError("No connected server lists resource '" + uri + "'");
    }
    if (!pImpl->sessions.GetSession(*server)) {
        throw errors::SessionNotFoundError("No session for '" + *server + "'");
    }
    const std::string subscriber = options.subscriberId.value_or(pImpl->config.clientName);
    return pImpl->resources.Subscribe(*server, uri, subscriber, std::move(callback));
}

bool Client::UnsubscribeResource(const std::string& uri, const std::optional<std::string>& subscriberId) {
    FUNC_SCOPE();
    return pImpl->resources.Unsubscribe(uri, subscriberId.value_or(pImpl->config.clientName));
}

std::future<JSONValue> Client::ReadResource(const std::string& uri, bool useCache) {
    FUNC_SCOPE();
    return pImpl->coReadResource(uri, useCache).toFuture();
}

std::future<JSONValue> Client::SendProtocolMessage(const std::string& serverName, const JSONValue& envelope,
                                                   CallOptions options) {
    FUNC_SCOPE();
    auto session = pImpl->sessions.GetSession(serverName);
    if (!session) {
        return errors::MakeFailedFuture<JSONValue>(errors::SessionNotFoundError("No session for '" + serverName + "'"));
    }
    return session->GetConnection().Call(Methods::ProtocolMessage, MakeObject({{"message", envelope}}),
                                         std::move(options));
}

std::optional<SessionStatus> Client::GetSessionStatus(const std::string& serverName) const {
    return pImpl->sessions.GetSessionStatus(serverName);
}

std::vector<std::string> Client::ListSessions() const {
    return pImpl->sessions.ListSessions();
}

JSONValue Client::GetHealthReport() const {
    FUNC_SCOPE();
    JSONValue::Object sessionsObj;
    for (const auto& name : pImpl->sessions.ListSessions()) {
        if (auto status = pImpl->sessions.GetSessionStatus(name)) {
            sessionsObj[name] = boxed(statusToJson(*status));
        }
    }

    JSONValue::Object collisionsObj;
    for (const auto& [raw, owners] : pImpl->tools.GetCollisions()) {
        JSONValue::Array arr;
        for (const auto& o : owners) {
            arr.push_back(boxed(JSONValue(o)));
        }
        collisionsObj[raw] = boxed(JSONValue(std::move(arr)));
    }

    const ResourceStats rs = pImpl->resources.GetStats();
    return MakeObject({
        {"client", JSONValue(pImpl->config.clientName)},
        {"version", JSONValue(getVersionString())},
        {"sessions", JSONValue(std::move(sessionsObj))},
        {"tools", MakeObject({
            {"count", toJsonCount(pImpl->tools.Size())},
            {"collisions", JSONValue(std::move(collisionsObj))},
        })},
        {"resources", MakeObject({
            {"subscriptions", toJsonCount(rs.subscriptionCount)},
            {"uris", toJsonCount(rs.uriCount)},
            {"cached", toJsonCount(rs.cachedCount)},
            {"notificationsDelivered", toJsonCount(rs.notificationsDelivered)},
            {"callbackErrors", toJsonCount(rs.callbackErrors)},
        })},
    });
}

void Client::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->userHandler = std::move(handler);
}

////////////////////////////////////////// ClientFactory //////////////////////////////////////////

std::unique_ptr<IClient> ClientFactory::CreateClient(const ClientConfig& config) {
    FUNC_SCOPE();
    return std::make_unique<Client>(config);
}

} // namespace mcpleague
