//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.cpp
// Purpose: Session lifecycle, transport construction and give-up reaping
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcpleague/HTTPTransport.hpp"
#include "mcpleague/InMemoryTransport.hpp"
#include "mcpleague/SessionManager.h"
#include "mcpleague/StreamTransport.hpp"
#include "mcpleague/ToolRegistry.h"

namespace mcpleague {

const char* SessionStateToString(SessionState s) {
    switch (s) {
        case SessionState::Connecting: return "CONNECTING";
        case SessionState::Active: return "ACTIVE";
        case SessionState::Degraded: return "DEGRADED";
        case SessionState::Closed: return "CLOSED";
    }
    return "CLOSED";
}

////////////////////////////////////////// Session //////////////////////////////////////////

class Session::Impl {
public:
    std::string id;
    ServerConfig config;
    std::unique_ptr<ConnectionManager> connection;
    std::atomic<bool> ready{false};
    std::atomic<bool> closed{false};
    mutable std::mutex infoMutex;
    std::string protocolVersion;
    JSONValue capabilities;
    Implementation serverInfo;
};

Session::Session(std::string sessionId, ServerConfig config, std::unique_ptr<ConnectionManager> connection)
    : pImpl(std::make_unique<Impl>()) {
    FUNC_SCOPE();
    pImpl->id = std::move(sessionId);
    pImpl->config = std::move(config);
    pImpl->connection = std::move(connection);
}

Session::~Session() {
    FUNC_SCOPE();
    Close();
}

const std::string& Session::GetId() const { return pImpl->id; }
const std::string& Session::GetServerName() const { return pImpl->config.serverName; }
const ServerConfig& Session::GetConfig() const { return pImpl->config; }
ConnectionManager& Session::GetConnection() { return *pImpl->connection; }

SessionState Session::GetState() const {
    if (pImpl->closed.load() || pImpl->connection->IsClosed()) {
        return SessionState::Closed;
    }
    if (!pImpl->ready.load()) {
        return SessionState::Connecting;
    }
    return pImpl->connection->IsDegraded() ? SessionState::Degraded : SessionState::Active;
}

SessionStatus Session::GetStatus() const {
    SessionStatus status;
    status.sessionId = pImpl->id;
    status.serverName = pImpl->config.serverName;
    status.state = GetState();
    status.circuitState = pImpl->connection->GetCircuitState();
    status.lastHeartbeatAt = pImpl->connection->GetLastHeartbeatAt();
    status.stats = pImpl->connection->GetStats();
    status.queue = pImpl->connection->GetQueueStats();
    return status;
}

bool Session::IsReady() const { return pImpl->ready.load(); }

void Session::MarkReady() {
    if (!pImpl->closed.load() && !pImpl->ready.exchange(true)) {
        LOG_INFO("Session {} to '{}' is ACTIVE", pImpl->id, pImpl->config.serverName);
    }
}

void Session::SetServerInfo(std::string protocolVersion, JSONValue capabilities, Implementation serverInfo) {
    std::lock_guard<std::mutex> lock(pImpl->infoMutex);
    pImpl->protocolVersion = std::move(protocolVersion);
    pImpl->capabilities = std::move(capabilities);
    pImpl->serverInfo = std::move(serverInfo);
}

std::string Session::GetProtocolVersion() const {
    std::lock_guard<std::mutex> lock(pImpl->infoMutex);
    return pImpl->protocolVersion;
}

JSONValue Session::GetCapabilities() const {
    std::lock_guard<std::mutex> lock(pImpl->infoMutex);
    return pImpl->capabilities;
}

Implementation Session::GetServerInfo() const {
    std::lock_guard<std::mutex> lock(pImpl->infoMutex);
    return pImpl->serverInfo;
}

void Session::Close() {
    if (pImpl->closed.exchange(true)) {
        return;
    }
    pImpl->connection->Close();
    LOG_INFO("Session {} to '{}' is CLOSED", pImpl->id, pImpl->config.serverName);
}

////////////////////////////////////////// SessionManager //////////////////////////////////////////

class SessionManager::Impl {
public:
    Impl(const ClientConfig& cfg, ConnectionManager::Clock clk) : config(cfg), clock(std::move(clk)) {}

    ClientConfig config;
    ConnectionManager::Clock clock;
    std::atomic<uint64_t> sessionCounter{0};

    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions;
    // Servers whose transport is starting outside the lock.
    std::unordered_map<std::string, std::shared_future<std::shared_ptr<Session>>> connecting;

    std::mutex listenerMutex;
    std::vector<ClosedListener> closedListeners;
    NotificationRouter notificationRouter;

    // Give-up reports are handled on the reaper thread; a connection manager cannot close itself.
    std::mutex reapMutex;
    std::condition_variable_any reapCv;
    std::deque<std::pair<std::string, std::string>> reapQueue; // (serverName, sessionId)
    std::jthread reaper;

    std::unique_ptr<ITransport> makeTransport(const ServerConfig& sc) {
        if (sc.transportFactory) {
            return sc.transportFactory->CreateTransport(sc.transportConfig);
        }
        if (sc.transport == "http" || sc.transport == "https") {
            HTTPTransportFactory f;
            return f.CreateTransport(sc.transportConfig);
        }
        if (sc.transport == "stream" || sc.transport == "stdio") {
            StreamTransportFactory f;
            return f.CreateTransport(sc.transportConfig);
        }
        if (sc.transport == "memory") {
            InMemoryTransportFactory f;
            return f.CreateTransport(sc.transportConfig);
        }
        throw std::invalid_argument("Unknown transport kind '" + sc.transport + "' for server '" + sc.serverName + "'");
    }

    // Builds the connection and starts its transport. Runs without the session lock held.
    std::shared_ptr<Session> startSession(const ServerConfig& config, const std::string& sessionId) {
        auto transport = makeTransport(config);
        if (!transport) {
            throw std::invalid_argument("Transport factory returned no transport for '" + config.serverName + "'");
        }
        auto connection = std::make_unique<ConnectionManager>(config.serverName, std::move(transport), this->config,
                                                              clock);
        {
            std::lock_guard<std::mutex> lk(listenerMutex);
            if (notificationRouter) {
                auto router = notificationRouter;
                const std::string name = config.serverName;
                connection->SetNotificationSink([router, name](const JSONRPCNotification& n) { router(name, n); });
            }
        }
        connection->SetGiveUpHandler([this, sessionId](const std::string& serverName) {
            {
                std::lock_guard<std::mutex> lk(reapMutex);
                reapQueue.emplace_back(serverName, sessionId);
            }
            reapCv.notify_one();
        });

        auto session = std::make_shared<Session>(sessionId, config, std::move(connection));
        // Transport start failures propagate; the half-built session is simply dropped.
        session->GetConnection().Start().get();
        return session;
    }

    void reaperLoop(std::stop_token st) {
        while (!st.stop_requested()) {
            std::pair<std::string, std::string> item;
            {
                std::unique_lock<std::mutex> lock(reapMutex);
                if (!reapCv.wait(lock, st, [this] { return !reapQueue.empty(); })) {
                    return;
                }
                item = std::move(reapQueue.front());
                reapQueue.pop_front();
            }
            LOG_WARN("Reaping session {} to '{}' after giving-up window", item.second, item.first);
            disconnect(item.first, item.second);
        }
    }

    // Removes the session; when expectedId is non-empty only that exact session is removed.
    bool disconnect(const std::string& serverName, const std::string& expectedId) {
        std::shared_ptr<Session> session;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = sessions.find(serverName);
            if (it == sessions.end()) {
                return false;
            }
            if (!expectedId.empty() && it->second->GetId() != expectedId) {
                return false;
            }
            session = it->second;
            sessions.erase(it);
        }
        session->Close();
        notifyClosed(serverName);
        return true;
    }

    void notifyClosed(const std::string& serverName) {
        std::vector<ClosedListener> listeners;
        {
            std::lock_guard<std::mutex> lock(listenerMutex);
            listeners = closedListeners;
        }
        for (auto& l : listeners) {
            try {
                l(serverName);
            } catch (const std::exception& e) {
                LOG_ERROR("Closed-session listener for '{}' threw: {}", serverName, e.what());
            }
        }
    }
};

SessionManager::SessionManager(const ClientConfig& config, ConnectionManager::Clock clock)
    : pImpl(std::make_unique<Impl>(config, std::move(clock))) {
    FUNC_SCOPE();
    Impl* impl = pImpl.get();
    pImpl->reaper = std::jthread([impl](std::stop_token st) { impl->reaperLoop(st); });
}

SessionManager::~SessionManager() {
    FUNC_SCOPE();
    pImpl->reaper.request_stop();
    if (pImpl->reaper.joinable()) {
        pImpl->reaper.join();
    }
    DisconnectAll();
}

SessionManager::ConnectResult SessionManager::Connect(const ServerConfig& config) {
    FUNC_SCOPE();
    ValidateServerName(config.serverName);

    std::promise<std::shared_ptr<Session>> started;
    std::string sessionId;
    {
        std::unique_lock<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->sessions.find(config.serverName);
        if (it != pImpl->sessions.end()) {
            if (it->second->GetState() != SessionState::Closed) {
                return ConnectResult{it->second, false};
            }
            pImpl->sessions.erase(it);
        }
        auto pending = pImpl->connecting.find(config.serverName);
        if (pending != pImpl->connecting.end()) {
            // Another caller is already starting this server; share its outcome.
            auto shared = pending->second;
            lock.unlock();
            return ConnectResult{shared.get(), false};
        }
        pImpl->connecting.emplace(config.serverName, started.get_future().share());
        sessionId = config.serverName + "_" + std::to_string(++pImpl->sessionCounter);
    }

    std::shared_ptr<Session> session;
    try {
        session = pImpl->startSession(config, sessionId);
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(pImpl->mutex);
            pImpl->connecting.erase(config.serverName);
        }
        started.set_exception(std::current_exception());
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->connecting.erase(config.serverName);
        pImpl->sessions[config.serverName] = session;
    }
    started.set_value(session);
    LOG_INFO("Session {} to '{}' created ({} transport)", sessionId, config.serverName,
             config.transportFactory ? "injected" : config.transport);
    return ConnectResult{session, true};
}

bool SessionManager::Disconnect(const std::string& serverName) {
    FUNC_SCOPE();
    return pImpl->disconnect(serverName, std::string());
}

void SessionManager::DisconnectAll() {
    FUNC_SCOPE();
    for (const auto& name : ListSessions()) {
        Disconnect(name);
    }
}

std::shared_ptr<Session> SessionManager::GetSession(const std::string& serverName) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->sessions.find(serverName);
    return it == pImpl->sessions.end() ? nullptr : it->second;
}

std::optional<SessionStatus> SessionManager::GetSessionStatus(const std::string& serverName) const {
    auto session = GetSession(serverName);
    if (!session) {
        return std::nullopt;
    }
    return session->GetStatus();
}

std::vector<std::string> SessionManager::ListSessions() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<std::string> names;
    names.reserve(pImpl->sessions.size());
    for (const auto& [name, session] : pImpl->sessions) {
        names.push_back(name);
    }
    return names;
}

void SessionManager::AddClosedListener(ClosedListener listener) {
    std::lock_guard<std::mutex> lock(pImpl->listenerMutex);
    pImpl->closedListeners.push_back(std::move(listener));
}

void SessionManager::SetNotificationRouter(NotificationRouter router) {
    std::lock_guard<std::mutex> lock(pImpl->listenerMutex);
    pImpl->notificationRouter = std::move(router);
}

} // namespace mcpleague
