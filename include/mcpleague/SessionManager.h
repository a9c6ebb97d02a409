//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.h
// Purpose: Owns one session (and its connection manager) per remote server name
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpleague/Config.h"
#include "mcpleague/ConnectionManager.h"
#include "mcpleague/Protocol.h"

namespace mcpleague {

enum class SessionState {
    Connecting,
    Active,
    Degraded,
    Closed
};

const char* SessionStateToString(SessionState s);

//==========================================================================================================
// SessionStatus
// Purpose: Observability snapshot of one session.
//==========================================================================================================
struct SessionStatus {
    std::string sessionId;
    std::string serverName;
    SessionState state{SessionState::Connecting};
    CircuitState circuitState{CircuitState::Closed};
    std::optional<std::chrono::system_clock::time_point> lastHeartbeatAt;
    ConnectionStats stats;
    MessageQueueStats queue;
};

//==========================================================================================================
// Session
// Purpose: Logical connection to one server. State is derived: CLOSED once closed, CONNECTING until the
//          initialize handshake marks it ready, then DEGRADED while heartbeats are failing, else ACTIVE.
//==========================================================================================================
class Session {
public:
    Session(std::string sessionId, ServerConfig config, std::unique_ptr<ConnectionManager> connection);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& GetId() const;
    const std::string& GetServerName() const;
    const ServerConfig& GetConfig() const;
    ConnectionManager& GetConnection();

    SessionState GetState() const;
    SessionStatus GetStatus() const;
    bool IsReady() const;

    // CONNECTING -> ACTIVE once the handshake has completed.
    void MarkReady();

    // Records what the server reported in its initialize result.
    void SetServerInfo(std::string protocolVersion, JSONValue capabilities, Implementation serverInfo);
    std::string GetProtocolVersion() const;
    JSONValue GetCapabilities() const;
    Implementation GetServerInfo() const;

    void Close();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

class SessionManager {
public:
    using ClosedListener = std::function<void(const std::string& serverName)>;
    using NotificationRouter = std::function<void(const std::string& serverName, const JSONRPCNotification&)>;

    struct ConnectResult {
        std::shared_ptr<Session> session;
        bool created{false};
    };

    explicit SessionManager(const ClientConfig& config, ConnectionManager::Clock clock = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    //==========================================================================================================
    // Connect
    // Purpose: Returns the live session for config.serverName, or creates one: builds the transport (the
    //          injected factory first, else by transport kind), wires the connection manager and starts it.
    //          The transport starts without the session lock held; concurrent callers for the same server
    //          share the one start.
    // Returns:
    //   {session, created}. Throws std::invalid_argument for an empty or dotted server name or an unknown
    //   transport kind, or whatever the transport raises while starting.
    //==========================================================================================================
    ConnectResult Connect(const ServerConfig& config);

    //==========================================================================================================
    // Disconnect
    // Purpose: Stops the session's heartbeat and dispatchers, fails its pending calls with
    //          SessionClosedError, closes the transport and notifies closed-session listeners.
    // Returns:
    //   false when no session exists for serverName.
    //==========================================================================================================
    bool Disconnect(const std::string& serverName);
    void DisconnectAll();

    std::shared_ptr<Session> GetSession(const std::string& serverName) const;
    std::optional<SessionStatus> GetSessionStatus(const std::string& serverName) const;
    std::vector<std::string> ListSessions() const;

    void AddClosedListener(ClosedListener listener);

    // Receives every server notification; installed on each connection before it starts.
    void SetNotificationRouter(NotificationRouter router);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpleague
