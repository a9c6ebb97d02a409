//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionManager.h
// Purpose: One per session. Owns the transport and applies priority dispatch, circuit breaking,
//          retry/backoff, deadlines and heartbeat monitoring to every call made to one server.
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "mcpleague/CircuitBreaker.h"
#include "mcpleague/Config.h"
#include "mcpleague/JSONRPCTypes.h"
#include "mcpleague/MessageQueue.h"
#include "mcpleague/Transport.h"

namespace mcpleague {

//==========================================================================================================
// CallOptions
// Fields:
//   priority: Dispatch tier (default NORMAL).
//   timeout: Relative deadline; defaults to ClientConfig::requestTimeoutSeconds.
//   stopToken: Cooperative cancellation. A stop request resolves the call with CancelledError; an attempt
//              already on the wire is not interrupted.
//   correlationId: Optional caller-chosen key for Cancel(); generated when empty. Must be unique among
//                  the session's pending calls.
//==========================================================================================================
struct CallOptions {
    Priority priority = Priority::Normal;
    std::optional<std::chrono::milliseconds> timeout;
    std::stop_token stopToken;
    std::string correlationId;
};

struct ConnectionStats {
    uint64_t totalRequests{0};
    uint64_t totalErrors{0};
    uint64_t totalRetries{0};
    uint64_t totalTimeouts{0};
    unsigned int consecutiveFailures{0};
    std::string lastErrorMessage;
    std::optional<std::chrono::system_clock::time_point> connectedAt;
    std::size_t pendingCount{0};
};

class ConnectionManager {
public:
    using Clock = CircuitBreaker::Clock;
    using NotificationSink = std::function<void(const JSONRPCNotification&)>;
    using GiveUpHandler = std::function<void(const std::string& serverName)>;
    using HeartbeatHandler = std::function<void(bool succeeded, bool degraded)>;

    //==========================================================================================================
    // Args:
    //   serverName: Remote agent name, used in logs and give-up reports.
    //   transport: Exclusively owned transport (not yet started).
    //   config: Retry, breaker, heartbeat and queue settings.
    //   clock: Optional clock for the circuit breaker.
    //==========================================================================================================
    ConnectionManager(std::string serverName, std::unique_ptr<ITransport> transport,
                      const ClientConfig& config, Clock clock = nullptr);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Installs transport handlers, starts the transport, then the dispatcher, maintenance,
    //          inbound router and heartbeat threads.
    // Returns:
    //   Future completing when the transport is running.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Call
    // Purpose: Submits a JSON-RPC request for dispatch.
    // Returns:
    //   Future resolved exactly once with the result member of the response, or with one of:
    //   TimeoutError, TransportError (after retries), ProtocolError, CircuitOpenError, QueueFullError,
    //   CancelledError, SessionClosedError. Rejections known at submit time are already ready.
    //==========================================================================================================
    std::future<JSONValue> Call(const std::string& method, std::optional<JSONValue> params,
                                CallOptions options = {});

    // Sends a notification directly (no queueing, no retry).
    std::future<void> Notify(const std::string& method, std::optional<JSONValue> params);

    //==========================================================================================================
    // Cancel
    // Purpose: Resolves the pending call with CancelledError.
    // Returns:
    //   true when this cancel settled the call; false when it had already resolved.
    //==========================================================================================================
    bool Cancel(const std::string& correlationId);

    //==========================================================================================================
    // Close
    // Purpose: Stops all threads, fails every pending call with SessionClosedError and closes the
    //          transport. Idempotent.
    //==========================================================================================================
    void Close();
    bool IsClosed() const;

    void SetNotificationSink(NotificationSink sink);
    void SetGiveUpHandler(GiveUpHandler handler);
    void SetHeartbeatHandler(HeartbeatHandler handler);

    const std::string& GetServerName() const;
    CircuitState GetCircuitState() const;
    std::optional<std::chrono::system_clock::time_point> GetLastHeartbeatAt() const;
    bool IsDegraded() const;
    ConnectionStats GetStats() const;
    MessageQueueStats GetQueueStats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpleague
