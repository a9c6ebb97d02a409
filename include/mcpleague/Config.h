//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Client core configuration: retry, circuit breaker, heartbeat and per-server endpoint settings
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "mcpleague/Transport.h"

namespace mcpleague {

//==========================================================================================================
// ParseKeyValueConfig
// Purpose: Splits a semicolon-delimited "key=value" string into trimmed pairs, in order. Segments
//          without '=' are skipped. Shared by the config parser and the transport factories.
//==========================================================================================================
std::vector<std::pair<std::string, std::string>> ParseKeyValueConfig(const std::string& text);

struct RetryConfig {
    unsigned int maxAttempts = 3;
    double baseDelaySeconds = 1.0;
    double maxDelaySeconds = 30.0;
    // Jitter upper bound as a fraction of the un-jittered delay.
    double jitterFactor = 0.1;
};

struct CircuitBreakerConfig {
    unsigned int failureThreshold = 5;
    double recoveryTimeoutSeconds = 30.0;
};

//==========================================================================================================
// HeartbeatConfig
// Fields:
//   method: JSON-RPC method checked each interval.
//   tool: When non-empty, the heartbeat is a tools/call of this tool instead of `method`.
//==========================================================================================================
struct HeartbeatConfig {
    bool enabled = true;
    double intervalSeconds = 10.0;
    double timeoutSeconds = 5.0;
    unsigned int failureThreshold = 3;
    std::string method = "ping";
    std::string tool;
};

//==========================================================================================================
// ClientConfig
// Purpose: Settings shared by every session a client owns.
//==========================================================================================================
struct ClientConfig {
    RetryConfig retry;
    CircuitBreakerConfig circuitBreaker;
    HeartbeatConfig heartbeat;
    double requestTimeoutSeconds = 30.0;
    std::size_t queueMaxSize = 1000;
    unsigned int dispatchConcurrency = 4;
    // Seconds without a CLOSED circuit before a session is torn down; 0 disables.
    double givingUpWindowSeconds = 300.0;
    // 0 keeps cached resource values until replaced.
    double resourceCacheTtlSeconds = 60.0;
    std::string clientName = "mcpleague-client";
    bool discoverOnConnect = true;

    //==========================================================================================================
    // FromEnvironment
    // Purpose: Overlays MCPLEAGUE_* environment variables on top of base, or on the defaults.
    //==========================================================================================================
    static ClientConfig FromEnvironment();
    static ClientConfig FromEnvironment(const ClientConfig& base);

    std::chrono::milliseconds RequestTimeout() const;
    std::chrono::milliseconds HeartbeatInterval() const;
    std::chrono::milliseconds HeartbeatTimeout() const;
};

//==========================================================================================================
// ParseClientConfig
// Purpose: Applies a "key=value;key=value" string on top of base.
// Args:
//   text: e.g. "retry.max_attempts=4;circuit_breaker.recovery_timeout=10".
//   base: Starting configuration.
// Returns:
//   The merged configuration. Unknown keys are logged and ignored; malformed numbers throw
//   std::invalid_argument.
//==========================================================================================================
ClientConfig ParseClientConfig(const std::string& text, const ClientConfig& base = ClientConfig{});

//==========================================================================================================
// ServerConfig
// Purpose: How to reach one remote agent.
// Fields:
//   transport: "http", "stream" or "memory".
//   transportConfig: Factory configuration string handed to the transport factory.
//   transportFactory: Optional injected factory; takes precedence over `transport`.
//==========================================================================================================
struct ServerConfig {
    std::string serverName;
    std::string transport = "http";
    std::string transportConfig;
    std::shared_ptr<ITransportFactory> transportFactory;
};

// Builds a ServerConfig from "name=...;transport=...;<transport keys>". Throws std::invalid_argument
// when the name is missing.
ServerConfig ParseServerConfig(const std::string& text);

} // namespace mcpleague
