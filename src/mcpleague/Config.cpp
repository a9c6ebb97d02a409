//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Configuration parsing from key=value strings and MCPLEAGUE_* environment variables
//==========================================================================================================

#include <cmath>
#include <stdexcept>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpleague/Config.h"

namespace mcpleague {

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}

double parseDouble(const std::string& key, const std::string& val) {
    std::size_t used = 0;
    double d = 0.0;
    try {
        d = std::stod(val, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid number for " + key + ": '" + val + "'");
    }
    if (used != val.size() || !std::isfinite(d) || d < 0.0) {
        throw std::invalid_argument("Invalid number for " + key + ": '" + val + "'");
    }
    return d;
}

unsigned long long parseUnsigned(const std::string& key, const std::string& val) {
    std::size_t used = 0;
    unsigned long long v = 0;
    if (val.empty() || val[0] == '-') {
        throw std::invalid_argument("Invalid integer for " + key + ": '" + val + "'");
    }
    try {
        v = std::stoull(val, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid integer for " + key + ": '" + val + "'");
    }
    if (used != val.size()) {
        throw std::invalid_argument("Invalid integer for " + key + ": '" + val + "'");
    }
    return v;
}

bool parseBool(const std::string& key, const std::string& val) {
    if (val == "1" || val == "true" || val == "yes" || val == "on") {
        return true;
    }
    if (val == "0" || val == "false" || val == "no" || val == "off") {
        return false;
    }
    throw std::invalid_argument("Invalid boolean for " + key + ": '" + val + "'");
}

std::chrono::milliseconds toMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

} // namespace

std::vector<std::pair<std::string, std::string>> ParseKeyValueConfig(const std::string& text) {
    std::vector<std::pair<std::string, std::string>> out;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t sep = text.find(';', start);
        if (sep == std::string::npos) { sep = text.size(); }
        std::string kv = trim(text.substr(start, sep - start));
        if (!kv.empty()) {
            std::size_t eq = kv.find('=');
            if (eq != std::string::npos) {
                out.emplace_back(trim(kv.substr(0, eq)), trim(kv.substr(eq + 1)));
            }
        }
        start = sep + 1;
    }
    return out;
}

ClientConfig ParseClientConfig(const std::string& text, const ClientConfig& base) {
    FUNC_SCOPE();
    ClientConfig cfg = base;
    for (const auto& [key, val] : ParseKeyValueConfig(text)) {
        if (key == "retry.max_attempts") {
            cfg.retry.maxAttempts = static_cast<unsigned int>(parseUnsigned(key, val));
        }
        else if (key == "retry.base_delay") {
            cfg.retry.baseDelaySeconds = parseDouble(key, val);
        }
        else if (key == "retry.max_delay") {
            cfg.retry.maxDelaySeconds = parseDouble(key, val);
        }
        else if (key == "retry.jitter_factor") {
            cfg.retry.jitterFactor = parseDouble(key, val);
        }
        else if (key == "circuit_breaker.failure_threshold") {
            cfg.circuitBreaker.failureThreshold = static_cast<unsigned int>(parseUnsigned(key, val));
        }
        else if (key == "circuit_breaker.recovery_timeout") {
            cfg.circuitBreaker.recoveryTimeoutSeconds = parseDouble(key, val);
        }
        else if (key == "heartbeat.enabled") {
            cfg.heartbeat.enabled = parseBool(key, val);
        }
        else if (key == "heartbeat.interval_seconds") {
            cfg.heartbeat.intervalSeconds = parseDouble(key, val);
        }
        else if (key == "heartbeat.timeout_seconds") {
            cfg.heartbeat.timeoutSeconds = parseDouble(key, val);
        }
        else if (key == "heartbeat.failure_threshold") {
            cfg.heartbeat.failureThreshold = static_cast<unsigned int>(parseUnsigned(key, val));
        }
        else if (key == "heartbeat.method") {
            cfg.heartbeat.method = val;
        }
        else if (key == "heartbeat.tool") {
            cfg.heartbeat.tool = val;
        }
        else if (key == "request_timeout") {
            cfg.requestTimeoutSeconds = parseDouble(key, val);
        }
        else if (key == "queue_max_size") {
            cfg.queueMaxSize = static_cast<std::size_t>(parseUnsigned(key, val));
        }
        else if (key == "dispatch_concurrency") {
            cfg.dispatchConcurrency = static_cast<unsigned int>(parseUnsigned(key, val));
        }
        else if (key == "giving_up_window") {
            cfg.givingUpWindowSeconds = parseDouble(key, val);
        }
        else if (key == "resource_cache_ttl") {
            cfg.resourceCacheTtlSeconds = parseDouble(key, val);
        }
        else if (key == "client_name") {
            cfg.clientName = val;
        }
        else if (key == "discover_on_connect") {
            cfg.discoverOnConnect = parseBool(key, val);
        }
        else {
            LOG_WARN("Ignoring unknown config key: {}", key);
        }
    }
    if (cfg.dispatchConcurrency == 0) {
        cfg.dispatchConcurrency = 1;
    }
    if (cfg.retry.maxAttempts == 0) {
        cfg.retry.maxAttempts = 1;
    }
    return cfg;
}

ClientConfig ClientConfig::FromEnvironment() {
    return FromEnvironment(ClientConfig{});
}

ClientConfig ClientConfig::FromEnvironment(const ClientConfig& base) {
    FUNC_SCOPE();
    ClientConfig cfg = base;
    cfg.retry.maxAttempts = static_cast<unsigned int>(GetEnvUnsigned("MCPLEAGUE_RETRY_MAX_ATTEMPTS", cfg.retry.maxAttempts));
    cfg.retry.baseDelaySeconds = GetEnvDouble("MCPLEAGUE_RETRY_BASE_DELAY", cfg.retry.baseDelaySeconds);
    cfg.retry.maxDelaySeconds = GetEnvDouble("MCPLEAGUE_RETRY_MAX_DELAY", cfg.retry.maxDelaySeconds);
    cfg.circuitBreaker.failureThreshold = static_cast<unsigned int>(
        GetEnvUnsigned("MCPLEAGUE_CB_FAILURE_THRESHOLD", cfg.circuitBreaker.failureThreshold));
    cfg.circuitBreaker.recoveryTimeoutSeconds = GetEnvDouble("MCPLEAGUE_CB_RECOVERY_TIMEOUT", cfg.circuitBreaker.recoveryTimeoutSeconds);
    cfg.heartbeat.intervalSeconds = GetEnvDouble("MCPLEAGUE_HEARTBEAT_INTERVAL", cfg.heartbeat.intervalSeconds);
    cfg.heartbeat.timeoutSeconds = GetEnvDouble("MCPLEAGUE_HEARTBEAT_TIMEOUT", cfg.heartbeat.timeoutSeconds);
    cfg.heartbeat.failureThreshold = static_cast<unsigned int>(
        GetEnvUnsigned("MCPLEAGUE_HEARTBEAT_FAILURE_THRESHOLD", cfg.heartbeat.failureThreshold));
    cfg.requestTimeoutSeconds = GetEnvDouble("MCPLEAGUE_REQUEST_TIMEOUT", cfg.requestTimeoutSeconds);
    cfg.queueMaxSize = static_cast<std::size_t>(GetEnvUnsigned("MCPLEAGUE_QUEUE_MAX_SIZE", cfg.queueMaxSize));
    if (cfg.retry.maxAttempts == 0) {
        cfg.retry.maxAttempts = 1;
    }
    return cfg;
}

std::chrono::milliseconds ClientConfig::RequestTimeout() const { return toMillis(requestTimeoutSeconds); }
std::chrono::milliseconds ClientConfig::HeartbeatInterval() const { return toMillis(heartbeat.intervalSeconds); }
std::chrono::milliseconds ClientConfig::HeartbeatTimeout() const { return toMillis(heartbeat.timeoutSeconds); }

ServerConfig ParseServerConfig(const std::string& text) {
    FUNC_SCOPE();
    ServerConfig sc;
    std::string transportKeys;
    for (const auto& [key, val] : ParseKeyValueConfig(text)) {
        if (key == "name") {
            sc.serverName = val;
        } else if (key == "transport") {
            sc.transport = val;
        } else {
            transportKeys += key + "=" + val + ";";
        }
    }
    if (sc.serverName.empty()) {
        throw std::invalid_argument("Server config is missing name=");
    }
    sc.transportConfig = transportKeys;
    return sc;
}

} // namespace mcpleague
