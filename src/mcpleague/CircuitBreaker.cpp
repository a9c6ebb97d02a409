//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CircuitBreaker.cpp
// Purpose: Circuit breaker state machine
//==========================================================================================================

#include <mutex>

#include "logging/Logger.h"
#include "mcpleague/CircuitBreaker.h"

namespace mcpleague {

const char* CircuitStateToString(CircuitState s) {
    switch (s) {
        case CircuitState::Closed: return "CLOSED";
        case CircuitState::Open: return "OPEN";
        case CircuitState::HalfOpen: return "HALF_OPEN";
    }
    return "CLOSED";
}

class CircuitBreaker::Impl {
public:
    Impl(const CircuitBreakerConfig& cfg, Clock clk)
        : config(cfg), clock(clk ? std::move(clk) : Clock([]() { return std::chrono::steady_clock::now(); })) {
        if (config.failureThreshold == 0) {
            config.failureThreshold = 1;
        }
    }

    CircuitBreakerConfig config;
    Clock clock;
    mutable std::mutex mutex;
    CircuitState state{CircuitState::Closed};
    unsigned int consecutiveFailures{0};
    std::optional<std::chrono::steady_clock::time_point> openedAt;
    std::optional<std::chrono::steady_clock::time_point> unhealthySince;
    bool trialInFlight{false};

    std::chrono::steady_clock::duration recoveryTimeout() const {
        return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(config.recoveryTimeoutSeconds));
    }

    bool cooledDownLocked(std::chrono::steady_clock::time_point now) const {
        return openedAt.has_value() && now - *openedAt >= recoveryTimeout();
    }

    void transitionLocked(CircuitState next) {
        if (state == next) {
            return;
        }
        LOG_INFO("Circuit breaker: {} -> {}", CircuitStateToString(state), CircuitStateToString(next));
        state = next;
    }

    void openLocked(std::chrono::steady_clock::time_point now) {
        transitionLocked(CircuitState::Open);
        openedAt = now;
        consecutiveFailures = 0;
        trialInFlight = false;
        if (!unhealthySince.has_value()) {
            unhealthySince = now;
        }
    }
};

CircuitBreaker::CircuitBreaker(const CircuitBreakerConfig& config, Clock clock)
    : pImpl(std::make_unique<Impl>(config, std::move(clock))) {
    FUNC_SCOPE();
}

CircuitBreaker::~CircuitBreaker() = default;

CircuitBreaker::Admission CircuitBreaker::TryAcquire() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    switch (pImpl->state) {
        case CircuitState::Closed:
            return Admission::Allowed;
        case CircuitState::Open:
            if (pImpl->cooledDownLocked(pImpl->clock())) {
                pImpl->transitionLocked(CircuitState::HalfOpen);
                pImpl->trialInFlight = true;
                return Admission::Trial;
            }
            return Admission::Rejected;
        case CircuitState::HalfOpen:
            if (!pImpl->trialInFlight) {
                pImpl->trialInFlight = true;
                return Admission::Trial;
            }
            return Admission::Rejected;
    }
    return Admission::Rejected;
}

bool CircuitBreaker::WouldReject() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    switch (pImpl->state) {
        case CircuitState::Closed:
            return false;
        case CircuitState::Open:
            return !pImpl->cooledDownLocked(pImpl->clock());
        case CircuitState::HalfOpen:
            return pImpl->trialInFlight;
    }
    return false;
}

void CircuitBreaker::RecordSuccess() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->state == CircuitState::Open) {
        // Late completion of a call admitted before the circuit opened.
        return;
    }
    pImpl->transitionLocked(CircuitState::Closed);
    pImpl->consecutiveFailures = 0;
    pImpl->trialInFlight = false;
    pImpl->openedAt.reset();
    pImpl->unhealthySince.reset();
}

void CircuitBreaker::RecordFailure() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    const auto now = pImpl->clock();
    switch (pImpl->state) {
        case CircuitState::Closed:
            ++pImpl->consecutiveFailures;
            if (pImpl->consecutiveFailures >= pImpl->config.failureThreshold) {
                LOG_WARN("Circuit breaker: failure threshold {} reached", pImpl->config.failureThreshold);
                pImpl->openLocked(now);
            }
            break;
        case CircuitState::HalfOpen:
            LOG_WARN("Circuit breaker: trial failed");
            pImpl->openLocked(now);
            break;
        case CircuitState::Open:
            // Already open; late failures of calls admitted earlier do not extend the cooldown.
            break;
    }
}

CircuitState CircuitBreaker::GetState() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->state;
}

unsigned int CircuitBreaker::GetConsecutiveFailures() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->consecutiveFailures;
}

std::optional<std::chrono::steady_clock::time_point> CircuitBreaker::GetOpenedAt() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->openedAt;
}

std::chrono::steady_clock::duration CircuitBreaker::GetUnhealthyDuration() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->unhealthySince.has_value()) {
        return std::chrono::steady_clock::duration::zero();
    }
    return pImpl->clock() - *pImpl->unhealthySince;
}

void CircuitBreaker::Reset() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->transitionLocked(CircuitState::Closed);
    pImpl->consecutiveFailures = 0;
    pImpl->trialInFlight = false;
    pImpl->openedAt.reset();
    pImpl->unhealthySince.reset();
}

} // namespace mcpleague
