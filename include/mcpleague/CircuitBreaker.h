//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CircuitBreaker.h
// Purpose: Per-session circuit breaker (CLOSED -> OPEN -> HALF_OPEN) with an injectable clock
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "mcpleague/Config.h"

namespace mcpleague {

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

const char* CircuitStateToString(CircuitState s);

//==========================================================================================================
// CircuitBreaker
// Purpose: Single source of truth for whether calls to one server may proceed.
//   CLOSED: calls pass; failureThreshold consecutive failures open the circuit.
//   OPEN: calls are rejected until recoveryTimeout has elapsed since opening; the next call after that
//         moves the breaker to HALF_OPEN and is admitted as the only trial.
//   HALF_OPEN: trial success closes the circuit, trial failure reopens it.
//==========================================================================================================
class CircuitBreaker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    enum class Admission {
        Allowed,
        Trial,
        Rejected
    };

    explicit CircuitBreaker(const CircuitBreakerConfig& config, Clock clock = nullptr);
    ~CircuitBreaker();

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    //==========================================================================================================
    // TryAcquire
    // Purpose: Admission decision for one call attempt. A Trial admission must be followed by exactly one
    //          RecordSuccess or RecordFailure.
    //==========================================================================================================
    Admission TryAcquire();

    // True when TryAcquire would currently reject, without changing state.
    bool WouldReject() const;

    void RecordSuccess();
    void RecordFailure();

    CircuitState GetState() const;
    unsigned int GetConsecutiveFailures() const;
    std::optional<std::chrono::steady_clock::time_point> GetOpenedAt() const;

    // Time since the breaker was last CLOSED; zero while closed.
    std::chrono::steady_clock::duration GetUnhealthyDuration() const;

    void Reset();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpleague
