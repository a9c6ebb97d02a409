//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RetryPolicy.h
// Purpose: Exponential backoff with jitter for transient call failures
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>

#include "mcpleague/Config.h"

namespace mcpleague {

//==========================================================================================================
// RetryPolicy
// Purpose: delay(n) = min(base * 2^n + uniform(0, base * 2^n * jitterFactor), maxDelay), where n is the
//          zero-based index of the attempt that just failed.
//==========================================================================================================
class RetryPolicy {
public:
    explicit RetryPolicy(const RetryConfig& config, std::optional<uint64_t> seed = std::nullopt);
    ~RetryPolicy();

    RetryPolicy(const RetryPolicy&) = delete;
    RetryPolicy& operator=(const RetryPolicy&) = delete;

    std::chrono::milliseconds ComputeDelay(unsigned int attempt);

    // True when the failure is transient and another attempt fits the budget.
    bool ShouldRetry(unsigned int attempt, const std::exception_ptr& error) const;

    unsigned int GetMaxAttempts() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpleague
