//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RetryPolicy.cpp
// Purpose: Backoff computation
//==========================================================================================================

#include <algorithm>
#include <cmath>
#include <mutex>
#include <random>

#include "mcpleague/RetryPolicy.h"
#include "mcpleague/errors/Errors.h"

namespace mcpleague {

class RetryPolicy::Impl {
public:
    Impl(const RetryConfig& cfg, std::optional<uint64_t> seed)
        : config(cfg), rng(seed.has_value() ? static_cast<std::mt19937::result_type>(*seed) : std::random_device{}()) {}

    RetryConfig config;
    std::mutex rngMutex;
    std::mt19937 rng;
};

RetryPolicy::RetryPolicy(const RetryConfig& config, std::optional<uint64_t> seed)
    : pImpl(std::make_unique<Impl>(config, seed)) {}

RetryPolicy::~RetryPolicy() = default;

std::chrono::milliseconds RetryPolicy::ComputeDelay(unsigned int attempt) {
    const auto& cfg = pImpl->config;
    // Cap the exponent; 2^62 seconds is far beyond any maxDelay.
    const double raw = cfg.baseDelaySeconds * std::pow(2.0, static_cast<double>(std::min(attempt, 62u)));
    double jitter = 0.0;
    if (cfg.jitterFactor > 0.0 && raw > 0.0) {
        std::uniform_real_distribution<double> dist(0.0, raw * cfg.jitterFactor);
        std::lock_guard<std::mutex> lock(pImpl->rngMutex);
        jitter = dist(pImpl->rng);
    }
    const double seconds = std::min(raw + jitter, cfg.maxDelaySeconds);
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

bool RetryPolicy::ShouldRetry(unsigned int attempt, const std::exception_ptr& error) const {
    return attempt + 1 < pImpl->config.maxAttempts && errors::IsRetryable(error);
}

unsigned int RetryPolicy::GetMaxAttempts() const {
    return pImpl->config.maxAttempts;
}

} // namespace mcpleague
