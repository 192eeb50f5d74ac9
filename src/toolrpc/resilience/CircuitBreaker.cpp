//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CircuitBreaker.cpp
// Purpose: Circuit breaker state machine
//==========================================================================================================

#include "logging/Logger.h"
#include "toolrpc/resilience/CircuitBreaker.h"

namespace toolrpc {
namespace resilience {

const char* toString(CircuitState s) {
    switch (s) {
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half-open";
        case CircuitState::Closed:
        default: return "closed";
    }
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig d, MillisClock clock)
    : defaults(d), now(clock ? std::move(clock) : SystemMillisClock()) {}

void CircuitBreaker::Configure(const std::string& tool, const CircuitBreakerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex);
    configs[tool] = config;
}

CircuitBreaker::Circuit& CircuitBreaker::circuitLocked(const std::string& tool) {
    auto it = circuits.find(tool);
    if (it == circuits.end()) {
        it = circuits.emplace(tool, Circuit{}).first;
        it->second.windowStart = now();
    }
    return it->second;
}

const CircuitBreakerConfig& CircuitBreaker::configLocked(const std::string& tool) const {
    auto it = configs.find(tool);
    return it == configs.end() ? defaults : it->second;
}

bool CircuitBreaker::IsOpen(const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex);
    Circuit& c = circuitLocked(tool);
    if (c.s.state != CircuitState::Open) {
        return false;
    }
    const int64_t t = now();
    if (c.s.nextAttemptTime && t >= *c.s.nextAttemptTime) {
        c.s.state = CircuitState::HalfOpen;
        c.s.failures = 0;
        c.s.successes = 0;
        LOG_INFO("Circuit half-open for {}", tool);
        return false;
    }
    return true;
}

void CircuitBreaker::RecordSuccess(const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex);
    Circuit& c = circuitLocked(tool);
    const int64_t t = now();
    if (c.s.state == CircuitState::Closed && t - c.windowStart > configLocked(tool).timeWindowMs) {
        c.s.failures = 0;
        c.s.successes = 0;
        c.windowStart = t;
    }
    ++c.s.successes;
    c.s.lastSuccessTime = t;
    if (c.s.state == CircuitState::HalfOpen) {
        c.s.state = CircuitState::Closed;
        c.s.failures = 0;
        c.s.successes = 0;
        c.s.nextAttemptTime.reset();
        c.windowStart = t;
        LOG_INFO("Circuit closed for {}", tool);
    }
}

void CircuitBreaker::RecordFailure(const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex);
    Circuit& c = circuitLocked(tool);
    const CircuitBreakerConfig& cfg = configLocked(tool);
    const int64_t t = now();
    if (c.s.state == CircuitState::Closed && t - c.windowStart > cfg.timeWindowMs) {
        c.s.failures = 0;
        c.s.successes = 0;
        c.windowStart = t;
    }
    ++c.s.failures;
    c.s.lastFailureTime = t;
    const int64_t total = c.s.failures + c.s.successes;
    const double errorRate = static_cast<double>(c.s.failures) / static_cast<double>(total);

    if (c.s.state == CircuitState::Closed && total >= cfg.minRequests && errorRate >= cfg.errorThreshold) {
        c.s.state = CircuitState::Open;
        c.s.nextAttemptTime = t + cfg.halfOpenTimeoutMs;
        LOG_WARN("Circuit opened for {} (error rate {:.2f}, {} of {} failed)", tool, errorRate, c.s.failures, total);
    } else if (c.s.state == CircuitState::HalfOpen) {
        c.s.state = CircuitState::Open;
        c.s.nextAttemptTime = t + cfg.halfOpenTimeoutMs;
        LOG_WARN("Circuit re-opened for {}", tool);
    }
}

CircuitState CircuitBreaker::GetState(const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex);
    return circuitLocked(tool).s.state;
}

CircuitSnapshot CircuitBreaker::Snapshot(const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex);
    return circuitLocked(tool).s;
}

void CircuitBreaker::Reset(const std::optional<std::string>& tool) {
    std::lock_guard<std::mutex> lock(mutex);
    if (tool.has_value()) {
        circuits.erase(*tool);
        configs.erase(*tool);
    } else {
        circuits.clear();
        configs.clear();
    }
}

} // namespace resilience
} // namespace toolrpc
