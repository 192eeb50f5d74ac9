//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CircuitBreaker.h
// Purpose: Per-tool circuit breaker (closed -> open -> half-open -> closed)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "toolrpc/resilience/RateLimiter.h"

namespace toolrpc {
namespace resilience {

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

const char* toString(CircuitState s);

struct CircuitBreakerConfig {
    double errorThreshold{0.5};     // failure ratio that opens the circuit
    int64_t timeWindowMs{60000};    // closed-state counters restart after this long
    int64_t minRequests{10};        // outcomes required before the ratio is considered
    int64_t halfOpenTimeoutMs{30000};
};

struct CircuitSnapshot {
    CircuitState state{CircuitState::Closed};
    int64_t failures{0};
    int64_t successes{0};
    std::optional<int64_t> lastFailureTime;
    std::optional<int64_t> lastSuccessTime;
    std::optional<int64_t> nextAttemptTime;
};

//==========================================================================================================
// CircuitBreaker
// Purpose: Tracks outcomes per tool and refuses calls while a tool is failing.
// Notes:
//   - State is created lazily; a tool with no recorded outcomes is Closed.
//   - IsOpen() performs the Open -> HalfOpen transition once the cooldown has elapsed.
//   - A success while HalfOpen closes the circuit; a failure re-opens it and restarts the cooldown.
//   - All methods are thread-safe.
//==========================================================================================================
class CircuitBreaker {
public:
    explicit CircuitBreaker(CircuitBreakerConfig defaults = {}, MillisClock clock = SystemMillisClock());

    // Per-tool override of the defaults; applies from the next call.
    void Configure(const std::string& tool, const CircuitBreakerConfig& config);

    bool IsOpen(const std::string& tool);
    void RecordSuccess(const std::string& tool);
    void RecordFailure(const std::string& tool);

    CircuitState GetState(const std::string& tool);
    CircuitSnapshot Snapshot(const std::string& tool);

    void Reset(const std::optional<std::string>& tool = std::nullopt);

private:
    struct Circuit {
        CircuitSnapshot s;
        int64_t windowStart{0};
    };

    Circuit& circuitLocked(const std::string& tool);
    const CircuitBreakerConfig& configLocked(const std::string& tool) const;

    CircuitBreakerConfig defaults;
    MillisClock now;
    std::mutex mutex;
    std::map<std::string, Circuit> circuits;
    std::map<std::string, CircuitBreakerConfig> configs;
};

} // namespace resilience
} // namespace toolrpc
