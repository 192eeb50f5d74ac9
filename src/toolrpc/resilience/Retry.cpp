//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Retry.cpp
// Purpose: Backoff computation and default sleep/jitter sources
//==========================================================================================================

#include <algorithm>
#include <random>

#include "toolrpc/resilience/Retry.h"

namespace toolrpc {
namespace resilience {

namespace {
constexpr double kMaxJitter = 0.2;

double defaultJitter() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}
} // namespace

const char* toString(BackoffStrategy s) {
    switch (s) {
        case BackoffStrategy::Fixed: return "fixed";
        case BackoffStrategy::Linear: return "linear";
        case BackoffStrategy::Exponential:
        default: return "exponential";
    }
}

BackoffStrategy backoffFromString(const std::string& s) {
    if (s == "fixed") return BackoffStrategy::Fixed;
    if (s == "linear") return BackoffStrategy::Linear;
    return BackoffStrategy::Exponential;
}

Retry::Retry()
    : sleep([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }),
      jitter(defaultJitter) {}

Retry::Retry(SleepFn s, JitterFn j)
    : sleep(s ? std::move(s) : SleepFn([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })),
      jitter(j ? std::move(j) : JitterFn(defaultJitter)) {}

int64_t Retry::BaseDelayMs(int attempt, const RetryOptions& opts) {
    const int64_t initial = std::max<int64_t>(0, opts.initialDelayMs);
    double delay = static_cast<double>(initial);
    switch (opts.strategy) {
        case BackoffStrategy::Linear:
            delay = static_cast<double>(initial) * static_cast<double>(attempt + 1);
            break;
        case BackoffStrategy::Exponential:
            // Exponent capped so the double never overflows before clamping
            delay = static_cast<double>(initial) * static_cast<double>(1ull << std::min(attempt, 52));
            break;
        case BackoffStrategy::Fixed:
        default:
            break;
    }
    return static_cast<int64_t>(std::min(delay, static_cast<double>(opts.maxDelayMs)));
}

int64_t Retry::DelayMs(int attempt, const RetryOptions& opts) const {
    const int64_t initial = std::max<int64_t>(0, opts.initialDelayMs);
    double base = static_cast<double>(initial);
    if (opts.strategy == BackoffStrategy::Linear) {
        base *= static_cast<double>(attempt + 1);
    } else if (opts.strategy == BackoffStrategy::Exponential) {
        base *= static_cast<double>(1ull << std::min(attempt, 52));
    }
    double j = jitter();
    j = std::clamp(j, 0.0, 1.0);
    const double withJitter = base + base * kMaxJitter * j;
    return static_cast<int64_t>(std::min(withJitter, static_cast<double>(opts.maxDelayMs)));
}

} // namespace resilience
} // namespace toolrpc
