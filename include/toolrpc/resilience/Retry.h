//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Retry.h
// Purpose: Bounded retry with fixed, linear or exponential backoff and positive jitter
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <stop_token>
#include <string>
#include <thread>
#include <type_traits>

#include "logging/Logger.h"

namespace toolrpc {
namespace resilience {

enum class BackoffStrategy {
    Fixed,
    Linear,
    Exponential
};

const char* toString(BackoffStrategy s);
// "fixed", "linear" or "exponential"; anything else falls back to Exponential.
BackoffStrategy backoffFromString(const std::string& s);

struct RetryOptions {
    int maxAttempts{3};
    BackoffStrategy strategy{BackoffStrategy::Exponential};
    int64_t initialDelayMs{100};
    int64_t maxDelayMs{10000};
};

//==========================================================================================================
// Retry
// Purpose: Runs an operation up to maxAttempts times, sleeping between failures.
// Notes:
//   - attempt is 0-based. Base delay: fixed = initial, linear = initial * (attempt + 1),
//     exponential = initial * 2^attempt.
//   - Up to 20% positive jitter is added, then the result is clamped to maxDelayMs.
//   - The last failure is rethrown unmodified.
//   - A stop request seen before or after a backoff sleep ends the loop with the last failure.
//==========================================================================================================
class Retry {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;
    using JitterFn = std::function<double()>;   // uniform in [0, 1)

    Retry();
    Retry(SleepFn sleep, JitterFn jitter);

    // Delay before the next attempt without jitter, clamped to maxDelayMs.
    static int64_t BaseDelayMs(int attempt, const RetryOptions& opts);
    // Delay before the next attempt including jitter, clamped to maxDelayMs.
    int64_t DelayMs(int attempt, const RetryOptions& opts) const;

    template <typename F>
    auto Execute(F&& op, const RetryOptions& opts, std::stop_token stop = {}) const -> std::invoke_result_t<F&> {
        const int attempts = opts.maxAttempts < 1 ? 1 : opts.maxAttempts;
        for (int attempt = 0;; ++attempt) {
            std::exception_ptr failure;
            int64_t delay = 0;
            try {
                return op();
            } catch (const std::exception& e) {
                if (attempt >= attempts - 1 || stop.stop_requested()) {
                    throw;
                }
                delay = DelayMs(attempt, opts);
                LOG_DEBUG("Retry attempt {}/{} after {} ms: {}", attempt + 1, attempts, delay, e.what());
                failure = std::current_exception();
            }
            sleep(std::chrono::milliseconds(delay));
            if (stop.stop_requested()) {
                LOG_DEBUG("Retry abandoned after stop request ({} attempts made)", attempt + 1);
                std::rethrow_exception(failure);
            }
        }
    }

private:
    SleepFn sleep;
    JitterFn jitter;
};

} // namespace resilience
} // namespace toolrpc
