//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RateLimiter.h
// Purpose: Fixed-window rate limiting per (tool, caller)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace toolrpc {
namespace resilience {

// Milliseconds since the epoch; injectable for tests.
using MillisClock = std::function<int64_t()>;
MillisClock SystemMillisClock();

//==========================================================================================================
// ParseWindow
// Purpose: Converts "<n>s", "<n>m", "<n>h" or "<n>d" to milliseconds.
// Throws:
//   std::invalid_argument("Invalid window format: X") for anything else.
//==========================================================================================================
int64_t ParseWindow(const std::string& window);

struct RateLimitConfig {
    int64_t max{60};
    std::string window{"1m"};
};

struct RateLimitResult {
    bool allowed{true};
    int64_t remaining{0};
    int64_t resetTime{0};   // epoch ms when the current window ends
};

// How often Check() sweeps expired entries of every tool and caller.
constexpr int64_t kDefaultCleanupIntervalMs = 60 * 1000;

class RateLimiter {
public:
    explicit RateLimiter(MillisClock clock = SystemMillisClock(), int64_t cleanupIntervalMs = kDefaultCleanupIntervalMs);

    //==========================================================================================================
    // Check
    // Purpose: Counts one call for (tool, caller) against config.
    // Notes:
    //   - A missing or expired entry (now > resetTime) starts a fresh window with count 0.
    //   - count >= max rejects without incrementing and reports remaining 0.
    //   - Otherwise the count is incremented and remaining = max - count.
    //   - At most once per cleanup interval the call also drops every expired entry (see Cleanup).
    // Throws:
    //   std::invalid_argument when config.window is malformed.
    //==========================================================================================================
    RateLimitResult Check(const std::string& tool, const std::string& caller, const RateLimitConfig& config);

    // Drops expired entries and tools left without entries.
    void Cleanup();

    // Clears one tool's entries, or everything when tool is nullopt.
    void Reset(const std::optional<std::string>& tool = std::nullopt);

    std::size_t EntryCount() const;

private:
    struct Entry {
        int64_t count{0};
        int64_t resetTime{0};
    };

    void purgeExpiredLocked(int64_t t);

    MillisClock now;
    int64_t cleanupIntervalMs;
    std::optional<int64_t> lastCleanup;
    mutable std::mutex mutex;
    std::map<std::string, std::map<std::string, Entry>> limits;
};

} // namespace resilience
} // namespace toolrpc
