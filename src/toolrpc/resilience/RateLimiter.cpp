//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RateLimiter.cpp
// Purpose: Fixed-window rate limiter
//==========================================================================================================

#include <chrono>
#include <regex>
#include <stdexcept>

#include "logging/Logger.h"
#include "toolrpc/resilience/RateLimiter.h"

namespace toolrpc {
namespace resilience {

MillisClock SystemMillisClock() {
    return []() {
        return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    };
}

int64_t ParseWindow(const std::string& window) {
    static const std::regex re(R"(^(\d+)([smhd])$)");
    std::smatch m;
    if (!std::regex_match(window, m, re)) {
        throw std::invalid_argument("Invalid window format: " + window);
    }
    int64_t n = 0;
    try {
        n = std::stoll(m[1].str());
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Invalid window format: " + window);
    }
    switch (m[2].str()[0]) {
        case 's': return n * 1000;
        case 'm': return n * 60 * 1000;
        case 'h': return n * 60 * 60 * 1000;
        case 'd': return n * 24 * 60 * 60 * 1000;
        default: throw std::invalid_argument("Invalid window format: " + window);
    }
}

RateLimiter::RateLimiter(MillisClock clock, int64_t cleanupIntervalMs)
    : now(clock ? std::move(clock) : SystemMillisClock()), cleanupIntervalMs(cleanupIntervalMs) {}

RateLimitResult RateLimiter::Check(const std::string& tool, const std::string& caller, const RateLimitConfig& config) {
    const int64_t windowMs = ParseWindow(config.window);
    const int64_t t = now();

    std::lock_guard<std::mutex> lock(mutex);
    if (!lastCleanup.has_value()) {
        lastCleanup = t;
    } else if (t - *lastCleanup >= cleanupIntervalMs) {
        purgeExpiredLocked(t);
        lastCleanup = t;
    }
    Entry& e = limits[tool][caller];
    if (e.resetTime == 0 || t > e.resetTime) {
        e.count = 0;
        e.resetTime = t + windowMs;
    }
    if (e.count >= config.max) {
        LOG_WARN("Rate limit exceeded for tool {} (max {} per {})", tool, config.max, config.window);
        return RateLimitResult{false, 0, e.resetTime};
    }
    ++e.count;
    return RateLimitResult{true, config.max - e.count, e.resetTime};
}

void RateLimiter::Cleanup() {
    const int64_t t = now();
    std::lock_guard<std::mutex> lock(mutex);
    purgeExpiredLocked(t);
}

void RateLimiter::purgeExpiredLocked(int64_t t) {
    std::size_t removed = 0;
    for (auto toolIt = limits.begin(); toolIt != limits.end();) {
        auto& callers = toolIt->second;
        for (auto it = callers.begin(); it != callers.end();) {
            if (t > it->second.resetTime) {
                it = callers.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        if (callers.empty()) {
            toolIt = limits.erase(toolIt);
        } else {
            ++toolIt;
        }
    }
    if (removed > 0) {
        LOG_DEBUG("RateLimiter: purged {} expired entries", removed);
    }
}

void RateLimiter::Reset(const std::optional<std::string>& tool) {
    std::lock_guard<std::mutex> lock(mutex);
    if (tool.has_value()) {
        limits.erase(*tool);
    } else {
        limits.clear();
    }
}

std::size_t RateLimiter::EntryCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::size_t n = 0;
    for (const auto& [tool, callers] : limits) {
        n += callers.size();
    }
    return n;
}

} // namespace resilience
} // namespace toolrpc
