//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_rate_limiter.cpp
// Purpose: Tests for window parsing and fixed-window rate limiting
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "toolrpc/resilience/RateLimiter.h"

namespace toolrpc {
namespace resilience {

TEST(RateLimiterWindow, ParsesUnits) {
    EXPECT_EQ(ParseWindow("30s"), 30000);
    EXPECT_EQ(ParseWindow("1m"), 60000);
    EXPECT_EQ(ParseWindow("2h"), 7200000);
    EXPECT_EQ(ParseWindow("1d"), 86400000);
}

TEST(RateLimiterWindow, RejectsMalformed) {
    for (const char* bad : {"", "m", "10", "10x", "1.5m", "-1m", " 1m", "1 m"}) {
        EXPECT_THROW(ParseWindow(bad), std::invalid_argument) << bad;
    }
    try {
        ParseWindow("5 minutes");
        FAIL();
    } catch (const std::invalid_argument& e) {
        EXPECT_EQ(std::string(e.what()), "Invalid window format: 5 minutes");
    }
}

TEST(RateLimiter, AllowsUpToMaxThenRejects) {
    int64_t t = 1000;
    RateLimiter limiter([&t]() { return t; });
    RateLimitConfig cfg{3, "1m"};

    auto r1 = limiter.Check("add", "c1", cfg);
    EXPECT_TRUE(r1.allowed);
    EXPECT_EQ(r1.remaining, 2);
    EXPECT_EQ(r1.resetTime, 61000);
    EXPECT_EQ(limiter.Check("add", "c1", cfg).remaining, 1);
    EXPECT_EQ(limiter.Check("add", "c1", cfg).remaining, 0);

    auto denied = limiter.Check("add", "c1", cfg);
    EXPECT_FALSE(denied.allowed);
    EXPECT_EQ(denied.remaining, 0);
    EXPECT_EQ(denied.resetTime, 61000);
}

TEST(RateLimiter, CallersAndToolsAreIndependent) {
    int64_t t = 0;
    RateLimiter limiter([&t]() { return t; });
    RateLimitConfig cfg{1, "10s"};
    EXPECT_TRUE(limiter.Check("add", "a", cfg).allowed);
    EXPECT_FALSE(limiter.Check("add", "a", cfg).allowed);
    EXPECT_TRUE(limiter.Check("add", "b", cfg).allowed);
    EXPECT_TRUE(limiter.Check("echo", "a", cfg).allowed);
    EXPECT_EQ(limiter.EntryCount(), 3u);
}

TEST(RateLimiter, WindowResetsAfterExpiry) {
    int64_t t = 5000;
    RateLimiter limiter([&t]() { return t; });
    RateLimitConfig cfg{1, "1s"};
    EXPECT_TRUE(limiter.Check("add", "c", cfg).allowed);
    t = 6000;  // equal to resetTime: still inside the window
    EXPECT_FALSE(limiter.Check("add", "c", cfg).allowed);
    t = 6001;
    auto r = limiter.Check("add", "c", cfg);
    EXPECT_TRUE(r.allowed);
    EXPECT_EQ(r.resetTime, 7001);
}

TEST(RateLimiter, CleanupDropsExpiredEntries) {
    int64_t t = 0;
    RateLimiter limiter([&t]() { return t; });
    limiter.Check("a", "c", RateLimitConfig{5, "1s"});
    limiter.Check("b", "c", RateLimitConfig{5, "1h"});
    t = 2000;
    limiter.Cleanup();
    EXPECT_EQ(limiter.EntryCount(), 1u);
}

TEST(RateLimiter, CheckSweepsExpiredEntriesEachInterval) {
    int64_t t = 0;
    RateLimiter limiter([&t]() { return t; }, 1000);
    limiter.Check("a", "c", RateLimitConfig{5, "1s"});
    limiter.Check("b", "c", RateLimitConfig{5, "1h"});
    t = 999;
    limiter.Check("d", "c", RateLimitConfig{5, "1s"});
    EXPECT_EQ(limiter.EntryCount(), 3u);

    t = 2500;  // "a" and "d" expired; the next check sweeps them
    EXPECT_TRUE(limiter.Check("e", "c", RateLimitConfig{5, "1s"}).allowed);
    EXPECT_EQ(limiter.EntryCount(), 2u);
}

TEST(RateLimiter, ManyCallersDoNotAccumulate) {
    int64_t t = 0;
    RateLimiter limiter([&t]() { return t; });
    for (int i = 0; i < 1000; ++i) {
        t = static_cast<int64_t>(i) * 1000;
        limiter.Check("add", "caller-" + std::to_string(i), RateLimitConfig{1, "1s"});
    }
    EXPECT_LE(limiter.EntryCount(), 62u);
}

TEST(RateLimiter, ResetOneToolOrAll) {
    int64_t t = 0;
    RateLimiter limiter([&t]() { return t; });
    RateLimitConfig cfg{1, "1m"};
    limiter.Check("a", "c", cfg);
    limiter.Check("b", "c", cfg);
    limiter.Reset(std::string("a"));
    EXPECT_TRUE(limiter.Check("a", "c", cfg).allowed);
    EXPECT_FALSE(limiter.Check("b", "c", cfg).allowed);
    limiter.Reset();
    EXPECT_EQ(limiter.EntryCount(), 0u);
}

TEST(RateLimiter, MalformedWindowThrowsWithoutCounting) {
    RateLimiter limiter;
    EXPECT_THROW(limiter.Check("a", "c", RateLimitConfig{1, "soon"}), std::invalid_argument);
    EXPECT_EQ(limiter.EntryCount(), 0u);
}

} // namespace resilience
} // namespace toolrpc
