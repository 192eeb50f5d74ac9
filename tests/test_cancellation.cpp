//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_cancellation.cpp
// Purpose: Tests for cancellation handles, the bounded registry and scoped registration
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>

#include "toolrpc/Cancellation.h"

namespace toolrpc {

TEST(CancellationHandle, CancelFlipsOnce) {
    CancellationHandle h;
    EXPECT_FALSE(h.IsCancelled());
    EXPECT_TRUE(h.Cancel());
    EXPECT_FALSE(h.Cancel());
    EXPECT_TRUE(h.IsCancelled());
    EXPECT_TRUE(h.Token().stop_requested());
}

TEST(CancellationHandle, ListenersRunOnCancelAndLateListenersRunImmediately) {
    CancellationHandle h;
    std::atomic<int> fired{0};
    h.OnCancel([&fired]() { ++fired; });
    EXPECT_EQ(fired.load(), 0);
    h.Cancel();
    EXPECT_EQ(fired.load(), 1);
    h.OnCancel([&fired]() { ++fired; });
    EXPECT_EQ(fired.load(), 2);
}

TEST(CancellationRegistry, CancelKnownAndUnknownIds) {
    CancellationRegistry reg(4);
    auto h = reg.Register("1");
    EXPECT_TRUE(reg.Contains("1"));
    EXPECT_FALSE(reg.Cancel("2"));
    EXPECT_TRUE(reg.Cancel("1"));
    EXPECT_TRUE(h->IsCancelled());
}

TEST(CancellationRegistry, EvictsOldestWhenFull) {
    CancellationRegistry reg(2);
    auto a = reg.Register("a");
    reg.Register("b");
    reg.Register("c");
    EXPECT_EQ(reg.Size(), 2u);
    EXPECT_FALSE(reg.Contains("a"));
    EXPECT_FALSE(reg.Cancel("a"));
    EXPECT_FALSE(a->IsCancelled());
    EXPECT_TRUE(reg.Contains("b"));
    EXPECT_TRUE(reg.Contains("c"));
}

TEST(CancellationRegistry, ReRegisterReplacesAndRemoveIgnoresStaleHandle) {
    CancellationRegistry reg(4);
    auto first = reg.Register("x");
    auto second = reg.Register("x");
    EXPECT_EQ(reg.Size(), 1u);
    reg.Remove("x", first);
    EXPECT_TRUE(reg.Contains("x"));
    reg.Cancel("x");
    EXPECT_FALSE(first->IsCancelled());
    EXPECT_TRUE(second->IsCancelled());
    reg.Remove("x", second);
    EXPECT_FALSE(reg.Contains("x"));
}

TEST(CancellationRegistry, ZeroCapacityIsClampedToOne) {
    CancellationRegistry reg(0);
    EXPECT_EQ(reg.Capacity(), 1u);
}

TEST(CancellationScope, RegistersForItsLifetime) {
    CancellationRegistry reg(4);
    {
        CancellationScope scope(&reg, "req-1");
        EXPECT_TRUE(reg.Contains("req-1"));
        reg.Cancel("req-1");
        EXPECT_TRUE(scope.Handle()->IsCancelled());
    }
    EXPECT_FALSE(reg.Contains("req-1"));
}

TEST(CancellationScope, WithoutIdStillOwnsAHandle) {
    CancellationRegistry reg(4);
    CancellationScope scope(&reg, "");
    ASSERT_NE(scope.Handle(), nullptr);
    EXPECT_EQ(reg.Size(), 0u);
    CancellationScope detached(nullptr, "id");
    ASSERT_NE(detached.Handle(), nullptr);
    EXPECT_FALSE(detached.Handle()->IsCancelled());
}

} // namespace toolrpc
