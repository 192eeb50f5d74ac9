//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_batch_executor.cpp
// Purpose: Tests for batch tool execution, limits, cancellation and progress
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "toolrpc/BatchExecutor.h"
#include "toolrpc/ToolRegistry.h"

namespace toolrpc {

namespace {
class BatchFixture : public ::testing::Test {
protected:
    void SetUp() override {
        registry.Register("double", "Doubles n",
                          ParseJSON(R"({"type":"object","properties":{"n":{"type":"integer"}},"required":["n"]})"),
                          [](const JSONValue& args, const CancellationHandle&) {
                              return JSONValue(GetInteger(args, "n").value_or(0) * 2);
                          });
        registry.Register("explode", "Always fails", ParseJSON(R"({"type":"object"})"),
                          [](const JSONValue&, const CancellationHandle&) -> JSONValue {
                              throw std::runtime_error("kaboom");
                          });
        registry.Register("odd", "Throws a non-standard value", ParseJSON(R"({"type":"object"})"),
                          [](const JSONValue&, const CancellationHandle&) -> JSONValue {
                              throw 42;
                          });
    }

    BatchRequest req(const std::string& tool, int64_t n) {
        return BatchRequest{tool, MakeObject({{"n", JSONValue(n)}})};
    }

    ToolRegistry registry;
};
} // namespace

TEST_F(BatchFixture, EmptyBatchReturnsEmpty) {
    BatchExecutor exec(registry);
    int calls = 0;
    auto results = exec.Execute({}, {}, nullptr, [&calls](const ProgressUpdate&) { ++calls; });
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(calls, 0);
}

TEST_F(BatchFixture, ResultsKeepInputOrder) {
    BatchExecutor exec(registry);
    std::vector<BatchRequest> reqs;
    for (int i = 0; i < 25; ++i) reqs.push_back(req("double", i));
    BatchOptions opts;
    opts.concurrency = 4;
    auto results = exec.Execute(reqs, opts);
    ASSERT_EQ(results.size(), 25u);
    for (int i = 0; i < 25; ++i) {
        EXPECT_TRUE(results[i].success);
        EXPECT_EQ(results[i].result.value(), JSONValue(int64_t{i * 2}));
    }
}

TEST_F(BatchFixture, FailuresAreRecordedPerEntry) {
    BatchExecutor exec(registry);
    auto results = exec.Execute({req("double", 1), BatchRequest{"explode", JSONValue(JSONValue::Object{})},
                                 BatchRequest{"missing", JSONValue(JSONValue::Object{})},
                                 BatchRequest{"double", JSONValue(JSONValue::Object{})}});
    ASSERT_EQ(results.size(), 4u);
    EXPECT_TRUE(results[0].success);
    EXPECT_FALSE(results[1].success);
    EXPECT_EQ(results[1].error.value_or(""), "kaboom");
    EXPECT_FALSE(results[2].success);
    EXPECT_NE(results[2].error.value_or("").find("missing"), std::string::npos);
    EXPECT_FALSE(results[3].success);
    EXPECT_FALSE(results[3].error.value_or("").empty());
}

TEST_F(BatchFixture, NonStandardThrowIsRecordedAsFailure) {
    BatchExecutor exec(registry);
    auto results = exec.Execute({BatchRequest{"odd", JSONValue(JSONValue::Object{})}, req("double", 2)});
    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].success);
    EXPECT_EQ(results[0].error.value_or(""), "Tool execution failed");
    EXPECT_TRUE(results[1].success);
}

TEST_F(BatchFixture, EntriesBeyondLimitAreRejected) {
    BatchExecutor exec(registry);
    BatchOptions opts;
    opts.maxBatchSize = 2;
    auto results = exec.Execute({req("double", 1), req("double", 2), req("double", 3)}, opts);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].success);
    EXPECT_TRUE(results[1].success);
    EXPECT_FALSE(results[2].success);
    EXPECT_EQ(results[2].tool, "double");
    EXPECT_EQ(results[2].error.value_or(""), "Batch size limit exceeded");
}

TEST_F(BatchFixture, CancelledBatchSkipsEverything) {
    BatchExecutor exec(registry);
    CancellationHandle h;
    h.Cancel();
    auto results = exec.Execute({req("double", 1), req("double", 2)}, {}, &h);
    for (const auto& r : results) {
        EXPECT_FALSE(r.success);
        EXPECT_EQ(r.error.value_or(""), "Batch cancelled");
    }
}

TEST_F(BatchFixture, CancelDuringFirstChunkSkipsTheRest) {
    CancellationHandle h;
    std::mutex m;
    std::vector<int64_t> invoked;
    registry.Register("track", "Records n and cancels the batch at n == 2",
                      ParseJSON(R"({"type":"object","properties":{"n":{"type":"integer"}},"required":["n"]})"),
                      [&](const JSONValue& args, const CancellationHandle&) {
                          const int64_t n = GetInteger(args, "n").value_or(-1);
                          {
                              std::lock_guard<std::mutex> lock(m);
                              invoked.push_back(n);
                          }
                          if (n == 2) {
                              h.Cancel();
                          }
                          return JSONValue(n);
                      });
    BatchExecutor exec(registry);
    std::vector<BatchRequest> reqs;
    for (int i = 0; i < 12; ++i) reqs.push_back(req("track", i));
    BatchOptions opts;
    opts.concurrency = 10;

    auto results = exec.Execute(reqs, opts, &h);

    ASSERT_EQ(results.size(), 12u);
    std::lock_guard<std::mutex> lock(m);
    auto wasInvoked = [&invoked](int64_t n) {
        return std::find(invoked.begin(), invoked.end(), n) != invoked.end();
    };
    for (int i = 0; i < 12; ++i) {
        EXPECT_EQ(results[i].tool, "track");
        if (results[i].success) {
            EXPECT_EQ(results[i].result.value(), JSONValue(int64_t{i}));
            EXPECT_TRUE(wasInvoked(i));
        } else {
            EXPECT_EQ(results[i].error.value_or(""), "Batch cancelled");
            EXPECT_FALSE(wasInvoked(i));
        }
    }
    EXPECT_TRUE(results[2].success);
    for (int i = 10; i < 12; ++i) {
        EXPECT_FALSE(results[i].success);
        EXPECT_EQ(results[i].error.value_or(""), "Batch cancelled");
        EXPECT_FALSE(wasInvoked(i));
    }
}

TEST_F(BatchFixture, ConcurrencyIsBounded) {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    registry.Register("slow", "Sleeps briefly", ParseJSON(R"({"type":"object"})"),
                      [&active, &peak](const JSONValue&, const CancellationHandle&) {
                          int now = ++active;
                          int prev = peak.load();
                          while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                          std::this_thread::sleep_for(std::chrono::milliseconds(20));
                          --active;
                          return JSONValue(true);
                      });
    BatchExecutor exec(registry);
    std::vector<BatchRequest> reqs(9, BatchRequest{"slow", JSONValue(JSONValue::Object{})});
    BatchOptions opts;
    opts.concurrency = 3;
    auto results = exec.Execute(reqs, opts);
    EXPECT_EQ(results.size(), 9u);
    EXPECT_LE(peak.load(), 3);
}

TEST_F(BatchFixture, ProgressStartsAtZeroAndEndsAtOne) {
    BatchExecutor exec(registry);
    std::mutex m;
    std::vector<double> seen;
    exec.Execute({req("double", 1), req("double", 2), req("double", 3)}, {}, nullptr,
                 [&](const ProgressUpdate& u) {
                     std::lock_guard<std::mutex> lock(m);
                     seen.push_back(u.progress);
                 });
    ASSERT_EQ(seen.size(), 5u);
    EXPECT_DOUBLE_EQ(seen.front(), 0.0);
    EXPECT_DOUBLE_EQ(seen.back(), 1.0);
    for (double p : seen) {
        EXPECT_GE(p, 0.0);
        EXPECT_LE(p, 1.0);
    }
}

TEST(BatchResult, ToJsonCarriesResultOrError) {
    BatchResult ok;
    ok.tool = "a";
    ok.success = true;
    ok.result = JSONValue(int64_t{1});
    JSONValue j = ok.ToJSON();
    EXPECT_EQ(GetBool(j, "success").value_or(false), true);
    EXPECT_NE(j.find("result"), nullptr);
    EXPECT_EQ(j.find("error"), nullptr);

    BatchResult bad;
    bad.tool = "b";
    bad.error = "nope";
    JSONValue k = bad.ToJSON();
    EXPECT_EQ(GetString(k, "error").value_or(""), "nope");
    EXPECT_EQ(k.find("result"), nullptr);
}

} // namespace toolrpc
