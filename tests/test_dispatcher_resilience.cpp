//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_dispatcher_resilience.cpp
// Purpose: Tests for rate limiting, circuit breaking, retry and cancellation around tools/call
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "toolrpc/AuditLog.h"
#include "toolrpc/Cancellation.h"
#include "toolrpc/Dispatcher.h"
#include "toolrpc/InMemoryTransport.hpp"
#include "toolrpc/PromptRegistry.h"
#include "toolrpc/ResourceRegistry.h"
#include "toolrpc/ToolRegistry.h"
#include "toolrpc/resilience/CircuitBreaker.h"
#include "toolrpc/resilience/RateLimiter.h"
#include "toolrpc/resilience/Retry.h"

namespace toolrpc {

namespace {
using namespace std::chrono_literals;

// Polls until the handle is cancelled or the deadline passes.
bool waitForCancel(const CancellationHandle& h, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!h.IsCancelled() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    return h.IsCancelled();
}

class ResilienceTest : public ::testing::Test {
protected:
    ResilienceTest()
        : limiter([this]() { return clock.load(); }),
          breaker(resilience::CircuitBreakerConfig{}, [this]() { return clock.load(); }),
          retry([](std::chrono::milliseconds) {}, []() { return 0.0; }),
          audit([this](const std::string& line) {
              std::lock_guard<std::mutex> lock(auditMutex);
              auditLines.push_back(line);
          }),
          dispatcher(DispatcherContext{tools, resources, prompts, limiter, breaker, retry, audit}) {}

    void registerTool(const std::string& name, ToolExecutor exec, ToolPolicy policy = {}) {
        Tool t;
        t.name = name;
        t.description = "Test tool " + name;
        t.inputSchema = ObjectSchema::Empty();
        t.executor = std::move(exec);
        t.policy = std::move(policy);
        tools.Register(std::move(t));
    }

    std::unique_ptr<JSONRPCResponse> callTool(const std::string& name, JSONRPCId id = int64_t{1}) {
        return dispatcher.HandleRequest(
            JSONRPCRequest(std::move(id), Methods::CallTool, MakeObject({{"name", JSONValue(name)}})));
    }

    std::string lastOutcome() {
        std::lock_guard<std::mutex> lock(auditMutex);
        return auditLines.empty() ? std::string() : GetString(ParseJSON(auditLines.back()), "outcome").value_or("");
    }

    std::atomic<int64_t> clock{1000};
    ToolRegistry tools;
    ResourceRegistry resources;
    PromptRegistry prompts;
    resilience::RateLimiter limiter;
    resilience::CircuitBreaker breaker;
    resilience::Retry retry;
    std::mutex auditMutex;
    std::vector<std::string> auditLines;
    AuditLog audit;
    Dispatcher dispatcher;
};
} // namespace

TEST_F(ResilienceTest, RateLimitDeniesWithResetTime) {
    ToolPolicy policy;
    policy.rateLimit = resilience::RateLimitConfig{2, "1m"};
    registerTool("limited", [](const JSONValue&, const CancellationHandle&) { return JSONValue(true); }, policy);

    EXPECT_FALSE(callTool("limited")->IsError());
    EXPECT_FALSE(callTool("limited")->IsError());
    auto denied = callTool("limited");
    ASSERT_TRUE(denied->IsError());
    EXPECT_EQ(denied->ErrorCode(), JSONRPCErrorCodes::ToolExecutionError);
    EXPECT_EQ(denied->ErrorMessage(), "Rate limit exceeded");
    auto err = errors::rpcErrorFromResponse(*denied);
    ASSERT_TRUE(err.has_value() && err->data.has_value());
    EXPECT_EQ(GetInteger(*err->data, "resetTime").value_or(0), 61000);
    EXPECT_EQ(lastOutcome(), "denied");

    clock = 61001;
    EXPECT_FALSE(callTool("limited")->IsError());
}

TEST_F(ResilienceTest, CircuitOpensAfterFailuresAndRecovers) {
    resilience::CircuitBreakerConfig cfg;
    cfg.minRequests = 2;
    cfg.halfOpenTimeoutMs = 500;
    breaker.Configure("flaky", cfg);
    std::atomic<bool> healthy{false};
    ToolPolicy policy;
    policy.circuitBreaker = true;
    registerTool("flaky", [&healthy](const JSONValue&, const CancellationHandle&) -> JSONValue {
        if (!healthy) throw std::runtime_error("backend down");
        return JSONValue("ok");
    }, policy);

    EXPECT_EQ(callTool("flaky")->ErrorMessage(), "Tool execution failed");
    EXPECT_EQ(callTool("flaky")->ErrorMessage(), "Tool execution failed");
    EXPECT_EQ(breaker.GetState("flaky"), resilience::CircuitState::Open);

    auto blocked = callTool("flaky");
    EXPECT_EQ(blocked->ErrorCode(), JSONRPCErrorCodes::ToolExecutionError);
    EXPECT_EQ(blocked->ErrorMessage(), "Circuit open");
    EXPECT_EQ(lastOutcome(), "denied");

    healthy = true;
    clock = clock.load() + 500;
    EXPECT_FALSE(callTool("flaky")->IsError());
    EXPECT_EQ(breaker.GetState("flaky"), resilience::CircuitState::Closed);
}

TEST_F(ResilienceTest, RetryRecoversTransientFailures) {
    std::atomic<int> calls{0};
    ToolPolicy policy;
    policy.retry = resilience::RetryOptions{3, resilience::BackoffStrategy::Fixed, 1, 10};
    registerTool("transient", [&calls](const JSONValue&, const CancellationHandle&) -> JSONValue {
        if (++calls < 3) throw std::runtime_error("try again");
        return JSONValue("done");
    }, policy);
    auto resp = callTool("transient");
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(calls.load(), 3);
}

TEST_F(ResilienceTest, RetryGivesUpAfterMaxAttempts) {
    std::atomic<int> calls{0};
    ToolPolicy policy;
    policy.retry = resilience::RetryOptions{2, resilience::BackoffStrategy::Fixed, 1, 10};
    registerTool("broken", [&calls](const JSONValue&, const CancellationHandle&) -> JSONValue {
        ++calls;
        throw std::runtime_error("still broken");
    }, policy);
    EXPECT_EQ(callTool("broken")->ErrorCode(), JSONRPCErrorCodes::ToolExecutionError);
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(ResilienceTest, RetryStopsOnceRequestIsCancelled) {
    std::atomic<int> calls{0};
    ToolPolicy policy;
    policy.retry = resilience::RetryOptions{5, resilience::BackoffStrategy::Fixed, 1, 10};
    registerTool("cancels", [this, &calls](const JSONValue&, const CancellationHandle&) -> JSONValue {
        ++calls;
        dispatcher.Cancellations().Cancel("job-r");
        throw std::runtime_error("interrupted");
    }, policy);
    auto resp = callTool("cancels", std::string("job-r"));
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(resp->ErrorCode(), JSONRPCErrorCodes::RequestCancelled);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(lastOutcome(), "cancelled");
}

TEST_F(ResilienceTest, NonStandardExceptionBecomesToolError) {
    ToolPolicy policy;
    policy.circuitBreaker = true;
    registerTool("odd", [](const JSONValue&, const CancellationHandle&) -> JSONValue {
        throw 42;
    }, policy);
    auto resp = callTool("odd");
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(resp->ErrorCode(), JSONRPCErrorCodes::ToolExecutionError);
    EXPECT_EQ(resp->ErrorMessage(), "Tool execution failed");
    EXPECT_EQ(lastOutcome(), "failure");
}

TEST_F(ResilienceTest, CancellationNotificationStopsCooperativeTool) {
    std::promise<void> started;
    auto startedFuture = started.get_future();
    registerTool("slow", [&started](const JSONValue&, const CancellationHandle& h) {
        started.set_value();
        waitForCancel(h, 5000ms);
        return JSONValue("finished");
    });

    auto pending = std::async(std::launch::async, [this]() { return callTool("slow", std::string("job-1")); });
    ASSERT_EQ(startedFuture.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(dispatcher.Cancellations().Contains("job-1"));

    dispatcher.HandleNotification(JSONRPCNotification(Methods::Cancelled, MakeObject({{"requestId", JSONValue("job-1")}})));
    auto resp = pending.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(resp->ErrorCode(), JSONRPCErrorCodes::RequestCancelled);
    EXPECT_EQ(lastOutcome(), "cancelled");
    EXPECT_FALSE(dispatcher.Cancellations().Contains("job-1"));
}

TEST_F(ResilienceTest, CancelledToolThatThrowsStillReportsCancellation) {
    std::promise<void> started;
    auto startedFuture = started.get_future();
    registerTool("abort", [&started](const JSONValue&, const CancellationHandle& h) -> JSONValue {
        started.set_value();
        waitForCancel(h, 5000ms);
        throw std::runtime_error("aborted");
    });
    auto pending = std::async(std::launch::async, [this]() { return callTool("abort", int64_t{42}); });
    ASSERT_EQ(startedFuture.wait_for(5s), std::future_status::ready);
    dispatcher.HandleNotification(JSONRPCNotification(Methods::Cancelled, MakeObject({{"requestId", JSONValue(int64_t{42})}})));
    EXPECT_EQ(pending.get()->ErrorCode(), JSONRPCErrorCodes::RequestCancelled);
}

TEST_F(ResilienceTest, CancellationForUnknownIdIsIgnored) {
    EXPECT_NO_THROW(dispatcher.HandleNotification(
        JSONRPCNotification(Methods::Cancelled, MakeObject({{"requestId", JSONValue("ghost")}}))));
    EXPECT_NO_THROW(dispatcher.HandleNotification(JSONRPCNotification(Methods::Cancelled)));
    EXPECT_NO_THROW(dispatcher.HandleNotification(JSONRPCNotification("notifications/unknown")));
}

TEST_F(ResilienceTest, CancellationOverInMemoryTransport) {
    std::promise<void> started;
    auto startedFuture = started.get_future();
    registerTool("slow", [&started](const JSONValue&, const CancellationHandle& h) {
        started.set_value();
        waitForCancel(h, 5000ms);
        return JSONValue("finished");
    });

    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    dispatcher.Start(std::move(pair.second)).get();
    client->Start().get();

    auto fut = client->SendRequest(std::make_unique<JSONRPCRequest>(
        JSONRPCId{std::string("cancel-1")}, Methods::CallTool,
        MakeObject({{"name", JSONValue("slow")}, {"arguments", JSONValue(JSONValue::Object{})}})));
    ASSERT_EQ(startedFuture.wait_for(5s), std::future_status::ready);

    client->SendNotification(std::make_unique<JSONRPCNotification>(
        Methods::Cancelled, MakeObject({{"requestId", JSONValue("cancel-1")}}))).get();

    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(resp->ErrorCode(), JSONRPCErrorCodes::RequestCancelled);

    client->Close().get();
    dispatcher.Stop().get();
}

} // namespace toolrpc
