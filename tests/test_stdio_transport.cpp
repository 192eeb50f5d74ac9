//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_transport.cpp
// Purpose: StdioTransport tests over pipes: framing, routing, EOF, backpressure and factory config
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include "toolrpc/JSONRPCTypes.h"
#include "toolrpc/StdioTransport.hpp"

using namespace std::chrono_literals;

namespace toolrpc {

namespace {

// Pipe pair standing in for stdin/stdout. The test writes to inWrite and reads from outRead.
struct Pipes {
    int inRead{-1}, inWrite{-1}, outRead{-1}, outWrite{-1};
    Pipes() {
        int a[2]{}, b[2]{};
        if (::pipe(a) == 0) { inRead = a[0]; inWrite = a[1]; }
        if (::pipe(b) == 0) { outRead = b[0]; outWrite = b[1]; }
    }
    ~Pipes() {
        for (int fd : {inRead, inWrite, outRead, outWrite}) {
            if (fd >= 0) ::close(fd);
        }
    }
    bool ok() const { return inRead >= 0 && outRead >= 0; }
    void closeInput() {
        if (inWrite >= 0) { ::close(inWrite); inWrite = -1; }
    }
    bool send(const std::string& s) const {
        return ::write(inWrite, s.data(), s.size()) == static_cast<ssize_t>(s.size());
    }
    // Reads until done(out) holds or the timeout passes.
    template <typename Pred>
    std::string readWhile(Pred done, std::chrono::milliseconds timeout) const {
        std::string out;
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!done(out) && std::chrono::steady_clock::now() < deadline) {
            struct pollfd p{outRead, POLLIN, 0};
            if (::poll(&p, 1, 20) > 0 && (p.revents & POLLIN)) {
                char buf[4096];
                ssize_t n = ::read(outRead, buf, sizeof(buf));
                if (n > 0) out.append(buf, static_cast<std::size_t>(n));
            }
        }
        return out;
    }
    std::string readUntil(const std::string& terminator, std::chrono::milliseconds timeout) const {
        return readWhile([&terminator](const std::string& s) { return s.find(terminator) != std::string::npos; }, timeout);
    }
    // One complete "Content-Length: N\r\n\r\n<body>" frame.
    std::string readContentLengthFrame(std::chrono::milliseconds timeout) const {
        return readWhile([](const std::string& s) {
            const auto sep = s.find("\r\n\r\n");
            if (s.rfind("Content-Length: ", 0) != 0 || sep == std::string::npos) return false;
            const std::size_t len = std::stoul(s.substr(16, sep - 16));
            return s.size() >= sep + 4 + len;
        }, timeout);
    }
};

StdioTransportOptions optionsFor(const Pipes& p, FramingMode mode = FramingMode::Newline) {
    StdioTransportOptions o;
    o.inputFd = p.inRead;
    o.outputFd = p.outWrite;
    o.framing = mode;
    return o;
}

std::unique_ptr<JSONRPCResponse> echoMethod(const JSONRPCRequest& req) {
    return std::make_unique<JSONRPCResponse>(req.id, MakeObject({{"method", JSONValue(req.method)}}));
}

} // namespace

TEST(StdioTransport, NewlineRequestGetsNewlineResponse) {
    Pipes p;
    ASSERT_TRUE(p.ok());
    StdioTransport t(optionsFor(p));
    t.SetRequestHandler(echoMethod);
    t.Start().get();

    ASSERT_TRUE(p.send(R"({"jsonrpc":"2.0","id":1,"method":"ping"})" "\n"));
    const std::string out = p.readUntil("\n", 2s);
    ASSERT_FALSE(out.empty());
    JSONRPCResponse resp;
    ASSERT_TRUE(resp.Deserialize(out.substr(0, out.find('\n'))));
    EXPECT_EQ(std::get<int64_t>(resp.id), 1);
    EXPECT_EQ(GetString(*resp.result, "method").value_or(""), "ping");
    t.Close().get();
}

TEST(StdioTransport, CloseWaitsForRunningRequests) {
    Pipes p;
    ASSERT_TRUE(p.ok());
    std::promise<void> started;
    std::atomic<bool> finished{false};
    {
        StdioTransport t(optionsFor(p));
        t.SetRequestHandler([&started, &finished](const JSONRPCRequest& req) {
            started.set_value();
            std::this_thread::sleep_for(3s);
            finished = true;
            return echoMethod(req);
        });
        t.Start().get();

        ASSERT_TRUE(p.send(R"({"jsonrpc":"2.0","id":"slow","method":"sleep"})" "\n"));
        ASSERT_EQ(started.get_future().wait_for(2s), std::future_status::ready);
        t.Close().get();
        EXPECT_TRUE(finished.load());
    }
    // The response was flushed before Close returned, and nothing touches the transport afterwards.
    const std::string out = p.readUntil("\n", 1s);
    JSONRPCResponse resp;
    ASSERT_TRUE(resp.Deserialize(out.substr(0, out.find('\n'))));
    EXPECT_EQ(IdToString(resp.id), "slow");
}

TEST(StdioTransport, ContentLengthInboundAndOutbound) {
    Pipes p;
    ASSERT_TRUE(p.ok());
    StdioTransport t(optionsFor(p, FramingMode::ContentLength));
    t.SetRequestHandler(echoMethod);
    t.Start().get();

    const std::string body = R"({"jsonrpc":"2.0","id":"cl","method":"tools/list"})";
    ASSERT_TRUE(p.send("Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body));
    const std::string out = p.readContentLengthFrame(2s);
    ASSERT_EQ(out.rfind("Content-Length: ", 0), 0u);
    const auto sep = out.find("\r\n\r\n");
    ASSERT_NE(sep, std::string::npos);
    JSONRPCResponse resp;
    ASSERT_TRUE(resp.Deserialize(out.substr(sep + 4)));
    EXPECT_EQ(std::get<std::string>(resp.id), "cl");
    t.Close().get();
}

TEST(StdioTransport, NotificationsReachHandler) {
    Pipes p;
    ASSERT_TRUE(p.ok());
    StdioTransport t(optionsFor(p));
    std::promise<std::string> got;
    t.SetNotificationHandler([&got](std::unique_ptr<JSONRPCNotification> n) { got.set_value(n->method); });
    t.Start().get();
    ASSERT_TRUE(p.send(R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"));
    auto fut = got.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "notifications/initialized");
    t.Close().get();
}

TEST(StdioTransport, InvalidMessageWithIdGetsInvalidRequest) {
    Pipes p;
    ASSERT_TRUE(p.ok());
    StdioTransport t(optionsFor(p));
    t.SetRequestHandler(echoMethod);
    t.Start().get();
    ASSERT_TRUE(p.send(R"({"jsonrpc":"2.0","id":5,"method":7})" "\n"));
    const std::string out = p.readUntil("\n", 2s);
    JSONRPCResponse resp;
    ASSERT_TRUE(resp.Deserialize(out.substr(0, out.find('\n'))));
    EXPECT_EQ(resp.ErrorCode(), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(std::get<int64_t>(resp.id), 5);
    t.Close().get();
}

TEST(StdioTransport, EofReportsErrorAndDisconnects) {
    Pipes p;
    ASSERT_TRUE(p.ok());
    StdioTransport t(optionsFor(p));
    std::promise<std::string> err;
    std::atomic<bool> once{false};
    t.SetErrorHandler([&](const std::string& e) { if (!once.exchange(true)) err.set_value(e); });
    t.Start().get();
    p.closeInput();
    auto fut = err.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "StdioTransport: EOF on input");
    const auto deadline = std::chrono::steady_clock::now() + 1s;
    while (t.IsConnected() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(t.IsConnected());
    t.Close().get();
}

TEST(StdioTransport, WriteQueueOverflowCloses) {
    Pipes p;
    ASSERT_TRUE(p.ok());
    StdioTransport t(optionsFor(p));
    std::promise<void> errPromise;
    std::atomic<bool> sawError{false};
    t.SetErrorHandler([&](const std::string&) { if (!sawError.exchange(true)) errPromise.set_value(); });
    t.SetWriteQueueMaxBytes(16);
    t.Start().get();

    t.SendNotification(std::make_unique<JSONRPCNotification>(
        "notifications/progress", MakeObject({{"data", JSONValue(std::string(128, 'x'))}}))).get();

    auto fut = errPromise.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(t.IsConnected());
    t.Close().get();
}

TEST(StdioTransport, CloseIsIdempotent) {
    Pipes p;
    ASSERT_TRUE(p.ok());
    StdioTransport t(optionsFor(p));
    t.Start().get();
    t.Close().get();
    EXPECT_NO_THROW(t.Close().get());
    EXPECT_FALSE(t.IsConnected());
}

TEST(StdioTransportHooks, ContentLengthBodyWithoutTrailingNewline) {
    StdioTransport t;
    std::vector<std::string> methods;
    t.SetNotificationHandler([&methods](std::unique_ptr<JSONRPCNotification> n) { methods.push_back(n->method); });
    const std::string body = R"({"jsonrpc":"2.0","method":"a"})";
    StdioTransportTestHooks::feedBytes(t, "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body.substr(0, 10));
    EXPECT_TRUE(methods.empty());
    StdioTransportTestHooks::feedBytes(t, body.substr(10));
    ASSERT_EQ(methods.size(), 1u);
    EXPECT_EQ(methods[0], "a");
    EXPECT_EQ(StdioTransportTestHooks::framerStats(t).bodies, 1u);

    StdioTransportTestHooks::feedBytes(t, R"({"jsonrpc":"2.0","method":"b"})" "\n");
    ASSERT_EQ(methods.size(), 2u);
    EXPECT_EQ(methods[1], "b");
}

TEST(StdioTransportFactory, ParsesKnownKeysAndIgnoresOthers) {
    StdioTransportFactory f;
    auto base = f.CreateTransport("content_length=1;max_message_bytes=2048;write_timeout_ms=250;colour=blue;frame_timeout_ms=x");
    auto* t = dynamic_cast<StdioTransport*>(base.get());
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->Options().framing, FramingMode::ContentLength);
    EXPECT_EQ(t->Options().maxMessageBytes, 2048u);
    EXPECT_EQ(t->Options().writeTimeout, 250ms);
    EXPECT_EQ(t->Options().frameTimeout, 30000ms);
    EXPECT_EQ(StdioTransportTestHooks::outboundMode(*t), FramingMode::ContentLength);
}

} // namespace toolrpc
