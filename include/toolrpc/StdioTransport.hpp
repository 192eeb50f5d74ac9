//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Line-oriented stdio transport (newline-delimited or Content-Length framed JSON-RPC)
//==========================================================================================================
#pragma once

#include "toolrpc/ContentFramer.h"
#include "toolrpc/LineFramer.h"
#include "toolrpc/Transport.h"
#include <chrono>
#include <cstdint>
#include <memory>

namespace toolrpc {

struct StdioTransportOptions {
    int inputFd{0};                                     // stdin
    int outputFd{1};                                    // stdout
    FramingMode framing{FramingMode::Newline};          // outbound framing
    std::size_t maxMessageBytes{DEFAULT_MAX_MESSAGE_SIZE};
    std::chrono::milliseconds frameTimeout{30000};
    std::chrono::milliseconds idleReadTimeout{0};       // 0 = disabled
    std::chrono::milliseconds writeTimeout{0};          // 0 = disabled
    std::size_t writeQueueMaxBytes{16u * 1024u * 1024u};
};

//==========================================================================================================
// StdioTransport
// Purpose: JSON-RPC server transport over a pair of file descriptors (stdin/stdout by default).
// Notes:
//   - A reader thread splits input into lines and runs them through LineFramer, so both framings are
//     accepted inbound regardless of the outbound mode.
//   - Each request is handled on its own detached thread; responses are written in completion order.
//   - Notifications (including cancellations) are handled on the reader thread.
//   - A writer thread drains a bounded queue; overflow reports an error and disconnects.
//   - EOF or a read error marks the transport disconnected; Close() then drains pending writes.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    StdioTransport();
    explicit StdioTransport(StdioTransportOptions options);
    ~StdioTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the reader, waits for dispatched requests to finish, flushes queued frames and joins the threads.
    // The descriptors are left open; they belong to the caller.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    void SetIdleReadTimeoutMs(uint64_t timeoutMs);

    //==========================================================================================================
    // SetWriteQueueMaxBytes
    // Purpose: Backpressure clamp for pending write buffers.
    // Args:
    //   maxBytes: Maximum allowed bytes in write queue before emitting an error and closing.
    //==========================================================================================================
    void SetWriteQueueMaxBytes(std::size_t maxBytes);

    void SetWriteTimeoutMs(uint64_t timeoutMs);

    const StdioTransportOptions& Options() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct StdioTransportTestHooks;
};

//==========================================================================================================
// StdioTransportFactory
// Purpose: Builds a stdio transport from "key=value;..." where keys are content_length,
//          max_message_bytes, frame_timeout_ms, idle_read_timeout_ms, write_timeout_ms and
//          write_queue_max_bytes. Unknown keys and malformed values are logged and ignored.
//==========================================================================================================
class StdioTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

struct StdioTransportTestHooks {
    // Runs bytes through the same line splitting, framing and routing the reader thread uses.
    static void feedBytes(StdioTransport& t, const std::string& bytes);
    static void setConnected(StdioTransport& t, bool v);
    static bool isConnected(const StdioTransport& t);
    static LineFramer::Stats framerStats(const StdioTransport& t);
    static std::size_t queuedBytes(const StdioTransport& t);
    static FramingMode outboundMode(const StdioTransport& t);
};

} // namespace toolrpc
