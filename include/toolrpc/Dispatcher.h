//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: JSON-RPC method table for the tool server
//==========================================================================================================

#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <string>

#include "toolrpc/JSONRPCTypes.h"
#include "toolrpc/Protocol.h"
#include "toolrpc/Transport.h"

namespace toolrpc {

class ToolRegistry;
class ResourceRegistry;
class PromptRegistry;
class AuditLog;
class CancellationRegistry;

namespace resilience {
class RateLimiter;
class CircuitBreaker;
class Retry;
}

//==========================================================================================================
// DispatcherContext
// Purpose: Collaborators owned by the caller (main or a test). They must outlive the Dispatcher.
//==========================================================================================================
struct DispatcherContext {
    ToolRegistry& tools;
    ResourceRegistry& resources;
    PromptRegistry& prompts;
    resilience::RateLimiter& rateLimiter;
    resilience::CircuitBreaker& circuitBreaker;
    const resilience::Retry& retry;
    const AuditLog& audit;
};

struct DispatcherOptions {
    Implementation serverInfo{"toolrpc-server", "1.0.0"};
    std::size_t maxMessageSize{DEFAULT_MAX_MESSAGE_SIZE};
    std::size_t cancellationCapacity{DEFAULT_CANCELLATION_CAPACITY};
};

//==========================================================================================================
// IDispatcher
// Purpose: What a transport adapter needs: a request entry point, a notification entry point and the
//          lifecycle of the transport it serves.
//==========================================================================================================
class IDispatcher {
public:
    virtual ~IDispatcher() = default;

    //==========================================================================================================
    // HandleRequest
    // Purpose: Dispatches one request through the method table.
    // Returns:
    //   Response carrying the request id; never null. Unknown methods yield MethodNotFound and uncaught
    //   failures InternalError "Internal error" (detail is logged only).
    // Notes:
    //   Safe to call concurrently from several threads.
    //==========================================================================================================
    virtual std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request) = 0;

    // Handles notifications/cancelled and notifications/initialized. Others are logged and ignored.
    virtual void HandleNotification(const JSONRPCNotification& notification) = 0;

    //==========================================================================================================
    // Start
    // Purpose: Takes ownership of transport, wires its handlers to this dispatcher and starts it.
    // Returns:
    //   The transport's Start() future.
    //==========================================================================================================
    virtual std::future<void> Start(std::unique_ptr<ITransport> transport) = 0;

    // Closes the owned transport, if any.
    virtual std::future<void> Stop() = 0;

    // Wires an acceptor (HTTP) without taking ownership.
    virtual void Attach(ITransportAcceptor& acceptor) = 0;
};

class Dispatcher : public IDispatcher {
public:
    Dispatcher(DispatcherContext context, DispatcherOptions options = {});
    ~Dispatcher() override;
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request) override;
    void HandleNotification(const JSONRPCNotification& notification) override;

    std::future<void> Start(std::unique_ptr<ITransport> transport) override;
    std::future<void> Stop() override;
    void Attach(ITransportAcceptor& acceptor) override;

    // Receives transport errors (EOF, write failure) after they are logged. Set before Start/Attach.
    void SetErrorHandler(ITransport::ErrorHandler handler);

    // True once initialize has succeeded.
    bool IsInitialized() const;

    // Caller identifier recorded by initialize ("anonymous" until then). One identifier is kept per
    // Dispatcher: with several clients on one acceptor the latest initialize wins, and it keys the
    // rate limiter and audit records for every client. Run one Dispatcher per client to separate them.
    std::string Actor() const;

    // Capabilities as advertised by initialize given the current registries.
    ServerCapabilities Capabilities() const;

    CancellationRegistry& Cancellations();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolrpc
