//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-memory transport for tests and embedding
//==========================================================================================================
#pragma once

#include "toolrpc/Transport.h"
#include <memory>
#include <string>
#include <utility>

namespace toolrpc {

//==========================================================================================================
// InMemoryTransport
// Purpose: In-process transport that delivers serialized messages to a paired instance. One end is wired to
//          a Dispatcher, the other plays the client through SendRequest/SendNotification/SendRaw.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    ~InMemoryTransport() override;

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two paired transports wired to each other in-memory.
    // Returns:
    //   pair(left,right) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;

    // Closes the transport and fails pending requests with InternalError "Transport closed".
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;

    ////////////////////////////////////////// Client side //////////////////////////////////////////
    //==========================================================================================================
    // Sends a JSON-RPC request to the paired transport and returns its response. A null or empty id is
    // replaced by a generated one.
    //==========================================================================================================
    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(std::unique_ptr<JSONRPCRequest> request);

    // Delivers arbitrary text to the peer as one message body.
    bool SendRaw(const std::string& body);

    // Called for every message body the peer sends that does not resolve a pending request.
    using RawHandler = std::function<void(const std::string&)>;
    void SetRawMessageHandler(RawHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

class InMemoryTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace toolrpc
