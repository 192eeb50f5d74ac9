//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: JSON-RPC message classification, envelope validation and request error boundary
//========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <memory>

#include "toolrpc/Transport.h"
#include "toolrpc/JSONRPCTypes.h"
#include "toolrpc/Protocol.h"

namespace toolrpc {

struct RouterHandlers {
    ITransport::RequestHandler requestHandler;
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;
};

using ResponseResolver = std::function<void(JSONRPCResponse&&)>;

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Invalid,     // well-formed JSON that is not a valid JSON-RPC 2.0 message
        Unparsable   // not JSON at all
    };

    //====================================================================================================
    // InboundMessage
    // Purpose: Result of parse(). Exactly one of request/notification/response is set for the matching
    //          kind. For Invalid messages with a recoverable id, errorReply holds a serialized
    //          InvalidRequest response.
    //====================================================================================================
    struct InboundMessage {
        MessageKind kind{MessageKind::Unparsable};
        std::unique_ptr<JSONRPCRequest> request;
        std::unique_ptr<JSONRPCNotification> notification;
        std::unique_ptr<JSONRPCResponse> response;
        std::optional<std::string> errorReply;
    };

    // Classify a JSON-RPC message without invoking handlers.
    virtual MessageKind classify(const std::string& json) = 0;

    // Parse and validate a message body.
    virtual InboundMessage parse(const std::string& json) = 0;

    //====================================================================================================
    // handleRequest
    // Purpose: Invokes the request handler inside the error boundary and returns the serialized response.
    // Notes:
    //   - Handler exceptions become InternalError "Internal error during request handling".
    //   - A response larger than the maximum message size is replaced by InternalError "Response too large".
    //====================================================================================================
    virtual std::string handleRequest(const JSONRPCRequest& request, const ITransport::RequestHandler& handler) = 0;

    // Synchronous parse + dispatch. Returns the payload to send back, if any.
    virtual std::optional<std::string> route(
        const std::string& json,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) = 0;
};

// Factory: returns the default router implementation
std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter(std::size_t maxMessageSize = DEFAULT_MAX_MESSAGE_SIZE);

} // namespace toolrpc
