//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC message routing
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "toolrpc/JsonRpcMessageRouter.h"
#include "toolrpc/JSONRPCTypes.h"

namespace toolrpc {

namespace {
constexpr const char* kHandlerFailure = "Internal error during request handling";
constexpr const char* kResponseTooLarge = "Response too large";

class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    explicit JsonRpcMessageRouter(std::size_t maxSize) : maxMessageSize(maxSize) {}

    MessageKind classify(const std::string& json) override {
        JSONValue v;
        if (!TryParseJSON(json, v)) {
            return MessageKind::Unparsable;
        }
        return classifyValue(v);
    }

    InboundMessage parse(const std::string& json) override {
        InboundMessage msg;
        JSONValue v;
        if (!TryParseJSON(json, v)) {
            msg.kind = MessageKind::Unparsable;
            return msg;
        }
        msg.kind = classifyValue(v);
        switch (msg.kind) {
            case MessageKind::Response: {
                auto r = std::make_unique<JSONRPCResponse>();
                if (r->FromValue(v)) {
                    msg.response = std::move(r);
                } else {
                    msg.kind = MessageKind::Invalid;
                }
                break;
            }
            case MessageKind::Request: {
                auto r = std::make_unique<JSONRPCRequest>();
                if (r->FromValue(v)) {
                    msg.request = std::move(r);
                } else {
                    msg.kind = MessageKind::Invalid;
                }
                break;
            }
            case MessageKind::Notification: {
                auto n = std::make_unique<JSONRPCNotification>();
                if (n->FromValue(v)) {
                    msg.notification = std::move(n);
                } else {
                    msg.kind = MessageKind::Invalid;
                }
                break;
            }
            default:
                break;
        }
        if (msg.kind == MessageKind::Invalid) {
            auto id = recoverId(v);
            if (id.has_value()) {
                msg.errorReply = CreateErrorResponse(*id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->Serialize();
            }
        }
        return msg;
    }

    std::string handleRequest(const JSONRPCRequest& request, const ITransport::RequestHandler& handler) override {
        std::unique_ptr<JSONRPCResponse> resp;
        try {
            if (handler) {
                resp = handler(request);
            }
            if (!resp) {
                LOG_ERROR("Request handler returned no response for method {}", request.method);
                resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, kHandlerFailure);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Request handler exception for method {}: {}", request.method, e.what());
            resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, kHandlerFailure);
        } catch (...) {
            LOG_ERROR("Request handler threw a non-standard exception for method {}", request.method);
            resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, kHandlerFailure);
        }
        resp->id = request.id;
        std::string payload = resp->Serialize();
        if (payload.size() > maxMessageSize) {
            LOG_WARN("Response for method {} is {} bytes, above limit {}; replaced with error",
                     request.method, payload.size(), maxMessageSize);
            payload = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, kResponseTooLarge)->Serialize();
        }
        return payload;
    }

    std::optional<std::string> route(
        const std::string& json,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) override {
        InboundMessage msg = parse(json);
        switch (msg.kind) {
            case MessageKind::Request:
                return handleRequest(*msg.request, handlers.requestHandler);
            case MessageKind::Notification:
                if (handlers.notificationHandler) {
                    handlers.notificationHandler(std::move(msg.notification));
                }
                return std::nullopt;
            case MessageKind::Response:
                if (resolve) {
                    resolve(std::move(*msg.response));
                }
                return std::nullopt;
            case MessageKind::Invalid:
                LOG_WARN("Router: invalid JSON-RPC message{}", msg.errorReply ? "" : " without id; dropped");
                if (handlers.errorHandler) {
                    handlers.errorHandler("Router: invalid JSON-RPC message");
                }
                return msg.errorReply;
            case MessageKind::Unparsable:
            default:
                LOG_DEBUG("Router: dropping unparsable message ({} bytes)", json.size());
                return std::nullopt;
        }
    }

private:
    static MessageKind classifyValue(const JSONValue& v) {
        if (!v.isObject()) {
            return MessageKind::Invalid;
        }
        const JSONValue* method = v.find("method");
        if (method == nullptr) {
            if (v.find("result") || v.find("error")) {
                return MessageKind::Response;
            }
            return MessageKind::Invalid;
        }
        auto ver = GetString(v, "jsonrpc");
        if (!ver || *ver != "2.0" || !method->isString()) {
            return MessageKind::Invalid;
        }
        const JSONValue* id = v.find("id");
        if (id == nullptr || id->isNull()) {
            return MessageKind::Notification;
        }
        if (!id->isString() && !id->isInteger()) {
            return MessageKind::Invalid;
        }
        return MessageKind::Request;
    }

    // Only string or integer ids are echoed; anything else means there is nobody to answer.
    static std::optional<JSONRPCId> recoverId(const JSONValue& v) {
        const JSONValue* id = v.find("id");
        if (id == nullptr || id->isNull()) {
            return std::nullopt;
        }
        if (id->isString() || id->isInteger()) {
            return IdFromValue(*id);
        }
        return std::nullopt;
    }

    std::size_t maxMessageSize;
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter(std::size_t maxMessageSize) {
    return std::make_unique<JsonRpcMessageRouter>(maxMessageSize);
}

} // namespace toolrpc
