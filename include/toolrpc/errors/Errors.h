//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, exception types and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "toolrpc/JSONRPCTypes.h"

namespace toolrpc {
namespace errors {

// Categorization of JSON-RPC and application error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    ToolNotFound,
    ToolExecution,
    ResourceNotFound,
    PromptNotFound,
    NotSupported,
    Cancelled,
    Unknown
};

// Typed error representation carried on the wire.
struct RpcError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or application-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::ToolNotFound;
        case JSONRPCErrorCodes::ToolExecutionError: return ErrorCategory::ToolExecution;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::ResourceNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::PromptNotFound;
        case JSONRPCErrorCodes::SamplingNotSupported:
        case JSONRPCErrorCodes::RootsNotSupported:
        case JSONRPCErrorCodes::ElicitationNotSupported: return ErrorCategory::NotSupported;
        case JSONRPCErrorCodes::RequestCancelled: return ErrorCategory::Cancelled;
        default: return ErrorCategory::Unknown;
    }
}

// Build an RpcError with its category filled in.
inline RpcError makeRpcError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    RpcError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to RpcError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<RpcError> rpcErrorFromErrorValue(const JSONValue& errVal) {
    auto code = GetInteger(errVal, "code");
    auto message = GetString(errVal, "message");
    if (!code || !message) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = errVal.find("data")) {
        data = *d;
    }
    return makeRpcError(static_cast<int>(*code), *message, std::move(data));
}

// Extract RpcError from a JSONRPCResponse if it carries an error.
inline std::optional<RpcError> rpcErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return rpcErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed RpcError.
inline JSONValue makeErrorValue(const RpcError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from RpcError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const RpcError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// Exception hierarchy
// Purpose: Thrown at registration/configuration time and by registry lookups. Never sent to callers verbatim.
//==========================================================================================================
class ToolRpcError : public std::runtime_error {
public:
    explicit ToolRpcError(const std::string& what) : std::runtime_error(what) {}
};

// Invalid configuration or registration input. Fatal at startup.
class ConfigurationError : public ToolRpcError {
public:
    explicit ConfigurationError(const std::string& what) : ToolRpcError(what) {}
};

class ToolNotFoundError : public ToolRpcError {
public:
    explicit ToolNotFoundError(const std::string& toolName)
        : ToolRpcError("Tool not found: " + toolName), tool(toolName) {}
    std::string tool;
};

// Wraps a failure raised by a tool executor. The original message is kept for server-side logs.
class ToolExecutionError : public ToolRpcError {
public:
    ToolExecutionError(const std::string& toolName, const std::string& detail)
        : ToolRpcError("Tool '" + toolName + "' failed: " + detail), tool(toolName) {}
    std::string tool;
};

class ResourceNotFoundError : public ToolRpcError {
public:
    explicit ResourceNotFoundError(const std::string& uri) : ToolRpcError("Resource not found: " + uri), uri(uri) {}
    std::string uri;
};

class PromptNotFoundError : public ToolRpcError {
public:
    explicit PromptNotFoundError(const std::string& name) : ToolRpcError("Prompt not found: " + name), name(name) {}
    std::string name;
};

// Raised by ToolRegistry::Execute when arguments do not satisfy the tool's schema.
class ValidationError : public ToolRpcError {
public:
    explicit ValidationError(const std::string& what) : ToolRpcError(what) {}
};

} // namespace errors
} // namespace toolrpc
