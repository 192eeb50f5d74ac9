//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol versions, capability structures and method names served by the dispatcher
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <array>
#include <cstddef>
#include <string>
#include <optional>

namespace toolrpc {
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Primary protocol version; returned when a client asks for one we do not support.
constexpr const char* PROTOCOL_VERSION = "2025-11-25";

// Every version a client may negotiate. A supported request is echoed back unchanged.
constexpr std::array<const char*, 3> SUPPORTED_PROTOCOL_VERSIONS = {
    "2024-11-05",
    "2025-06-18",
    "2025-11-25"
};

// Upper bound for one inbound frame and one outbound response (10 MiB).
constexpr std::size_t DEFAULT_MAX_MESSAGE_SIZE = 10u * 1024u * 1024u;

// Capacity of the in-flight cancellation map.
constexpr std::size_t DEFAULT_CANCELLATION_CAPACITY = 1000;

inline bool IsSupportedProtocolVersion(const std::string& v) {
    for (const char* s : SUPPORTED_PROTOCOL_VERSIONS) {
        if (v == s) return true;
    }
    return false;
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct PromptsCapability {
    bool listChanged = false;
};

struct LoggingCapability {
    // Presence indicates structured logging is available
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    std::optional<PromptsCapability> prompts;
    std::optional<LoggingCapability> logging;
};

// Serialize capabilities into the shape returned by initialize.
JSONValue SerializeServerCapabilities(const ServerCapabilities& caps);

///////////////////////////////////////// Methods ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";

    // Client-side features; always answered with a not-supported error
    constexpr const char* SamplingCreate = "sampling/create";
    constexpr const char* RootsList = "roots/list";
    constexpr const char* RootsRead = "roots/read";
    constexpr const char* ElicitationElicit = "elicitation/elicit";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* Progress = "notifications/progress";
}

} // namespace toolrpc
