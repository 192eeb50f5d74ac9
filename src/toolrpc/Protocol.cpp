//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Capability serialization
//==========================================================================================================

#include "toolrpc/Protocol.h"

namespace toolrpc {

JSONValue SerializeServerCapabilities(const ServerCapabilities& caps) {
    JSONValue::Object o;
    if (caps.tools) {
        o["tools"] = MakeShared(MakeObject({{"listChanged", JSONValue(caps.tools->listChanged)}}));
    }
    if (caps.resources) {
        o["resources"] = MakeShared(MakeObject({
            {"subscribe", JSONValue(caps.resources->subscribe)},
            {"listChanged", JSONValue(caps.resources->listChanged)}
        }));
    }
    if (caps.prompts) {
        o["prompts"] = MakeShared(MakeObject({{"listChanged", JSONValue(caps.prompts->listChanged)}}));
    }
    if (caps.logging) {
        o["logging"] = MakeShared(JSONValue(JSONValue::Object{}));
    }
    return JSONValue(std::move(o));
}

} // namespace toolrpc
