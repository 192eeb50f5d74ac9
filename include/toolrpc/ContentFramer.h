//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Outbound message framing for stream transports (Content-Length or newline-delimited)
//========================================================================================================

#pragma once

#include <string>
#include <memory>

namespace toolrpc {

enum class FramingMode {
    Newline,
    ContentLength
};

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    // Wraps one serialized JSON-RPC message for the wire.
    virtual std::string encode(const std::string& payload) = 0;
    virtual FramingMode mode() const = 0;
};

// Content-Length: N\r\n\r\n<payload>
std::unique_ptr<IContentFramer> MakeContentLengthFramer();
// <payload>\n
std::unique_ptr<IContentFramer> MakeNewlineFramer();
std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode);

// Parses "content-length"/"newline" (also "1"/"0"); anything else is Newline.
FramingMode FramingModeFromString(const std::string& s);

} // namespace toolrpc
