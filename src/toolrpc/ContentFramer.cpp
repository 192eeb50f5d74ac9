//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.cpp
// Purpose: Content-Length and newline framers for the stdio transport
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <string>

#include "toolrpc/ContentFramer.h"

namespace toolrpc {

namespace {
class ContentLengthFramer : public IContentFramer {
public:
    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }
    FramingMode mode() const override { return FramingMode::ContentLength; }
};

class NewlineFramer : public IContentFramer {
public:
    std::string encode(const std::string& payload) override {
        std::string frame; frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }
    FramingMode mode() const override { return FramingMode::Newline; }
};
} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer() {
    return std::make_unique<ContentLengthFramer>();
}

std::unique_ptr<IContentFramer> MakeNewlineFramer() {
    return std::make_unique<NewlineFramer>();
}

std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode) {
    if (mode == FramingMode::ContentLength) {
        return MakeContentLengthFramer();
    }
    return MakeNewlineFramer();
}

FramingMode FramingModeFromString(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (v == "content-length" || v == "content_length" || v == "1" || v == "true") {
        return FramingMode::ContentLength;
    }
    return FramingMode::Newline;
}

} // namespace toolrpc
