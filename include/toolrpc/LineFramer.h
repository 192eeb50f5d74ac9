//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.h
// Purpose: Inbound frame assembly from a line-oriented byte stream
//========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "toolrpc/Protocol.h"

namespace toolrpc {

//========================================================================================================
// LineFramer
// Purpose: Turns input lines (without their trailing '\n') into complete message bodies.
// Notes:
//   - A line matching "Content-Length: N" (case-insensitive) starts length-prefixed accumulation. Later
//     lines are appended with '\n' until N bytes are buffered; the body is the first N bytes and any
//     non-blank remainder is treated as a fresh line.
//   - Any other non-blank line outside accumulation is a complete newline-delimited body.
//   - A pending accumulation older than frameTimeout is discarded; a new header while pending discards
//     the old state. Declared lengths above maxMessageSize are refused.
//   - Not thread-safe; owned by one reader thread.
//========================================================================================================
class LineFramer {
public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        std::size_t maxMessageSize{DEFAULT_MAX_MESSAGE_SIZE};
        std::chrono::milliseconds frameTimeout{30000};
    };

    struct Stats {
        std::uint64_t bodies{0};
        std::uint64_t oversizeDropped{0};
        std::uint64_t timedOut{0};
        std::uint64_t resetByHeader{0};
    };

    LineFramer();
    explicit LineFramer(Options opts);

    //====================================================================================================
    // Feed
    // Purpose: Consumes one line and returns the bodies it completed (usually zero or one).
    // Args:
    //   line: Line content without the terminating '\n'. A trailing '\r' is tolerated.
    //   now: Current time; tests pass a synthetic clock.
    //====================================================================================================
    std::vector<std::string> Feed(const std::string& line, Clock::time_point now = Clock::now());

    // Discards a pending accumulation older than frameTimeout. Returns true when something was discarded.
    bool Expire(Clock::time_point now = Clock::now());

    bool IsPending() const { return expected_.has_value(); }
    std::size_t PendingBytes() const { return buffer_.size(); }
    // Bytes still needed to complete the pending body; 0 when nothing is pending.
    std::size_t RemainingBytes() const {
        return (expected_ && *expected_ > buffer_.size()) ? *expected_ - buffer_.size() : 0;
    }
    const Stats& GetStats() const { return stats_; }
    const Options& GetOptions() const { return opts_; }
    void Reset();

    // Returns N when the line is a Content-Length header; values too large for uint64 yield UINT64_MAX.
    static std::optional<std::uint64_t> ParseContentLengthHeader(const std::string& line);

private:
    void feedOne(const std::string& line, Clock::time_point now, std::vector<std::string>& out, int depth);

    Options opts_;
    std::optional<std::size_t> expected_;
    std::string buffer_;
    Clock::time_point startedAt_{};
    Stats stats_;
};

} // namespace toolrpc
