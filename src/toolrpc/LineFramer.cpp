//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.cpp
// Purpose: Content-Length / newline inbound framing state machine
//========================================================================================================

#include <cctype>
#include <limits>
#include <stdexcept>

#include "logging/Logger.h"
#include "toolrpc/LineFramer.h"

namespace toolrpc {

namespace {
constexpr const char* kHeaderName = "content-length:";

bool isBlank(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

bool startsWithHeaderName(const std::string& line) {
    const std::size_t n = std::char_traits<char>::length(kHeaderName);
    if (line.size() < n) return false;
    for (std::size_t k = 0; k < n; ++k) {
        if (std::tolower(static_cast<unsigned char>(line[k])) != kHeaderName[k]) return false;
    }
    return true;
}
} // namespace

LineFramer::LineFramer() : LineFramer(Options{}) {}

LineFramer::LineFramer(Options opts) : opts_(opts) {}

std::optional<std::uint64_t> LineFramer::ParseContentLengthHeader(const std::string& line) {
    if (!startsWithHeaderName(line)) {
        return std::nullopt;
    }
    std::size_t i = std::char_traits<char>::length(kHeaderName);
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    const std::size_t digitsBegin = i;
    while (i < line.size() && std::isdigit(static_cast<unsigned char>(line[i]))) ++i;
    const std::size_t digitsEnd = i;
    if (digitsEnd == digitsBegin) {
        return std::nullopt;
    }
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    if (i != line.size()) {
        return std::nullopt;
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(line.substr(digitsBegin, digitsEnd - digitsBegin)));
    } catch (const std::out_of_range&) {
        return std::numeric_limits<std::uint64_t>::max();
    }
}

void LineFramer::Reset() {
    expected_.reset();
    buffer_.clear();
    startedAt_ = Clock::time_point{};
}

bool LineFramer::Expire(Clock::time_point now) {
    if (!expected_.has_value()) {
        return false;
    }
    if (now - startedAt_ <= opts_.frameTimeout) {
        return false;
    }
    LOG_WARN("Discarding partial frame after {} ms timeout ({} of {} bytes buffered)",
             opts_.frameTimeout.count(), buffer_.size(), *expected_);
    ++stats_.timedOut;
    Reset();
    return true;
}

std::vector<std::string> LineFramer::Feed(const std::string& line, Clock::time_point now) {
    std::vector<std::string> out;
    feedOne(line, now, out, 0);
    return out;
}

void LineFramer::feedOne(const std::string& line, Clock::time_point now, std::vector<std::string>& out, int depth) {
    Expire(now);

    auto header = ParseContentLengthHeader(line);
    if (header.has_value()) {
        if (expected_.has_value()) {
            LOG_WARN("Content-Length header received while {} bytes pending; discarding partial frame", buffer_.size());
            ++stats_.resetByHeader;
            Reset();
        }
        if (*header > static_cast<std::uint64_t>(opts_.maxMessageSize)) {
            LOG_WARN("Content-Length {} exceeds maximum message size {}; frame dropped", *header, opts_.maxMessageSize);
            ++stats_.oversizeDropped;
            Reset();
            return;
        }
        expected_ = static_cast<std::size_t>(*header);
        startedAt_ = now;
        buffer_.clear();
        if (*expected_ == 0) {
            ++stats_.bodies;
            Reset();
            out.emplace_back();
        }
        return;
    }

    if (expected_.has_value()) {
        if (buffer_.empty() && isBlank(line)) {
            // Header/body separator
            return;
        }
        buffer_.append(line);
        buffer_.push_back('\n');
        if (buffer_.size() < *expected_) {
            return;
        }
        std::string body = buffer_.substr(0, *expected_);
        std::string rest = buffer_.substr(*expected_);
        Reset();
        ++stats_.bodies;
        out.push_back(std::move(body));
        if (!rest.empty() && rest.back() == '\n') rest.pop_back();
        if (!isBlank(rest) && depth < 8) {
            feedOne(rest, now, out, depth + 1);
        }
        return;
    }

    if (isBlank(line)) {
        return;
    }
    if (line.size() > opts_.maxMessageSize) {
        LOG_WARN("Unframed message of {} bytes exceeds maximum message size {}; dropped", line.size(), opts_.maxMessageSize);
        ++stats_.oversizeDropped;
        return;
    }
    ++stats_.bodies;
    out.push_back(line);
}

} // namespace toolrpc
