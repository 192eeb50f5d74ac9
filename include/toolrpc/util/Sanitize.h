//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Sanitize.h
// Purpose: Redaction and truncation helpers applied to everything that leaves the server (responses,
//          error strings, audit and log records)
//==========================================================================================================
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "toolrpc/JSONRPCTypes.h"

namespace toolrpc {
namespace sanitize {

constexpr const char* kRedacted = "[REDACTED]";
constexpr const char* kTruncatedSuffix = "... [truncated]";
constexpr std::size_t kMaxLogStringLength = 200;
constexpr std::size_t kDefaultValuePreview = 50;

// Key fragments that mark an object member as sensitive (compared case-insensitively, substring match).
const std::vector<std::string>& DefaultSensitiveKeys();

// Rejects keys that are commonly abused for prototype pollution in downstream JSON consumers.
bool IsSafeObjectKey(const std::string& key);

//==========================================================================================================
// RedactSensitive
// Purpose: Returns a copy of value where every object member whose key contains a sensitive fragment is
//          replaced by "[REDACTED]". Recurses through objects and arrays.
//==========================================================================================================
JSONValue RedactSensitive(const JSONValue& value,
                          const std::vector<std::string>& sensitiveKeys = DefaultSensitiveKeys());

// Replaces "api_key=...", "token: ...", "password=...", "secret=..." style assignments inside free text.
std::string RedactText(const std::string& text);

// Cuts text to at most maxBytes on a UTF-8 boundary and appends "... [truncated]" when cut.
std::string Truncate(const std::string& text, std::size_t maxBytes);

// Short preview of a value for audit digests: strings as-is, others JSON-encoded, capped at maxLength.
std::string SanitizeValue(const JSONValue& value, std::size_t maxLength = kDefaultValuePreview);

//==========================================================================================================
// SanitizeToolResult
// Purpose: Text returned to callers for a tool result. Strings are used as-is, other values JSON-encoded
//          after key redaction; credential assignments are redacted and the output capped at maxBytes.
//==========================================================================================================
std::string SanitizeToolResult(const JSONValue& result, std::size_t maxBytes);

// Redacts credentials from an exception message and caps it to kMaxLogStringLength.
std::string SanitizeErrorMessage(const std::string& message);

// Removes control characters and caps to kMaxLogStringLength. Empty input yields "[invalid name]".
std::string SanitizeName(const std::string& name);

// Like SanitizeName; URIs carrying credential query parameters or longer than 100 bytes are hashed.
std::string SanitizeUri(const std::string& uri);

// Caller identifier for audit and rate limiting. Session-like ids pass through, user-like ids
// ("user:" prefix or e-mail shape) are hashed, empty input yields "anonymous".
std::string SanitizeActorId(const std::string& actorId);

// Non-cryptographic 32-bit string hash rendered in base 36.
std::string HashBase36(const std::string& text);

} // namespace sanitize
} // namespace toolrpc
