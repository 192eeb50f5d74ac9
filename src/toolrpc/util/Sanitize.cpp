//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Sanitize.cpp
// Purpose: Redaction, truncation and identifier hashing
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <regex>

#include "toolrpc/util/Sanitize.h"

namespace toolrpc {
namespace sanitize {

namespace {
std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isSensitiveKey(const std::string& key, const std::vector<std::string>& lowered) {
    const std::string k = toLower(key);
    for (const auto& frag : lowered) {
        if (k.find(frag) != std::string::npos) return true;
    }
    return false;
}

JSONValue redactWith(const JSONValue& value, const std::vector<std::string>& lowered) {
    if (const auto* obj = std::get_if<JSONValue::Object>(&value.value)) {
        JSONValue::Object out;
        for (const auto& [k, v] : *obj) {
            if (isSensitiveKey(k, lowered)) {
                out[k] = MakeShared(JSONValue(kRedacted));
            } else {
                out[k] = MakeShared(v ? redactWith(*v, lowered) : JSONValue());
            }
        }
        return JSONValue(std::move(out));
    }
    if (const auto* arr = std::get_if<JSONValue::Array>(&value.value)) {
        JSONValue::Array out;
        out.reserve(arr->size());
        for (const auto& v : *arr) {
            out.push_back(MakeShared(v ? redactWith(*v, lowered) : JSONValue()));
        }
        return JSONValue(std::move(out));
    }
    return value;
}

// Strips ASCII control characters, DEL and UTF-8 encoded C1 controls (U+0080..U+009F).
std::string stripControl(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(in[i]);
        if (c < 0x20 || c == 0x7F) continue;
        if (c == 0xC2 && i + 1 < in.size()) {
            const unsigned char n = static_cast<unsigned char>(in[i + 1]);
            if (n >= 0x80 && n <= 0x9F) { ++i; continue; }
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

// Largest prefix length <= maxBytes that does not split a UTF-8 sequence.
std::size_t utf8Cut(const std::string& s, std::size_t maxBytes) {
    if (s.size() <= maxBytes) return s.size();
    std::size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return cut;
}

std::string capLength(const std::string& s, std::size_t maxBytes) {
    return s.substr(0, utf8Cut(s, maxBytes));
}

// Case-insensitive match of a lowercase word at pos; returns its length or 0.
std::size_t matchWord(const std::string& s, std::size_t pos, const char* word) {
    std::size_t n = 0;
    for (; word[n] != '\0'; ++n) {
        if (pos + n >= s.size() || std::tolower(static_cast<unsigned char>(s[pos + n])) != word[n]) return 0;
    }
    return n;
}

// api[_-]?key
std::size_t matchApiKey(const std::string& s, std::size_t pos) {
    const std::size_t api = matchWord(s, pos, "api");
    if (api == 0) return 0;
    std::size_t p = pos + api;
    if (p < s.size() && (s[p] == '_' || s[p] == '-')) {
        if (const std::size_t key = matchWord(s, p + 1, "key")) return p + 1 + key - pos;
        return 0;
    }
    const std::size_t key = matchWord(s, p, "key");
    return key ? p + key - pos : 0;
}

std::size_t matchToken(const std::string& s, std::size_t pos) { return matchWord(s, pos, "token"); }
std::size_t matchPassword(const std::string& s, std::size_t pos) { return matchWord(s, pos, "password"); }
std::size_t matchSecret(const std::string& s, std::size_t pos) { return matchWord(s, pos, "secret"); }

bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

// End of the value after the separator at sep (`\s*[^\s,}]+`), or npos when the value is empty.
std::size_t valueEnd(const std::string& s, std::size_t sep) {
    std::size_t p = sep + 1;
    while (p < s.size() && isSpace(s[p])) ++p;
    const std::size_t start = p;
    while (p < s.size() && !isSpace(s[p]) && s[p] != ',' && s[p] != '}') ++p;
    return p > start ? p : std::string::npos;
}

// End of `['":\s]*[=:]\s*[^\s,}]+` starting at pos, or npos. Tries separators right to left like a
// greedy matcher would.
std::size_t matchAssignment(const std::string& s, std::size_t pos) {
    std::size_t run = pos;
    while (run < s.size() && (s[run] == '\'' || s[run] == '"' || s[run] == ':' || isSpace(s[run]))) ++run;
    if (run < s.size() && s[run] == '=') {
        if (const std::size_t end = valueEnd(s, run); end != std::string::npos) return end;
    }
    for (std::size_t k = run; k > pos; --k) {
        if (s[k - 1] != ':') continue;
        if (const std::size_t end = valueEnd(s, k - 1); end != std::string::npos) return end;
    }
    return std::string::npos;
}

using KeywordMatcher = std::size_t (*)(const std::string&, std::size_t);

// Single left-to-right pass replacing each `<keyword><assignment>` with replacement.
std::string redactAssignments(const std::string& text, KeywordMatcher match, const char* replacement) {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (const std::size_t kw = match(text, i)) {
            const std::size_t end = matchAssignment(text, i + kw);
            if (end != std::string::npos) {
                out += replacement;
                i = end;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}
} // namespace

const std::vector<std::string>& DefaultSensitiveKeys() {
    static const std::vector<std::string> keys = {
        "password", "token", "apikey", "api_key", "secret", "auth", "credential", "key"
    };
    return keys;
}

bool IsSafeObjectKey(const std::string& key) {
    return key != "__proto__" && key != "constructor" && key != "prototype";
}

JSONValue RedactSensitive(const JSONValue& value, const std::vector<std::string>& sensitiveKeys) {
    std::vector<std::string> lowered;
    lowered.reserve(sensitiveKeys.size());
    for (const auto& k : sensitiveKeys) lowered.push_back(toLower(k));
    return redactWith(value, lowered);
}

std::string RedactText(const std::string& text) {
    std::string out = redactAssignments(text, matchApiKey, "api[REDACTED]");
    out = redactAssignments(out, matchToken, "token[REDACTED]");
    out = redactAssignments(out, matchPassword, "password[REDACTED]");
    out = redactAssignments(out, matchSecret, "secret[REDACTED]");
    return out;
}

std::string Truncate(const std::string& text, std::size_t maxBytes) {
    if (text.size() <= maxBytes) return text;
    return text.substr(0, utf8Cut(text, maxBytes)) + kTruncatedSuffix;
}

std::string SanitizeValue(const JSONValue& value, std::size_t maxLength) {
    if (const auto* s = std::get_if<std::string>(&value.value)) {
        return Truncate(*s, maxLength);
    }
    return Truncate(SerializeJSON(value), maxLength);
}

std::string SanitizeToolResult(const JSONValue& result, std::size_t maxBytes) {
    std::string text;
    if (const auto* s = std::get_if<std::string>(&result.value)) {
        text = *s;
    } else {
        text = SerializeJSON(RedactSensitive(result));
    }
    text = RedactText(text);
    if (text.size() > maxBytes) {
        const std::size_t suffix = std::char_traits<char>::length(kTruncatedSuffix);
        text = Truncate(text, maxBytes > suffix ? maxBytes - suffix : 0);
    }
    return text;
}

std::string SanitizeErrorMessage(const std::string& message) {
    // Capped before redaction.
    const std::string bounded = capLength(stripControl(message), 4 * kMaxLogStringLength);
    return capLength(RedactText(bounded), kMaxLogStringLength);
}

std::string SanitizeName(const std::string& name) {
    if (name.empty()) return "[invalid name]";
    return capLength(stripControl(name), kMaxLogStringLength);
}

std::string SanitizeUri(const std::string& uri) {
    if (uri.empty()) return "[invalid uri]";
    std::string s = capLength(stripControl(uri), kMaxLogStringLength);
    static const std::regex credentialParam(R"([?&](token|key|secret|auth|password|api[_-]?key)=)", std::regex::icase);
    if (s.size() > 100 || std::regex_search(s, credentialParam)) {
        return "[uri:" + HashBase36(s) + "]";
    }
    return s;
}

std::string SanitizeActorId(const std::string& actorId) {
    std::string s = capLength(stripControl(actorId), kMaxLogStringLength);
    if (s.empty()) return "anonymous";
    static const std::regex sessionLike(R"(^[a-f0-9-]{20,}$)", std::regex::icase);
    if (std::regex_match(s, sessionLike) || s.rfind("session:", 0) == 0 || s.rfind("sess:", 0) == 0) {
        return s;
    }
    static const std::regex emailLike(R"(^[a-zA-Z0-9._-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)");
    if (s.rfind("user:", 0) == 0 || std::regex_match(s, emailLike)) {
        return "user:" + HashBase36(s);
    }
    return s;
}

std::string HashBase36(const std::string& text) {
    std::uint32_t h = 0;
    for (unsigned char c : text) {
        h = (h << 5) - h + c;
    }
    const std::int32_t signedHash = static_cast<std::int32_t>(h);
    std::uint64_t mag = signedHash < 0 ? static_cast<std::uint64_t>(-static_cast<std::int64_t>(signedHash))
                                       : static_cast<std::uint64_t>(signedHash);
    if (mag == 0) return "0";
    static const char* digits = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string out;
    while (mag > 0) {
        out.push_back(digits[mag % 36]);
        mag /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace sanitize
} // namespace toolrpc
