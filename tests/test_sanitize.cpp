//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_sanitize.cpp
// Purpose: Tests for redaction, truncation and identifier hashing
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "toolrpc/util/Sanitize.h"

namespace toolrpc {
namespace sanitize {

TEST(Sanitize, RedactsSensitiveKeysRecursively) {
    JSONValue v = ParseJSON(R"({"outer":{"apiKey":"v","list":[{"Token":"t","n":1}]},"name":"ok"})");
    JSONValue r = RedactSensitive(v);
    const JSONValue* outer = r.find("outer");
    ASSERT_NE(outer, nullptr);
    EXPECT_EQ(GetString(*outer, "apiKey").value_or(""), "[REDACTED]");
    const auto& list = std::get<JSONValue::Array>(outer->find("list")->value);
    EXPECT_EQ(GetString(*list[0], "Token").value_or(""), "[REDACTED]");
    EXPECT_EQ(GetInteger(*list[0], "n").value_or(0), 1);
    EXPECT_EQ(GetString(r, "name").value_or(""), "ok");
}

TEST(Sanitize, RedactsCredentialAssignmentsInText) {
    EXPECT_EQ(RedactText("connect failed: api_key=abc123 retrying"), "connect failed: api[REDACTED] retrying");
    EXPECT_EQ(RedactText("password: hunter2"), "password[REDACTED]");
    EXPECT_EQ(RedactText("nothing to hide"), "nothing to hide");
}

TEST(Sanitize, RedactionHandlesMegabyteValues) {
    const std::string secret(1 << 20, 'a');
    EXPECT_EQ(SanitizeToolResult(JSONValue("token=" + secret), 10 * 1024 * 1024), "token[REDACTED]");
    EXPECT_EQ(RedactText("{\"apiKey\": \"" + secret + "\", \"n\": 1}"), "{\"api[REDACTED], \"n\": 1}");
    EXPECT_EQ(SanitizeErrorMessage("secret=" + secret), "secret[REDACTED]");

    const std::string spaces = "token:" + std::string(1 << 20, ' ') + ",";
    EXPECT_EQ(RedactText(spaces), spaces);
}

TEST(Sanitize, RedactionKeepsSurroundingText) {
    EXPECT_EQ(RedactText(R"({"token":"abc","user":"bob"})"), R"({"token[REDACTED],"user":"bob"})");
    EXPECT_EQ(RedactText("API-KEY = k1 and Secret:s2"), "api[REDACTED] and secret[REDACTED]");
    EXPECT_EQ(RedactText("token= , next"), "token= , next");
}

TEST(Sanitize, TruncateRespectsUtf8Boundaries) {
    EXPECT_EQ(Truncate("short", 10), "short");
    EXPECT_EQ(Truncate("h\xC3\xA9llo", 2), std::string("h") + kTruncatedSuffix);
}

TEST(Sanitize, ToolResultIsCappedIncludingSuffix) {
    std::string big(100, 'a');
    std::string out = SanitizeToolResult(JSONValue(big), 40);
    EXPECT_EQ(out.size(), 40u);
    EXPECT_NE(out.find(kTruncatedSuffix), std::string::npos);

    std::string obj = SanitizeToolResult(ParseJSON(R"({"password":"hunter2","n":1})"), 1000);
    EXPECT_EQ(obj.find("hunter2"), std::string::npos);
    EXPECT_NE(obj.find("[REDACTED]"), std::string::npos);
}

TEST(Sanitize, ErrorMessagesAndNames) {
    EXPECT_EQ(SanitizeErrorMessage("bad\ttoken=xyz"), "badtoken[REDACTED]");
    EXPECT_EQ(SanitizeErrorMessage(std::string(500, 'e')).size(), kMaxLogStringLength);
    EXPECT_EQ(SanitizeName(""), "[invalid name]");
    EXPECT_EQ(SanitizeName("ab\ncd"), "abcd");
}

TEST(Sanitize, UrisWithCredentialsAreHashed) {
    EXPECT_EQ(SanitizeUri("toolrpc://server/info"), "toolrpc://server/info");
    const std::string hidden = SanitizeUri("https://api.example.com/x?token=abc");
    EXPECT_EQ(hidden.rfind("[uri:", 0), 0u);
    EXPECT_EQ(hidden.find("abc"), std::string::npos);
    EXPECT_EQ(SanitizeUri(""), "[invalid uri]");
}

TEST(Sanitize, ActorIds) {
    EXPECT_EQ(SanitizeActorId(""), "anonymous");
    EXPECT_EQ(SanitizeActorId("session:42"), "session:42");
    EXPECT_EQ(SanitizeActorId("worker-7"), "worker-7");
    const std::string user = SanitizeActorId("alice@example.com");
    EXPECT_EQ(user.rfind("user:", 0), 0u);
    EXPECT_EQ(user.find("alice"), std::string::npos);
}

TEST(Sanitize, HashBase36IsStable) {
    EXPECT_EQ(HashBase36(""), "0");
    EXPECT_EQ(HashBase36("a"), "2p");
    EXPECT_EQ(HashBase36("same"), HashBase36("same"));
}

TEST(Sanitize, UnsafeObjectKeys) {
    EXPECT_FALSE(IsSafeObjectKey("__proto__"));
    EXPECT_FALSE(IsSafeObjectKey("constructor"));
    EXPECT_TRUE(IsSafeObjectKey("name"));
}

} // namespace sanitize
} // namespace toolrpc
