//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_parser.cpp
// Purpose: Tests for the JSON value model, parser and serializer
//==========================================================================================================

#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "toolrpc/JSONRPCTypes.h"

namespace toolrpc {

TEST(JsonParser, ParsesScalars) {
    EXPECT_TRUE(ParseJSON("null").isNull());
    EXPECT_EQ(std::get<bool>(ParseJSON("true").value), true);
    EXPECT_EQ(std::get<int64_t>(ParseJSON("-42").value), -42);
    EXPECT_DOUBLE_EQ(std::get<double>(ParseJSON("2.5e1").value), 25.0);
    EXPECT_EQ(std::get<std::string>(ParseJSON("  \"hi\"  ").value), "hi");
}

TEST(JsonParser, IntegersStayIntegersAndLargeOnesBecomeDouble) {
    JSONValue big = ParseJSON("9223372036854775807");
    ASSERT_TRUE(big.isInteger());
    EXPECT_EQ(std::get<int64_t>(big.value), std::numeric_limits<int64_t>::max());

    JSONValue bigger = ParseJSON("92233720368547758070");
    EXPECT_FALSE(bigger.isInteger());
    EXPECT_TRUE(bigger.isNumber());
}

TEST(JsonParser, RejectsTrailingGarbage) {
    EXPECT_THROW(ParseJSON("{} x"), JSONParseError);
    EXPECT_THROW(ParseJSON("[1,2]]"), JSONParseError);
    JSONValue out{std::string("untouched")};
    EXPECT_FALSE(TryParseJSON("1 2", out));
    EXPECT_EQ(std::get<std::string>(out.value), "untouched");
}

TEST(JsonParser, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON(""), JSONParseError);
    EXPECT_THROW(ParseJSON("{"), JSONParseError);
    EXPECT_THROW(ParseJSON("{\"a\" 1}"), JSONParseError);
    EXPECT_THROW(ParseJSON("[1,]"), JSONParseError);
    EXPECT_THROW(ParseJSON("01"), JSONParseError);
    EXPECT_THROW(ParseJSON("\"tab\there\""), JSONParseError);
    EXPECT_THROW(ParseJSON("'single'"), JSONParseError);
}

TEST(JsonParser, ErrorCarriesOffset) {
    try {
        ParseJSON("[1, x]");
        FAIL() << "expected JSONParseError";
    } catch (const JSONParseError& e) {
        EXPECT_EQ(e.offset, 4u);
    }
}

TEST(JsonParser, DecodesEscapesAndSurrogatePairs) {
    JSONValue v = ParseJSON("\"a\\n\\u00e9\\ud83d\\ude00\"");
    EXPECT_EQ(std::get<std::string>(v.value), "a\n\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(JsonParser, LoneLowSurrogateBecomesReplacementCharacter) {
    JSONValue v = ParseJSON("\"\\udc00\"");
    EXPECT_EQ(std::get<std::string>(v.value), "\xEF\xBF\xBD");
}

TEST(JsonParser, RejectsExcessiveNesting) {
    std::string deep(300, '[');
    deep += std::string(300, ']');
    EXPECT_THROW(ParseJSON(deep), JSONParseError);
}

TEST(JsonSerializer, EscapesControlCharacters) {
    EXPECT_EQ(SerializeJSON(JSONValue{std::string("q\"\\\x01")}), "\"q\\\"\\\\\\u0001\"");
}

TEST(JsonSerializer, NonFiniteDoublesBecomeNull) {
    EXPECT_EQ(SerializeJSON(JSONValue{std::numeric_limits<double>::infinity()}), "null");
}

TEST(JsonSerializer, ParsedDocumentSurvivesReserialization) {
    const std::string text = R"({"a":[1,2.5,"x",null,true],"b":{"c":-7}})";
    JSONValue v = ParseJSON(text);
    EXPECT_EQ(ParseJSON(SerializeJSON(v)), v);
}

TEST(JsonValue, EqualityComparesNumbersByValue) {
    EXPECT_EQ(JSONValue{int64_t{3}}, JSONValue{3.0});
    EXPECT_NE(JSONValue{int64_t{3}}, JSONValue{3.5});
    EXPECT_NE(JSONValue{std::string("3")}, JSONValue{int64_t{3}});
}

TEST(JsonValue, MemberReadersCheckTypes) {
    JSONValue obj = MakeObject({{"s", JSONValue{"x"}}, {"n", JSONValue{int64_t{5}}}, {"b", JSONValue{true}}});
    EXPECT_EQ(GetString(obj, "s").value_or(""), "x");
    EXPECT_FALSE(GetString(obj, "n").has_value());
    EXPECT_EQ(GetInteger(obj, "n").value_or(0), 5);
    EXPECT_TRUE(GetBool(obj, "b").value_or(false));
    EXPECT_EQ(obj.find("missing"), nullptr);
}

TEST(JsonRpcEnvelope, RequestRoundTripKeepsIdType) {
    JSONRPCRequest req(int64_t{7}, "tools/list");
    JSONRPCRequest back;
    ASSERT_TRUE(back.Deserialize(req.Serialize()));
    ASSERT_TRUE(std::holds_alternative<int64_t>(back.id));
    EXPECT_EQ(std::get<int64_t>(back.id), 7);
    EXPECT_EQ(back.method, "tools/list");
    EXPECT_FALSE(back.params.has_value());
}

TEST(JsonRpcEnvelope, ResponseNeedsExactlyOneOfResultAndError) {
    JSONRPCResponse r;
    EXPECT_FALSE(r.Deserialize(R"({"jsonrpc":"2.0","id":1})"));
    EXPECT_FALSE(r.Deserialize(R"({"jsonrpc":"2.0","id":1,"result":{},"error":{}})"));
    ASSERT_TRUE(r.Deserialize(R"({"jsonrpc":"2.0","id":"a","error":{"code":-32601,"message":"Method not found: x"}})"));
    EXPECT_TRUE(r.IsError());
    EXPECT_EQ(r.ErrorCode(), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(r.ErrorMessage(), "Method not found: x");
}

TEST(JsonRpcEnvelope, IdHelpers) {
    EXPECT_EQ(IdToString(JSONRPCId{std::string("abc")}), "abc");
    EXPECT_EQ(IdToString(JSONRPCId{int64_t{12}}), "12");
    EXPECT_EQ(IdToString(JSONRPCId{nullptr}), "");
    EXPECT_FALSE(IdFromValue(JSONValue{1.5}).has_value());
    EXPECT_FALSE(IdFromValue(JSONValue{true}).has_value());
    EXPECT_TRUE(IsNullId(*IdFromValue(JSONValue{nullptr})));
}

TEST(JsonRpcEnvelope, CreateErrorObjectIncludesDataOnlyWhenGiven) {
    JSONValue e = CreateErrorObject(-32602, "bad");
    EXPECT_EQ(GetInteger(e, "code").value_or(0), -32602);
    EXPECT_EQ(e.find("data"), nullptr);
    JSONValue withData = CreateErrorObject(-32002, "Rate limit exceeded", MakeObject({{"resetTime", JSONValue{int64_t{10}}}}));
    ASSERT_NE(withData.find("data"), nullptr);
    EXPECT_EQ(GetInteger(*withData.find("data"), "resetTime").value_or(0), 10);
}

} // namespace toolrpc
