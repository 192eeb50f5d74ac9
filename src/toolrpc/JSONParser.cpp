//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Strict recursive-descent JSON parser, serializer and JSON-RPC message conversions
//==========================================================================================================

#include <cctype>
#include <cmath>
#include <format>
#include <limits>
#include <sstream>
#include "toolrpc/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace toolrpc {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int v) : value(static_cast<int64_t>(v)) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

const JSONValue* JSONValue::find(const std::string& key) const {
    const auto* obj = std::get_if<Object>(&value);
    if (!obj) return nullptr;
    auto it = obj->find(key);
    if (it == obj->end() || !it->second) return nullptr;
    return it->second.get();
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.isNumber() && b.isNumber()) {
        if (a.isInteger() && b.isInteger()) {
            return std::get<int64_t>(a.value) == std::get<int64_t>(b.value);
        }
        const double x = a.isInteger() ? static_cast<double>(std::get<int64_t>(a.value)) : std::get<double>(a.value);
        const double y = b.isInteger() ? static_cast<double>(std::get<int64_t>(b.value)) : std::get<double>(b.value);
        return x == y;
    }
    if (a.value.index() != b.value.index()) return false;
    if (const auto* arr = std::get_if<JSONValue::Array>(&a.value)) {
        const auto& other = std::get<JSONValue::Array>(b.value);
        if (arr->size() != other.size()) return false;
        for (std::size_t i = 0; i < arr->size(); ++i) {
            const JSONValue& l = (*arr)[i] ? *(*arr)[i] : JSONValue();
            const JSONValue& r = other[i] ? *other[i] : JSONValue();
            if (!(l == r)) return false;
        }
        return true;
    }
    if (const auto* obj = std::get_if<JSONValue::Object>(&a.value)) {
        const auto& other = std::get<JSONValue::Object>(b.value);
        if (obj->size() != other.size()) return false;
        for (const auto& [k, v] : *obj) {
            auto it = other.find(k);
            if (it == other.end()) return false;
            const JSONValue& l = v ? *v : JSONValue();
            const JSONValue& r = it->second ? *it->second : JSONValue();
            if (!(l == r)) return false;
        }
        return true;
    }
    return a.value == b.value;
}

// -------------------------------
// Strict recursive JSON parser
// -------------------------------
namespace {
constexpr int kMaxDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw JSONParseError(what, i);
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Unescaped control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate: a low surrogate must follow to form one code point
                        if (i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low >= 0xDC00 && low <= 0xDFFF) {
                                code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                            } else {
                                fail("Invalid low surrogate");
                            }
                        } else {
                            code = 0xFFFD;
                        }
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        code = 0xFFFD;
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid number");
        if (s[i] == '0') {
            ++i;
        } else {
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid fraction");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid exponent");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        const std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Falls through to double for integers beyond int64_t
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            return JSONValue(num[0] == '-' ? -std::numeric_limits<double>::infinity()
                                           : std::numeric_limits<double>::infinity());
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();
        fail("Unexpected character");
    }
};

void serializeString(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void serializeInto(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                out += "null";
            } else {
                out += std::format("{}", v);
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            serializeString(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out.push_back(',');
                if (v[i]) serializeInto(out, *v[i]); else out += "null";
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) out.push_back(',');
                first = false;
                serializeString(out, key);
                out.push_back(':');
                if (val) serializeInto(out, *val); else out += "null";
            }
            out.push_back('}');
        }
    }, value.get());
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) p.fail("Trailing characters after JSON value");
    return v;
}

bool TryParseJSON(const std::string& text, JSONValue& out) {
    try {
        out = ParseJSON(text);
        return true;
    } catch (const JSONParseError& e) {
        LOG_DEBUG("JSON parse failed: {}", e.what());
        return false;
    }
}

std::string SerializeJSON(const JSONValue& value) {
    std::string out;
    serializeInto(out, value);
    return out;
}

std::shared_ptr<JSONValue> MakeShared(JSONValue v) {
    return std::make_shared<JSONValue>(std::move(v));
}

JSONValue MakeObject(std::initializer_list<std::pair<const std::string, JSONValue>> members) {
    JSONValue::Object o;
    for (const auto& [k, v] : members) {
        o[k] = std::make_shared<JSONValue>(v);
    }
    return JSONValue(std::move(o));
}

JSONValue MakeArray(std::initializer_list<JSONValue> items) {
    JSONValue::Array a;
    a.reserve(items.size());
    for (const auto& v : items) {
        a.push_back(std::make_shared<JSONValue>(v));
    }
    return JSONValue(std::move(a));
}

std::optional<std::string> GetString(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = obj.find(key);
    if (!v) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&v->value)) return *s;
    return std::nullopt;
}

std::optional<int64_t> GetInteger(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = obj.find(key);
    if (!v) return std::nullopt;
    if (const auto* n = std::get_if<int64_t>(&v->value)) return *n;
    return std::nullopt;
}

std::optional<bool> GetBool(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = obj.find(key);
    if (!v) return std::nullopt;
    if (const auto* b = std::get_if<bool>(&v->value)) return *b;
    return std::nullopt;
}

//----------------------------------------------------------------------------------------------------------
// Ids
//----------------------------------------------------------------------------------------------------------
JSONValue IdToValue(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return JSONValue(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return JSONValue(v);
        } else {
            return JSONValue(nullptr);
        }
    }, id);
}

std::optional<JSONRPCId> IdFromValue(const JSONValue& v) {
    if (const auto* s = std::get_if<std::string>(&v.value)) return JSONRPCId{*s};
    if (const auto* n = std::get_if<int64_t>(&v.value)) return JSONRPCId{*n};
    if (v.isNull()) return JSONRPCId{nullptr};
    return std::nullopt;
}

std::string IdToString(const JSONRPCId& id) {
    if (const auto* s = std::get_if<std::string>(&id)) return *s;
    if (const auto* n = std::get_if<int64_t>(&id)) return std::to_string(*n);
    return std::string();
}

//----------------------------------------------------------------------------------------------------------
// Messages
//----------------------------------------------------------------------------------------------------------
bool JSONRPCMessage::Deserialize(const std::string& json) {
    JSONValue v;
    if (!TryParseJSON(json, v)) {
        return false;
    }
    return FromValue(v);
}

JSONValue JSONRPCRequest::ToValue() const {
    JSONValue::Object o;
    o["jsonrpc"] = MakeShared(JSONValue(jsonrpc));
    o["id"] = MakeShared(IdToValue(id));
    o["method"] = MakeShared(JSONValue(method));
    if (params.has_value()) {
        o["params"] = MakeShared(params.value());
    }
    return JSONValue(std::move(o));
}

bool JSONRPCRequest::FromValue(const JSONValue& v) {
    if (!v.isObject()) return false;
    auto ver = GetString(v, "jsonrpc");
    auto m = GetString(v, "method");
    if (!ver || *ver != "2.0" || !m) return false;
    jsonrpc = *ver;
    method = *m;
    id = nullptr;
    if (const JSONValue* idv = v.find("id")) {
        auto parsed = IdFromValue(*idv);
        if (!parsed) return false;
        id = *parsed;
    }
    params.reset();
    if (const JSONValue* p = v.find("params")) {
        params = *p;
    }
    return true;
}

JSONValue JSONRPCResponse::ToValue() const {
    JSONValue::Object o;
    o["jsonrpc"] = MakeShared(JSONValue(jsonrpc));
    o["id"] = MakeShared(IdToValue(id));
    if (error.has_value()) {
        o["error"] = MakeShared(error.value());
    } else {
        o["result"] = MakeShared(result.has_value() ? result.value() : JSONValue(JSONValue::Object{}));
    }
    return JSONValue(std::move(o));
}

bool JSONRPCResponse::FromValue(const JSONValue& v) {
    if (!v.isObject()) return false;
    const JSONValue* r = v.find("result");
    const JSONValue* e = v.find("error");
    if ((r == nullptr) == (e == nullptr)) return false;
    id = nullptr;
    if (const JSONValue* idv = v.find("id")) {
        auto parsed = IdFromValue(*idv);
        if (!parsed) return false;
        id = *parsed;
    }
    result.reset();
    error.reset();
    if (r) result = *r;
    if (e) error = *e;
    return true;
}

int JSONRPCResponse::ErrorCode() const {
    if (!error.has_value()) return 0;
    auto code = GetInteger(error.value(), "code");
    return code ? static_cast<int>(*code) : 0;
}

std::string JSONRPCResponse::ErrorMessage() const {
    if (!error.has_value()) return std::string();
    return GetString(error.value(), "message").value_or(std::string());
}

JSONValue JSONRPCNotification::ToValue() const {
    JSONValue::Object o;
    o["jsonrpc"] = MakeShared(JSONValue(jsonrpc));
    o["method"] = MakeShared(JSONValue(method));
    if (params.has_value()) {
        o["params"] = MakeShared(params.value());
    }
    return JSONValue(std::move(o));
}

bool JSONRPCNotification::FromValue(const JSONValue& v) {
    if (!v.isObject()) return false;
    auto ver = GetString(v, "jsonrpc");
    auto m = GetString(v, "method");
    if (!ver || *ver != "2.0" || !m) return false;
    jsonrpc = *ver;
    method = *m;
    params.reset();
    if (const JSONValue* p = v.find("params")) {
        params = *p;
    }
    return true;
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    JSONValue::Object errorObj;
    errorObj["code"] = MakeShared(JSONValue(static_cast<int64_t>(code)));
    errorObj["message"] = MakeShared(JSONValue(message));
    if (data.has_value()) {
        errorObj["data"] = MakeShared(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace toolrpc
