//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model, strict JSON codec and JSON-RPC 2.0 message types
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace toolrpc {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
// Notes:
//   Integers that fit int64_t are held as int64_t; all other numbers as double.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isBool() const { return std::holds_alternative<bool>(value); }
    bool isInteger() const { return std::holds_alternative<int64_t>(value); }
    bool isNumber() const { return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }

    // Object member lookup; nullptr when this is not an object or the key is absent.
    const JSONValue* find(const std::string& key) const;
};

// Structural equality. Numbers compare by numeric value across int64_t and double.
bool operator==(const JSONValue& a, const JSONValue& b);
inline bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

//==========================================================================================================
// JSONParseError
// Purpose: Thrown by ParseJSON for malformed input; carries the byte offset of the failure.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset(offset) {}
    std::size_t offset;
};

//==========================================================================================================
// ParseJSON
// Purpose: Strict RFC 8259 parse of a complete document. Trailing non-whitespace is an error.
// Throws:
//   JSONParseError on malformed input or nesting deeper than 256 levels.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

// Non-throwing variant. Returns false and leaves out untouched on failure.
bool TryParseJSON(const std::string& text, JSONValue& out);

// Compact serialization. Doubles use the shortest round-trip form; NaN and infinities become null.
std::string SerializeJSON(const JSONValue& value);

// Object builders used throughout the server to keep call sites short.
std::shared_ptr<JSONValue> MakeShared(JSONValue v);
JSONValue MakeObject(std::initializer_list<std::pair<const std::string, JSONValue>> members);
JSONValue MakeArray(std::initializer_list<JSONValue> items);

// Member readers returning nullopt when absent or of a different type.
std::optional<std::string> GetString(const JSONValue& obj, const std::string& key);
std::optional<int64_t> GetInteger(const JSONValue& obj, const std::string& key);
std::optional<bool> GetBool(const JSONValue& obj, const std::string& key);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

JSONValue IdToValue(const JSONRPCId& id);
// Converts a JSON value to an id; nullopt for types JSON-RPC does not allow (bool, double, array, object).
std::optional<JSONRPCId> IdFromValue(const JSONValue& v);
// Stable textual key for an id: strings as-is, integers in decimal, null as empty.
std::string IdToString(const JSONRPCId& id);
inline bool IsNullId(const JSONRPCId& id) { return std::holds_alternative<std::nullptr_t>(id); }

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   Serialize(): Returns compact JSON string for the message.
//   Deserialize(json): Parses JSON string into this object; returns true on success.
//   ToValue()/FromValue(v): Conversion to and from an already parsed JSON tree.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual JSONValue ToValue() const = 0;
    virtual bool FromValue(const JSONValue& v) = 0;

    std::string Serialize() const { return SerializeJSON(ToValue()); }
    bool Deserialize(const std::string& json);
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request message with id, method, and optional params.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    JSONValue ToValue() const override;
    bool FromValue(const JSONValue& v) override;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
// Ctors:
//   JSONRPCResponse(id, result): Success response with result set.
//   JSONRPCResponse(id, error, /*isError*/): Error response with error set.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    JSONValue ToValue() const override;
    bool FromValue(const JSONValue& v) override;

    bool IsError() const { return error.has_value(); }
    // Error code when IsError(); 0 otherwise.
    int ErrorCode() const;
    std::string ErrorMessage() const;
};

//==========================================================================================================
// JSONRPCNotification
// Purpose: JSON-RPC 2.0 notification (no id, no response).
//==========================================================================================================
class JSONRPCNotification : public JSONRPCMessage {
public:
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCNotification() = default;
    JSONRPCNotification(std::string method, std::optional<JSONValue> params = std::nullopt)
        : method(std::move(method)), params(std::move(params)) {}

    JSONValue ToValue() const override;
    bool FromValue(const JSONValue& v) override;
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus the server's application codes.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // Application codes
    constexpr int ToolNotFound = -32001;
    constexpr int ToolExecutionError = -32002;
    constexpr int ResourceNotFound = -32003;
    constexpr int PromptNotFound = -32004;
    constexpr int SamplingNotSupported = -32005;
    constexpr int RootsNotSupported = -32006;
    constexpr int ElicitationNotSupported = -32007;
    constexpr int RequestCancelled = -32800;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Convenience to wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace toolrpc
