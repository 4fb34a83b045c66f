//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 message types
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

namespace embedmcp {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
// Notes:
//   Integers without fraction/exponent parse as int64_t; everything else numeric parses as double.
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
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }
};

// Deep structural equality; object member order is irrelevant, null members are compared by value.
bool operator==(const JSONValue& a, const JSONValue& b);
inline bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

//==========================================================================================================
// JSONParseError
// Purpose: Thrown by ParseJSON on malformed text; carries the byte offset of the failure.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset(offset) {}
    std::size_t offset;
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON document. Trailing non-whitespace is an error.
// Throws:
//   JSONParseError on malformed input.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact serialization. Doubles use the shortest round-trip form and always carry a '.' or
//          exponent so they parse back as doubles.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

// Member lookup helpers for object values; return nullptr/nullopt when absent or of another type.
const JSONValue* FindMember(const JSONValue& object, const std::string& key);
std::optional<std::string> GetStringMember(const JSONValue& object, const std::string& key);
std::optional<int64_t> GetIntMember(const JSONValue& object, const std::string& key);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Stable textual key for an id ("7", "abc"); null maps to an empty string.
std::string IdToString(const JSONRPCId& id);
JSONValue IdToJSON(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   ToJSON(): Object form of the message.
//   Serialize(): Compact JSON text for the message.
//   Deserialize(json): Parses JSON text into this object; returns true when the text is a well-formed
//                      message of this kind.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual JSONValue ToJSON() const = 0;
    virtual std::string Serialize() const;
    virtual bool Deserialize(const std::string& json) = 0;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request message with id, method, and optional params.
// Notes:
//   params: nullopt means the member is absent; a contained null JSONValue means "params": null.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    JSONValue ToJSON() const override;
    bool Deserialize(const std::string& json) override;
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

    JSONValue ToJSON() const override;
    bool Deserialize(const std::string& json) override;

    bool IsError() const { return error.has_value(); }
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

    JSONValue ToJSON() const override;
    bool Deserialize(const std::string& json) override;
};

bool operator==(const JSONRPCRequest& a, const JSONRPCRequest& b);
bool operator==(const JSONRPCResponse& a, const JSONRPCResponse& b);
bool operator==(const JSONRPCNotification& a, const JSONRPCNotification& b);

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus server-specific codes.
// Notes:
//   Values are stable and align with JSON-RPC 2.0; server codes are negative values in the -320xx range.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // Server specific error codes
    constexpr int InvalidRequestId = -32000;
    constexpr int MethodNotAllowed = -32001;
    constexpr int ResourceNotFound = -32002;
    constexpr int ToolNotFound = -32003;
    constexpr int PromptNotFound = -32004;
    constexpr int AccessDenied = -32005;
    constexpr int SubscriptionLimitExceeded = -32006;
    constexpr int RequestTimeout = -32007;
    constexpr int ChannelClosed = -32008;
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

} // namespace embedmcp
