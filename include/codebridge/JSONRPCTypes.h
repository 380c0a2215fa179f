//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 message types
//==========================================================================================================

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace codebridge {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: map<string, shared_ptr<JSONValue>> representing a JSON object. Keys are kept sorted so that
//           serialization is deterministic.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
// Notes:
//   operator== compares structurally (pointees, not pointers). int64_t and double never compare equal.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::map<std::string, std::shared_ptr<JSONValue>>;

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
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(uint64_t v);
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
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isInteger() const { return std::holds_alternative<int64_t>(value); }

    bool operator==(const JSONValue& other) const;
    bool operator!=(const JSONValue& other) const { return !(*this == other); }
};

// Shorthand for building Array/Object members.
template <typename T>
std::shared_ptr<JSONValue> MakeJSON(T&& v) {
    return std::make_shared<JSONValue>(JSONValue(std::forward<T>(v)));
}

// Returns the member named key when value is an object that carries it; nullptr otherwise.
const JSONValue* GetMember(const JSONValue& value, const std::string& key);

//==========================================================================================================
// JSONParseError
// Purpose: Raised by ParseJSON for syntactically invalid documents.
// Fields:
//   offset(): Byte offset at which parsing stopped.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset_(offset) {}
    std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete RFC 8259 document. Trailing non-whitespace, unterminated strings, invalid
//          escapes, leading '+' or bare control characters are rejected.
// Throws:
//   JSONParseError on any syntax error or when nesting exceeds 512 levels.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

// Compact, deterministic serialization. Never emits a raw newline (control characters are escaped).
std::string SerializeJSON(const JSONValue& value);

// Two-space indented rendering for human-facing text content.
std::string SerializeJSONPretty(const JSONValue& value);

//==========================================================================================================
// UTF-8 helpers
// Purpose: Strings reach the wire as UTF-8. Both serializers replace ill-formed sequences (overlongs,
//          surrogates, stray continuation bytes, truncated tails) with U+FFFD.
//   ToValidUtf8(bytes): bytes with every ill-formed sequence replaced by U+FFFD.
//   Utf8PrefixLength(bytes, maxBytes): largest length <= maxBytes that does not end inside a multi-byte
//                                      sequence.
//==========================================================================================================
std::string ToValidUtf8(const std::string& bytes);
std::size_t Utf8PrefixLength(const std::string& bytes, std::size_t maxBytes);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

std::string IdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization.
// Methods:
//   Serialize(): Returns canonical single-line JSON for the message. Envelope key order is fixed:
//                jsonrpc, id, method, params | result | error.
//   ToJSON(): The same message as a JSONValue tree.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
    virtual JSONValue ToJSON() const = 0;

protected:
    JSONRPCMessage() = default;
    JSONRPCMessage(const JSONRPCMessage&) = default;
    JSONRPCMessage(JSONRPCMessage&&) = default;
    JSONRPCMessage& operator=(const JSONRPCMessage&) = default;
    JSONRPCMessage& operator=(JSONRPCMessage&&) = default;
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

    std::string Serialize() const override;
    JSONValue ToJSON() const override;

    bool operator==(const JSONRPCRequest& other) const {
        return id == other.id && method == other.method && params == other.params;
    }
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

    std::string Serialize() const override;
    JSONValue ToJSON() const override;

    bool IsError() const { return error.has_value(); }

    bool operator==(const JSONRPCResponse& other) const {
        return id == other.id && result == other.result && error == other.error;
    }
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

    std::string Serialize() const override;
    JSONValue ToJSON() const override;

    bool operator==(const JSONRPCNotification& other) const {
        return method == other.method && params == other.params;
    }
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus the server-defined codes in the -320xx range.
// Notes:
//   Values are stable. NotFound follows the MCP resource-not-found convention and is reused for unknown
//   symbols, files and tree paths.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    constexpr int NotInitialized = -32001;
    constexpr int NotFound = -32002;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace codebridge
