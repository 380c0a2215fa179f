//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.cpp
// Purpose: Default JSON-RPC 2.0 codec with ParseError/InvalidRequest classification
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "codebridge/MessageCodec.h"

namespace codebridge {

namespace {

// Locate the value of a given top-level key (e.g., id at root, not inside params).
// Returns the offset of the first character after ':' when found.
std::optional<std::size_t> findTopLevelValue(const std::string& s, const std::string& key) {
    std::size_t i = 0;
    auto isWs = [](char c){ return c==' ' || c=='\t' || c=='\r' || c=='\n'; };
    while (i < s.size() && isWs(s[i])) {
        ++i;
    }
    if (i >= s.size() || s[i] != '{') {
        return std::nullopt;
    }
    ++i;
    unsigned int depth = 1u;
    while (i < s.size()) {
        char c = s[i++];
        if (c == '"') {
            std::string keyStr;
            bool esc = false;
            while (i < s.size()) {
                char d = s[i++];
                if (esc) {
                    esc = false;
                    keyStr.push_back(d);
                    continue;
                }
                if (d == '\\') {
                    esc = true;
                    continue;
                }
                if (d == '"') {
                    break;
                }
                keyStr.push_back(d);
            }
            while (i < s.size() && isWs(s[i])) {
                ++i;
            }
            if (i < s.size() && s[i] == ':') {
                ++i;
                if (depth == 1u && keyStr == key) {
                    return i;
                }
            }
            continue;
        }
        if (c == '{' || c == '[') {
            ++depth;
            continue;
        }
        if (c == '}' || c == ']') {
            if (--depth == 0u) {
                break;
            }
        }
    }
    return std::nullopt;
}

std::optional<JSONRPCId> idFromValue(const JSONValue& v) {
    if (std::holds_alternative<std::string>(v.value)) {
        return JSONRPCId{std::get<std::string>(v.value)};
    }
    if (std::holds_alternative<int64_t>(v.value)) {
        return JSONRPCId{std::get<int64_t>(v.value)};
    }
    return std::nullopt;
}

DecodeError invalid(const std::string& message, std::optional<JSONRPCId> id) {
    return DecodeError{JSONRPCErrorCodes::InvalidRequest, message, std::move(id)};
}

bool isStructured(const JSONValue& v) {
    return v.isObject() || v.isArray();
}

class JsonRpcCodec : public IMessageCodec {
public:
    DecodeResult decode(const std::string& payload) override {
        JSONValue root;
        try {
            root = ParseJSON(payload);
        } catch (const JSONParseError& e) {
            LOG_DEBUG("Codec: parse error: {}", e.what());
            return DecodeError{JSONRPCErrorCodes::ParseError, "Parse error", SalvageRequestId(payload)};
        }

        if (root.isArray()) {
            return invalid("Batch requests are not supported", std::nullopt);
        }
        if (!root.isObject()) {
            return invalid("Invalid Request: expected a JSON object", std::nullopt);
        }

        const JSONValue* idNode = GetMember(root, "id");
        std::optional<JSONRPCId> echoId = idNode ? idFromValue(*idNode) : std::nullopt;

        const JSONValue* version = GetMember(root, "jsonrpc");
        if (version == nullptr || !version->isString() || std::get<std::string>(version->value) != "2.0") {
            return invalid("Invalid Request: jsonrpc must be \"2.0\"", echoId);
        }
        if (idNode != nullptr && !idNode->isNull() && !echoId.has_value()) {
            return invalid("Invalid Request: id must be a string or an integer", std::nullopt);
        }

        const JSONValue* method = GetMember(root, "method");
        if (method != nullptr) {
            if (!method->isString() || std::get<std::string>(method->value).empty()) {
                return invalid("Invalid Request: method must be a non-empty string", echoId);
            }
            std::optional<JSONValue> params;
            if (const JSONValue* p = GetMember(root, "params"); p != nullptr && !p->isNull()) {
                if (!isStructured(*p)) {
                    return invalid("Invalid Request: params must be an object or an array", echoId);
                }
                params = *p;
            }
            const std::string& name = std::get<std::string>(method->value);
            if (idNode == nullptr) {
                return Message{JSONRPCNotification(name, std::move(params))};
            }
            if (!echoId.has_value()) {
                return invalid("Invalid Request: id must not be null", std::nullopt);
            }
            return Message{JSONRPCRequest(*echoId, name, std::move(params))};
        }

        const JSONValue* result = GetMember(root, "result");
        const JSONValue* error = GetMember(root, "error");
        const bool hasResult = hasMember(root, "result");
        if (hasResult || error != nullptr) {
            if (hasResult == (error != nullptr)) {
                return invalid("Invalid Request: response must carry exactly one of result or error", echoId);
            }
            if (idNode == nullptr) {
                return invalid("Invalid Request: response without id", std::nullopt);
            }
            JSONRPCResponse response;
            if (echoId.has_value()) {
                response.id = *echoId;
            } else {
                response.id = nullptr;
            }
            if (error != nullptr) {
                const JSONValue* code = GetMember(*error, "code");
                const JSONValue* msg = GetMember(*error, "message");
                if (code == nullptr || !code->isInteger() || msg == nullptr || !msg->isString()) {
                    return invalid("Invalid Request: malformed error object", echoId);
                }
                response.error = *error;
            } else {
                response.result = result != nullptr ? *result : JSONValue(nullptr);
            }
            return Message{std::move(response)};
        }

        return invalid("Invalid Request: missing method", echoId);
    }

    std::string encode(const Message& message) override {
        return std::visit([](const auto& m) { return m.Serialize(); }, message);
    }

private:
    // "result": null is a valid success response, so presence is checked on the raw object.
    static bool hasMember(const JSONValue& root, const std::string& key) {
        const auto& obj = std::get<JSONValue::Object>(root.value);
        return obj.find(key) != obj.end();
    }
};

} // namespace

std::optional<JSONRPCId> SalvageRequestId(const std::string& payload) {
    auto pos = findTopLevelValue(payload, "id");
    if (!pos.has_value()) {
        return std::nullopt;
    }
    std::size_t i = *pos;
    while (i < payload.size() && (payload[i] == ' ' || payload[i] == '\t' || payload[i] == '\r' || payload[i] == '\n')) {
        ++i;
    }
    if (i >= payload.size()) {
        return std::nullopt;
    }
    std::size_t end = i;
    if (payload[i] == '"') {
        bool esc = false;
        for (end = i + 1; end < payload.size(); ++end) {
            if (esc) { esc = false; continue; }
            if (payload[end] == '\\') { esc = true; continue; }
            if (payload[end] == '"') { ++end; break; }
        }
    } else {
        while (end < payload.size() && (payload[end] == '-' || (payload[end] >= '0' && payload[end] <= '9'))) {
            ++end;
        }
        // Fractional or exponent ids are not echoable.
        if (end < payload.size() && (payload[end] == '.' || payload[end] == 'e' || payload[end] == 'E')) {
            return std::nullopt;
        }
    }
    if (end == i) {
        return std::nullopt;
    }
    try {
        return idFromValue(ParseJSON(payload.substr(i, end - i)));
    } catch (const JSONParseError&) {
        return std::nullopt;
    }
}

std::unique_ptr<IMessageCodec> MakeJsonRpcCodec() {
    return std::make_unique<JsonRpcCodec>();
}

} // namespace codebridge
