//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.h
// Purpose: JSON-RPC 2.0 envelope decoding/encoding between frame payloads and typed messages
//========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "codebridge/JSONRPCTypes.h"

namespace codebridge {

using Message = std::variant<JSONRPCRequest, JSONRPCResponse, JSONRPCNotification>;

//========================================================================================================
// DecodeError
// Purpose: A payload that could not be turned into a Message.
// Fields:
//   code: JSONRPCErrorCodes::ParseError or JSONRPCErrorCodes::InvalidRequest.
//   message: Human readable reason, safe to send to the peer.
//   id: Request id recovered from the payload when it was a string or integer; nullopt otherwise.
//========================================================================================================
struct DecodeError {
    int code;
    std::string message;
    std::optional<JSONRPCId> id;
};

class IMessageCodec {
public:
    virtual ~IMessageCodec() = default;

    using DecodeResult = std::variant<Message, DecodeError>;

    //====================================================================================================
    // Decodes one frame payload.
    // Returns:
    //   Message when the payload is a well formed request, response or notification.
    //   DecodeError{ParseError} for syntactically invalid JSON.
    //   DecodeError{InvalidRequest} for valid JSON that is not a JSON-RPC 2.0 envelope (including batches).
    //====================================================================================================
    virtual DecodeResult decode(const std::string& payload) = 0;

    // Deterministic single-line encoding; decode(encode(m)) == m.
    virtual std::string encode(const Message& message) = 0;
};

std::unique_ptr<IMessageCodec> MakeJsonRpcCodec();

// Best-effort scan of a (possibly malformed) payload for a top-level string or integer "id".
std::optional<JSONRPCId> SalvageRequestId(const std::string& payload);

} // namespace codebridge
