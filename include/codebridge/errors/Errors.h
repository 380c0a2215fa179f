//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed protocol errors and their mapping to JSON-RPC error objects and responses
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "codebridge/JSONRPCTypes.h"
#include "codebridge/index/IndexTypes.h"

namespace codebridge {
namespace errors {

// Categorization of the error codes this server emits.
enum class ErrorCategory {
    Parse,
    InvalidRequest,
    MethodNotFound,
    InvalidParams,
    Internal,
    NotInitialized,
    NotFound,
    Unknown
};

// Typed error representation passed around inside the server before it is rendered.
struct RpcError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric JSON-RPC error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::Parse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::InvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::MethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::InvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::Internal;
        case JSONRPCErrorCodes::NotInitialized: return ErrorCategory::NotInitialized;
        case JSONRPCErrorCodes::NotFound: return ErrorCategory::NotFound;
        default: return ErrorCategory::Unknown;
    }
}

inline RpcError makeRpcError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    RpcError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

inline RpcError parseError(const std::string& detail) {
    return makeRpcError(JSONRPCErrorCodes::ParseError, "Parse error: " + detail);
}

inline RpcError invalidRequest(const std::string& message) {
    return makeRpcError(JSONRPCErrorCodes::InvalidRequest, message);
}

inline RpcError methodNotFound(const std::string& what) {
    return makeRpcError(JSONRPCErrorCodes::MethodNotFound, "Method not found: " + what);
}

inline RpcError invalidParams(const std::string& message) {
    return makeRpcError(JSONRPCErrorCodes::InvalidParams, "Invalid params: " + message);
}

inline RpcError notInitialized() {
    return makeRpcError(JSONRPCErrorCodes::NotInitialized, "Server not initialized");
}

inline RpcError notFound(const std::string& message) {
    return makeRpcError(JSONRPCErrorCodes::NotFound, message);
}

inline RpcError internalError(const std::string& message = "Internal error") {
    return makeRpcError(JSONRPCErrorCodes::InternalError, message);
}

//==========================================================================================================
// faultToRpcError
// Purpose: Render a provider fault as a peer-facing error.
// Notes:
//   NotIndexed and BackendUnavailable carry guidance to run the indexer. BackendError is generic. The
//   fault detail is never copied into the message; callers log it. data = { "reason": <fault kind> }.
//==========================================================================================================
inline RpcError faultToRpcError(const ProviderFault& fault) {
    JSONValue::Object data;
    data["reason"] = MakeJSON(FaultKindName(fault.kind));
    switch (fault.kind) {
        case FaultKind::NotFound:
            return makeRpcError(JSONRPCErrorCodes::NotFound,
                                fault.detail.empty() ? std::string("Not found") : fault.detail,
                                JSONValue(std::move(data)));
        case FaultKind::NotIndexed:
            return makeRpcError(JSONRPCErrorCodes::InternalError,
                                "Project is not indexed. Run the indexer (adi index) in the project root first.",
                                JSONValue(std::move(data)));
        case FaultKind::BackendUnavailable:
            return makeRpcError(JSONRPCErrorCodes::InternalError,
                                "Index backend unavailable. Re-run the indexer (adi index) and retry.",
                                JSONValue(std::move(data)));
        case FaultKind::BackendError:
            break;
    }
    return makeRpcError(JSONRPCErrorCodes::InternalError, "Index backend error", JSONValue(std::move(data)));
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to RpcError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<RpcError> rpcErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = GetMember(errVal, "code");
    const JSONValue* message = GetMember(errVal, "message");
    if (code == nullptr || message == nullptr || !code->isInteger() || !message->isString()) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = GetMember(errVal, "data")) {
        data = *d;
    }
    return makeRpcError(static_cast<int>(std::get<int64_t>(code->value)),
                        std::get<std::string>(message->value), std::move(data));
}

// Extract RpcError from a JSONRPCResponse if it carries an error.
inline std::optional<RpcError> rpcErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return rpcErrorFromErrorValue(response.error.value());
}

// JSON error object { code, message, data? } for a typed error.
inline JSONValue makeErrorValue(const RpcError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Error response echoing id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const RpcError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace codebridge
