//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ArgumentCompletion.h
// Purpose: completion/complete request parsing, candidate filtering and result shape
//==========================================================================================================

#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include "codebridge/JSONRPCTypes.h"
#include "codebridge/errors/Errors.h"

namespace codebridge {
namespace completion {

constexpr std::size_t MaxCompletionValues = 20;

struct CompletionRequest {
    enum class RefKind { Prompt, Resource };
    RefKind ref{RefKind::Prompt};
    std::string refName;        // prompt name, or resource URI (template) for ref/resource
    std::string argumentName;
    std::string argumentValue;  // partial text typed so far
};

// Where the candidates for a request come from.
enum class CandidateSource {
    None,         // argument without completions
    ProjectFiles, // ref/resource, or a prompt's file_path
    SymbolNames,  // a prompt's symbol_name or target
    Fixed         // focus and direction: FixedCandidates()
};

//==========================================================================================================
// ParseCompletionRequest
// Purpose: Validates completion/complete params: { ref: { type, name|uri }, argument: { name, value } }.
// Returns:
//   The request, or InvalidParams naming the offending field. A missing argument object completes an
//   empty value for an unnamed argument.
//==========================================================================================================
std::variant<CompletionRequest, errors::RpcError> ParseCompletionRequest(const JSONValue* params);

CandidateSource SourceFor(const CompletionRequest& request);

// Closed value lists of prompt arguments; empty for other arguments.
const std::vector<std::string>& FixedCandidates(const std::string& argumentName);

// Candidates containing partial (case-sensitive), duplicates dropped, first MaxCompletionValues kept in order.
std::vector<std::string> FilterCandidates(const std::vector<std::string>& candidates, const std::string& partial);

// { completion: { values, total, hasMore } }
JSONValue CompletionResult(const std::vector<std::string>& values);

} // namespace completion
} // namespace codebridge
