//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ArgumentCompletion.cpp
// Purpose: Argument completion for prompts and resource templates
//==========================================================================================================

#include <unordered_set>

#include "codebridge/completion/ArgumentCompletion.h"

namespace codebridge {
namespace completion {

namespace {

// Absent members read as ""; present members of another type are an error.
bool optionalString(const JSONValue& object, const char* key, std::string& out) {
    const JSONValue* v = GetMember(object, key);
    if (v == nullptr || v->isNull()) {
        out.clear();
        return true;
    }
    if (!v->isString()) {
        return false;
    }
    out = std::get<std::string>(v->value);
    return true;
}

} // namespace

std::variant<CompletionRequest, errors::RpcError> ParseCompletionRequest(const JSONValue* params) {
    if (params == nullptr || !params->isObject()) {
        return errors::invalidParams("completion/complete params must be an object");
    }
    const JSONValue* ref = GetMember(*params, "ref");
    if (ref == nullptr || !ref->isObject()) {
        return errors::invalidParams("ref: required object");
    }
    const JSONValue* type = GetMember(*ref, "type");
    if (type == nullptr || !type->isString()) {
        return errors::invalidParams("ref.type: required string");
    }

    CompletionRequest request;
    const std::string& refType = std::get<std::string>(type->value);
    if (refType == "ref/prompt") {
        request.ref = CompletionRequest::RefKind::Prompt;
        if (!optionalString(*ref, "name", request.refName)) {
            return errors::invalidParams("ref.name: expected string");
        }
    } else if (refType == "ref/resource") {
        request.ref = CompletionRequest::RefKind::Resource;
        if (!optionalString(*ref, "uri", request.refName)) {
            return errors::invalidParams("ref.uri: expected string");
        }
    } else {
        return errors::invalidParams("ref.type must be 'ref/prompt' or 'ref/resource'");
    }

    if (const JSONValue* argument = GetMember(*params, "argument"); argument != nullptr && !argument->isNull()) {
        if (!argument->isObject()) {
            return errors::invalidParams("argument: expected object");
        }
        if (!optionalString(*argument, "name", request.argumentName)) {
            return errors::invalidParams("argument.name: expected string");
        }
        if (!optionalString(*argument, "value", request.argumentValue)) {
            return errors::invalidParams("argument.value: expected string");
        }
    }
    return request;
}

CandidateSource SourceFor(const CompletionRequest& request) {
    if (request.ref == CompletionRequest::RefKind::Resource) {
        return CandidateSource::ProjectFiles;
    }
    const std::string& arg = request.argumentName;
    if (arg == "file_path") return CandidateSource::ProjectFiles;
    if (arg == "symbol_name" || arg == "target") return CandidateSource::SymbolNames;
    if (!FixedCandidates(arg).empty()) return CandidateSource::Fixed;
    return CandidateSource::None;
}

const std::vector<std::string>& FixedCandidates(const std::string& argumentName) {
    static const std::vector<std::string> focus = {"security", "performance", "style", "bugs", "general"};
    static const std::vector<std::string> direction = {"callers", "callees", "both"};
    static const std::vector<std::string> none;
    if (argumentName == "focus") return focus;
    if (argumentName == "direction") return direction;
    return none;
}

std::vector<std::string> FilterCandidates(const std::vector<std::string>& candidates, const std::string& partial) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& c : candidates) {
        if (out.size() >= MaxCompletionValues) break;
        if (c.find(partial) == std::string::npos) continue;
        if (seen.insert(c).second) out.push_back(c);
    }
    return out;
}

JSONValue CompletionResult(const std::vector<std::string>& values) {
    JSONValue::Array arr;
    arr.reserve(values.size());
    for (const auto& v : values) {
        arr.push_back(MakeJSON(v));
    }
    JSONValue::Object inner;
    inner["values"] = MakeJSON(std::move(arr));
    inner["total"] = MakeJSON(static_cast<int64_t>(values.size()));
    inner["hasMore"] = MakeJSON(false);
    JSONValue::Object result;
    result["completion"] = MakeJSON(std::move(inner));
    return JSONValue(std::move(result));
}

} // namespace completion
} // namespace codebridge
