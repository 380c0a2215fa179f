//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Fixed catalogue of code-intelligence tools with schema-first parameter validation
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "codebridge/JSONRPCTypes.h"
#include "codebridge/errors/Errors.h"
#include "codebridge/index/IndexTypes.h"

namespace codebridge {

enum class ToolKind {
    Search,
    Symbols,
    Files,
    Show,
    Tree
};

const char* ToolKindName(ToolKind kind);

//==========================================================================================================
// ToolDescriptor
// Purpose: Published metadata of one tool. inputSchema is both advertised by tools/list and enforced by
//          ToolRegistry::validate.
//==========================================================================================================
struct ToolDescriptor {
    ToolKind kind{ToolKind::Search};
    std::string name;
    std::string description;
    JSONValue inputSchema;
};

//==========================================================================================================
// ToolRegistry
// Purpose: Immutable after construction; safe to share across threads without locking.
// Methods:
//   resolve(name): Descriptor for name, or nullptr for an unknown tool.
//   validate(name, params, out): Schema check then typed extraction into out. Returns the InvalidParams
//                                (or MethodNotFound) error on failure, std::nullopt on success.
//   toolsListResult(): { "tools": [ {name, description, inputSchema}, ... ] } in catalogue order.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry();

    const ToolDescriptor* resolve(const std::string& name) const;
    const std::vector<ToolDescriptor>& descriptors() const { return tools; }

    std::optional<errors::RpcError> validate(const std::string& name, const JSONValue* params, ToolCall& out) const;

    JSONValue toolsListResult() const;

private:
    std::vector<ToolDescriptor> tools;
};

} // namespace codebridge
