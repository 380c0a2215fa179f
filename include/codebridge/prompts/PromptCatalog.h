//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PromptCatalog.h
// Purpose: Prompt templates advertised through prompts/list and rendered for prompts/get
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "codebridge/JSONRPCTypes.h"
#include "codebridge/index/IndexTypes.h"

namespace codebridge {
namespace prompts {

struct PromptArgument {
    std::string name;
    std::string description;
    bool required{false};
};

struct PromptDescriptor {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;
};

const std::vector<PromptDescriptor>& Catalog();

// nullptr for unknown names.
const PromptDescriptor* FindPrompt(const std::string& name);

// Name of the first required argument that is absent or not a string, if any.
std::optional<std::string> MissingArgument(const PromptDescriptor& prompt, const JSONValue& arguments);

JSONValue PromptsListResult();

// { description, messages: [ { role: "user", content: { type: "text", text } } ] }
JSONValue PromptResult(const std::string& description, const std::string& text);

//==========================================================================================================
// Text renderers. Each takes whatever the index could provide; empty/nullopt inputs produce the
// "not found" variants of the text.
//==========================================================================================================
std::string RenderCodeReview(const std::string& filePath, const std::string& focus,
                             const std::optional<std::string>& language, const std::vector<SymbolRecord>& symbols,
                             const std::optional<std::string>& content);

std::string RenderExplainSymbol(const std::string& symbolName, const std::vector<SymbolDetail>& matches);

std::string RenderFindSimilar(const std::string& description);

std::string RenderAnalyzeDependencies(const std::string& target, const std::string& direction,
                                      const std::optional<SymbolDetail>& detail);

std::string RenderSummarizeFile(const std::string& filePath, const std::optional<std::string>& language,
                                const std::vector<SymbolRecord>& symbols, const std::optional<std::string>& content);

std::string RenderRefactorSuggestions(const std::string& target, const std::optional<SymbolDetail>& detail);

std::string RenderArchitectureOverview(const std::optional<IndexStatus>& status);

} // namespace prompts
} // namespace codebridge
