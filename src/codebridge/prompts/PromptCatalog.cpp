//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PromptCatalog.cpp
// Purpose: Prompt descriptors and text rendering
//==========================================================================================================

#include <fmt/format.h>

#include "codebridge/prompts/PromptCatalog.h"

namespace codebridge {
namespace prompts {

namespace {

std::string joinSymbols(const std::vector<SymbolRecord>& symbols, const std::string& sep) {
    std::string out;
    for (const auto& s : symbols) {
        if (!out.empty()) out += sep;
        out += s.name;
    }
    return out;
}

std::string bulletList(const std::vector<SymbolRecord>& symbols) {
    std::string out;
    for (const auto& s : symbols) {
        if (!out.empty()) out += "\n";
        out += fmt::format("  - {} ({})", s.name, s.file);
    }
    return out;
}

} // namespace

const std::vector<PromptDescriptor>& Catalog() {
    static const std::vector<PromptDescriptor> catalog = {
        {"code_review", "Review code in a file for quality, bugs, and improvements",
         {{"file_path", "Path to the file to review (relative to project root)", true},
          {"focus", "Specific aspect to focus on (security, performance, style, bugs)", false}}},
        {"explain_symbol", "Explain what a symbol does and how it's used in the codebase",
         {{"symbol_name", "Name of the symbol to explain", true}}},
        {"find_similar", "Find similar code patterns or implementations in the codebase",
         {{"description", "Description of the code pattern to find", true}}},
        {"analyze_dependencies", "Analyze the dependency graph of a symbol or file",
         {{"target", "Symbol name or file path to analyze", true},
          {"direction", "Direction to analyze: 'callers' (who uses this), 'callees' (what this uses), or 'both'", false}}},
        {"summarize_file", "Generate a summary of a file's purpose and contents",
         {{"file_path", "Path to the file to summarize", true}}},
        {"refactor_suggestions", "Suggest refactoring opportunities for a symbol or file",
         {{"target", "Symbol name or file path to analyze", true}}},
        {"architecture_overview", "Generate an overview of the project architecture based on indexed symbols", {}},
    };
    return catalog;
}

const PromptDescriptor* FindPrompt(const std::string& name) {
    for (const auto& p : Catalog()) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

std::optional<std::string> MissingArgument(const PromptDescriptor& prompt, const JSONValue& arguments) {
    for (const auto& arg : prompt.arguments) {
        if (!arg.required) continue;
        const JSONValue* v = GetMember(arguments, arg.name);
        if (v == nullptr || !v->isString()) {
            return arg.name;
        }
    }
    return std::nullopt;
}

JSONValue PromptsListResult() {
    JSONValue::Array prompts;
    for (const auto& p : Catalog()) {
        JSONValue::Array args;
        for (const auto& a : p.arguments) {
            JSONValue::Object ao;
            ao["name"] = MakeJSON(a.name);
            ao["description"] = MakeJSON(a.description);
            ao["required"] = MakeJSON(a.required);
            args.push_back(MakeJSON(std::move(ao)));
        }
        JSONValue::Object po;
        po["name"] = MakeJSON(p.name);
        po["description"] = MakeJSON(p.description);
        po["arguments"] = MakeJSON(std::move(args));
        prompts.push_back(MakeJSON(std::move(po)));
    }
    JSONValue::Object result;
    result["prompts"] = MakeJSON(std::move(prompts));
    return JSONValue(std::move(result));
}

JSONValue PromptResult(const std::string& description, const std::string& text) {
    JSONValue::Object content;
    content["type"] = MakeJSON("text");
    content["text"] = MakeJSON(text);
    JSONValue::Object message;
    message["role"] = MakeJSON("user");
    message["content"] = MakeJSON(std::move(content));
    JSONValue::Array messages;
    messages.push_back(MakeJSON(std::move(message)));
    JSONValue::Object result;
    result["description"] = MakeJSON(description);
    result["messages"] = MakeJSON(std::move(messages));
    return JSONValue(std::move(result));
}

std::string RenderCodeReview(const std::string& filePath, const std::string& focus,
                             const std::optional<std::string>& language, const std::vector<SymbolRecord>& symbols,
                             const std::optional<std::string>& content) {
    std::string context;
    if (language.has_value()) {
        std::string listed;
        for (const auto& s : symbols) {
            if (!listed.empty()) listed += ", ";
            listed += fmt::format("{} ({})", s.name, s.kind);
        }
        context = fmt::format("File: {}\nLanguage: {}\nSymbols: {}\n", filePath, *language, listed);
    } else {
        context = fmt::format("File: {}", filePath);
    }
    return fmt::format("Please review the following code with a focus on {}.\n\n{}\n\nCode:\n```\n{}\n```\n\n"
                       "Provide specific, actionable feedback.",
                       focus, context, content.value_or("[File content not available]"));
}

std::string RenderExplainSymbol(const std::string& symbolName, const std::vector<SymbolDetail>& matches) {
    std::string context;
    for (const auto& d : matches) {
        if (!context.empty()) context += "\n\n---\n\n";
        context += fmt::format("Symbol: {} ({})\nFile: {}\nSignature: {}\nDoc: {}\nCallers: {}\nCallees: {}",
                               d.symbol.name, d.symbol.kind, d.symbol.file, d.symbol.signature.value_or("N/A"),
                               d.symbol.doc.value_or("N/A"), joinSymbols(d.callers, ", "),
                               joinSymbols(d.callees, ", "));
    }
    if (context.empty()) {
        context = "No symbol found with name: " + symbolName;
    }
    return fmt::format("Please explain what '{}' does and how it's used in this codebase.\n\n"
                       "Context from code index:\n{}",
                       symbolName, context);
}

std::string RenderFindSimilar(const std::string& description) {
    return fmt::format("Find code in this codebase that is similar to or implements: {}\n\n"
                       "Use the 'search' tool with semantic search to find relevant symbols, then analyze them.",
                       description);
}

std::string RenderAnalyzeDependencies(const std::string& target, const std::string& direction,
                                      const std::optional<SymbolDetail>& detail) {
    std::string info = "No symbol found";
    if (detail.has_value()) {
        const bool wantCallers = direction != "callees";
        const bool wantCallees = direction != "callers";
        info = fmt::format("Symbol: {} ({})\nFile: {}\nCallers ({}):\n{}\n\nCallees ({}):\n{}",
                           detail->symbol.name, detail->symbol.kind, detail->symbol.file,
                           wantCallers ? detail->callers.size() : 0,
                           wantCallers ? bulletList(detail->callers) : std::string("N/A"),
                           wantCallees ? detail->callees.size() : 0,
                           wantCallees ? bulletList(detail->callees) : std::string("N/A"));
    }
    return fmt::format("Analyze the dependency graph for '{}' (direction: {}).\n\nDependency Information:\n{}",
                       target, direction, info);
}

std::string RenderSummarizeFile(const std::string& filePath, const std::optional<std::string>& language,
                                const std::vector<SymbolRecord>& symbols, const std::optional<std::string>& content) {
    std::string summary;
    for (const auto& s : symbols) {
        if (!summary.empty()) summary += "\n";
        summary += fmt::format("- {} ({}): {}", s.name, s.kind, s.doc.value_or("no documentation"));
    }
    return fmt::format("Please summarize the purpose and contents of this file.\n\nFile: {}\nLanguage: {}\n\n"
                       "Symbols:\n{}\n\nCode:\n```\n{}\n```",
                       filePath, language.value_or("unknown"), summary,
                       content.value_or("[Content not available]"));
}

std::string RenderRefactorSuggestions(const std::string& target, const std::optional<SymbolDetail>& detail) {
    std::string context = "No symbol found. Try searching with the 'search' tool.";
    if (detail.has_value()) {
        context = fmt::format("Symbol: {} ({})\nFile: {}\nReferences: {}\nCallers: {}\nCallees: {}",
                              detail->symbol.name, detail->symbol.kind, detail->symbol.file,
                              detail->referenceCount, detail->callers.size(), detail->callees.size());
    }
    return fmt::format("Suggest refactoring opportunities for '{}'.\n\nContext:\n{}", target, context);
}

std::string RenderArchitectureOverview(const std::optional<IndexStatus>& status) {
    std::string overview;
    if (status.has_value() && status->indexed) {
        std::string byLanguage;
        for (const auto& [lang, count] : status->languages) {
            if (!byLanguage.empty()) byLanguage += "\n";
            byLanguage += fmt::format("- {}: {} files", lang, count);
        }
        overview = fmt::format("Project Statistics:\n- Total files: {}\n- Total symbols: {}\n\nFiles by language:\n{}",
                               status->fileCount, status->symbolCount, byLanguage);
    } else {
        overview = "No index available. Run the indexer (adi index) first.";
    }
    return fmt::format("Generate an architecture overview for this project based on the indexed structure.\n\n{}",
                       overview);
}

} // namespace prompts
} // namespace codebridge
