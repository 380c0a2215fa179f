//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool schemas and typed parameter extraction
//==========================================================================================================

#include <algorithm>

#include "logging/Logger.h"
#include "codebridge/tools/ToolRegistry.h"
#include "codebridge/validation/SchemaValidator.h"

namespace codebridge {

namespace {

JSONValue prop(const std::string& type, const std::string& description) {
    JSONValue::Object o;
    o["type"] = MakeJSON(type);
    o["description"] = MakeJSON(description);
    return JSONValue(std::move(o));
}

JSONValue withMember(JSONValue schema, const std::string& key, JSONValue value) {
    std::get<JSONValue::Object>(schema.value)[key] = MakeJSON(std::move(value));
    return schema;
}

JSONValue objectSchema(std::vector<std::pair<std::string, JSONValue>> properties, std::vector<std::string> required) {
    JSONValue::Object props;
    for (auto& [name, schema] : properties) {
        props[name] = MakeJSON(std::move(schema));
    }
    JSONValue::Object o;
    o["type"] = MakeJSON("object");
    o["properties"] = MakeJSON(std::move(props));
    if (!required.empty()) {
        JSONValue::Array req;
        for (auto& r : required) req.push_back(MakeJSON(std::move(r)));
        o["required"] = MakeJSON(std::move(req));
    }
    return JSONValue(std::move(o));
}

std::optional<std::string> stringMember(const JSONValue& params, const std::string& key) {
    const JSONValue* v = GetMember(params, key);
    if (v == nullptr || !v->isString()) return std::nullopt;
    return std::get<std::string>(v->value);
}

std::optional<int64_t> integerMember(const JSONValue& params, const std::string& key) {
    const JSONValue* v = GetMember(params, key);
    if (v == nullptr || !v->isInteger()) return std::nullopt;
    return std::get<int64_t>(v->value);
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c){ return c == ' ' || c == '\t' || c == '\r' || c == '\n'; });
}

ToolCall extractSearch(const JSONValue& p) {
    SearchParams sp;
    sp.query = stringMember(p, "query").value_or("");
    sp.limit = std::clamp<int64_t>(integerMember(p, "limit").value_or(SearchParams::DefaultLimit), 1, SearchParams::MaxLimit);
    if (const JSONValue* f = GetMember(p, "filters")) {
        sp.filters.kind = stringMember(*f, "kind");
        sp.filters.file = stringMember(*f, "file");
        sp.filters.language = stringMember(*f, "language");
    }
    return sp;
}

ToolCall extractSymbols(const JSONValue& p) {
    SymbolsParams sp;
    sp.name = stringMember(p, "name");
    sp.kind = stringMember(p, "kind");
    sp.file = stringMember(p, "file");
    sp.limit = integerMember(p, "limit");
    return sp;
}

ToolCall extractFiles(const JSONValue& p) {
    FilesParams fp;
    fp.prefix = stringMember(p, "prefix");
    fp.glob = stringMember(p, "glob");
    return fp;
}

ToolCall extractShow(const JSONValue& p) {
    ShowParams sp;
    sp.id = integerMember(p, "id");
    sp.file = stringMember(p, "file");
    sp.name = stringMember(p, "name");
    return sp;
}

ToolCall extractTree(const JSONValue& p) {
    TreeParams tp;
    tp.path = stringMember(p, "path").value_or("");
    tp.depth = integerMember(p, "depth");
    return tp;
}

} // namespace

const char* ToolKindName(ToolKind kind) {
    switch (kind) {
        case ToolKind::Search: return "search";
        case ToolKind::Symbols: return "symbols";
        case ToolKind::Files: return "files";
        case ToolKind::Show: return "show";
        case ToolKind::Tree: return "tree";
    }
    return "unknown";
}

ToolRegistry::ToolRegistry() {
    JSONValue filters = objectSchema({
        {"kind", prop("string", "Only symbols of this kind (function, struct, class, ...)")},
        {"file", prop("string", "Only symbols in this file or directory")},
        {"language", prop("string", "Only symbols written in this language")},
    }, {});
    tools.push_back(ToolDescriptor{
        ToolKind::Search, "search",
        "Semantic search for code symbols using natural language. Returns symbols ranked by relevance.",
        objectSchema({
            {"query", withMember(prop("string", "Natural language search query (e.g., 'function that handles user authentication')"),
                                 "minLength", JSONValue(1))},
            {"limit", prop("integer", "Maximum number of results (1-100, default 10)")},
            {"filters", withMember(std::move(filters), "description", JSONValue("Optional result filters"))},
        }, {"query"})});

    tools.push_back(ToolDescriptor{
        ToolKind::Symbols, "symbols",
        "List symbols by name, kind or file. Use for finding specific functions, classes, or variables.",
        objectSchema({
            {"name", prop("string", "Symbol name to match (case-insensitive, partial matching)")},
            {"kind", prop("string", "Symbol kind (function, struct, class, ...)")},
            {"file", prop("string", "File path or directory to restrict to")},
            {"limit", withMember(withMember(prop("integer", "Maximum number of results (1-1000)"),
                                            "minimum", JSONValue(1)),
                                 "maximum", JSONValue(static_cast<int64_t>(SymbolsParams::MaxLimit)))},
        }, {})});

    tools.push_back(ToolDescriptor{
        ToolKind::Files, "files",
        "List indexed files, optionally filtered by path prefix or shell glob.",
        objectSchema({
            {"prefix", prop("string", "Path prefix relative to the project root")},
            {"glob", prop("string", "Shell pattern such as 'src/**/*.rs'")},
        }, {})});

    tools.push_back(ToolDescriptor{
        ToolKind::Show, "show",
        "Get detailed information about a symbol, including callers, callees and reference count. "
        "Identify it either by id or by file and name.",
        objectSchema({
            {"id", prop("integer", "Symbol ID (from search results)")},
            {"file", prop("string", "File containing the symbol")},
            {"name", prop("string", "Symbol name")},
        }, {})});

    tools.push_back(ToolDescriptor{
        ToolKind::Tree, "tree",
        "Get the project structure as a hierarchical tree of directories, files and symbols.",
        objectSchema({
            {"path", prop("string", "Directory or file to start from; \"\" or \".\" for the project root")},
            {"depth", withMember(prop("integer", "Levels below the start node to include (absent: unlimited)"),
                                 "minimum", JSONValue(0))},
        }, {"path"})});
}

const ToolDescriptor* ToolRegistry::resolve(const std::string& name) const {
    for (const auto& t : tools) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

std::optional<errors::RpcError> ToolRegistry::validate(const std::string& name, const JSONValue* params, ToolCall& out) const {
    const ToolDescriptor* tool = resolve(name);
    if (tool == nullptr) {
        return errors::methodNotFound("unknown tool '" + name + "'");
    }

    static const JSONValue emptyObject{JSONValue::Object{}};
    const JSONValue& p = (params == nullptr || params->isNull()) ? emptyObject : *params;
    if (!p.isObject()) {
        return errors::invalidParams("arguments must be an object");
    }
    if (auto problem = validation::ValidateAgainstSchema(tool->inputSchema, p)) {
        LOG_DEBUG("ToolRegistry: {} rejected: {}", name, *problem);
        return errors::invalidParams(*problem);
    }

    switch (tool->kind) {
        case ToolKind::Search: {
            out = extractSearch(p);
            if (isBlank(std::get<SearchParams>(out).query)) {
                return errors::invalidParams("query: must not be empty");
            }
            break;
        }
        case ToolKind::Symbols:
            out = extractSymbols(p);
            break;
        case ToolKind::Files:
            out = extractFiles(p);
            break;
        case ToolKind::Show: {
            out = extractShow(p);
            const auto& sp = std::get<ShowParams>(out);
            const bool byId = sp.id.has_value();
            const bool byName = sp.file.has_value() && sp.name.has_value();
            if (byId == byName || (byId && (sp.file || sp.name))) {
                return errors::invalidParams("provide either 'id' or both 'file' and 'name'");
            }
            break;
        }
        case ToolKind::Tree:
            out = extractTree(p);
            break;
    }
    return std::nullopt;
}

JSONValue ToolRegistry::toolsListResult() const {
    JSONValue::Array arr;
    for (const auto& t : tools) {
        JSONValue::Object o;
        o["name"] = MakeJSON(t.name);
        o["description"] = MakeJSON(t.description);
        o["inputSchema"] = MakeJSON(t.inputSchema);
        arr.push_back(MakeJSON(std::move(o)));
    }
    JSONValue::Object result;
    result["tools"] = MakeJSON(std::move(arr));
    return JSONValue(std::move(result));
}

} // namespace codebridge
