//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: IndexJson.cpp
// Purpose: JSON rendering of index records and snapshot parsing
//==========================================================================================================

#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "codebridge/index/IndexJson.h"

namespace codebridge {

const char* TreeNodeKindName(TreeNodeKind kind) {
    switch (kind) {
        case TreeNodeKind::Directory: return "directory";
        case TreeNodeKind::File: return "file";
        case TreeNodeKind::Symbol: return "symbol";
    }
    return "unknown";
}

const char* FaultKindName(FaultKind kind) {
    switch (kind) {
        case FaultKind::NotIndexed: return "notIndexed";
        case FaultKind::NotFound: return "notFound";
        case FaultKind::BackendUnavailable: return "backendUnavailable";
        case FaultKind::BackendError: return "backendError";
    }
    return "backendError";
}

JSONValue ToJSON(const SymbolRecord& symbol) {
    JSONValue::Object obj;
    obj["id"] = MakeJSON(symbol.id);
    obj["name"] = MakeJSON(symbol.name);
    obj["kind"] = MakeJSON(symbol.kind);
    obj["file"] = MakeJSON(symbol.file);
    obj["line"] = MakeJSON(symbol.line);
    obj["endLine"] = MakeJSON(symbol.endLine);
    if (symbol.signature) obj["signature"] = MakeJSON(*symbol.signature);
    if (symbol.doc) obj["doc"] = MakeJSON(*symbol.doc);
    if (symbol.language) obj["language"] = MakeJSON(*symbol.language);
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const std::vector<SymbolRecord>& symbols) {
    JSONValue::Array arr;
    arr.reserve(symbols.size());
    for (const auto& s : symbols) {
        arr.push_back(MakeJSON(ToJSON(s)));
    }
    return JSONValue(std::move(arr));
}

JSONValue ToJSON(const SymbolDetail& detail) {
    JSONValue::Object obj;
    obj["symbol"] = MakeJSON(ToJSON(detail.symbol));
    obj["callers"] = MakeJSON(ToJSON(detail.callers));
    obj["callees"] = MakeJSON(ToJSON(detail.callees));
    obj["referenceCount"] = MakeJSON(detail.referenceCount);
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const SearchMatch& match) {
    JSONValue::Object obj;
    obj["symbol"] = MakeJSON(ToJSON(match.symbol));
    obj["score"] = MakeJSON(match.score);
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const std::vector<SearchMatch>& matches) {
    JSONValue::Array arr;
    arr.reserve(matches.size());
    for (const auto& m : matches) {
        arr.push_back(MakeJSON(ToJSON(m)));
    }
    return JSONValue(std::move(arr));
}

JSONValue ToJSON(const std::vector<std::string>& paths) {
    JSONValue::Array arr;
    arr.reserve(paths.size());
    for (const auto& p : paths) {
        arr.push_back(MakeJSON(p));
    }
    return JSONValue(std::move(arr));
}

JSONValue ToJSON(const TreeNode& node) {
    JSONValue::Object obj;
    obj["name"] = MakeJSON(node.name);
    obj["path"] = MakeJSON(node.path);
    obj["kind"] = MakeJSON(TreeNodeKindName(node.kind));
    if (node.symbolId) obj["id"] = MakeJSON(*node.symbolId);
    JSONValue::Array children;
    children.reserve(node.children.size());
    for (const auto& child : node.children) {
        children.push_back(MakeJSON(ToJSON(child)));
    }
    obj["children"] = MakeJSON(std::move(children));
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const IndexStatus& status) {
    JSONValue::Object obj;
    obj["projectRoot"] = MakeJSON(status.projectRoot);
    obj["indexPath"] = MakeJSON(status.indexPath);
    obj["indexed"] = MakeJSON(status.indexed);
    obj["files"] = MakeJSON(status.fileCount);
    obj["symbols"] = MakeJSON(status.symbolCount);
    if (status.generatedAt) obj["generatedAt"] = MakeJSON(*status.generatedAt);
    JSONValue::Object languages;
    for (const auto& [lang, count] : status.languages) {
        languages[lang] = MakeJSON(count);
    }
    obj["languages"] = MakeJSON(std::move(languages));
    return JSONValue(std::move(obj));
}

namespace {

const JSONValue& requireMember(const JSONValue& obj, const std::string& key, const std::string& where) {
    const JSONValue* v = GetMember(obj, key);
    if (v == nullptr) {
        throw std::runtime_error(where + ": missing '" + key + "'");
    }
    return *v;
}

std::string requireString(const JSONValue& obj, const std::string& key, const std::string& where) {
    const JSONValue& v = requireMember(obj, key, where);
    if (!v.isString()) {
        throw std::runtime_error(where + ": '" + key + "' must be a string");
    }
    return std::get<std::string>(v.value);
}

int64_t requireInteger(const JSONValue& obj, const std::string& key, const std::string& where) {
    const JSONValue& v = requireMember(obj, key, where);
    if (!v.isInteger()) {
        throw std::runtime_error(where + ": '" + key + "' must be an integer");
    }
    return std::get<int64_t>(v.value);
}

std::optional<std::string> optionalString(const JSONValue& obj, const std::string& key, const std::string& where) {
    const JSONValue* v = GetMember(obj, key);
    if (v == nullptr || v->isNull()) return std::nullopt;
    if (!v->isString()) {
        throw std::runtime_error(where + ": '" + key + "' must be a string");
    }
    return std::get<std::string>(v->value);
}

std::optional<int64_t> optionalInteger(const JSONValue& obj, const std::string& key, const std::string& where) {
    const JSONValue* v = GetMember(obj, key);
    if (v == nullptr || v->isNull()) return std::nullopt;
    if (!v->isInteger()) {
        throw std::runtime_error(where + ": '" + key + "' must be an integer");
    }
    return std::get<int64_t>(v->value);
}

const JSONValue::Array& optionalArray(const JSONValue& obj, const std::string& key, const std::string& where) {
    static const JSONValue::Array empty;
    const JSONValue* v = GetMember(obj, key);
    if (v == nullptr || v->isNull()) return empty;
    if (!v->isArray()) {
        throw std::runtime_error(where + ": '" + key + "' must be an array");
    }
    return std::get<JSONValue::Array>(v->value);
}

} // namespace

IndexSnapshot ParseIndexSnapshot(const JSONValue& root) {
    if (!root.isObject()) {
        throw std::runtime_error("index snapshot: root must be an object");
    }
    IndexSnapshot snap;
    snap.version = optionalInteger(root, "version", "index snapshot").value_or(1);
    if (snap.version != 1) {
        throw std::runtime_error("index snapshot: unsupported version " + std::to_string(snap.version));
    }
    snap.generatedAt = optionalString(root, "generatedAt", "index snapshot");

    std::unordered_map<std::string, std::size_t> fileIndex;
    for (const auto& node : optionalArray(root, "files", "index snapshot")) {
        const std::string where = "index snapshot: files[" + std::to_string(snap.files.size()) + "]";
        if (!node || !node->isObject()) {
            throw std::runtime_error(where + " must be an object");
        }
        FileRecord f;
        f.path = requireString(*node, "path", where);
        f.language = optionalString(*node, "language", where).value_or("unknown");
        f.size = optionalInteger(*node, "size", where).value_or(0);
        if (!fileIndex.emplace(f.path, snap.files.size()).second) {
            throw std::runtime_error(where + ": duplicate path '" + f.path + "'");
        }
        snap.files.push_back(std::move(f));
    }

    std::unordered_set<SymbolId> ids;
    for (const auto& node : optionalArray(root, "symbols", "index snapshot")) {
        const std::string where = "index snapshot: symbols[" + std::to_string(snap.symbols.size()) + "]";
        if (!node || !node->isObject()) {
            throw std::runtime_error(where + " must be an object");
        }
        SymbolRecord s;
        s.id = requireInteger(*node, "id", where);
        if (!ids.insert(s.id).second) {
            throw std::runtime_error(where + ": duplicate id " + std::to_string(s.id));
        }
        s.name = requireString(*node, "name", where);
        s.kind = optionalString(*node, "kind", where).value_or("unknown");
        s.file = requireString(*node, "file", where);
        s.line = optionalInteger(*node, "line", where).value_or(0);
        s.endLine = optionalInteger(*node, "endLine", where).value_or(s.line);
        s.signature = optionalString(*node, "signature", where);
        s.doc = optionalString(*node, "doc", where);

        auto fit = fileIndex.find(s.file);
        if (fit == fileIndex.end()) {
            // Symbols may reference files the export did not list; they still belong to the tree.
            FileRecord implicitFile;
            implicitFile.path = s.file;
            implicitFile.language = "unknown";
            fit = fileIndex.emplace(s.file, snap.files.size()).first;
            snap.files.push_back(std::move(implicitFile));
        }
        FileRecord& owner = snap.files[fit->second];
        s.language = owner.language;
        ++owner.symbolCount;

        std::vector<SymbolId> calls;
        for (const auto& callee : optionalArray(*node, "calls", where)) {
            if (!callee || !callee->isInteger()) {
                throw std::runtime_error(where + ": 'calls' must contain integer ids");
            }
            calls.push_back(std::get<int64_t>(callee->value));
        }
        snap.symbols.push_back(std::move(s));
        snap.calls.push_back(std::move(calls));
    }
    return snap;
}

} // namespace codebridge
