//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceCatalog.cpp
// Purpose: Resource URIs, listings and project file access
//==========================================================================================================

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <unordered_map>

#include "logging/Logger.h"
#include "codebridge/resources/ResourceCatalog.h"

namespace codebridge {
namespace resources {

namespace fs = std::filesystem;

namespace {

JSONValue resourceEntry(const std::string& uri, const std::string& name, const std::string& description,
                        const std::string& mimeType) {
    JSONValue::Object o;
    o["uri"] = MakeJSON(uri);
    o["name"] = MakeJSON(name);
    o["description"] = MakeJSON(description);
    o["mimeType"] = MakeJSON(mimeType);
    return JSONValue(std::move(o));
}

JSONValue templateEntry(const std::string& uriTemplate, const std::string& name, const std::string& description) {
    JSONValue::Object o;
    o["uriTemplate"] = MakeJSON(uriTemplate);
    o["name"] = MakeJSON(name);
    o["description"] = MakeJSON(description);
    o["mimeType"] = MakeJSON("application/json");
    return JSONValue(std::move(o));
}

bool isUnder(const fs::path& root, const fs::path& candidate) {
    auto rel = candidate.lexically_relative(root);
    if (rel.empty()) return false;
    auto first = rel.begin();
    return first == rel.end() || *first != "..";
}

} // namespace

std::variant<ResourceTarget, errors::RpcError> ParseResourceUri(const std::string& uri) {
    ResourceTarget target;
    if (uri == StatusUri) {
        target.kind = ResourceTarget::Kind::Status;
        return target;
    }
    if (uri == TreeUri) {
        target.kind = ResourceTarget::Kind::Tree;
        return target;
    }
    const std::string symbolPrefix = SymbolUriPrefix;
    if (uri.starts_with(symbolPrefix)) {
        const std::string idText = uri.substr(symbolPrefix.size());
        SymbolId id = 0;
        auto [end, ec] = std::from_chars(idText.data(), idText.data() + idText.size(), id);
        if (idText.empty() || ec != std::errc() || end != idText.data() + idText.size()) {
            return errors::invalidParams("Invalid symbol ID '" + idText + "'");
        }
        target.kind = ResourceTarget::Kind::Symbol;
        target.symbolId = id;
        return target;
    }
    const std::string filePrefix = FileUriPrefix;
    if (uri.starts_with(filePrefix)) {
        target.path = uri.substr(filePrefix.size());
        if (target.path.empty()) {
            return errors::invalidParams("File URI without a path");
        }
        target.kind = ResourceTarget::Kind::File;
        return target;
    }
    return errors::invalidParams("Unknown resource URI: " + uri);
}

std::string MimeTypeForPath(const std::string& path) {
    static const std::unordered_map<std::string, std::string> byExtension = {
        {".rs", "text/x-rust"},
        {".py", "text/x-python"},
        {".js", "text/javascript"},
        {".jsx", "text/javascript"},
        {".ts", "text/typescript"},
        {".tsx", "text/typescript"},
        {".go", "text/x-go"},
        {".java", "text/x-java"},
        {".c", "text/x-c"},
        {".h", "text/x-c"},
        {".cc", "text/x-c++"},
        {".cpp", "text/x-c++"},
        {".cxx", "text/x-c++"},
        {".hpp", "text/x-c++"},
        {".rb", "text/x-ruby"},
        {".md", "text/markdown"},
        {".json", "application/json"},
        {".toml", "application/toml"},
        {".yaml", "application/yaml"},
        {".yml", "application/yaml"},
    };
    auto it = byExtension.find(fs::path(path).extension().string());
    return it == byExtension.end() ? std::string("text/plain") : it->second;
}

JSONValue ResourcesListResult(const std::vector<std::string>& files) {
    JSONValue::Array arr;
    arr.push_back(MakeJSON(resourceEntry(StatusUri, "Index Status", "Current indexing status and statistics",
                                         "application/json")));
    arr.push_back(MakeJSON(resourceEntry(TreeUri, "Project Tree", "Hierarchical view of all indexed files and symbols",
                                         "application/json")));
    for (const auto& path : files) {
        const std::string name = fs::path(path).filename().string();
        arr.push_back(MakeJSON(resourceEntry(FileUriPrefix + path, name.empty() ? path : name,
                                             "Indexed source file " + path, MimeTypeForPath(path))));
    }
    JSONValue::Object result;
    result["resources"] = MakeJSON(std::move(arr));
    return JSONValue(std::move(result));
}

JSONValue ResourceTemplatesListResult() {
    JSONValue::Array arr;
    arr.push_back(MakeJSON(templateEntry(std::string(FileUriPrefix) + "{path}", "Source File",
                                         "Access indexed source file with symbols and content")));
    arr.push_back(MakeJSON(templateEntry(std::string(SymbolUriPrefix) + "{id}", "Symbol Details",
                                         "Get detailed information about a symbol by ID")));
    JSONValue::Object result;
    result["resourceTemplates"] = MakeJSON(std::move(arr));
    return JSONValue(std::move(result));
}

JSONValue ReadResult(const std::string& uri, const std::string& mimeType, const std::string& text) {
    JSONValue::Object content;
    content["uri"] = MakeJSON(uri);
    content["mimeType"] = MakeJSON(mimeType);
    content["text"] = MakeJSON(text);
    JSONValue::Array contents;
    contents.push_back(MakeJSON(std::move(content)));
    JSONValue::Object result;
    result["contents"] = MakeJSON(std::move(contents));
    return JSONValue(std::move(result));
}

std::optional<std::string> ResolveInsideRoot(const std::string& root, const std::string& relative) {
    const fs::path rel(relative);
    if (relative.empty() || rel.is_absolute() || rel.has_root_name()) {
        return std::nullopt;
    }
    std::error_code ec;
    const fs::path base = fs::weakly_canonical(fs::path(root), ec);
    if (ec) {
        return std::nullopt;
    }
    const fs::path joined = (base / rel).lexically_normal();
    if (!isUnder(base, joined)) {
        return std::nullopt;
    }
    // Resolve symlinks of the existing part too.
    const fs::path resolved = fs::weakly_canonical(joined, ec);
    if (ec || !isUnder(base, resolved)) {
        return std::nullopt;
    }
    return resolved.string();
}

std::optional<FileText> ReadProjectFile(const std::string& root, const std::string& relative, std::size_t maxBytes) {
    auto full = ResolveInsideRoot(root, relative);
    if (!full) {
        LOG_WARN("ResourceCatalog: refusing path outside project root: {}", relative);
        return std::nullopt;
    }
    std::ifstream in(*full, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        LOG_DEBUG("ResourceCatalog: cannot open {}", *full);
        return std::nullopt;
    }
    FileText out;
    out.text.resize(maxBytes + 1);
    in.read(out.text.data(), static_cast<std::streamsize>(out.text.size()));
    if (in.bad()) {
        return std::nullopt;
    }
    const auto got = static_cast<std::size_t>(in.gcount());
    out.text.resize(got);
    out.truncated = got > maxBytes;
    if (out.truncated) {
        out.text.resize(Utf8PrefixLength(out.text, maxBytes));
    }
    // Latin-1 and binary files still render as text.
    out.text = ToValidUtf8(out.text);
    return out;
}

} // namespace resources
} // namespace codebridge
