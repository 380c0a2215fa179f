//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceCatalog.h
// Purpose: codebridge:// resource URIs, listings and project file access
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "codebridge/JSONRPCTypes.h"
#include "codebridge/errors/Errors.h"
#include "codebridge/index/IndexTypes.h"

namespace codebridge {
namespace resources {

inline constexpr const char* StatusUri = "codebridge://status";
inline constexpr const char* TreeUri = "codebridge://tree";
inline constexpr const char* FileUriPrefix = "codebridge://file/";
inline constexpr const char* SymbolUriPrefix = "codebridge://symbol/";

// Largest slice of a project file embedded in a resource read.
inline constexpr std::size_t MaxFileContentBytes = 1024 * 1024;

struct ResourceTarget {
    enum class Kind { Status, Tree, Symbol, File };
    Kind kind{Kind::Status};
    SymbolId symbolId{0};
    std::string path;
};

// Parses a resource URI. Unknown schemes or paths, and non-numeric symbol ids, are InvalidParams.
std::variant<ResourceTarget, errors::RpcError> ParseResourceUri(const std::string& uri);

// MIME type guessed from a file extension; text/plain when unknown.
std::string MimeTypeForPath(const std::string& path);

//==========================================================================================================
// ResourcesListResult
// Purpose: { "resources": [...] } with the status and tree entries followed by one entry per file.
// Args:
//   files: Indexed file paths; empty when the index is unavailable.
//==========================================================================================================
JSONValue ResourcesListResult(const std::vector<std::string>& files);

JSONValue ResourceTemplatesListResult();

// { "contents": [ { uri, mimeType, text } ] }
JSONValue ReadResult(const std::string& uri, const std::string& mimeType, const std::string& text);

//==========================================================================================================
// ResolveInsideRoot
// Purpose: Joins a project-relative path to root. Absolute paths and paths that escape root (through ".."
//          or symlinks) yield std::nullopt.
//==========================================================================================================
std::optional<std::string> ResolveInsideRoot(const std::string& root, const std::string& relative);

struct FileText {
    std::string text;
    bool truncated{false};
};

// Reads at most maxBytes of a project file as UTF-8 text: the cut never splits a character and ill-formed
// bytes become U+FFFD. std::nullopt when the path escapes root or cannot be read.
std::optional<FileText> ReadProjectFile(const std::string& root, const std::string& relative,
                                        std::size_t maxBytes = MaxFileContentBytes);

} // namespace resources
} // namespace codebridge
