//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: IndexJson.h
// Purpose: JSON rendering of index records and parsing of the index snapshot file
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "codebridge/JSONRPCTypes.h"
#include "codebridge/index/IndexTypes.h"

namespace codebridge {

JSONValue ToJSON(const SymbolRecord& symbol);
JSONValue ToJSON(const SymbolDetail& detail);
JSONValue ToJSON(const SearchMatch& match);
JSONValue ToJSON(const TreeNode& node);
JSONValue ToJSON(const IndexStatus& status);
JSONValue ToJSON(const std::vector<SearchMatch>& matches);
JSONValue ToJSON(const std::vector<SymbolRecord>& symbols);
JSONValue ToJSON(const std::vector<std::string>& paths);

//==========================================================================================================
// IndexSnapshot
// Purpose: In-memory form of the snapshot exported by the external indexer.
// Format:
//   { "version": 1, "generatedAt": "...",
//     "files":   [ { "path", "language", "size" } ],
//     "symbols": [ { "id", "name", "kind", "file", "line", "endLine", "signature"?, "doc"?, "calls": [ids] } ] }
//==========================================================================================================
struct IndexSnapshot {
    int64_t version{1};
    std::optional<std::string> generatedAt;
    std::vector<FileRecord> files;
    std::vector<SymbolRecord> symbols;
    std::vector<std::vector<SymbolId>> calls; // parallel to symbols
};

// Throws std::runtime_error with a description of the first structural problem.
IndexSnapshot ParseIndexSnapshot(const JSONValue& root);

} // namespace codebridge
