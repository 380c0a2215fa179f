//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: IndexTypes.h
// Purpose: Domain records exchanged with the index provider and typed tool parameters
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace codebridge {

using SymbolId = int64_t;

//==========================================================================================================
// SymbolRecord
// Purpose: One named code entity known to the index.
// Fields:
//   line/endLine: 1-based inclusive source range.
//   file: Path relative to the project root, '/' separated.
//==========================================================================================================
struct SymbolRecord {
    SymbolId id{0};
    std::string name;
    std::string kind;
    std::string file;
    int64_t line{0};
    int64_t endLine{0};
    std::optional<std::string> signature;
    std::optional<std::string> doc;
    std::optional<std::string> language;

    bool operator==(const SymbolRecord&) const = default;
};

struct SymbolDetail {
    SymbolRecord symbol;
    std::vector<SymbolRecord> callers;
    std::vector<SymbolRecord> callees;
    int64_t referenceCount{0};
};

struct SearchMatch {
    SymbolRecord symbol;
    double score{0.0}; // [0,1], higher is better
};

struct FileRecord {
    std::string path;
    std::string language;
    int64_t size{0};
    int64_t symbolCount{0};
};

enum class TreeNodeKind {
    Directory,
    File,
    Symbol
};

const char* TreeNodeKindName(TreeNodeKind kind);

struct TreeNode {
    std::string name;
    std::string path;
    TreeNodeKind kind{TreeNodeKind::Directory};
    std::optional<SymbolId> symbolId;
    std::vector<TreeNode> children;
};

struct IndexStatus {
    std::string projectRoot;
    std::string indexPath;
    bool indexed{false};
    int64_t fileCount{0};
    int64_t symbolCount{0};
    std::optional<std::string> generatedAt;
    std::vector<std::pair<std::string, int64_t>> languages; // language -> file count, sorted by name
};

//==========================================================================================================
// Tool parameters (validated, typed)
//==========================================================================================================
struct SearchFilters {
    std::optional<std::string> kind;
    std::optional<std::string> file;
    std::optional<std::string> language;
};

struct SearchParams {
    static constexpr int64_t DefaultLimit = 10;
    static constexpr int64_t MaxLimit = 100;

    std::string query;
    int64_t limit{DefaultLimit};
    SearchFilters filters;
};

struct SymbolsParams {
    static constexpr int64_t MaxLimit = 1000;

    std::optional<std::string> name;
    std::optional<std::string> kind;
    std::optional<std::string> file;
    std::optional<int64_t> limit;
};

struct FilesParams {
    std::optional<std::string> prefix;
    std::optional<std::string> glob;
};

struct ShowParams {
    std::optional<SymbolId> id;
    std::optional<std::string> file;
    std::optional<std::string> name;
};

struct TreeParams {
    std::string path;
    std::optional<int64_t> depth;
};

using ToolCall = std::variant<SearchParams, SymbolsParams, FilesParams, ShowParams, TreeParams>;

//==========================================================================================================
// Provider outcome
//==========================================================================================================
enum class FaultKind {
    NotIndexed,
    NotFound,
    BackendUnavailable,
    BackendError
};

const char* FaultKindName(FaultKind kind);

struct ProviderFault {
    FaultKind kind{FaultKind::BackendError};
    std::string detail; // diagnostics only; never sent to the peer verbatim for backend faults
};

template <typename T>
using ProviderResult = std::variant<T, ProviderFault>;

} // namespace codebridge
