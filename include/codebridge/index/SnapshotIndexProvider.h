//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SnapshotIndexProvider.h
// Purpose: IIndexProvider backed by the JSON snapshot the external indexer writes into the project
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "codebridge/index/IndexProvider.h"
#include "codebridge/index/LexicalRanker.h"

namespace codebridge {

struct SnapshotProviderOptions {
    std::string projectRoot{"."};
    std::string indexFile{".adi/index.json"}; // relative to projectRoot unless absolute
    std::size_t threads{2};
    RankingConfig ranking{};
};

//==========================================================================================================
// SnapshotIndexProvider
// Purpose: Serves index queries from a read-only snapshot file.
// Notes:
//   - Queries run on the provider's own Boost.Asio thread pool.
//   - The snapshot is loaded on first use and reloaded when its modification time changes.
//   - Missing snapshot -> NotIndexed; unreadable -> BackendUnavailable; malformed -> BackendError.
//==========================================================================================================
class SnapshotIndexProvider : public IIndexProvider {
public:
    explicit SnapshotIndexProvider(SnapshotProviderOptions options);
    ~SnapshotIndexProvider() override;

    std::future<ProviderResult<std::vector<SearchMatch>>> search(const SearchParams& params, std::stop_token stop) override;
    std::future<ProviderResult<std::vector<SymbolRecord>>> listSymbols(const SymbolsParams& params, std::stop_token stop) override;
    std::future<ProviderResult<std::vector<std::string>>> listFiles(const FilesParams& params, std::stop_token stop) override;
    std::future<ProviderResult<SymbolDetail>> showSymbol(const ShowParams& params, std::stop_token stop) override;
    std::future<ProviderResult<TreeNode>> tree(const TreeParams& params, std::stop_token stop) override;
    std::future<ProviderResult<IndexStatus>> status(std::stop_token stop) override;

    std::string IndexPath() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

ProviderFactory MakeSnapshotProviderFactory(std::string indexFile, std::size_t threads);

} // namespace codebridge
