//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: IndexProvider.h
// Purpose: Interface to the external code index
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "codebridge/index/IndexTypes.h"

namespace codebridge {

//==========================================================================================================
// IIndexProvider
// Purpose: Asynchronous, cancellable access to the code index.
// Contract:
//   - Every operation returns immediately with a promise-backed future; work happens elsewhere.
//   - Faults are values (ProviderFault), never exceptions through the future.
//   - When the stop token is triggered the provider should stop early; the caller discards the outcome.
//   - Result order is meaningful: search is ranked by descending score, listings keep the index order
//     unless documented otherwise.
//==========================================================================================================
class IIndexProvider {
public:
    virtual ~IIndexProvider() = default;

    virtual std::future<ProviderResult<std::vector<SearchMatch>>> search(const SearchParams& params, std::stop_token stop) = 0;
    virtual std::future<ProviderResult<std::vector<SymbolRecord>>> listSymbols(const SymbolsParams& params, std::stop_token stop) = 0;
    virtual std::future<ProviderResult<std::vector<std::string>>> listFiles(const FilesParams& params, std::stop_token stop) = 0;
    virtual std::future<ProviderResult<SymbolDetail>> showSymbol(const ShowParams& params, std::stop_token stop) = 0;
    virtual std::future<ProviderResult<TreeNode>> tree(const TreeParams& params, std::stop_token stop) = 0;
    virtual std::future<ProviderResult<IndexStatus>> status(std::stop_token stop) = 0;
};

// Creates the provider for a project root once the handshake has fixed it.
using ProviderFactory = std::function<std::shared_ptr<IIndexProvider>(const std::string& projectRoot)>;

// Helper for providers and test doubles: an already-satisfied future.
template <typename T>
std::future<ProviderResult<T>> MakeReadyResult(ProviderResult<T> value) {
    std::promise<ProviderResult<T>> promise;
    auto fut = promise.get_future();
    promise.set_value(std::move(value));
    return fut;
}

} // namespace codebridge
