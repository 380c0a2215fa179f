//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SnapshotIndexProvider.cpp
// Purpose: IIndexProvider backed by the indexer's JSON snapshot
//==========================================================================================================

#include <fnmatch.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <sstream>
#include <unordered_map>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "logging/Logger.h"
#include "codebridge/index/IndexJson.h"
#include "codebridge/index/SnapshotIndexProvider.h"

namespace codebridge {

namespace fs = std::filesystem;

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() && toLower(a) == toLower(b);
}

// "./src//lib/" -> "src/lib"; "." and "/" -> ""
std::string normalizeRelPath(const std::string& raw) {
    std::string p = raw;
    std::replace(p.begin(), p.end(), '\\', '/');
    std::string out;
    out.reserve(p.size());
    std::size_t i = 0;
    while (i < p.size()) {
        std::size_t j = p.find('/', i);
        if (j == std::string::npos) j = p.size();
        std::string part = p.substr(i, j - i);
        if (!part.empty() && part != ".") {
            if (!out.empty()) out.push_back('/');
            out += part;
        }
        i = j + 1;
    }
    return out;
}

// Exact path, path suffix on a component boundary, or directory prefix.
bool inFileScope(const std::string& filePath, const std::string& scope) {
    if (scope.empty() || filePath == scope) {
        return true;
    }
    if (filePath.size() > scope.size()) {
        if (filePath.ends_with("/" + scope)) return true;
        if (filePath.starts_with(scope + "/")) return true;
    }
    return false;
}

ProviderFault cancelledFault() {
    return ProviderFault{FaultKind::BackendError, "operation cancelled"};
}

struct DirBuilder {
    std::map<std::string, std::unique_ptr<DirBuilder>> dirs;
    std::map<std::string, std::string> files; // name -> full path
};

struct LoadedIndex {
    IndexSnapshot snapshot;
    fs::file_time_type mtime;
    std::unordered_map<SymbolId, std::size_t> byId;
    std::unordered_map<SymbolId, std::vector<SymbolId>> callers;
    std::unordered_map<std::string, std::vector<std::size_t>> symbolsByFile; // sorted by line, id
    std::vector<std::string> sortedPaths;
    TreeNode root;

    const SymbolRecord* find(SymbolId id) const {
        auto it = byId.find(id);
        return it == byId.end() ? nullptr : &snapshot.symbols[it->second];
    }
};

TreeNode buildNode(const LoadedIndex& idx, const DirBuilder& dir, const std::string& name, const std::string& path) {
    TreeNode node;
    node.name = name;
    node.path = path;
    node.kind = TreeNodeKind::Directory;
    for (const auto& [childName, child] : dir.dirs) {
        node.children.push_back(buildNode(idx, *child, childName, path.empty() ? childName : path + "/" + childName));
    }
    for (const auto& [fileName, filePath] : dir.files) {
        TreeNode fileNode;
        fileNode.name = fileName;
        fileNode.path = filePath;
        fileNode.kind = TreeNodeKind::File;
        auto it = idx.symbolsByFile.find(filePath);
        if (it != idx.symbolsByFile.end()) {
            for (std::size_t k : it->second) {
                const SymbolRecord& s = idx.snapshot.symbols[k];
                TreeNode symNode;
                symNode.name = s.name;
                symNode.path = filePath + "#" + std::to_string(s.line);
                symNode.kind = TreeNodeKind::Symbol;
                symNode.symbolId = s.id;
                fileNode.children.push_back(std::move(symNode));
            }
        }
        node.children.push_back(std::move(fileNode));
    }
    return node;
}

TreeNode pruneToDepth(const TreeNode& node, std::optional<int64_t> depth) {
    TreeNode out;
    out.name = node.name;
    out.path = node.path;
    out.kind = node.kind;
    out.symbolId = node.symbolId;
    if (depth.has_value() && *depth <= 0) {
        return out;
    }
    std::optional<int64_t> next = depth.has_value() ? std::optional<int64_t>(*depth - 1) : std::nullopt;
    out.children.reserve(node.children.size());
    for (const auto& child : node.children) {
        out.children.push_back(pruneToDepth(child, next));
    }
    return out;
}

std::shared_ptr<LoadedIndex> buildIndex(IndexSnapshot snapshot, fs::file_time_type mtime, const std::string& rootName) {
    auto idx = std::make_shared<LoadedIndex>();
    idx->snapshot = std::move(snapshot);
    idx->mtime = mtime;
    const auto& symbols = idx->snapshot.symbols;
    for (std::size_t k = 0; k < symbols.size(); ++k) {
        idx->byId.emplace(symbols[k].id, k);
        idx->symbolsByFile[symbols[k].file].push_back(k);
    }
    for (std::size_t k = 0; k < symbols.size(); ++k) {
        for (SymbolId callee : idx->snapshot.calls[k]) {
            auto& list = idx->callers[callee];
            if (std::find(list.begin(), list.end(), symbols[k].id) == list.end()) {
                list.push_back(symbols[k].id);
            }
        }
    }
    for (auto& [file, list] : idx->symbolsByFile) {
        std::sort(list.begin(), list.end(), [&symbols](std::size_t a, std::size_t b) {
            if (symbols[a].line != symbols[b].line) return symbols[a].line < symbols[b].line;
            return symbols[a].id < symbols[b].id;
        });
    }
    for (const auto& f : idx->snapshot.files) {
        idx->sortedPaths.push_back(f.path);
    }
    std::sort(idx->sortedPaths.begin(), idx->sortedPaths.end());

    DirBuilder rootDir;
    for (const auto& path : idx->sortedPaths) {
        DirBuilder* cur = &rootDir;
        std::size_t start = 0;
        while (true) {
            std::size_t slash = path.find('/', start);
            if (slash == std::string::npos) {
                cur->files[path.substr(start)] = path;
                break;
            }
            auto& next = cur->dirs[path.substr(start, slash - start)];
            if (!next) next = std::make_unique<DirBuilder>();
            cur = next.get();
            start = slash + 1;
        }
    }
    idx->root = buildNode(*idx, rootDir, rootName, "");
    return idx;
}

} // namespace

class SnapshotIndexProvider::Impl {
public:
    SnapshotProviderOptions options;
    std::string indexPath;
    std::string rootName;
    LexicalRanker ranker;
    boost::asio::thread_pool pool;

    std::mutex loadMutex; // serializes loads and guards cached
    std::shared_ptr<const LoadedIndex> cached;

    explicit Impl(SnapshotProviderOptions opts)
        : options(std::move(opts)),
          ranker(options.ranking),
          pool(std::max<std::size_t>(1, options.threads)) {
        fs::path idxPath(options.indexFile);
        if (idxPath.is_relative()) {
            idxPath = fs::path(options.projectRoot) / idxPath;
        }
        indexPath = idxPath.lexically_normal().string();
        std::error_code ec;
        fs::path canonicalRoot = fs::weakly_canonical(fs::path(options.projectRoot), ec);
        rootName = (ec || canonicalRoot.filename().empty()) ? std::string(".") : canonicalRoot.filename().string();
    }

    ~Impl() {
        pool.stop();
        pool.join();
    }

    std::variant<std::shared_ptr<const LoadedIndex>, ProviderFault> acquire() {
        std::lock_guard<std::mutex> lock(loadMutex);
        std::error_code ec;
        const fs::path path(indexPath);
        const bool exists = fs::exists(path, ec);
        if (ec) {
            return ProviderFault{FaultKind::BackendUnavailable, "cannot stat " + indexPath + ": " + ec.message()};
        }
        if (!exists) {
            return ProviderFault{FaultKind::NotIndexed, "no index snapshot at " + indexPath};
        }
        const auto mtime = fs::last_write_time(path, ec);
        if (ec) {
            return ProviderFault{FaultKind::BackendUnavailable, "cannot stat " + indexPath + ": " + ec.message()};
        }
        if (cached && cached->mtime == mtime) {
            return cached;
        }

        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in.is_open()) {
            return ProviderFault{FaultKind::BackendUnavailable, "cannot open " + indexPath};
        }
        std::ostringstream contents;
        contents << in.rdbuf();
        if (in.bad()) {
            return ProviderFault{FaultKind::BackendUnavailable, "read error on " + indexPath};
        }

        try {
            IndexSnapshot snap = ParseIndexSnapshot(ParseJSON(contents.str()));
            LOG_INFO("SnapshotIndexProvider: loaded {} files, {} symbols from {}", snap.files.size(), snap.symbols.size(), indexPath);
            cached = buildIndex(std::move(snap), mtime, rootName);
            return cached;
        } catch (const JSONParseError& e) {
            return ProviderFault{FaultKind::BackendError, "malformed index snapshot: " + std::string(e.what())};
        } catch (const std::runtime_error& e) {
            return ProviderFault{FaultKind::BackendError, e.what()};
        }
    }

    template <typename T, typename Fn>
    std::future<ProviderResult<T>> submit(std::stop_token stop, Fn fn) {
        auto promise = std::make_shared<std::promise<ProviderResult<T>>>();
        auto fut = promise->get_future();
        boost::asio::post(pool, [this, promise, stop, fn = std::move(fn)]() {
            ProviderResult<T> outcome = ProviderFault{};
            try {
                if (stop.stop_requested()) {
                    outcome = cancelledFault();
                } else {
                    auto loaded = acquire();
                    if (std::holds_alternative<ProviderFault>(loaded)) {
                        outcome = std::get<ProviderFault>(loaded);
                    } else {
                        outcome = fn(*std::get<std::shared_ptr<const LoadedIndex>>(loaded), stop);
                    }
                }
            } catch (const std::exception& e) {
                outcome = ProviderFault{FaultKind::BackendError, e.what()};
            }
            if (std::holds_alternative<ProviderFault>(outcome)) {
                const auto& f = std::get<ProviderFault>(outcome);
                LOG_DEBUG("SnapshotIndexProvider: fault {} ({})", FaultKindName(f.kind), f.detail);
            }
            promise->set_value(std::move(outcome));
        });
        return fut;
    }
};

SnapshotIndexProvider::SnapshotIndexProvider(SnapshotProviderOptions options)
    : pImpl(std::make_unique<Impl>(std::move(options))) {
    FUNC_SCOPE();
}

SnapshotIndexProvider::~SnapshotIndexProvider() { FUNC_SCOPE(); }

std::string SnapshotIndexProvider::IndexPath() const { return pImpl->indexPath; }

std::future<ProviderResult<std::vector<SearchMatch>>> SnapshotIndexProvider::search(const SearchParams& params, std::stop_token stop) {
    FUNC_SCOPE();
    const LexicalRanker* ranker = &pImpl->ranker;
    return pImpl->submit<std::vector<SearchMatch>>(stop, [params, ranker](const LoadedIndex& idx, const std::stop_token& st) -> ProviderResult<std::vector<SearchMatch>> {
        const auto terms = LexicalRanker::extractQueryTerms(params.query);
        std::string normalizedQuery = toLower(params.query);
        normalizedQuery.erase(0, normalizedQuery.find_first_not_of(" \t"));
        normalizedQuery.erase(normalizedQuery.find_last_not_of(" \t") + 1);
        const std::string fileScope = normalizeRelPath(params.filters.file.value_or(""));

        std::vector<SearchMatch> matches;
        std::size_t visited = 0;
        for (const auto& s : idx.snapshot.symbols) {
            if ((++visited & 0xFF) == 0 && st.stop_requested()) {
                return cancelledFault();
            }
            if (params.filters.kind && !equalsIgnoreCase(s.kind, *params.filters.kind)) continue;
            if (params.filters.language && !equalsIgnoreCase(s.language.value_or(""), *params.filters.language)) continue;
            if (!inFileScope(s.file, fileScope)) continue;
            const double score = ranker->calculateScore(s, terms, normalizedQuery);
            if (score > 0.0) {
                matches.push_back(SearchMatch{s, score});
            }
        }
        LexicalRanker::rankResults(matches);
        if (matches.size() > static_cast<std::size_t>(params.limit)) {
            matches.resize(static_cast<std::size_t>(params.limit));
        }
        return matches;
    });
}

std::future<ProviderResult<std::vector<SymbolRecord>>> SnapshotIndexProvider::listSymbols(const SymbolsParams& params, std::stop_token stop) {
    FUNC_SCOPE();
    return pImpl->submit<std::vector<SymbolRecord>>(stop, [params](const LoadedIndex& idx, const std::stop_token& st) -> ProviderResult<std::vector<SymbolRecord>> {
        const std::string needle = toLower(params.name.value_or(""));
        const std::string fileScope = normalizeRelPath(params.file.value_or(""));
        const std::size_t limit = static_cast<std::size_t>(params.limit.value_or(SymbolsParams::MaxLimit));
        std::vector<SymbolRecord> out;
        std::size_t visited = 0;
        for (const auto& s : idx.snapshot.symbols) {
            if ((++visited & 0xFF) == 0 && st.stop_requested()) {
                return cancelledFault();
            }
            if (!needle.empty() && toLower(s.name).find(needle) == std::string::npos) continue;
            if (params.kind && !equalsIgnoreCase(s.kind, *params.kind)) continue;
            if (!inFileScope(s.file, fileScope)) continue;
            out.push_back(s);
            if (out.size() >= limit) break;
        }
        return out;
    });
}

std::future<ProviderResult<std::vector<std::string>>> SnapshotIndexProvider::listFiles(const FilesParams& params, std::stop_token stop) {
    FUNC_SCOPE();
    return pImpl->submit<std::vector<std::string>>(stop, [params](const LoadedIndex& idx, const std::stop_token&) -> ProviderResult<std::vector<std::string>> {
        std::string prefix = params.prefix.value_or("");
        if (prefix.starts_with("./")) prefix.erase(0, 2);
        if (prefix == ".") prefix.clear();
        std::vector<std::string> out;
        for (const auto& path : idx.sortedPaths) {
            if (!prefix.empty() && !path.starts_with(prefix)) continue;
            if (params.glob && ::fnmatch(params.glob->c_str(), path.c_str(), 0) != 0) continue;
            out.push_back(path);
        }
        return out;
    });
}

std::future<ProviderResult<SymbolDetail>> SnapshotIndexProvider::showSymbol(const ShowParams& params, std::stop_token stop) {
    FUNC_SCOPE();
    return pImpl->submit<SymbolDetail>(stop, [params](const LoadedIndex& idx, const std::stop_token&) -> ProviderResult<SymbolDetail> {
        const SymbolRecord* target = nullptr;
        if (params.id.has_value()) {
            target = idx.find(*params.id);
            if (target == nullptr) {
                return ProviderFault{FaultKind::NotFound, "Symbol " + std::to_string(*params.id) + " not found"};
            }
        } else {
            const std::string scope = normalizeRelPath(params.file.value_or(""));
            const std::string& name = params.name.value_or("");
            for (const auto& s : idx.snapshot.symbols) {
                if (s.name == name && inFileScope(s.file, scope) && (target == nullptr || s.line < target->line)) {
                    target = &s;
                }
            }
            if (target == nullptr) {
                return ProviderFault{FaultKind::NotFound, "Symbol '" + name + "' not found in " + params.file.value_or("")};
            }
        }

        SymbolDetail detail;
        detail.symbol = *target;
        if (auto it = idx.callers.find(target->id); it != idx.callers.end()) {
            for (SymbolId callerId : it->second) {
                if (const SymbolRecord* c = idx.find(callerId)) detail.callers.push_back(*c);
            }
        }
        const std::size_t pos = idx.byId.at(target->id);
        for (SymbolId calleeId : idx.snapshot.calls[pos]) {
            if (const SymbolRecord* c = idx.find(calleeId)) detail.callees.push_back(*c);
        }
        detail.referenceCount = static_cast<int64_t>(detail.callers.size());
        return detail;
    });
}

std::future<ProviderResult<TreeNode>> SnapshotIndexProvider::tree(const TreeParams& params, std::stop_token stop) {
    FUNC_SCOPE();
    return pImpl->submit<TreeNode>(stop, [params](const LoadedIndex& idx, const std::stop_token&) -> ProviderResult<TreeNode> {
        const std::string path = normalizeRelPath(params.path);
        const TreeNode* node = &idx.root;
        std::size_t start = 0;
        while (!path.empty() && start <= path.size()) {
            std::size_t slash = path.find('/', start);
            const std::string part = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
            const TreeNode* next = nullptr;
            for (const auto& child : node->children) {
                if (child.kind != TreeNodeKind::Symbol && child.name == part) {
                    next = &child;
                    break;
                }
            }
            if (next == nullptr) {
                return ProviderFault{FaultKind::NotFound, "Path '" + params.path + "' is not in the index"};
            }
            node = next;
            if (slash == std::string::npos) break;
            start = slash + 1;
        }
        return pruneToDepth(*node, params.depth);
    });
}

std::future<ProviderResult<IndexStatus>> SnapshotIndexProvider::status(std::stop_token stop) {
    FUNC_SCOPE();
    auto promise = std::make_shared<std::promise<ProviderResult<IndexStatus>>>();
    auto fut = promise->get_future();
    Impl* impl = pImpl.get();
    boost::asio::post(impl->pool, [impl, promise, stop]() {
        IndexStatus st;
        st.projectRoot = impl->options.projectRoot;
        st.indexPath = impl->indexPath;
        if (stop.stop_requested()) {
            promise->set_value(cancelledFault());
            return;
        }
        try {
            auto loaded = impl->acquire();
            if (std::holds_alternative<ProviderFault>(loaded)) {
                const auto& fault = std::get<ProviderFault>(loaded);
                if (fault.kind != FaultKind::NotIndexed) {
                    promise->set_value(fault);
                    return;
                }
                promise->set_value(st); // indexed=false
                return;
            }
            const auto& idx = *std::get<std::shared_ptr<const LoadedIndex>>(loaded);
            st.indexed = true;
            st.fileCount = static_cast<int64_t>(idx.snapshot.files.size());
            st.symbolCount = static_cast<int64_t>(idx.snapshot.symbols.size());
            st.generatedAt = idx.snapshot.generatedAt;
            std::map<std::string, int64_t> langs;
            for (const auto& f : idx.snapshot.files) {
                ++langs[f.language];
            }
            st.languages.assign(langs.begin(), langs.end());
            promise->set_value(std::move(st));
        } catch (const std::exception& e) {
            promise->set_value(ProviderFault{FaultKind::BackendError, e.what()});
        }
    });
    return fut;
}

ProviderFactory MakeSnapshotProviderFactory(std::string indexFile, std::size_t threads) {
    return [indexFile = std::move(indexFile), threads](const std::string& projectRoot) -> std::shared_ptr<IIndexProvider> {
        SnapshotProviderOptions opts;
        opts.projectRoot = projectRoot;
        opts.indexFile = indexFile;
        opts.threads = threads;
        return std::make_shared<SnapshotIndexProvider>(std::move(opts));
    };
}

} // namespace codebridge
