//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FakeIndexProvider.h
// Purpose: Scriptable IIndexProvider and session fixture shared by the dispatcher tests
//==========================================================================================================

#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>

#include "codebridge/Dispatcher.h"
#include "codebridge/InMemoryTransport.hpp"
#include "codebridge/JSONRPCTypes.h"
#include "codebridge/index/IndexProvider.h"

namespace codebridge {
namespace testing_support {

//==========================================================================================================
// FakeIndexProvider
// Purpose: Answers every query from a tiny fixed index. Search latency is scripted per query text so tests
//          can force completion order; every call is counted.
//==========================================================================================================
class FakeIndexProvider : public IIndexProvider {
public:
    std::atomic<int> calls{0};
    std::atomic<int> stopped{0};

    void SetSearchDelay(const std::string& query, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex);
        delays[query] = delay;
    }

    static SymbolRecord Symbol(SymbolId id, const std::string& name, const std::string& kind, const std::string& file,
                               int64_t line) {
        SymbolRecord s;
        s.id = id;
        s.name = name;
        s.kind = kind;
        s.file = file;
        s.line = line;
        s.endLine = line + 5;
        s.language = "rust";
        return s;
    }

    std::future<ProviderResult<std::vector<SearchMatch>>> search(const SearchParams& params, std::stop_token stop) override {
        ++calls;
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (auto it = delays.find(params.query); it != delays.end()) delay = it->second;
        }
        const std::string query = params.query;
        return later<std::vector<SearchMatch>>(delay, stop, [query]() -> ProviderResult<std::vector<SearchMatch>> {
            return std::vector<SearchMatch>{SearchMatch{Symbol(7, query, "function", "src/lib.rs", 10), 0.75}};
        });
    }

    std::future<ProviderResult<std::vector<SymbolRecord>>> listSymbols(const SymbolsParams& params, std::stop_token) override {
        ++calls;
        std::vector<SymbolRecord> out;
        for (const auto& s : all()) {
            if (params.kind && s.kind != *params.kind) continue;
            if (params.name && s.name.find(*params.name) == std::string::npos) continue;
            if (params.file && s.file != *params.file) continue;
            out.push_back(s);
        }
        return MakeReadyResult<std::vector<SymbolRecord>>(std::move(out));
    }

    std::future<ProviderResult<std::vector<std::string>>> listFiles(const FilesParams&, std::stop_token) override {
        ++calls;
        return MakeReadyResult<std::vector<std::string>>(std::vector<std::string>{"src/lib.rs", "src/main.rs"});
    }

    std::future<ProviderResult<SymbolDetail>> showSymbol(const ShowParams& params, std::stop_token) override {
        ++calls;
        for (const auto& s : all()) {
            if (params.id && s.id == *params.id) {
                SymbolDetail d;
                d.symbol = s;
                return MakeReadyResult<SymbolDetail>(std::move(d));
            }
        }
        return MakeReadyResult<SymbolDetail>(ProviderFault{FaultKind::NotFound,
                                                           "Symbol " + std::to_string(params.id.value_or(0)) + " not found"});
    }

    std::future<ProviderResult<TreeNode>> tree(const TreeParams& params, std::stop_token) override {
        ++calls;
        TreeNode root;
        root.name = params.path.empty() ? "project" : params.path;
        root.path = params.path;
        return MakeReadyResult<TreeNode>(std::move(root));
    }

    std::future<ProviderResult<IndexStatus>> status(std::stop_token) override {
        ++calls;
        IndexStatus st;
        st.indexed = true;
        st.fileCount = 2;
        st.symbolCount = static_cast<int64_t>(all().size());
        st.languages = {{"rust", 2}};
        return MakeReadyResult<IndexStatus>(std::move(st));
    }

private:
    static std::vector<SymbolRecord> all() {
        return {Symbol(1, "main", "function", "src/main.rs", 1),
                Symbol(2, "Config", "struct", "src/lib.rs", 3),
                Symbol(3, "Parser", "struct", "src/lib.rs", 20),
                Symbol(4, "parse", "function", "src/lib.rs", 40)};
    }

    template <typename T, typename Fn>
    std::future<ProviderResult<T>> later(std::chrono::milliseconds delay, std::stop_token stop, Fn fn) {
        return std::async(std::launch::async, [this, delay, stop, fn]() -> ProviderResult<T> {
            const auto until = std::chrono::steady_clock::now() + delay;
            while (std::chrono::steady_clock::now() < until) {
                if (stop.stop_requested()) {
                    ++stopped;
                    return ProviderFault{FaultKind::BackendError, "stopped"};
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return fn();
        });
    }

    std::mutex mutex;
    std::map<std::string, std::chrono::milliseconds> delays;
};

//==========================================================================================================
// SessionFixture
// Purpose: Dispatcher bound to an InMemoryTransport and a FakeIndexProvider, with JSON helpers.
//==========================================================================================================
class SessionFixture : public ::testing::Test {
protected:
    static constexpr std::chrono::milliseconds Timeout{3000};

    void SetUp() override {
        std::random_device rd;
        projectDir = std::filesystem::temp_directory_path() / ("codebridge-dispatch-" + std::to_string(rd()));
        std::filesystem::create_directories(projectDir / "src");
        provider = std::make_shared<FakeIndexProvider>();
        transport = std::make_unique<InMemoryTransport>();
        DispatcherOptions opts;
        opts.projectRoot = projectDir.string();
        opts.workerThreads = 4;
        opts.serverVersion = "0.0.0-test";
        dispatcher = std::make_unique<Dispatcher>(*transport, [this](const std::string&) -> std::shared_ptr<IIndexProvider> {
            ++factoryCalls;
            return provider;
        }, opts);
        transport->Start().get();
    }

    void TearDown() override {
        transport->Close().get();
        dispatcher.reset();
        transport.reset();
        std::error_code ec;
        std::filesystem::remove_all(projectDir, ec);
    }

    void send(const std::string& json) { transport->Deliver(json); }

    void request(const std::string& id, const std::string& method, const std::string& params = "") {
        std::string json = "{\"jsonrpc\":\"2.0\",\"id\":" + id + ",\"method\":\"" + method + "\"";
        if (!params.empty()) json += ",\"params\":" + params;
        send(json + "}");
    }

    // Next outbound frame as JSON; a null JSONValue plus a test failure when nothing arrives.
    JSONValue next() {
        auto frame = transport->NextOutbound(Timeout);
        if (!frame.has_value()) {
            ADD_FAILURE() << "no response within timeout";
            return JSONValue();
        }
        return ParseJSON(*frame);
    }

    JSONValue initialize() {
        request("0", "initialize", R"({"protocolVersion":"2025-06-18","capabilities":{},"clientInfo":{"name":"gtest","version":"1"}})");
        auto resp = next();
        send(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
        return resp;
    }

    static int64_t errorCode(const JSONValue& response) {
        const JSONValue* err = GetMember(response, "error");
        if (err == nullptr) return 0;
        return std::get<int64_t>(GetMember(*err, "code")->value);
    }

    static std::string errorMessage(const JSONValue& response) {
        const JSONValue* err = GetMember(response, "error");
        if (err == nullptr) return {};
        return std::get<std::string>(GetMember(*err, "message")->value);
    }

    std::filesystem::path projectDir; // project root handed to the dispatcher; holds src/
    std::shared_ptr<FakeIndexProvider> provider;
    std::unique_ptr<InMemoryTransport> transport;
    std::unique_ptr<Dispatcher> dispatcher;
    std::atomic<int> factoryCalls{0};
};

} // namespace testing_support
} // namespace codebridge
