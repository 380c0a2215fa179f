//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_snapshot_provider.cpp
// Purpose: SnapshotIndexProvider queries, fault classification and reload behavior
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include "codebridge/index/LexicalRanker.h"
#include "codebridge/index/SnapshotIndexProvider.h"

using namespace codebridge;
namespace fs = std::filesystem;

namespace {

const char* kSnapshot = R"json({
  "version": 1,
  "generatedAt": "2025-06-01T12:00:00Z",
  "files": [
    {"path": "src/config/loader.rs", "language": "rust", "size": 1200},
    {"path": "src/main.rs", "language": "rust", "size": 300},
    {"path": "scripts/build.py", "language": "python", "size": 80}
  ],
  "symbols": [
    {"id": 1, "name": "main", "kind": "function", "file": "src/main.rs", "line": 3, "endLine": 12,
     "signature": "fn main()", "calls": [2, 3]},
    {"id": 2, "name": "load_config", "kind": "function", "file": "src/config/loader.rs", "line": 20, "endLine": 48,
     "signature": "pub fn load_config(path: &Path) -> Result<Config>", "doc": "Parse the configuration file",
     "calls": [3]},
    {"id": 3, "name": "Config", "kind": "struct", "file": "src/config/loader.rs", "line": 5, "endLine": 15,
     "doc": "Runtime configuration"},
    {"id": 4, "name": "build", "kind": "function", "file": "scripts/build.py", "line": 1, "endLine": 9}
  ]
})json";

class SnapshotProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root = fs::temp_directory_path() / ("codebridge-snapshot-" + std::to_string(rd()));
        fs::create_directories(root / ".adi");
        writeIndex(kSnapshot);
        SnapshotProviderOptions opts;
        opts.projectRoot = root.string();
        provider = std::make_unique<SnapshotIndexProvider>(opts);
    }

    void TearDown() override {
        provider.reset();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void writeIndex(const std::string& text) {
        std::ofstream out(root / ".adi" / "index.json", std::ios::trunc);
        out << text;
    }

    template <typename T>
    static ProviderResult<T> wait(std::future<ProviderResult<T>> fut) {
        EXPECT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        return fut.get();
    }

    template <typename T>
    static const T& value(const ProviderResult<T>& r) {
        if (const auto* fault = std::get_if<ProviderFault>(&r)) {
            ADD_FAILURE() << "unexpected fault: " << fault->detail;
        }
        return std::get<T>(r);
    }

    fs::path root;
    std::unique_ptr<SnapshotIndexProvider> provider;
};

} // namespace

TEST_F(SnapshotProviderTest, SearchRanksNameMatchesFirst) {
    SearchParams p;
    p.query = "load config";
    auto r = wait(provider->search(p, {}));
    const auto& matches = value(r);
    ASSERT_GE(matches.size(), 2u);
    EXPECT_EQ(matches[0].symbol.name, "load_config");
    for (std::size_t i = 0; i < matches.size(); ++i) {
        EXPECT_GT(matches[i].score, 0.0);
        EXPECT_LE(matches[i].score, 1.0);
        if (i > 0) {
            EXPECT_GE(matches[i - 1].score, matches[i].score);
        }
    }
}

TEST_F(SnapshotProviderTest, SearchHonorsFiltersAndLimit) {
    SearchParams p;
    p.query = "config";
    p.filters.kind = "struct";
    auto r = wait(provider->search(p, {}));
    const auto& onlyStructs = value(r);
    ASSERT_EQ(onlyStructs.size(), 1u);
    EXPECT_EQ(onlyStructs[0].symbol.id, 3);

    SearchParams limited;
    limited.query = "config";
    limited.limit = 1;
    EXPECT_EQ(value(wait(provider->search(limited, {}))).size(), 1u);

    SearchParams none;
    none.query = "zzzqqq";
    EXPECT_TRUE(value(wait(provider->search(none, {}))).empty());
}

TEST_F(SnapshotProviderTest, ListSymbolsFiltersByKindAndFileScope) {
    SymbolsParams byKind;
    byKind.kind = "function";
    auto functions = value(wait(provider->listSymbols(byKind, {})));
    ASSERT_EQ(functions.size(), 3u);
    EXPECT_EQ(functions[0].id, 1);

    SymbolsParams byDir;
    byDir.file = "src/config";
    EXPECT_EQ(value(wait(provider->listSymbols(byDir, {}))).size(), 2u);

    SymbolsParams bySuffix;
    bySuffix.file = "loader.rs";
    bySuffix.name = "CONF";
    auto matched = value(wait(provider->listSymbols(bySuffix, {})));
    ASSERT_EQ(matched.size(), 2u);

    SymbolsParams limited;
    limited.limit = 2;
    EXPECT_EQ(value(wait(provider->listSymbols(limited, {}))).size(), 2u);
}

TEST_F(SnapshotProviderTest, ListFilesSortedWithPrefixAndGlob) {
    auto all = value(wait(provider->listFiles(FilesParams{}, {})));
    EXPECT_EQ(all, (std::vector<std::string>{"scripts/build.py", "src/config/loader.rs", "src/main.rs"}));

    FilesParams prefix;
    prefix.prefix = "src/";
    EXPECT_EQ(value(wait(provider->listFiles(prefix, {}))).size(), 2u);

    FilesParams glob;
    glob.glob = "*.py";
    EXPECT_EQ(value(wait(provider->listFiles(glob, {}))), (std::vector<std::string>{"scripts/build.py"}));
}

TEST_F(SnapshotProviderTest, ShowReportsCallersCalleesAndReferences) {
    ShowParams p;
    p.id = 3;
    auto detail = value(wait(provider->showSymbol(p, {})));
    EXPECT_EQ(detail.symbol.name, "Config");
    EXPECT_EQ(detail.callers.size(), 2u);
    EXPECT_TRUE(detail.callees.empty());
    EXPECT_EQ(detail.referenceCount, 2);

    ShowParams byName;
    byName.file = "src/main.rs";
    byName.name = "main";
    auto mainDetail = value(wait(provider->showSymbol(byName, {})));
    EXPECT_EQ(mainDetail.symbol.id, 1);
    EXPECT_EQ(mainDetail.callees.size(), 2u);
}

TEST_F(SnapshotProviderTest, ShowUnknownIdIsNotFound) {
    ShowParams p;
    p.id = 999999;
    auto r = wait(provider->showSymbol(p, {}));
    ASSERT_TRUE(std::holds_alternative<ProviderFault>(r));
    EXPECT_EQ(std::get<ProviderFault>(r).kind, FaultKind::NotFound);
}

TEST_F(SnapshotProviderTest, TreeNavigatesAndPrunes) {
    TreeParams rootParams;
    rootParams.path = "";
    rootParams.depth = 1;
    auto top = value(wait(provider->tree(rootParams, {})));
    EXPECT_EQ(top.kind, TreeNodeKind::Directory);
    ASSERT_EQ(top.children.size(), 2u);
    EXPECT_EQ(top.children[0].name, "scripts");
    EXPECT_TRUE(top.children[0].children.empty());

    TreeParams file;
    file.path = "./src/config/loader.rs";
    auto fileNode = value(wait(provider->tree(file, {})));
    EXPECT_EQ(fileNode.kind, TreeNodeKind::File);
    ASSERT_EQ(fileNode.children.size(), 2u);
    EXPECT_EQ(fileNode.children[0].name, "Config"); // line 5 before line 20
    EXPECT_EQ(fileNode.children[0].symbolId, std::optional<SymbolId>(3));

    TreeParams missing;
    missing.path = "docs";
    auto r = wait(provider->tree(missing, {}));
    ASSERT_TRUE(std::holds_alternative<ProviderFault>(r));
    EXPECT_EQ(std::get<ProviderFault>(r).kind, FaultKind::NotFound);
}

TEST_F(SnapshotProviderTest, StatusCountsFilesByLanguage) {
    auto st = value(wait(provider->status({})));
    EXPECT_TRUE(st.indexed);
    EXPECT_EQ(st.fileCount, 3);
    EXPECT_EQ(st.symbolCount, 4);
    EXPECT_EQ(st.generatedAt, std::optional<std::string>("2025-06-01T12:00:00Z"));
    ASSERT_EQ(st.languages.size(), 2u);
    EXPECT_EQ(st.languages[0], (std::pair<std::string, int64_t>{"python", 1}));
    EXPECT_EQ(st.languages[1], (std::pair<std::string, int64_t>{"rust", 2}));
}

TEST_F(SnapshotProviderTest, MissingSnapshotIsNotIndexed) {
    fs::remove(root / ".adi" / "index.json");
    auto r = wait(provider->listFiles(FilesParams{}, {}));
    ASSERT_TRUE(std::holds_alternative<ProviderFault>(r));
    EXPECT_EQ(std::get<ProviderFault>(r).kind, FaultKind::NotIndexed);

    auto st = value(wait(provider->status({})));
    EXPECT_FALSE(st.indexed);
}

TEST_F(SnapshotProviderTest, MalformedSnapshotIsBackendError) {
    writeIndex("{\"symbols\": [");
    fs::last_write_time(root / ".adi" / "index.json", fs::file_time_type::clock::now() + std::chrono::seconds(5));
    auto r = wait(provider->listFiles(FilesParams{}, {}));
    ASSERT_TRUE(std::holds_alternative<ProviderFault>(r));
    EXPECT_EQ(std::get<ProviderFault>(r).kind, FaultKind::BackendError);
}

TEST_F(SnapshotProviderTest, ReloadsWhenSnapshotChanges) {
    EXPECT_EQ(value(wait(provider->listFiles(FilesParams{}, {}))).size(), 3u);
    writeIndex(R"({"version":1,"files":[{"path":"only.c","language":"c"}],"symbols":[]})");
    fs::last_write_time(root / ".adi" / "index.json", fs::file_time_type::clock::now() + std::chrono::seconds(5));
    EXPECT_EQ(value(wait(provider->listFiles(FilesParams{}, {}))), (std::vector<std::string>{"only.c"}));
}

TEST_F(SnapshotProviderTest, StoppedRequestDoesNotRun) {
    std::stop_source source;
    source.request_stop();
    SearchParams p;
    p.query = "config";
    auto r = wait(provider->search(p, source.get_token()));
    EXPECT_TRUE(std::holds_alternative<ProviderFault>(r));
}

TEST(LexicalRanker, ExtractsUniqueLowercaseTerms) {
    auto terms = LexicalRanker::extractQueryTerms("Load the CONFIG, load config!");
    ASSERT_FALSE(terms.empty());
    EXPECT_EQ(terms.front(), "load");
    EXPECT_EQ(std::count(terms.begin(), terms.end(), "config"), 1);
}

TEST(LexicalRanker, TiesBreakByAscendingId) {
    SymbolRecord a;
    a.id = 9;
    SymbolRecord b;
    b.id = 2;
    std::vector<SearchMatch> results{{a, 0.5}, {b, 0.5}, {a, 0.9}};
    LexicalRanker::rankResults(results);
    EXPECT_DOUBLE_EQ(results[0].score, 0.9);
    EXPECT_EQ(results[1].symbol.id, 2);
    EXPECT_EQ(results[2].symbol.id, 9);
}
