//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_resources_prompts.cpp
// Purpose: Resource URI handling, project file access and prompt rendering tests
//==========================================================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <set>
#include <string>

#include "codebridge/prompts/PromptCatalog.h"
#include "codebridge/resources/ResourceCatalog.h"

using namespace codebridge;
namespace fs = std::filesystem;

namespace {

SymbolRecord makeSymbol(SymbolId id, const std::string& name, const std::string& kind, const std::string& file) {
    SymbolRecord s;
    s.id = id;
    s.name = name;
    s.kind = kind;
    s.file = file;
    s.line = 1;
    s.endLine = 2;
    return s;
}

class ProjectDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        base = fs::temp_directory_path() / ("codebridge-res-" + std::to_string(rd()));
        root = base / "project";
        fs::create_directories(root / "src");
        std::ofstream(root / "src" / "lib.rs") << "pub fn answer() -> u32 { 42 }\n";
        std::ofstream(base / "secret.txt") << "outside";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base, ec);
    }

    fs::path base;
    fs::path root;
};

} // namespace

TEST(ResourceUri, ParsesKnownForms) {
    auto status = resources::ParseResourceUri("codebridge://status");
    ASSERT_TRUE(std::holds_alternative<resources::ResourceTarget>(status));
    EXPECT_EQ(std::get<resources::ResourceTarget>(status).kind, resources::ResourceTarget::Kind::Status);

    auto symbol = resources::ParseResourceUri("codebridge://symbol/42");
    ASSERT_TRUE(std::holds_alternative<resources::ResourceTarget>(symbol));
    EXPECT_EQ(std::get<resources::ResourceTarget>(symbol).symbolId, 42);

    auto file = resources::ParseResourceUri("codebridge://file/src/config/loader.rs");
    ASSERT_TRUE(std::holds_alternative<resources::ResourceTarget>(file));
    EXPECT_EQ(std::get<resources::ResourceTarget>(file).kind, resources::ResourceTarget::Kind::File);
    EXPECT_EQ(std::get<resources::ResourceTarget>(file).path, "src/config/loader.rs");
}

TEST(ResourceUri, RejectsMalformedUris) {
    for (const char* uri : {"codebridge://symbol/abc", "codebridge://symbol/", "codebridge://file/",
                            "https://example.com/", "codebridge://nothing"}) {
        auto r = resources::ParseResourceUri(uri);
        ASSERT_TRUE(std::holds_alternative<errors::RpcError>(r)) << uri;
        EXPECT_EQ(std::get<errors::RpcError>(r).code, JSONRPCErrorCodes::InvalidParams) << uri;
    }
}

TEST(ResourceUri, MimeTypesFollowExtensions) {
    EXPECT_EQ(resources::MimeTypeForPath("src/main.rs"), "text/x-rust");
    EXPECT_EQ(resources::MimeTypeForPath("a/b.hpp"), "text/x-c++");
    EXPECT_EQ(resources::MimeTypeForPath("Makefile"), "text/plain");
}

TEST(ResourceList, StaticEntriesComeFirst) {
    auto list = resources::ResourcesListResult({"src/main.rs"});
    const auto& arr = std::get<JSONValue::Array>(GetMember(list, "resources")->value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_EQ(std::get<std::string>(GetMember(*arr[0], "uri")->value), "codebridge://status");
    EXPECT_EQ(std::get<std::string>(GetMember(*arr[1], "uri")->value), "codebridge://tree");
    EXPECT_EQ(std::get<std::string>(GetMember(*arr[2], "uri")->value), "codebridge://file/src/main.rs");
    EXPECT_EQ(std::get<std::string>(GetMember(*arr[2], "name")->value), "main.rs");

    auto templates = resources::ResourceTemplatesListResult();
    EXPECT_EQ(std::get<JSONValue::Array>(GetMember(templates, "resourceTemplates")->value).size(), 2u);
}

TEST_F(ProjectDirTest, ResolveRejectsEscapes) {
    EXPECT_TRUE(resources::ResolveInsideRoot(root.string(), "src/lib.rs").has_value());
    EXPECT_FALSE(resources::ResolveInsideRoot(root.string(), "../secret.txt").has_value());
    EXPECT_FALSE(resources::ResolveInsideRoot(root.string(), "src/../../secret.txt").has_value());
    EXPECT_FALSE(resources::ResolveInsideRoot(root.string(), (base / "secret.txt").string()).has_value());
    EXPECT_FALSE(resources::ResolveInsideRoot(root.string(), "").has_value());
}

TEST_F(ProjectDirTest, ResolveRejectsSymlinkOutOfRoot) {
    std::error_code ec;
    fs::create_symlink(base / "secret.txt", root / "link.txt", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }
    EXPECT_FALSE(resources::ResolveInsideRoot(root.string(), "link.txt").has_value());
}

TEST_F(ProjectDirTest, ReadProjectFileTruncates) {
    auto whole = resources::ReadProjectFile(root.string(), "src/lib.rs");
    ASSERT_TRUE(whole.has_value());
    EXPECT_FALSE(whole->truncated);
    EXPECT_EQ(whole->text, "pub fn answer() -> u32 { 42 }\n");

    auto head = resources::ReadProjectFile(root.string(), "src/lib.rs", 6);
    ASSERT_TRUE(head.has_value());
    EXPECT_TRUE(head->truncated);
    EXPECT_EQ(head->text, "pub fn");

    EXPECT_FALSE(resources::ReadProjectFile(root.string(), "src/missing.rs").has_value());
    EXPECT_FALSE(resources::ReadProjectFile(root.string(), "../secret.txt").has_value());
}

TEST_F(ProjectDirTest, ReadProjectFileRepairsInvalidUtf8) {
    std::ofstream(root / "src" / "legacy.c", std::ios::binary) << "/* caf\xe9 */\n\xc3(\xed\xa0\x80)\n";
    auto file = resources::ReadProjectFile(root.string(), "src/legacy.c");
    ASSERT_TRUE(file.has_value());
    EXPECT_FALSE(file->truncated);
    EXPECT_EQ(file->text, "/* caf\xEF\xBF\xBD */\n\xEF\xBF\xBD(\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD)\n");
}

TEST_F(ProjectDirTest, TruncationNeverSplitsACharacter) {
    // "ab" + U+00E9 (2 bytes) + U+1F600 (4 bytes) + "z"
    std::ofstream(root / "src" / "emoji.txt", std::ios::binary) << "ab\xC3\xA9\xF0\x9F\x98\x80z";
    auto cutInTwoByte = resources::ReadProjectFile(root.string(), "src/emoji.txt", 3);
    ASSERT_TRUE(cutInTwoByte.has_value());
    EXPECT_TRUE(cutInTwoByte->truncated);
    EXPECT_EQ(cutInTwoByte->text, "ab");

    auto cutInFourByte = resources::ReadProjectFile(root.string(), "src/emoji.txt", 7);
    ASSERT_TRUE(cutInFourByte.has_value());
    EXPECT_TRUE(cutInFourByte->truncated);
    EXPECT_EQ(cutInFourByte->text, "ab\xC3\xA9");

    auto onBoundary = resources::ReadProjectFile(root.string(), "src/emoji.txt", 8);
    ASSERT_TRUE(onBoundary.has_value());
    EXPECT_EQ(onBoundary->text, "ab\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(Prompts, CatalogListsSevenPrompts) {
    EXPECT_EQ(prompts::Catalog().size(), 7u);
    auto list = prompts::PromptsListResult();
    const auto& arr = std::get<JSONValue::Array>(GetMember(list, "prompts")->value);
    std::set<std::string> names;
    for (const auto& p : arr) {
        names.insert(std::get<std::string>(GetMember(*p, "name")->value));
    }
    EXPECT_TRUE(names.count("code_review"));
    EXPECT_TRUE(names.count("architecture_overview"));
    EXPECT_EQ(prompts::FindPrompt("nope"), nullptr);
}

TEST(Prompts, MissingArgumentNamesFirstRequired) {
    const auto* review = prompts::FindPrompt("code_review");
    ASSERT_NE(review, nullptr);
    EXPECT_EQ(prompts::MissingArgument(*review, ParseJSON(R"({"focus":"bugs"})")),
              std::optional<std::string>("file_path"));
    EXPECT_EQ(prompts::MissingArgument(*review, ParseJSON(R"({"file_path":3})")),
              std::optional<std::string>("file_path"));
    EXPECT_FALSE(prompts::MissingArgument(*review, ParseJSON(R"({"file_path":"a.rs"})")).has_value());

    const auto* overview = prompts::FindPrompt("architecture_overview");
    ASSERT_NE(overview, nullptr);
    EXPECT_FALSE(prompts::MissingArgument(*overview, ParseJSON("{}")).has_value());
}

TEST(Prompts, ExplainSymbolFallsBackWhenUnknown) {
    auto text = prompts::RenderExplainSymbol("Nope", {});
    EXPECT_NE(text.find("No symbol found with name: Nope"), std::string::npos);

    SymbolDetail d;
    d.symbol = makeSymbol(1, "load_config", "function", "src/config.rs");
    d.callers.push_back(makeSymbol(2, "main", "function", "src/main.rs"));
    auto found = prompts::RenderExplainSymbol("load_config", {d});
    EXPECT_NE(found.find("Callers: main"), std::string::npos);
    EXPECT_NE(found.find("Signature: N/A"), std::string::npos);
}

TEST(Prompts, DependencyDirectionHidesOtherSide) {
    SymbolDetail d;
    d.symbol = makeSymbol(1, "parse", "function", "src/p.rs");
    d.callers.push_back(makeSymbol(2, "main", "function", "src/main.rs"));
    d.callees.push_back(makeSymbol(3, "lex", "function", "src/l.rs"));
    auto callersOnly = prompts::RenderAnalyzeDependencies("parse", "callers", d);
    EXPECT_NE(callersOnly.find("  - main (src/main.rs)"), std::string::npos);
    EXPECT_EQ(callersOnly.find("lex"), std::string::npos);

    auto none = prompts::RenderAnalyzeDependencies("parse", "both", std::nullopt);
    EXPECT_NE(none.find("No symbol found"), std::string::npos);
}

TEST(Prompts, ArchitectureOverviewUsesStatus) {
    EXPECT_NE(prompts::RenderArchitectureOverview(std::nullopt).find("No index available"), std::string::npos);

    IndexStatus st;
    st.indexed = true;
    st.fileCount = 3;
    st.symbolCount = 10;
    st.languages = {{"rust", 3}};
    auto text = prompts::RenderArchitectureOverview(st);
    EXPECT_NE(text.find("Total files: 3"), std::string::npos);
    EXPECT_NE(text.find("- rust: 3 files"), std::string::npos);
}

TEST(Prompts, ResultWrapsSingleUserMessage) {
    auto r = prompts::PromptResult("desc", "body");
    const auto& messages = std::get<JSONValue::Array>(GetMember(r, "messages")->value);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(std::get<std::string>(GetMember(*messages[0], "role")->value), "user");
    const JSONValue* content = GetMember(*messages[0], "content");
    EXPECT_EQ(std::get<std::string>(GetMember(*content, "text")->value), "body");
}
