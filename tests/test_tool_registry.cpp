//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_registry.cpp
// Purpose: Tool catalogue, published schemas and schema-first parameter validation
//==========================================================================================================

#include <gtest/gtest.h>

#include <set>
#include <string>

#include "codebridge/tools/ToolRegistry.h"
#include "codebridge/validation/SchemaValidator.h"

using namespace codebridge;

namespace {

JSONValue params(const std::string& json) {
    return ParseJSON(json);
}

std::optional<errors::RpcError> check(const ToolRegistry& reg, const std::string& tool, const std::string& json,
                                      ToolCall& out) {
    const JSONValue p = params(json);
    return reg.validate(tool, &p, out);
}

} // namespace

TEST(ToolRegistry, PublishesExactlyFiveTools) {
    ToolRegistry reg;
    auto list = reg.toolsListResult();
    const auto& tools = std::get<JSONValue::Array>(GetMember(list, "tools")->value);
    std::set<std::string> names;
    for (const auto& t : tools) {
        names.insert(std::get<std::string>(GetMember(*t, "name")->value));
        const JSONValue* schema = GetMember(*t, "inputSchema");
        ASSERT_NE(schema, nullptr);
        EXPECT_EQ(std::get<std::string>(GetMember(*schema, "type")->value), "object");
        EXPECT_NE(GetMember(*t, "description"), nullptr);
    }
    EXPECT_EQ(names, (std::set<std::string>{"search", "symbols", "files", "show", "tree"}));
}

TEST(ToolRegistry, UnknownToolIsMethodNotFound) {
    ToolRegistry reg;
    ToolCall out;
    auto err = check(reg, "index", "{}", out);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(reg.resolve("index"), nullptr);
    ASSERT_NE(reg.resolve("tree"), nullptr);
    EXPECT_EQ(reg.resolve("tree")->kind, ToolKind::Tree);
}

TEST(ToolRegistry, SearchDefaultsAndClampsLimit) {
    ToolRegistry reg;
    ToolCall out;
    ASSERT_FALSE(check(reg, "search", R"({"query":"parse config"})", out).has_value());
    EXPECT_EQ(std::get<SearchParams>(out).limit, SearchParams::DefaultLimit);

    ASSERT_FALSE(check(reg, "search", R"({"query":"x","limit":5000})", out).has_value());
    EXPECT_EQ(std::get<SearchParams>(out).limit, SearchParams::MaxLimit);

    ASSERT_FALSE(check(reg, "search", R"({"query":"x","limit":0,"filters":{"kind":"function"}})", out).has_value());
    EXPECT_EQ(std::get<SearchParams>(out).limit, 1);
    EXPECT_EQ(std::get<SearchParams>(out).filters.kind, std::optional<std::string>("function"));
}

TEST(ToolRegistry, SearchRejectsMissingEmptyAndMistypedQuery) {
    ToolRegistry reg;
    ToolCall out;
    auto missing = check(reg, "search", R"({"limit":3})", out);
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_NE(missing->message.find("query: required property missing"), std::string::npos);

    auto empty = check(reg, "search", R"({"query":""})", out);
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(empty->code, JSONRPCErrorCodes::InvalidParams);

    auto blank = check(reg, "search", R"({"query":"   "})", out);
    ASSERT_TRUE(blank.has_value());

    auto mistyped = check(reg, "search", R"({"query":"x","limit":"ten"})", out);
    ASSERT_TRUE(mistyped.has_value());
    EXPECT_NE(mistyped->message.find("limit: expected integer, got string"), std::string::npos);
}

TEST(ToolRegistry, AbsentParamsMeanEmptyObject) {
    ToolRegistry reg;
    ToolCall out;
    EXPECT_FALSE(reg.validate("files", nullptr, out).has_value());
    EXPECT_TRUE(std::holds_alternative<FilesParams>(out));

    auto treeErr = reg.validate("tree", nullptr, out);
    ASSERT_TRUE(treeErr.has_value());
    EXPECT_EQ(treeErr->code, JSONRPCErrorCodes::InvalidParams);

    const JSONValue notObject = params("[1,2]");
    auto arrErr = reg.validate("files", &notObject, out);
    ASSERT_TRUE(arrErr.has_value());
    EXPECT_EQ(arrErr->code, JSONRPCErrorCodes::InvalidParams);
}

TEST(ToolRegistry, SymbolsLimitIsRangeChecked) {
    ToolRegistry reg;
    ToolCall out;
    ASSERT_FALSE(check(reg, "symbols", R"({"kind":"struct","limit":1000,"extra":true})", out).has_value());
    const auto& sp = std::get<SymbolsParams>(out);
    EXPECT_EQ(sp.kind, std::optional<std::string>("struct"));
    EXPECT_EQ(sp.limit, std::optional<int64_t>(1000));

    EXPECT_TRUE(check(reg, "symbols", R"({"limit":1001})", out).has_value());
    EXPECT_TRUE(check(reg, "symbols", R"({"limit":0})", out).has_value());
    EXPECT_TRUE(check(reg, "symbols", R"({"name":7})", out).has_value());
}

TEST(ToolRegistry, ShowNeedsIdOrFileAndName) {
    ToolRegistry reg;
    ToolCall out;
    ASSERT_FALSE(check(reg, "show", R"({"id":12})", out).has_value());
    EXPECT_EQ(std::get<ShowParams>(out).id, std::optional<int64_t>(12));

    ASSERT_FALSE(check(reg, "show", R"({"file":"src/a.rs","name":"main"})", out).has_value());
    EXPECT_EQ(std::get<ShowParams>(out).name, std::optional<std::string>("main"));

    EXPECT_TRUE(check(reg, "show", "{}", out).has_value());
    EXPECT_TRUE(check(reg, "show", R"({"file":"src/a.rs"})", out).has_value());
    EXPECT_TRUE(check(reg, "show", R"({"id":1,"name":"main"})", out).has_value());
    EXPECT_TRUE(check(reg, "show", R"({"id":"12"})", out).has_value());
}

TEST(ToolRegistry, TreeRequiresPathAndNonNegativeDepth) {
    ToolRegistry reg;
    ToolCall out;
    ASSERT_FALSE(check(reg, "tree", R"({"path":"src","depth":0})", out).has_value());
    EXPECT_EQ(std::get<TreeParams>(out).path, "src");
    EXPECT_EQ(std::get<TreeParams>(out).depth, std::optional<int64_t>(0));

    ASSERT_FALSE(check(reg, "tree", R"({"path":""})", out).has_value());
    EXPECT_FALSE(std::get<TreeParams>(out).depth.has_value());

    EXPECT_TRUE(check(reg, "tree", R"({"path":"src","depth":-1})", out).has_value());
    EXPECT_TRUE(check(reg, "tree", R"({"depth":2})", out).has_value());
}

TEST(SchemaValidator, ReportsPathOfNestedFailures) {
    auto schema = ParseJSON(R"({"type":"object","properties":{
        "filters":{"type":"object","properties":{"kind":{"type":"string"}}},
        "tags":{"type":"array","items":{"type":"string"}},
        "mode":{"enum":["a","b"]}}})");
    auto nested = validation::ValidateAgainstSchema(schema, ParseJSON(R"({"filters":{"kind":3}})"));
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(*nested, "filters.kind: expected string, got integer");

    auto item = validation::ValidateAgainstSchema(schema, ParseJSON(R"({"tags":["x",false]})"));
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, "tags[1]: expected string, got boolean");

    EXPECT_TRUE(validation::ValidateAgainstSchema(schema, ParseJSON(R"({"mode":"c"})")).has_value());
    EXPECT_FALSE(validation::ValidateAgainstSchema(schema, ParseJSON(R"({"mode":"b"})")).has_value());

    auto root = validation::ValidateAgainstSchema(schema, ParseJSON("42"));
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(*root, "params: expected object, got integer");
}
