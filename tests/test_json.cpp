//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json.cpp
// Purpose: JSON parser/serializer behavior and index record rendering
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "codebridge/JSONRPCTypes.h"
#include "codebridge/index/IndexJson.h"

using namespace codebridge;

TEST(JSON, ParsesNestedDocument) {
    auto v = ParseJSON(R"({"a":[1,2.5,"x",true,null],"b":{"c":-3}})");
    ASSERT_TRUE(v.isObject());
    const JSONValue* a = GetMember(v, "a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->isArray());
    const auto& arr = std::get<JSONValue::Array>(a->value);
    ASSERT_EQ(arr.size(), 5u);
    EXPECT_TRUE(arr[0]->isInteger());
    EXPECT_TRUE(std::holds_alternative<double>(arr[1]->value));
    EXPECT_TRUE(arr[4]->isNull());
    const JSONValue* c = GetMember(*GetMember(v, "b"), "c");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(std::get<int64_t>(c->value), -3);
}

TEST(JSON, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON("{\"a\":1,}"), JSONParseError);
    EXPECT_THROW(ParseJSON("[1 2]"), JSONParseError);
    EXPECT_THROW(ParseJSON("\"unterminated"), JSONParseError);
    EXPECT_THROW(ParseJSON("{} trailing"), JSONParseError);
    EXPECT_THROW(ParseJSON("+1"), JSONParseError);
    EXPECT_THROW(ParseJSON(""), JSONParseError);
}

TEST(JSON, SerializationIsSortedAndEscaped) {
    JSONValue::Object obj;
    obj["zeta"] = MakeJSON(int64_t{1});
    obj["alpha"] = MakeJSON("tab\there\nnewline \"quoted\"");
    const std::string out = SerializeJSON(JSONValue(obj));
    EXPECT_EQ(out, R"({"alpha":"tab\there\nnewline \"quoted\"","zeta":1})");
    EXPECT_EQ(out.find('\n'), std::string::npos);
}

TEST(JSON, DoublesKeepFractionMarker) {
    EXPECT_EQ(SerializeJSON(JSONValue(1.0)), "1.0");
    EXPECT_EQ(SerializeJSON(JSONValue(0.25)), "0.25");
    EXPECT_EQ(ParseJSON(SerializeJSON(JSONValue(0.1))), JSONValue(0.1));
}

TEST(JSON, UnicodeEscapesDecodeToUtf8) {
    auto v = ParseJSON(R"("café 😀")");
    ASSERT_TRUE(v.isString());
    EXPECT_EQ(std::get<std::string>(v.value), "caf\xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JSON, SerializerReplacesIllFormedUtf8) {
    EXPECT_EQ(SerializeJSON(JSONValue(std::string("caf\xC3\xA9"))), "\"caf\xC3\xA9\"");
    EXPECT_EQ(SerializeJSON(JSONValue(std::string("caf\xE9!"))), "\"caf\xEF\xBF\xBD!\"");
    // Overlong '/', then a truncated 3-byte sequence at the end.
    EXPECT_EQ(SerializeJSON(JSONValue(std::string("\xC0\xAF-\xE2\x82"))),
              "\"\xEF\xBF\xBD\xEF\xBF\xBD-\xEF\xBF\xBD\xEF\xBF\xBD\"");

    JSONValue::Object o;
    o[std::string("k\xFF")] = MakeJSON(std::string("v"));
    EXPECT_EQ(SerializeJSON(JSONValue(std::move(o))), "{\"k\xEF\xBF\xBD\":\"v\"}");
}

TEST(JSON, Utf8PrefixStopsAtCharacterBoundary) {
    const std::string text = "a\xE2\x82\xAC\xF0\x9F\x98\x80"; // a, U+20AC, U+1F600
    EXPECT_EQ(Utf8PrefixLength(text, 100), text.size());
    EXPECT_EQ(Utf8PrefixLength(text, 1), 1u);
    EXPECT_EQ(Utf8PrefixLength(text, 2), 1u);
    EXPECT_EQ(Utf8PrefixLength(text, 3), 1u);
    EXPECT_EQ(Utf8PrefixLength(text, 4), 4u);
    EXPECT_EQ(Utf8PrefixLength(text, 7), 4u);
    EXPECT_EQ(Utf8PrefixLength(text, 0), 0u);
    EXPECT_EQ(ToValidUtf8(text), text);
}

TEST(IndexJson, SymbolRecordOmitsAbsentOptionals) {
    SymbolRecord s;
    s.id = 3;
    s.name = "parse";
    s.kind = "function";
    s.file = "src/a.cpp";
    s.line = 10;
    s.endLine = 20;
    const auto json = ToJSON(s);
    EXPECT_EQ(GetMember(json, "signature"), nullptr);
    EXPECT_EQ(GetMember(json, "doc"), nullptr);
    EXPECT_EQ(std::get<int64_t>(GetMember(json, "endLine")->value), 20);
}

TEST(IndexJson, TreeNodeCarriesKindAndChildren) {
    TreeNode root;
    root.name = "";
    root.kind = TreeNodeKind::Directory;
    TreeNode file;
    file.name = "a.cpp";
    file.path = "a.cpp";
    file.kind = TreeNodeKind::File;
    root.children.push_back(file);
    const auto json = ToJSON(root);
    EXPECT_EQ(std::get<std::string>(GetMember(json, "kind")->value), "directory");
    const auto& children = std::get<JSONValue::Array>(GetMember(json, "children")->value);
    ASSERT_EQ(children.size(), 1u);
    EXPECT_EQ(std::get<std::string>(GetMember(*children[0], "kind")->value), "file");
}

TEST(IndexJson, SnapshotParsingLinksSymbolsToFiles) {
    auto root = ParseJSON(R"({
        "version": 1,
        "generatedAt": "2025-01-01T00:00:00Z",
        "files": [{"path": "src/a.py", "language": "python", "size": 10}],
        "symbols": [
            {"id": 1, "name": "main", "kind": "function", "file": "src/a.py", "line": 1, "calls": [2]},
            {"id": 2, "name": "helper", "kind": "function", "file": "src/b.py", "line": 4}
        ]
    })");
    auto snap = ParseIndexSnapshot(root);
    ASSERT_EQ(snap.symbols.size(), 2u);
    ASSERT_EQ(snap.files.size(), 2u);
    EXPECT_EQ(snap.symbols[0].language, std::optional<std::string>("python"));
    EXPECT_EQ(snap.symbols[1].endLine, 4);
    EXPECT_EQ(snap.files[1].path, "src/b.py");
    EXPECT_EQ(snap.files[0].symbolCount, 1);
    ASSERT_EQ(snap.calls[0].size(), 1u);
    EXPECT_EQ(snap.calls[0][0], 2);
}

TEST(IndexJson, SnapshotParsingRejectsBadShapes) {
    EXPECT_THROW(ParseIndexSnapshot(ParseJSON("[]")), std::runtime_error);
    EXPECT_THROW(ParseIndexSnapshot(ParseJSON(R"({"version":2})")), std::runtime_error);
    EXPECT_THROW(ParseIndexSnapshot(ParseJSON(R"({"symbols":[{"id":1,"name":"x"}]})")), std::runtime_error);
    EXPECT_THROW(ParseIndexSnapshot(ParseJSON(
                     R"({"symbols":[{"id":1,"name":"x","file":"a"},{"id":1,"name":"y","file":"a"}]})")),
                 std::runtime_error);
}
