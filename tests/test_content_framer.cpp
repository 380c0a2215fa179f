//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_content_framer.cpp
// Purpose: Tests for the newline and Content-Length framers
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "codebridge/ContentFramer.h"

using codebridge::IContentFramer;

TEST(NewlineFramerTest, EncodeAppendsSingleNewline) {
    auto framer = codebridge::MakeNewlineFramer(1024);
    EXPECT_EQ(framer->encode("{}"), std::string("{}\n"));
}

TEST(NewlineFramerTest, DecodeSplitsLinesAndKeepsRemainder) {
    auto framer = codebridge::MakeNewlineFramer(1024);
    std::string buffer = "{\"a\":1}\n{\"b\":2}\n{\"c\"";

    auto d1 = framer->tryDecode(buffer);
    ASSERT_TRUE(d1.has_value());
    EXPECT_EQ(d1.value(), "{\"a\":1}");

    auto d2 = framer->tryDecode(buffer);
    ASSERT_TRUE(d2.has_value());
    EXPECT_EQ(d2.value(), "{\"b\":2}");

    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_EQ(buffer, std::string("{\"c\""));
}

TEST(NewlineFramerTest, PartialLineCompletesAcrossReads) {
    auto framer = codebridge::MakeNewlineFramer(1024);
    std::string buffer = "{\"jsonrpc\":";
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    buffer += "\"2.0\"}\n";
    auto decoded = framer->tryDecode(buffer);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "{\"jsonrpc\":\"2.0\"}");
    EXPECT_TRUE(buffer.empty());
}

TEST(NewlineFramerTest, StripsCarriageReturnAndSkipsBlankLines) {
    auto framer = codebridge::MakeNewlineFramer(1024);
    std::string buffer = "\r\n  \n{}\r\n";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Ok);
    ASSERT_TRUE(ex.payload.has_value());
    EXPECT_EQ(ex.payload.value(), "{}");
    EXPECT_EQ(ex.bytesConsumed, buffer.size());
}

TEST(NewlineFramerTest, OverlongLineIsBodyTooLarge) {
    auto framer = codebridge::MakeNewlineFramer(4);
    auto terminated = framer->tryDecodeEx("abcdef\n");
    EXPECT_EQ(terminated.status, IContentFramer::DecodeStatus::BodyTooLarge);

    auto unterminated = framer->tryDecodeEx("abcdef");
    EXPECT_EQ(unterminated.status, IContentFramer::DecodeStatus::BodyTooLarge);

    auto atLimit = framer->tryDecodeEx("abcd\n");
    EXPECT_EQ(atLimit.status, IContentFramer::DecodeStatus::Ok);
}

TEST(ContentLengthFramerTest, EncodeProducesExpectedHeader) {
    auto framer = codebridge::MakeContentLengthFramer(1024);
    EXPECT_EQ(framer->encode("{}"), std::string("Content-Length: 2\r\n\r\n{}"));
}

TEST(ContentLengthFramerTest, BodyTooLargeAboveBoundaryLeavesBuffer) {
    auto framer = codebridge::MakeContentLengthFramer(4);
    std::string buffer = "Content-Length: 5\r\n\r\nabcde";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::BodyTooLarge);
    EXPECT_FALSE(ex.payload.has_value());
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_EQ(buffer, std::string("Content-Length: 5\r\n\r\nabcde"));
}

TEST(ContentLengthFramerTest, InvalidAndMissingHeaders) {
    auto framer = codebridge::MakeContentLengthFramer(1024);
    EXPECT_EQ(framer->tryDecodeEx("Content-Length: abc\r\n\r\n{}").status, IContentFramer::DecodeStatus::InvalidHeader);
    EXPECT_EQ(framer->tryDecodeEx("Content-Type: x\r\n\r\n{}").status, IContentFramer::DecodeStatus::InvalidHeader);
    EXPECT_EQ(framer->tryDecodeEx("garbage\r\n\r\n{}").status, IContentFramer::DecodeStatus::InvalidHeader);
}

TEST(ContentLengthFramerTest, IncompleteHeaderAndBodyWait) {
    auto framer = codebridge::MakeContentLengthFramer(1024);
    auto header = framer->tryDecodeEx("Content-Leng");
    EXPECT_EQ(header.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(header.bytesConsumed, 0u);

    std::string buffer = "Content-Length: 4\r\n\r\nab";
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_EQ(buffer, std::string("Content-Length: 4\r\n\r\nab"));
}

TEST(ContentLengthFramerTest, DecodeMultipleFramesSequentially) {
    auto framer = codebridge::MakeContentLengthFramer(1024);
    std::string buffer = "Content-Length: 1\r\n\r\na";
    buffer += "content-length: 2\r\nContent-Type: application/json\r\n\r\nbc";

    auto d1 = framer->tryDecode(buffer);
    ASSERT_TRUE(d1.has_value());
    EXPECT_EQ(d1.value(), std::string("a"));

    auto d2 = framer->tryDecode(buffer);
    ASSERT_TRUE(d2.has_value());
    EXPECT_EQ(d2.value(), std::string("bc"));
    EXPECT_TRUE(buffer.empty());
}

TEST(FramingMode, NamesRoundTripThroughParser) {
    using codebridge::FramingMode;
    EXPECT_EQ(codebridge::FramingModeFromString("newline"), FramingMode::Newline);
    EXPECT_EQ(codebridge::FramingModeFromString("Content-Length"), FramingMode::ContentLength);
    EXPECT_FALSE(codebridge::FramingModeFromString("xml").has_value());
    EXPECT_STREQ(codebridge::FramingModeName(FramingMode::ContentLength), "content-length");
    EXPECT_STREQ(codebridge::MakeFramer(FramingMode::Newline, 16)->name(), "newline");
}
