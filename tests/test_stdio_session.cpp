//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_session.cpp
// Purpose: End-to-end sessions through StdioTransport over pipes against a real snapshot index
//==========================================================================================================

#include <gtest/gtest.h>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "codebridge/Dispatcher.h"
#include "codebridge/JSONRPCTypes.h"
#include "codebridge/Server.h"
#include "codebridge/StdioTransport.hpp"

using namespace codebridge;
namespace fs = std::filesystem;

namespace {

const char* kIndex = R"({"version":1,"generatedAt":"2025-06-01T00:00:00Z",
  "files":[{"path":"src/config.rs","language":"rust","size":64}],
  "symbols":[{"id":1,"name":"load_config","kind":"function","file":"src/config.rs","line":2,"endLine":6,"calls":[2]},
             {"id":2,"name":"Config","kind":"struct","file":"src/config.rs","line":8,"endLine":10}]})";

class StdioSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root = fs::temp_directory_path() / ("codebridge-session-" + std::to_string(rd()));
        fs::create_directories(root / ".adi");
        fs::create_directories(root / "src");
        std::ofstream(root / ".adi" / "index.json") << kIndex;
        std::ofstream(root / "src" / "config.rs") << "// config\npub fn load_config() {}\n";
        ASSERT_EQ(::pipe(inPipe), 0);
        ASSERT_EQ(::pipe(outPipe), 0);
    }

    void TearDown() override {
        for (int fd : {inPipe[0], inPipe[1], outPipe[0], outPipe[1]}) {
            if (fd >= 0) ::close(fd);
        }
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    // Writes input and keeps the input pipe open until `frames` complete frames were written back (or
    // five seconds pass); then closes input, runs the session to completion and returns its exit code.
    int runSession(const std::string& input, FramingMode framing, std::size_t frames, std::string& output) {
        ServerOptions options;
        options.projectRoot = root.string();
        options.framing = framing;

        int code = -1;
        std::thread server([&] {
            auto transport = std::make_unique<StdioTransport>(inPipe[0], outPipe[1]);
            transport->SetFraming(framing);
            code = Server(options).Run(std::move(transport));
        });

        std::size_t written = 0;
        while (written < input.size()) {
            const ssize_t n = ::write(inPipe[1], input.data() + written, input.size() - written);
            if (n <= 0) break;
            written += static_cast<std::size_t>(n);
        }

        const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (countFrames(output, framing) < frames && std::chrono::steady_clock::now() < until) {
            readAvailable(output, 50);
        }
        ::close(inPipe[1]);
        inPipe[1] = -1;
        server.join();

        ::close(outPipe[1]);
        outPipe[1] = -1;
        while (readAvailable(output, 0)) {}
        return code;
    }

    // One read from the output pipe when it becomes readable within timeoutMs; false on timeout or EOF.
    bool readAvailable(std::string& output, int timeoutMs) {
        pollfd pfd{outPipe[0], POLLIN, 0};
        if (::poll(&pfd, 1, timeoutMs) <= 0) return false;
        char buf[4096];
        const ssize_t n = ::read(outPipe[0], buf, sizeof(buf));
        if (n <= 0) return false;
        output.append(buf, static_cast<std::size_t>(n));
        return true;
    }

    static std::size_t countFrames(const std::string& output, FramingMode framing) {
        if (framing == FramingMode::Newline) {
            return static_cast<std::size_t>(std::count(output.begin(), output.end(), '\n'));
        }
        std::string copy = output;
        auto framer = MakeContentLengthFramer();
        std::size_t n = 0;
        while (framer->tryDecode(copy)) ++n;
        return n;
    }

    static std::map<int64_t, JSONValue> byId(const std::vector<std::string>& frames) {
        std::map<int64_t, JSONValue> out;
        for (const auto& f : frames) {
            auto v = ParseJSON(f);
            out[std::get<int64_t>(GetMember(v, "id")->value)] = v;
        }
        return out;
    }

    static std::vector<std::string> splitLines(const std::string& text) {
        std::vector<std::string> lines;
        std::size_t start = 0;
        while (start < text.size()) {
            const std::size_t eol = text.find('\n', start);
            if (eol == std::string::npos) break;
            lines.push_back(text.substr(start, eol - start));
            start = eol + 1;
        }
        return lines;
    }

    fs::path root;
    int inPipe[2]{-1, -1};
    int outPipe[2]{-1, -1};
};

} // namespace

TEST_F(StdioSessionTest, NewlineSessionAnswersEveryRequest) {
    const std::string input =
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-11-25"}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/search","params":{"query":"load config"}})" "\n"
        R"({"jsonrpc":"2.0","id":3,"method":"tools/show","params":{"id":2}})" "\n"
        R"({"jsonrpc":"2.0","id":4,"method":"resources/read","params":{"uri":"codebridge://file/src/config.rs"}})" "\n";
    std::string output;
    EXPECT_EQ(runSession(input, FramingMode::Newline, 4, output), ExitCodes::Clean);

    auto frames = splitLines(output);
    ASSERT_EQ(frames.size(), 4u);
    auto responses = byId(frames);

    const auto& matches = std::get<JSONValue::Array>(GetMember(responses[2], "result")->value);
    ASSERT_FALSE(matches.empty());
    EXPECT_EQ(std::get<std::string>(GetMember(*GetMember(*matches[0], "symbol"), "name")->value), "load_config");

    const JSONValue* detail = GetMember(responses[3], "result");
    ASSERT_NE(detail, nullptr);
    EXPECT_EQ(std::get<int64_t>(GetMember(*detail, "referenceCount")->value), 1);

    const auto& contents = std::get<JSONValue::Array>(GetMember(*GetMember(responses[4], "result"), "contents")->value);
    auto body = ParseJSON(std::get<std::string>(GetMember(*contents[0], "text")->value));
    EXPECT_NE(std::get<std::string>(GetMember(body, "content")->value).find("load_config"), std::string::npos);
}

TEST_F(StdioSessionTest, ContentLengthFramingRoundTrips) {
    const std::string init = R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})";
    const std::string files = R"({"jsonrpc":"2.0","id":2,"method":"tools/files","params":{}})";
    std::string input;
    for (const auto& body : {init, files}) {
        input += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
    }
    std::string output;
    EXPECT_EQ(runSession(input, FramingMode::ContentLength, 2, output), ExitCodes::Clean);

    auto framer = MakeContentLengthFramer();
    std::vector<std::string> frames;
    while (auto payload = framer->tryDecode(output)) {
        frames.push_back(*payload);
    }
    ASSERT_EQ(frames.size(), 2u);
    auto responses = byId(frames);
    const auto& paths = std::get<JSONValue::Array>(GetMember(responses[2], "result")->value);
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(std::get<std::string>(paths[0]->value), "src/config.rs");
}

TEST_F(StdioSessionTest, TruncatedFrameIsTransportFailure) {
    const std::string input =
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"ping")";
    std::string output;
    EXPECT_EQ(runSession(input, FramingMode::Newline, 1, output), ExitCodes::TransportFailure);
    auto frames = splitLines(output);
    ASSERT_GE(frames.size(), 1u);
    EXPECT_NE(GetMember(ParseJSON(frames[0]), "result"), nullptr);
}
