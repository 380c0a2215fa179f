//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_cancellation.cpp
// Purpose: Tests for server-side cancellation propagation via notifications/cancelled
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "FakeIndexProvider.h"

using namespace codebridge;
using codebridge::testing_support::SessionFixture;

namespace {

class CancellationTest : public SessionFixture {
protected:
    void cancel(const std::string& idJson, const char* key = "requestId") {
        send(std::string(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{")") + key + "\":" + idJson +
             R"(,"reason":"user aborted"}})");
    }

    bool waitForPending(std::size_t count) {
        const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (std::chrono::steady_clock::now() < until) {
            if (dispatcher->PendingCount() == count) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }
};

} // namespace

TEST_F(CancellationTest, CancelledRequestGetsNoResponse) {
    initialize();
    provider->SetSearchDelay("slow", std::chrono::milliseconds(1500));
    request("\"cancel-1\"", "tools/search", R"({"query":"slow"})");
    ASSERT_TRUE(waitForPending(1));

    cancel("\"cancel-1\"");
    ASSERT_TRUE(waitForPending(0));

    // The next response on the wire belongs to a later request.
    request("2", "ping");
    auto resp = next();
    EXPECT_EQ(std::get<int64_t>(GetMember(resp, "id")->value), 2);
    EXPECT_FALSE(transport->NextOutbound(std::chrono::milliseconds(100)).has_value());
}

TEST_F(CancellationTest, StopReachesTheIndexProvider) {
    initialize();
    provider->SetSearchDelay("slow", std::chrono::milliseconds(2000));
    request("3", "tools/search", R"({"query":"slow"})");
    ASSERT_TRUE(waitForPending(1));
    cancel("3", "id");

    const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (provider->stopped.load() == 0 && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(provider->stopped.load(), 1);
}

TEST_F(CancellationTest, UnknownOrFinishedIdsAreIgnored) {
    initialize();
    request("4", "tools/files", "{}");
    auto done = next();
    EXPECT_NE(GetMember(done, "result"), nullptr);

    cancel("4");
    cancel("\"never-sent\"");
    send(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{}})");

    request("5", "ping");
    EXPECT_EQ(std::get<int64_t>(GetMember(next(), "id")->value), 5);
    EXPECT_FALSE(transport->NextOutbound(std::chrono::milliseconds(50)).has_value());
}

TEST_F(CancellationTest, CancelledIdCanBeReused) {
    initialize();
    provider->SetSearchDelay("slow", std::chrono::milliseconds(1500));
    request("6", "tools/search", R"({"query":"slow"})");
    ASSERT_TRUE(waitForPending(1));
    cancel("6");
    ASSERT_TRUE(waitForPending(0));

    request("6", "tools/search", R"({"query":"fast"})");
    auto resp = next();
    EXPECT_EQ(std::get<int64_t>(GetMember(resp, "id")->value), 6);
    EXPECT_NE(GetMember(resp, "result"), nullptr);
}
