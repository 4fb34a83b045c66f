//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_session_registry.cpp
// Purpose: GoogleTests for session id generation and SessionRegistry bookkeeping
//==========================================================================================================

#include <gtest/gtest.h>

#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "embedmcp/SessionRegistry.h"

TEST(SessionIds, BurstOfIdsIsDistinctAndWellFormed) {
    std::set<std::string> ids;
    for (int i = 0; i < 2000; ++i) {
        const std::string id = embedmcp::MakeSessionId("http");
        ASSERT_EQ(id.rfind("http_", 0), 0u) << id;
        const auto last = id.rfind('_');
        ASSERT_NE(last, 4u) << id;
        const int suffix = std::stoi(id.substr(last + 1));
        EXPECT_GE(suffix, 1000);
        EXPECT_LE(suffix, 9999);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 2000u);
}

TEST(SessionIds, ConcurrentCallersNeverCollide) {
    std::mutex mutex;
    std::set<std::string> ids;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            std::vector<std::string> local;
            for (int i = 0; i < 500; ++i) {
                local.push_back(embedmcp::MakeSessionId("ws"));
            }
            std::lock_guard<std::mutex> lock(mutex);
            ids.insert(local.begin(), local.end());
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(ids.size(), 4000u);
}

TEST(SessionRegistry, DuplicateOpenIsRejected) {
    embedmcp::SessionRegistry registry;
    EXPECT_TRUE(registry.Open("ws_1_1000", "websocket"));
    EXPECT_FALSE(registry.Open("ws_1_1000", "websocket"));
    EXPECT_EQ(registry.Count(), 1u);
    EXPECT_TRUE(registry.Close("ws_1_1000"));
    EXPECT_FALSE(registry.Close("ws_1_1000"));
    EXPECT_EQ(registry.Count(), 0u);
}
