//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_outbound_correlator.cpp
// Purpose: Tests for OutboundRequestCorrelator (resolution, timeouts, session failure, retry)
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "embedmcp/OutboundRequestCorrelator.h"
#include "embedmcp/Scheduler.hpp"
#include "embedmcp/errors/Errors.h"

using namespace std::chrono_literals;

namespace embedmcp {

namespace {

struct SentLog {
    std::mutex mutex;
    std::vector<std::pair<std::string, JSONRPCRequest>> sent;
    bool accept{true};

    OutboundRequestCorrelator::SendFunction fn() {
        return [this](const std::string& sessionId, const std::string& payload) {
            std::lock_guard<std::mutex> lock(mutex);
            if (!accept) {
                return false;
            }
            JSONRPCRequest req;
            EXPECT_TRUE(req.Deserialize(payload)) << payload;
            sent.emplace_back(sessionId, req);
            return true;
        };
    }

    std::string lastId() {
        std::lock_guard<std::mutex> lock(mutex);
        return sent.empty() ? std::string() : IdToString(sent.back().second.id);
    }

    std::size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return sent.size();
    }
};

JSONRPCResponse resultFor(const std::string& id, const std::string& model) {
    JSONValue::Object obj;
    obj["model"] = std::make_shared<JSONValue>(model);
    return JSONRPCResponse(id, JSONValue{obj});
}

} // namespace

TEST(Correlator, ResolvesWithClientResult) {
    BackgroundScheduler scheduler;
    SentLog log;
    OutboundRequestCorrelator correlator(scheduler, log.fn());

    auto fut = correlator.Issue("ws_1", "sampling/createMessage", std::nullopt, 5s);
    ASSERT_EQ(log.count(), 1u);
    const std::string id = log.lastId();
    EXPECT_EQ(id.rfind("srv-req-", 0), 0u);
    EXPECT_TRUE(correlator.IsPending(id));

    EXPECT_TRUE(correlator.Resolve(resultFor(id, "m1")));
    auto value = fut.get();
    EXPECT_EQ(GetStringMember(value, "model").value_or(""), "m1");
    EXPECT_FALSE(correlator.IsPending(id));
    // Later resolution attempts are ignored.
    EXPECT_FALSE(correlator.Resolve(resultFor(id, "m2")));
}

TEST(Correlator, ClientErrorSurfacesAsMcpException) {
    BackgroundScheduler scheduler;
    SentLog log;
    OutboundRequestCorrelator correlator(scheduler, log.fn());

    auto fut = correlator.Issue("ws_1", "roots/list", std::nullopt, 5s);
    JSONRPCResponse err(log.lastId(), CreateErrorObject(JSONRPCErrorCodes::MethodNotFound, "no"), true);
    ASSERT_TRUE(correlator.Resolve(err));
    try {
        fut.get();
        FAIL() << "expected McpException";
    } catch (const errors::TimeoutError&) {
        FAIL() << "not a timeout";
    } catch (const errors::ChannelError&) {
        FAIL() << "not a channel error";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::MethodNotFound);
    }
}

TEST(Correlator, UnansweredRequestTimesOutAndLeavesTable) {
    BackgroundScheduler scheduler;
    SentLog log;
    OutboundRequestCorrelator correlator(scheduler, log.fn());

    auto start = std::chrono::steady_clock::now();
    auto fut = correlator.Issue("ws_1", "sampling/createMessage", std::nullopt, 100ms);
    const std::string id = log.lastId();
    EXPECT_THROW(fut.get(), errors::TimeoutError);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 90ms);
    EXPECT_FALSE(correlator.IsPending(id));
    EXPECT_EQ(correlator.PendingCount(), 0u);
    EXPECT_FALSE(correlator.Resolve(resultFor(id, "late")));
}

TEST(Correlator, SessionDisconnectFailsItsRequestsOnly) {
    BackgroundScheduler scheduler;
    SentLog log;
    OutboundRequestCorrelator correlator(scheduler, log.fn());

    auto a = correlator.Issue("ws_gone", "ping", std::nullopt, 10s);
    auto b = correlator.Issue("ws_gone", "ping", std::nullopt, 10s);
    auto c = correlator.Issue("ws_other", "ping", std::nullopt, 10s);
    const std::string otherId = log.lastId();
    EXPECT_EQ(correlator.PendingCount(), 3u);

    EXPECT_EQ(correlator.FailSession("ws_gone"), 2u);
    EXPECT_EQ(a.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(b.wait_for(1s), std::future_status::ready);
    EXPECT_THROW(a.get(), errors::ChannelError);
    EXPECT_THROW(b.get(), errors::ChannelError);
    EXPECT_EQ(correlator.PendingCount(), 1u);

    EXPECT_TRUE(correlator.Resolve(resultFor(otherId, "ok")));
    EXPECT_NO_THROW(c.get());
}

TEST(Correlator, SendFailureIsChannelError) {
    BackgroundScheduler scheduler;
    SentLog log;
    log.accept = false;
    OutboundRequestCorrelator correlator(scheduler, log.fn());
    auto fut = correlator.Issue("ws_missing", "ping", std::nullopt, 5s);
    EXPECT_THROW(fut.get(), errors::ChannelError);
    EXPECT_EQ(correlator.PendingCount(), 0u);
}

TEST(Correlator, ConcurrentIssuesNeverCollide) {
    BackgroundScheduler scheduler;
    SentLog log;
    OutboundRequestCorrelator correlator(scheduler, log.fn());

    std::vector<std::thread> threads;
    std::mutex futMutex;
    std::vector<std::future<JSONValue>> futures;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 25; ++i) {
                auto f = correlator.Issue("ws_1", "ping", std::nullopt, 10s);
                std::lock_guard<std::mutex> lock(futMutex);
                futures.push_back(std::move(f));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    std::set<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(log.mutex);
        for (const auto& [session, req] : log.sent) {
            ids.insert(IdToString(req.id));
        }
    }
    EXPECT_EQ(ids.size(), 200u);
    for (const auto& id : ids) {
        EXPECT_TRUE(correlator.Resolve(resultFor(id, id)));
    }
    for (auto& f : futures) {
        EXPECT_NO_THROW(f.get());
    }
}

TEST(Correlator, RetryReissuesAfterTimeoutWithFreshId) {
    BackgroundScheduler scheduler;
    SentLog log;
    OutboundRequestCorrelator correlator(scheduler, log.fn());

    RetryPolicy policy;
    policy.maxAttempts = 3;
    policy.initialDelay = 10ms;
    policy.maxDelay = 20ms;
    auto fut = correlator.IssueWithRetry("ws_1", "ping", std::nullopt, policy, 80ms);

    // Let the first attempt time out, then answer the second.
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (log.count() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_GE(log.count(), 2u);
    std::string firstId;
    {
        std::lock_guard<std::mutex> lock(log.mutex);
        firstId = IdToString(log.sent[0].second.id);
    }
    const std::string secondId = log.lastId();
    EXPECT_NE(firstId, secondId);
    EXPECT_TRUE(correlator.Resolve(resultFor(secondId, "second")));
    EXPECT_EQ(GetStringMember(fut.get(), "model").value_or(""), "second");
}

TEST(Correlator, RetryGivesUpWithLastFailure) {
    BackgroundScheduler scheduler;
    SentLog log;
    OutboundRequestCorrelator correlator(scheduler, log.fn());

    RetryPolicy policy;
    policy.maxAttempts = 2;
    policy.initialDelay = 5ms;
    policy.maxDelay = 5ms;
    auto fut = correlator.IssueWithRetry("ws_1", "ping", std::nullopt, policy, 30ms);
    EXPECT_THROW(fut.get(), errors::TimeoutError);
    EXPECT_EQ(log.count(), 2u);
}

TEST(Correlator, RetryDoesNotRetryClientErrors) {
    BackgroundScheduler scheduler;
    SentLog log;
    OutboundRequestCorrelator correlator(scheduler, log.fn());

    RetryPolicy policy;
    policy.maxAttempts = 5;
    auto fut = correlator.IssueWithRetry("ws_1", "ping", std::nullopt, policy, 5s);
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (log.count() < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(correlator.Resolve(
        JSONRPCResponse(log.lastId(), CreateErrorObject(JSONRPCErrorCodes::InvalidParams, "bad"), true)));
    EXPECT_THROW(fut.get(), errors::McpException);
    EXPECT_EQ(log.count(), 1u);
}

TEST(Correlator, RetryPolicyDelayIsCapped) {
    RetryPolicy policy;
    policy.initialDelay = 100ms;
    policy.maxDelay = 350ms;
    policy.multiplier = 2.0;
    EXPECT_EQ(policy.DelayAfter(1), 100ms);
    EXPECT_EQ(policy.DelayAfter(2), 200ms);
    EXPECT_EQ(policy.DelayAfter(3), 350ms);
    EXPECT_EQ(policy.DelayAfter(30), 350ms);
}

TEST(Correlator, ShutdownFailsEverythingAndRejectsNewIssues) {
    BackgroundScheduler scheduler;
    SentLog log;
    OutboundRequestCorrelator correlator(scheduler, log.fn());
    auto pending = correlator.Issue("ws_1", "ping", std::nullopt, 10s);
    correlator.Shutdown();
    EXPECT_THROW(pending.get(), errors::ChannelError);
    EXPECT_THROW(correlator.Issue("ws_1", "ping", std::nullopt).get(), errors::ChannelError);
}

} // namespace embedmcp
