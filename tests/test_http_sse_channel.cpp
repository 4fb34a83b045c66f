//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_sse_channel.cpp
// Purpose: GoogleTests for HttpSseChannel POST dispatch, SSE streams and diagnostics endpoints
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "embedmcp/HttpSseChannel.hpp"
#include "embedmcp/JSONRPCTypes.h"

using namespace std::chrono_literals;
namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

//==========================================================================================================
// httpRequest
// Purpose: Send a single HTTP request and capture the response (synchronously).
//==========================================================================================================
static http::response<http::string_body> httpRequest(http::verb verb, unsigned short port, const std::string& target,
                                                     const std::string& body = std::string(),
                                                     const std::optional<std::string>& sessionId = std::nullopt) {
    net::io_context ioc;
    tcp::socket socket{ioc};
    socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    if (sessionId.has_value()) {
        req.set(embedmcp::kSessionIdHeader, sessionId.value());
    }
    req.prepare_payload();
    http::write(socket, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

//==========================================================================================================
// SseClient
// Purpose: Opens the events stream and reads one event block ("...\n\n") at a time.
//==========================================================================================================
class SseClient {
public:
    SseClient(unsigned short port, const std::string& target) : socket(ioc) {
        socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
        const std::string req = "GET " + target + " HTTP/1.1\r\nHost: 127.0.0.1\r\nAccept: text/event-stream\r\n\r\n";
        net::write(socket, net::buffer(req));
        std::size_t n = net::read_until(socket, net::dynamic_buffer(pending), "\r\n\r\n");
        header = pending.substr(0, n);
        pending.erase(0, n);
    }

    // Returns the next event block, or an empty string at end of stream.
    std::string NextBlock() {
        boost::system::error_code ec;
        std::size_t n = net::read_until(socket, net::dynamic_buffer(pending), "\n\n", ec);
        if (ec) {
            return std::string();
        }
        std::string block = pending.substr(0, n);
        pending.erase(0, n);
        return block;
    }

    // Skips keep-alive comments.
    std::string NextEvent() {
        for (;;) {
            std::string block = NextBlock();
            if (block.rfind(":", 0) != 0) {
                return block;
            }
        }
    }

    std::string HeaderValue(const std::string& name) const {
        auto pos = header.find(name + ": ");
        if (pos == std::string::npos) {
            return std::string();
        }
        pos += name.size() + 2;
        return header.substr(pos, header.find("\r\n", pos) - pos);
    }

    std::string header;

private:
    net::io_context ioc;
    tcp::socket socket;
    std::string pending;
};

std::string dataOf(const std::string& block) {
    auto pos = block.find("data: ");
    if (pos == std::string::npos) {
        return std::string();
    }
    pos += 6;
    return block.substr(pos, block.find('\n', pos) - pos);
}

embedmcp::HttpSseChannel::Options localOptions() {
    embedmcp::HttpSseChannel::Options opts;
    opts.address = "127.0.0.1";
    opts.port = 0;
    opts.keepAlive = 5000ms;
    opts.shutdownGrace = 1000ms;
    return opts;
}

// Records handler traffic; replies to requests and ignores notifications.
struct Recorder {
    std::mutex mutex;
    std::vector<std::string> sessions;
    std::vector<std::string> opened;
    std::vector<std::string> closed;

    void Attach(embedmcp::HttpSseChannel& channel) {
        channel.SetMessageHandler([this](const std::string& session, const std::string& payload) -> std::optional<std::string> {
            {
                std::lock_guard<std::mutex> lock(mutex);
                sessions.push_back(session);
            }
            auto v = embedmcp::ParseJSON(payload);
            auto method = embedmcp::GetStringMember(v, "method").value_or("");
            if (method == "explode") {
                throw std::runtime_error("handler failure");
            }
            if (embedmcp::FindMember(v, "id") == nullptr) {
                return std::nullopt;
            }
            return std::string("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}");
        });
        channel.SetSessionOpenedHandler([this](const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex);
            opened.push_back(id);
        });
        channel.SetSessionClosedHandler([this](const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex);
            closed.push_back(id);
        });
    }
};

const std::string kRequest = "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}";
const std::string kNotification = "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}";

} // namespace

TEST(HttpSseChannel, DiagnosticsEndpoints) {
    net::thread_pool workers(2);
    auto channel = std::make_shared<embedmcp::HttpSseChannel>(localOptions(), workers);
    Recorder rec;
    rec.Attach(*channel);
    auto info = channel->Start().get();
    EXPECT_EQ(info.type, "http");
    EXPECT_EQ(info.path, "/mcp/message");
    ASSERT_NE(info.port, 0);

    auto health = httpRequest(http::verb::get, info.port, "/health");
    EXPECT_EQ(health.result(), http::status::ok);
    EXPECT_EQ(embedmcp::GetStringMember(embedmcp::ParseJSON(health.body()), "status").value_or(""), "healthy");

    auto status = httpRequest(http::verb::get, info.port, "/mcp/status");
    ASSERT_EQ(status.result(), http::status::ok);
    auto statusJson = embedmcp::ParseJSON(status.body());
    EXPECT_EQ(embedmcp::GetStringMember(statusJson, "type").value_or(""), "http");
    EXPECT_EQ(embedmcp::GetIntMember(statusJson, "port").value_or(0), info.port);
    EXPECT_EQ(embedmcp::GetIntMember(statusJson, "connectionCount").value_or(-1), 0);

    EXPECT_EQ(httpRequest(http::verb::get, info.port, "/nowhere").result(), http::status::not_found);
    auto wrongVerb = httpRequest(http::verb::get, info.port, "/mcp/message");
    EXPECT_EQ(wrongVerb.result(), http::status::method_not_allowed);
    EXPECT_EQ(std::string(wrongVerb[http::field::allow]), "POST");
    EXPECT_EQ(httpRequest(http::verb::post, info.port, "/mcp/events", kRequest).result(),
              http::status::method_not_allowed);

    channel->Stop().get();
    workers.join();
}

TEST(HttpSseChannel, PostWithoutSessionUsesTransientSession) {
    net::thread_pool workers(2);
    auto channel = std::make_shared<embedmcp::HttpSseChannel>(localOptions(), workers);
    Recorder rec;
    rec.Attach(*channel);
    auto info = channel->Start().get();

    auto reply = httpRequest(http::verb::post, info.port, "/mcp/message", kRequest);
    EXPECT_EQ(reply.result(), http::status::ok);
    EXPECT_EQ(std::string(reply[http::field::content_type]), "application/json");
    EXPECT_EQ(reply.body(), "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}");
    EXPECT_EQ(reply.find(embedmcp::kSessionIdHeader), reply.end());

    auto accepted = httpRequest(http::verb::post, info.port, "/mcp/message", kNotification);
    EXPECT_EQ(accepted.result(), http::status::accepted);
    EXPECT_TRUE(accepted.body().empty());

    auto failed = httpRequest(http::verb::post, info.port, "/mcp/message",
                              "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"explode\"}");
    EXPECT_EQ(failed.result(), http::status::internal_server_error);

    {
        std::lock_guard<std::mutex> lock(rec.mutex);
        ASSERT_EQ(rec.sessions.size(), 3u);
        EXPECT_EQ(rec.sessions[0].rfind("http_", 0), 0u);
        EXPECT_NE(rec.sessions[0], rec.sessions[1]);
        // Each transient session is opened and closed around its request.
        EXPECT_EQ(rec.opened.size(), 3u);
        EXPECT_EQ(rec.closed.size(), 3u);
        EXPECT_FALSE(channel->HasSession(rec.sessions[0]));
    }
    channel->Stop().get();
    workers.join();
}

TEST(HttpSseChannel, EventStreamCarriesSessionTraffic) {
    net::thread_pool workers(2);
    auto channel = std::make_shared<embedmcp::HttpSseChannel>(localOptions(), workers);
    Recorder rec;
    rec.Attach(*channel);
    auto info = channel->Start().get();

    SseClient sse(info.port, "/mcp/events");
    EXPECT_NE(sse.header.find("200"), std::string::npos);
    EXPECT_EQ(sse.HeaderValue("Content-Type"), "text/event-stream");
    const std::string sessionId = sse.HeaderValue(embedmcp::kSessionIdHeader);
    ASSERT_EQ(sessionId.rfind("sse_", 0), 0u);

    auto hello = embedmcp::ParseJSON(dataOf(sse.NextEvent()));
    EXPECT_EQ(embedmcp::GetStringMember(hello, "type").value_or(""), "connection");
    EXPECT_EQ(embedmcp::GetStringMember(hello, "id").value_or(""), sessionId);
    EXPECT_TRUE(channel->HasSession(sessionId));
    EXPECT_EQ(channel->ConnectionCount(), 1u);

    EXPECT_TRUE(channel->SendTo(sessionId, kNotification));
    EXPECT_EQ(dataOf(sse.NextEvent()), kNotification);

    // Multi-line payloads become one data line per line.
    EXPECT_TRUE(channel->SendTo(sessionId, "{\n\"a\":1\n}"));
    EXPECT_EQ(sse.NextEvent(), "data: {\ndata: \"a\":1\ndata: }\n\n");

    EXPECT_EQ(channel->Broadcast(kNotification), 1u);
    EXPECT_EQ(dataOf(sse.NextEvent()), kNotification);

    auto bound = httpRequest(http::verb::post, info.port, "/mcp/message", kRequest, sessionId);
    EXPECT_EQ(bound.result(), http::status::ok);
    EXPECT_EQ(std::string(bound[embedmcp::kSessionIdHeader]), sessionId);
    {
        std::lock_guard<std::mutex> lock(rec.mutex);
        ASSERT_FALSE(rec.sessions.empty());
        EXPECT_EQ(rec.sessions.back(), sessionId);
    }

    auto unknown = httpRequest(http::verb::post, info.port, "/mcp/message", kRequest, std::string("sse_missing"));
    EXPECT_EQ(unknown.result(), http::status::not_found);
    EXPECT_FALSE(channel->SendTo("sse_missing", kNotification));

    channel->Stop().get();
    workers.join();
}

TEST(HttpSseChannel, IdleStreamsReceivePings) {
    net::thread_pool workers(1);
    auto opts = localOptions();
    opts.keepAlive = 100ms;
    auto channel = std::make_shared<embedmcp::HttpSseChannel>(opts, workers);
    Recorder rec;
    rec.Attach(*channel);
    auto info = channel->Start().get();

    SseClient sse(info.port, "/mcp/events");
    (void)sse.NextBlock();
    EXPECT_EQ(sse.NextBlock(), ": ping\n\n");
    channel->Stop().get();
    workers.join();
}

TEST(HttpSseChannel, StopSendsCloseEventAndReleasesSessions) {
    net::thread_pool workers(1);
    auto channel = std::make_shared<embedmcp::HttpSseChannel>(localOptions(), workers);
    Recorder rec;
    rec.Attach(*channel);
    auto info = channel->Start().get();

    SseClient sse(info.port, "/mcp/events");
    const std::string sessionId = sse.HeaderValue(embedmcp::kSessionIdHeader);
    (void)sse.NextEvent();

    channel->Stop().get();
    std::string closing = sse.NextEvent();
    EXPECT_EQ(closing.rfind("event: close\n", 0), 0u);
    EXPECT_NE(closing.find("Server shutting down"), std::string::npos);
    EXPECT_TRUE(sse.NextBlock().empty());

    EXPECT_FALSE(channel->IsRunning());
    EXPECT_EQ(channel->ConnectionCount(), 0u);
    {
        std::lock_guard<std::mutex> lock(rec.mutex);
        ASSERT_EQ(rec.closed.size(), 1u);
        EXPECT_EQ(rec.closed[0], sessionId);
    }
    workers.join();
}

TEST(HttpSseChannel, ConcurrentTransientSessionsNeverShareAnId) {
    net::thread_pool workers(4);
    auto channel = std::make_shared<embedmcp::HttpSseChannel>(localOptions(), workers);
    Recorder rec;
    rec.Attach(*channel);
    auto info = channel->Start().get();

    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;
    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < kPerThread; ++i) {
                if (httpRequest(http::verb::post, info.port, "/mcp/message", kRequest).result() == http::status::ok) {
                    ++ok;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(ok.load(), kThreads * kPerThread);
    {
        std::lock_guard<std::mutex> lock(rec.mutex);
        std::set<std::string> distinct(rec.opened.begin(), rec.opened.end());
        EXPECT_EQ(distinct.size(), rec.opened.size());
        EXPECT_EQ(rec.opened.size(), static_cast<std::size_t>(kThreads * kPerThread));
        EXPECT_EQ(rec.closed.size(), rec.opened.size());
    }
    channel->Stop().get();
    workers.join();
}

TEST(HttpSseChannel, StopClosesRequestsStillBeingHandled) {
    net::thread_pool workers(2);
    auto opts = localOptions();
    opts.shutdownGrace = 100ms;
    auto channel = std::make_shared<embedmcp::HttpSseChannel>(opts, workers);
    std::atomic<bool> entered{false};
    std::atomic<int> closedSessions{0};
    channel->SetMessageHandler([&](const std::string&, const std::string&) -> std::optional<std::string> {
        entered = true;
        std::this_thread::sleep_for(1500ms);
        return std::string("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}");
    });
    channel->SetSessionClosedHandler([&](const std::string&) { ++closedSessions; });
    auto info = channel->Start().get();

    net::io_context ioc;
    tcp::socket client{ioc};
    client.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), info.port));
    http::request<http::string_body> req{http::verb::post, "/mcp/message", 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::content_type, "application/json");
    req.body() = kRequest;
    req.prepare_payload();
    http::write(client, req);

    auto reader = std::async(std::launch::async, [&client]() {
        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;
        boost::system::error_code ec;
        http::read(client, buffer, res, ec);
        return ec;
    });
    for (int i = 0; i < 200 && !entered.load(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(entered.load());

    const auto stopAt = std::chrono::steady_clock::now();
    channel->Stop().get();
    EXPECT_LT(std::chrono::steady_clock::now() - stopAt, 1000ms);

    // The socket is already closed when Stop() returns, well before the handler would answer.
    const bool finished = reader.wait_for(500ms) == std::future_status::ready;
    if (!finished) {
        boost::system::error_code ignored;
        client.shutdown(tcp::socket::shutdown_both, ignored);
    }
    ASSERT_TRUE(finished);
    const auto ec = reader.get();
    EXPECT_TRUE(ec == http::error::end_of_stream || ec == net::error::eof || ec == net::error::connection_reset)
        << ec.message();
    // The transient session of the abandoned request is still reported closed exactly once.
    EXPECT_EQ(closedSessions.load(), 1);
    workers.join();
    EXPECT_EQ(closedSessions.load(), 1);
}

TEST(HttpSseChannel, HttpsWithoutCertificateFailsConstruction) {
    net::thread_pool workers(1);
    auto opts = localOptions();
    opts.scheme = "https";
    opts.certFile = "/nonexistent/cert.pem";
    opts.keyFile = "/nonexistent/key.pem";
    EXPECT_ANY_THROW((void)embedmcp::HttpSseChannel(opts, workers));

    opts.scheme = "ftp";
    EXPECT_THROW((void)embedmcp::HttpSseChannel(opts, workers), std::invalid_argument);
    workers.join();
}
