//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_server_integration.cpp
// Purpose: End-to-end GoogleTests driving Server over real WebSocket and HTTP connections
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "embedmcp/Registries.h"
#include "embedmcp/Server.h"
#include "embedmcp/errors/Errors.h"

using namespace std::chrono_literals;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

namespace {

constexpr const char* kRoot = "/srv/embedmcp-it";
const std::string kStateUri = std::string("file://") + kRoot + "/state.json";
const std::string kStatePath = std::string(kRoot) + "/state.json";

//==========================================================================================================
// ManualWatchBackend
// Purpose: Watch backend the test fires by hand.
//==========================================================================================================
class ManualWatchBackend : public embedmcp::subscriptions::IWatchBackend {
public:
    struct Shared {
        std::mutex mutex;
        std::map<int, std::pair<std::string, embedmcp::subscriptions::WatchCallback>> watches;
        int nextId{0};
    };

    class Handle : public embedmcp::subscriptions::IResourceWatcher {
    public:
        Handle(std::shared_ptr<Shared> shared, int id, std::string path)
            : shared(std::move(shared)), id(id), path(std::move(path)) {}
        ~Handle() override {
            std::lock_guard<std::mutex> lock(shared->mutex);
            shared->watches.erase(id);
        }
        const std::string& Path() const override { return path; }

    private:
        std::shared_ptr<Shared> shared;
        int id;
        std::string path;
    };

    explicit ManualWatchBackend(std::shared_ptr<Shared> shared) : shared(std::move(shared)) {}

    std::unique_ptr<embedmcp::subscriptions::IResourceWatcher> Watch(
        const std::string& path, embedmcp::subscriptions::WatchCallback callback) override {
        std::lock_guard<std::mutex> lock(shared->mutex);
        const int id = ++shared->nextId;
        shared->watches.emplace(id, std::make_pair(path, std::move(callback)));
        return std::make_unique<Handle>(shared, id, path);
    }

    static void Fire(Shared& shared, const std::string& path) {
        std::vector<embedmcp::subscriptions::WatchCallback> targets;
        {
            std::lock_guard<std::mutex> lock(shared.mutex);
            for (const auto& [id, w] : shared.watches) {
                if (w.first == path) {
                    targets.push_back(w.second);
                }
            }
        }
        for (auto& cb : targets) {
            cb(embedmcp::subscriptions::WatchEvent::Changed);
        }
    }

private:
    std::shared_ptr<Shared> shared;
};

//==========================================================================================================
// WsClient
// Purpose: Blocking WebSocket client that remembers its session id from the connection handshake.
//==========================================================================================================
class WsClient {
public:
    explicit WsClient(std::uint16_t port) : ws(ioc) {
        ws.next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
        ws.handshake("127.0.0.1:" + std::to_string(port), "/mcp");
        auto hello = embedmcp::ParseJSON(Read());
        const embedmcp::JSONValue* params = embedmcp::FindMember(hello, "params");
        if (params != nullptr) {
            sessionId = embedmcp::GetStringMember(*params, "sessionId").value_or("");
        }
    }

    void Send(const std::string& text) {
        ws.text(true);
        ws.write(net::buffer(text));
    }

    std::string Read() {
        beast::flat_buffer buffer;
        ws.read(buffer);
        return beast::buffers_to_string(buffer.data());
    }

    // Sends a request and returns the parsed response, skipping any interleaved notifications.
    embedmcp::JSONValue Call(int id, const std::string& method, const std::string& params = "{}") {
        Send("{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id) + ",\"method\":\"" + method +
             "\",\"params\":" + params + "}");
        for (;;) {
            auto v = embedmcp::ParseJSON(Read());
            if (embedmcp::GetIntMember(v, "id") == id) {
                return v;
            }
        }
    }

    void Close() {
        ws.close(websocket::close_code::normal);
    }

    std::string sessionId;

private:
    net::io_context ioc;
    websocket::stream<tcp::socket> ws;
};

static http::response<http::string_body> httpPost(unsigned short port, const std::string& body) {
    net::io_context ioc;
    tcp::socket socket{ioc};
    socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    http::request<http::string_body> req{http::verb::post, "/mcp/message", 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::content_type, "application/json");
    req.body() = body;
    req.prepare_payload();
    http::write(socket, req);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);
    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

class ServerIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        tools.Register(embedmcp::Tool("echo", "Echo text"), [](const embedmcp::JSONValue& args) {
            embedmcp::CallToolResult r;
            r.content.push_back(embedmcp::MakeTextContent(embedmcp::GetStringMember(args, "text").value_or("")));
            return r;
        });
        resources.Register(embedmcp::Resource(kStateUri, "state"), [](const std::string& uri) {
            embedmcp::ReadResourceResult r;
            r.contents.push_back(embedmcp::MakeTextResourceContent(uri, "{}", "application/json"));
            return r;
        });

        embedmcp::ServerConfig cfg;
        cfg.host = "127.0.0.1";
        cfg.wsPort = 0;
        cfg.httpPort = 0;
        cfg.roots = {kRoot};
        cfg.subscriptions.debounce = 50ms;
        cfg.outboundTimeout = 5000ms;
        cfg.shutdownGrace = 500ms;
        cfg.workerThreads = 2;

        watches = std::make_shared<ManualWatchBackend::Shared>();
        server = std::make_unique<embedmcp::Server>(
            cfg, embedmcp::Implementation{"it-server", "0.1.0"},
            embedmcp::Server::Providers{&tools, &resources, &prompts},
            std::make_unique<ManualWatchBackend>(watches));
        auto infos = server->Start().get();
        for (const auto& info : infos) {
            ports[info.type] = info.port;
        }
    }

    void TearDown() override {
        server->Stop().get();
    }

    embedmcp::ToolRegistry tools;
    embedmcp::ResourceRegistry resources;
    embedmcp::PromptRegistry prompts;
    std::shared_ptr<ManualWatchBackend::Shared> watches;
    std::unique_ptr<embedmcp::Server> server;
    std::map<std::string, std::uint16_t> ports;
};

} // namespace

TEST_F(ServerIntegrationTest, BothChannelsServeRequests) {
    ASSERT_EQ(ports.size(), 2u);
    EXPECT_TRUE(server->IsRunning());

    WsClient client(ports["websocket"]);
    ASSERT_FALSE(client.sessionId.empty());
    auto init = client.Call(1, "initialize",
                            "{\"protocolVersion\":\"2025-06-18\",\"capabilities\":{},"
                            "\"clientInfo\":{\"name\":\"it\",\"version\":\"1\"}}");
    const embedmcp::JSONValue* result = embedmcp::FindMember(init, "result");
    ASSERT_NE(result, nullptr);
    const embedmcp::JSONValue* info = embedmcp::FindMember(*result, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(embedmcp::GetStringMember(*info, "name").value_or(""), "it-server");

    auto call = client.Call(2, "tools/call", "{\"name\":\"echo\",\"arguments\":{\"text\":\"hi\"}}");
    ASSERT_NE(embedmcp::FindMember(call, "result"), nullptr);

    auto res = httpPost(ports["http"], "{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"tools/list\"}");
    EXPECT_EQ(res.result(), http::status::ok);
    auto listed = embedmcp::ParseJSON(res.body());
    EXPECT_EQ(embedmcp::GetIntMember(listed, "id").value_or(0), 7);
    ASSERT_NE(embedmcp::FindMember(listed, "result"), nullptr);

    auto bad = httpPost(ports["http"], "{not json");
    EXPECT_EQ(bad.result(), http::status::ok);
    auto err = embedmcp::ParseJSON(bad.body());
    const embedmcp::JSONValue* error = embedmcp::FindMember(err, "error");
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(embedmcp::GetIntMember(*error, "code").value_or(0), embedmcp::JSONRPCErrorCodes::ParseError);

    auto status = server->Status();
    EXPECT_EQ(status.size(), 2u);
}

TEST_F(ServerIntegrationTest, FileChangesReachSubscribedSessions) {
    WsClient subscriber(ports["websocket"]);
    WsClient bystander(ports["websocket"]);

    auto sub = subscriber.Call(1, "resources/subscribe", "{\"uri\":\"" + kStateUri + "\"}");
    ASSERT_NE(embedmcp::FindMember(sub, "result"), nullptr);
    EXPECT_EQ(server->Subscriptions().SessionsFor(kStateUri), std::vector<std::string>{subscriber.sessionId});

    auto denied = subscriber.Call(2, "resources/subscribe", "{\"uri\":\"file:///etc/passwd\"}");
    const embedmcp::JSONValue* error = embedmcp::FindMember(denied, "error");
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(embedmcp::GetIntMember(*error, "code").value_or(0), embedmcp::JSONRPCErrorCodes::AccessDenied);

    ManualWatchBackend::Fire(*watches, kStatePath);
    auto note = embedmcp::ParseJSON(subscriber.Read());
    EXPECT_EQ(embedmcp::GetStringMember(note, "method").value_or(""), "notifications/resources/updated");
    const embedmcp::JSONValue* params = embedmcp::FindMember(note, "params");
    ASSERT_NE(params, nullptr);
    EXPECT_EQ(embedmcp::GetStringMember(*params, "uri").value_or(""), kStateUri);

    // The bystander only sees broadcasts.
    EXPECT_EQ(server->BroadcastNotification("notifications/tools/list_changed"), 2u);
    auto first = embedmcp::ParseJSON(bystander.Read());
    EXPECT_EQ(embedmcp::GetStringMember(first, "method").value_or(""), "notifications/tools/list_changed");
}

TEST_F(ServerIntegrationTest, DisconnectReleasesSubscriptionsAndFailsPendingRequests) {
    auto client = std::make_unique<WsClient>(ports["websocket"]);
    const std::string sessionId = client->sessionId;
    auto sub = client->Call(1, "resources/subscribe", "{\"uri\":\"" + kStateUri + "\"}");
    ASSERT_NE(embedmcp::FindMember(sub, "result"), nullptr);

    embedmcp::CreateMessageParams params;
    params.messages.push_back(embedmcp::MakePromptMessage("user", "hello"));
    params.maxTokens = 16;
    auto pending = server->RequestCreateMessage(sessionId, params);
    auto request = embedmcp::ParseJSON(client->Read());
    EXPECT_EQ(embedmcp::GetStringMember(request, "method").value_or(""), "sampling/createMessage");
    EXPECT_EQ(server->PendingOutboundCount(), 1u);

    client->Close();
    client.reset();

    ASSERT_EQ(pending.wait_for(3s), std::future_status::ready);
    EXPECT_THROW(pending.get(), embedmcp::errors::ChannelError);
    EXPECT_TRUE(waitUntil([&]() { return server->Subscriptions().SessionsFor(kStateUri).empty(); }, 2s));
    EXPECT_EQ(server->PendingOutboundCount(), 0u);
    EXPECT_FALSE(server->Sessions().Get(sessionId).has_value());
}

TEST_F(ServerIntegrationTest, SamplingRoundTrip) {
    WsClient client(ports["websocket"]);
    embedmcp::CreateMessageParams params;
    params.messages.push_back(embedmcp::MakePromptMessage("user", "2+2?"));
    params.maxTokens = 8;
    auto pending = server->RequestCreateMessage(client.sessionId, params);

    auto request = embedmcp::ParseJSON(client.Read());
    auto id = embedmcp::GetStringMember(request, "id");
    ASSERT_TRUE(id.has_value());
    client.Send("{\"jsonrpc\":\"2.0\",\"id\":\"" + id.value() +
                "\",\"result\":{\"model\":\"m1\",\"role\":\"assistant\","
                "\"content\":{\"type\":\"text\",\"text\":\"4\"},\"stopReason\":\"endTurn\"}}");

    ASSERT_EQ(pending.wait_for(3s), std::future_status::ready);
    auto result = pending.get();
    EXPECT_EQ(result.model, "m1");
    EXPECT_EQ(result.role, "assistant");
    EXPECT_EQ(result.stopReason.value_or(""), "endTurn");
    EXPECT_EQ(server->PendingOutboundCount(), 0u);
}

TEST(ServerLifecycle, CannotRestartAfterStop) {
    embedmcp::ToolRegistry tools;
    embedmcp::ServerConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.wsPort = 0;
    cfg.enableHttp = false;
    embedmcp::Server server(cfg, embedmcp::Implementation{"once", "0.1.0"},
                            embedmcp::Server::Providers{&tools, nullptr, nullptr});
    ASSERT_EQ(server.Start().get().size(), 1u);
    server.Stop().get();
    EXPECT_FALSE(server.IsRunning());
    EXPECT_EQ(server.BroadcastNotification("notifications/tools/list_changed"), 0u);
    EXPECT_THROW(server.Start().get(), std::logic_error);
}

TEST(ServerLifecycle, InvalidConfigurationIsRejected) {
    embedmcp::ServerConfig cfg;
    cfg.enableHttp = false;
    cfg.enableWebSocket = false;
    EXPECT_THROW((void)embedmcp::Server(cfg, embedmcp::Implementation{"bad", "0"}, embedmcp::Server::Providers{}),
                 std::invalid_argument);
}
