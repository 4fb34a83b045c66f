//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/embedmcp/WebSocketChannel.cpp
// Purpose: Multi-client JSON-RPC channel over WebSocket using Boost.Beast
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "embedmcp/JSONRPCTypes.h"
#include "embedmcp/SessionRegistry.h"
#include "embedmcp/WebSocketChannel.hpp"
#include "embedmcp/errors/Errors.h"
#include "logging/Logger.h"

namespace embedmcp {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

constexpr const char* kShutdownReason = "Server shutting down";
constexpr std::chrono::seconds kHandshakeTimeout{30};

//==========================================================================================================
// WsConnection
// Purpose: One accepted WebSocket. The stream's executor is a per-connection strand; the outbox and the
//          close flags are only touched on that strand.
//==========================================================================================================
class WsConnection : public std::enable_shared_from_this<WsConnection> {
public:
    WsConnection(tcp::socket&& socket, std::string id)
        : ws(std::move(socket)), id(std::move(id)) {}

    websocket::stream<beast::tcp_stream> ws;
    const std::string id;
    std::atomic<bool> open{true};

    // Queues a text frame. Returns false once the connection is closing.
    bool send(std::string payload) {
        if (!open.load()) {
            return false;
        }
        net::post(ws.get_executor(), [self = shared_from_this(), payload = std::move(payload)]() mutable {
            if (self->closeStarted) {
                return;
            }
            self->outbox.push_back(std::move(payload));
            if (!self->writing) {
                self->writeNext();
            }
        });
        return true;
    }

    // Graceful close (1001) once queued frames are flushed.
    void close() {
        open.store(false);
        net::post(ws.get_executor(), [self = shared_from_this()]() {
            self->closeRequested = true;
            if (!self->writing) {
                self->startClose();
            }
        });
    }

    void forceClose() {
        open.store(false);
        net::post(ws.get_executor(), [self = shared_from_this()]() {
            beast::get_lowest_layer(self->ws).close();
        });
    }

private:
    void writeNext() {
        writing = true;
        ws.text(true);
        ws.async_write(net::buffer(outbox.front()),
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->outbox.pop_front();
                if (ec) {
                    self->writing = false;
                    self->outbox.clear();
                    self->open.store(false);
                    LOG_WARN("WebSocket write to {} failed: {}", self->id, ec.message());
                    beast::get_lowest_layer(self->ws).close();
                    return;
                }
                if (!self->outbox.empty()) {
                    self->writeNext();
                    return;
                }
                self->writing = false;
                if (self->closeRequested) {
                    self->startClose();
                }
            });
    }

    void startClose() {
        if (closeStarted) {
            return;
        }
        closeStarted = true;
        ws.async_close(websocket::close_reason(websocket::close_code::going_away, kShutdownReason),
            [self = shared_from_this()](beast::error_code ec) {
                if (ec) {
                    LOG_DEBUG("WebSocket close for {}: {}", self->id, ec.message());
                }
            });
    }

    std::deque<std::string> outbox;
    bool writing{false};
    bool closeRequested{false};
    bool closeStarted{false};
};

std::string stripQuery(beast::string_view target) {
    std::string t(target);
    auto q = t.find('?');
    if (q != std::string::npos) {
        t.resize(q);
    }
    return t;
}

} // namespace

class WebSocketChannel::Impl : public std::enable_shared_from_this<Impl> {
public:
    WebSocketChannel::Options opts;
    net::thread_pool& workers;

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;
    std::atomic<bool> running{false};
    std::atomic<bool> stopped{false};
    ChannelInfo info;

    mutable std::mutex mutex;
    std::condition_variable drained;
    // Every socket from accept until its coroutine ends, keyed by the id it will carry as a session.
    std::unordered_map<std::string, std::shared_ptr<WsConnection>> accepted;
    // The subset that completed the handshake.
    std::unordered_map<std::string, std::shared_ptr<WsConnection>> connections;

    IChannel::MessageHandler messageHandler;
    IChannel::SessionHandler openedHandler;
    IChannel::SessionHandler closedHandler;
    IChannel::ErrorHandler errorHandler;

    Impl(const WebSocketChannel::Options& o, net::thread_pool& w) : opts(o), workers(w) {}

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    /////////////////////////////////////////// Sessions ///////////////////////////////////////////

    // Takes ownership of an accepted socket under an id no other accepted socket holds.
    std::shared_ptr<WsConnection> admit(tcp::socket&& socket) {
        std::lock_guard<std::mutex> lock(mutex);
        std::string id = MakeSessionId("ws");
        while (accepted.count(id) > 0) {
            id = MakeSessionId("ws");
        }
        auto conn = std::make_shared<WsConnection>(std::move(socket), id);
        accepted.emplace(id, conn);
        return conn;
    }

    void release(const std::shared_ptr<WsConnection>& conn) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = accepted.find(conn->id);
            if (it != accepted.end() && it->second == conn) {
                accepted.erase(it);
            }
        }
        drained.notify_all();
    }

    void registerConnection(const std::shared_ptr<WsConnection>& conn) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!connections.emplace(conn->id, conn).second) {
                throw std::logic_error("WebSocket session id already registered: " + conn->id);
            }
        }
        LOG_INFO("WebSocket session {} connected", conn->id);
        if (openedHandler) {
            openedHandler(conn->id);
        }
        JSONValue::Object params;
        params["sessionId"] = std::make_shared<JSONValue>(conn->id);
        params["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
        params["serverInfo"] = std::make_shared<JSONValue>(ToJSON(opts.serverInfo));
        JSONRPCNotification hello(Methods::Connection, JSONValue{std::move(params)});
        conn->send(hello.Serialize());
    }

    void unregisterConnection(const std::shared_ptr<WsConnection>& conn) {
        conn->open.store(false);
        bool removed = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = connections.find(conn->id);
            if (it != connections.end() && it->second == conn) {
                connections.erase(it);
                removed = true;
            }
        }
        drained.notify_all();
        if (removed) {
            LOG_INFO("WebSocket session {} disconnected", conn->id);
            if (closedHandler) {
                closedHandler(conn->id);
            }
        }
    }

    std::vector<std::shared_ptr<WsConnection>> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::shared_ptr<WsConnection>> out;
        out.reserve(connections.size());
        for (const auto& [id, conn] : connections) {
            out.push_back(conn);
        }
        return out;
    }

    // Accepted sockets that have not finished the handshake.
    std::vector<std::shared_ptr<WsConnection>> handshaking() const {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::shared_ptr<WsConnection>> out;
        for (const auto& [id, conn] : accepted) {
            if (connections.count(id) == 0) {
                out.push_back(conn);
            }
        }
        return out;
    }

    std::vector<std::shared_ptr<WsConnection>> allAccepted() const {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::shared_ptr<WsConnection>> out;
        out.reserve(accepted.size());
        for (const auto& [id, conn] : accepted) {
            out.push_back(conn);
        }
        return out;
    }

    void dispatch(const std::shared_ptr<WsConnection>& conn, std::string payload) {
        net::post(workers, [self = shared_from_this(), conn, payload = std::move(payload)]() {
            if (!self->messageHandler) {
                return;
            }
            std::optional<std::string> reply;
            try {
                reply = self->messageHandler(conn->id, payload);
            } catch (const std::exception& e) {
                LOG_ERROR("WebSocket message handler failed for {}: {}", conn->id, e.what());
                return;
            }
            if (reply.has_value() && !conn->send(std::move(reply.value()))) {
                LOG_DEBUG("Dropping reply for closed session {}", conn->id);
            }
        });
    }

    /////////////////////////////////////////// Coroutines ///////////////////////////////////////////

    net::awaitable<void> rejectUpgrade(const std::shared_ptr<WsConnection>& conn,
                                       const http::request<http::string_body>& req,
                                       http::status status, const std::string& body) {
        http::response<http::string_body> res{status, req.version()};
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);
        res.body() = body;
        res.prepare_payload();
        co_await http::async_write(conn->ws.next_layer(), res, net::use_awaitable);
        boost::system::error_code ec;
        conn->ws.next_layer().socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    net::awaitable<void> session(std::shared_ptr<WsConnection> conn) {
        bool registered = false;
        try {
            beast::flat_buffer buffer;
            http::request<http::string_body> req;
            conn->ws.next_layer().expires_after(kHandshakeTimeout);
            co_await http::async_read(conn->ws.next_layer(), buffer, req, net::use_awaitable);
            conn->ws.next_layer().expires_never();

            if (!websocket::is_upgrade(req)) {
                co_await rejectUpgrade(conn, req, http::status::bad_request, "{\"error\":\"WebSocket upgrade required\"}");
                co_return;
            }
            if (stripQuery(req.target()) != opts.path) {
                co_await rejectUpgrade(conn, req, http::status::not_found, "{\"error\":\"Not found\"}");
                co_return;
            }

            conn->ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            conn->ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
                res.set(http::field::server, "embedmcp");
            }));
            conn->ws.read_message_max(opts.maxMessageBytes);
            co_await conn->ws.async_accept(req, net::use_awaitable);

            registerConnection(conn);
            registered = true;

            for (;;) {
                beast::flat_buffer frame;
                co_await conn->ws.async_read(frame, net::use_awaitable);
                if (!conn->ws.got_text()) {
                    LOG_WARN("WebSocket session {} sent a binary frame; ignored", conn->id);
                    continue;
                }
                dispatch(conn, beast::buffers_to_string(frame.data()));
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == websocket::error::closed || !running.load()) {
                LOG_DEBUG("WebSocket session {} ended: {}", conn->id, e.what());
            } else {
                LOG_WARN("WebSocket session {} error: {}", conn->id, e.what());
            }
        } catch (const std::exception& e) {
            setError(std::string("WebSocket session error: ") + e.what());
        }
        if (registered) {
            unregisterConnection(conn);
        }
        release(conn);
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                auto socket = co_await acceptor->async_accept(net::make_strand(ioc), net::use_awaitable);
                auto conn = admit(std::move(socket));
                net::co_spawn(conn->ws.get_executor(), session(conn), net::detached);
            }
        } catch (const boost::system::system_error& e) {
            if (!running.load()) {
                // Suppress shutdown-related errors (operation_aborted when the acceptor is closed)
                LOG_DEBUG("WebSocket accept suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("WebSocket accept error: ") + e.what());
            }
        }
        co_return;
    }

    void runIo() {
        for (;;) {
            try {
                ioc.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("WebSocket io loop error: {}", e.what());
            }
        }
    }

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////

    ChannelInfo start() {
        if (running.load() || stopped.load()) {
            throw std::logic_error("WebSocketChannel cannot be started twice");
        }
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(opts.address, std::to_string(opts.port));
        tcp::endpoint ep = *results.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen(net::socket_base::max_listen_connections);

        info.type = "websocket";
        info.host = opts.address;
        info.port = acceptor->local_endpoint().port();
        info.path = opts.path;

        running.store(true);
        net::co_spawn(ioc, acceptLoop(), net::detached);
        ioThread = std::thread([this]() { runIo(); });
        LOG_INFO("WebSocket channel listening on {}:{}{}", info.host, info.port, info.path);
        return info;
    }

    void stop() {
        if (stopped.exchange(true)) {
            return;
        }
        const bool wasRunning = running.exchange(false);
        if (!wasRunning) {
            return;
        }
        net::post(ioc, [self = shared_from_this()]() {
            boost::system::error_code ec;
            self->acceptor->close(ec);
        });

        // Sockets still in the handshake have no session to close gracefully.
        for (auto& conn : handshaking()) {
            conn->forceClose();
        }
        for (auto& conn : snapshot()) {
            conn->close();
        }
        {
            std::unique_lock<std::mutex> lock(mutex);
            drained.wait_for(lock, opts.shutdownGrace, [this]() { return accepted.empty(); });
        }
        auto remaining = allAccepted();
        if (!remaining.empty()) {
            LOG_WARN("WebSocket channel force-closing {} connections", remaining.size());
            for (auto& conn : remaining) {
                conn->forceClose();
            }
            std::unique_lock<std::mutex> lock(mutex);
            drained.wait_for(lock, std::chrono::milliseconds(250), [this]() { return accepted.empty(); });
        }

        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }

        // The io thread is gone: close any socket whose coroutine never ran again, and report its
        // session closed once.
        std::vector<std::string> leftover;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto& [id, conn] : accepted) {
                conn->open.store(false);
                beast::get_lowest_layer(conn->ws).close();
            }
            for (const auto& [id, conn] : connections) {
                leftover.push_back(id);
            }
            accepted.clear();
            connections.clear();
        }
        for (const auto& id : leftover) {
            if (closedHandler) {
                closedHandler(id);
            }
        }
        LOG_INFO("WebSocket channel stopped");
    }
};

WebSocketChannel::WebSocketChannel(const Options& opts, net::thread_pool& workers)
    : pImpl(std::make_shared<Impl>(opts, workers)) {}

WebSocketChannel::~WebSocketChannel() {
    pImpl->stop();
}

std::future<ChannelInfo> WebSocketChannel::Start() {
    std::promise<ChannelInfo> ready;
    auto fut = ready.get_future();
    try {
        ready.set_value(pImpl->start());
    } catch (const std::exception& e) {
        LOG_ERROR("WebSocket channel failed to start on {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        ready.set_exception(std::current_exception());
    }
    return fut;
}

std::future<void> WebSocketChannel::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    pImpl->stop();
    done.set_value();
    return fut;
}

bool WebSocketChannel::IsRunning() const {
    return pImpl->running.load();
}

std::size_t WebSocketChannel::Broadcast(const std::string& payload) {
    auto conns = pImpl->snapshot();
    std::size_t delivered = 0;
    for (auto& conn : conns) {
        if (conn->send(payload)) {
            ++delivered;
        } else {
            LOG_WARN("WebSocket broadcast skipped closing session {}", conn->id);
        }
    }
    if (delivered == 0 && !conns.empty()) {
        throw errors::ChannelError("WebSocket broadcast failed for all " + std::to_string(conns.size()) + " sessions");
    }
    return delivered;
}

bool WebSocketChannel::SendTo(const std::string& sessionId, const std::string& payload) {
    std::shared_ptr<WsConnection> conn;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->connections.find(sessionId);
        if (it == pImpl->connections.end()) {
            return false;
        }
        conn = it->second;
    }
    return conn->send(payload);
}

bool WebSocketChannel::HasSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->connections.count(sessionId) > 0;
}

std::size_t WebSocketChannel::ConnectionCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->connections.size();
}

ChannelInfo WebSocketChannel::Info() const {
    if (pImpl->running.load()) {
        return pImpl->info;
    }
    ChannelInfo configured{"websocket", pImpl->opts.address, pImpl->opts.port, pImpl->opts.path};
    return configured;
}

void WebSocketChannel::SetMessageHandler(MessageHandler handler) {
    pImpl->messageHandler = std::move(handler);
}

void WebSocketChannel::SetSessionOpenedHandler(SessionHandler handler) {
    pImpl->openedHandler = std::move(handler);
}

void WebSocketChannel::SetSessionClosedHandler(SessionHandler handler) {
    pImpl->closedHandler = std::move(handler);
}

void WebSocketChannel::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

} // namespace embedmcp
