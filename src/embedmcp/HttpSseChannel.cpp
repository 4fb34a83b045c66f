//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/embedmcp/HttpSseChannel.cpp
// Purpose: HTTP POST request endpoint plus Server-Sent Events push stream (Boost.Beast, optional TLS 1.3)
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "embedmcp/HttpSseChannel.hpp"
#include "embedmcp/JSONRPCTypes.h"
#include "embedmcp/SessionRegistry.h"
#include "embedmcp/errors/Errors.h"
#include "logging/Logger.h"

#include <openssl/ssl.h>

namespace embedmcp {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr const char* kShutdownReason = "Server shutting down";
constexpr std::chrono::seconds kReadTimeout{30};

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

std::string stripQuery(beast::string_view target) {
    std::string t(target);
    auto q = t.find('?');
    if (q != std::string::npos) {
        t.resize(q);
    }
    return t;
}

// One "data:" line per payload line, terminated by a blank line.
std::string formatEvent(const std::string& payload) {
    std::string out;
    out.reserve(payload.size() + 8);
    std::size_t start = 0;
    for (;;) {
        auto nl = payload.find('\n', start);
        out += "data: ";
        out.append(payload, start, nl == std::string::npos ? std::string::npos : nl - start);
        out += "\n";
        if (nl == std::string::npos) {
            break;
        }
        start = nl + 1;
    }
    out += "\n";
    return out;
}

Response jsonResponse(const Request& req, http::status status, std::string body) {
    Response res{status, req.version()};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::server, "embedmcp");
    res.keep_alive(false);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

Response methodNotAllowed(const Request& req, const char* allow) {
    Response res = jsonResponse(req, http::status::method_not_allowed, "{\"error\":\"Method not allowed\"}");
    res.set(http::field::allow, allow);
    return res;
}

bool isBenignDisconnect(const boost::system::error_code& ec) {
    return ec == http::error::end_of_stream || ec == net::error::eof || ec == net::error::connection_reset ||
           ec == net::error::broken_pipe || ec == net::error::operation_aborted || ec == beast::error::timeout;
}

//==========================================================================================================
// SseStream
// Purpose: One open event stream. The queue is shared with sender threads; wake is only used on the
//          channel's io thread.
//==========================================================================================================
struct SseStream {
    SseStream(net::io_context& ioc, std::string id) : id(std::move(id)), wake(ioc) {}

    const std::string id;
    net::steady_timer wake;

    std::mutex mutex;
    std::deque<std::string> queue;
    bool closing{false};

    bool push(const std::string& payload) {
        std::lock_guard<std::mutex> lock(mutex);
        if (closing) {
            return false;
        }
        queue.push_back(payload);
        return true;
    }
};

} // namespace

class HttpSseChannel::Impl : public std::enable_shared_from_this<Impl> {
public:
    HttpSseChannel::Options opts;
    net::thread_pool& workers;

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;
    std::atomic<bool> running{false};
    std::atomic<bool> stopped{false};
    ChannelInfo info;

    mutable std::mutex mutex;
    std::condition_variable drained;
    std::unordered_map<std::string, std::shared_ptr<SseStream>> streams;
    std::unordered_set<std::string> reserved; // SSE ids handed out before their stream registers
    std::unordered_set<std::string> anonymous;
    // Closers for every accepted socket until its coroutine ends. Run them on the io thread, or after
    // it has been joined.
    std::unordered_map<std::uint64_t, std::function<void()>> sockets;
    std::uint64_t nextSocket{0};

    IChannel::MessageHandler messageHandler;
    IChannel::SessionHandler openedHandler;
    IChannel::SessionHandler closedHandler;
    IChannel::ErrorHandler errorHandler;

    Impl(const HttpSseChannel::Options& o, net::thread_pool& w) : opts(o), workers(w) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HttpSseChannel: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        } else if (opts.scheme != "http") {
            throw std::invalid_argument("HttpSseChannel: unsupported scheme " + opts.scheme);
        }
    }

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

    template <class Stream>
    std::uint64_t trackSocket(const std::shared_ptr<Stream>& stream) {
        std::lock_guard<std::mutex> lock(mutex);
        const std::uint64_t token = ++nextSocket;
        sockets.emplace(token, [weak = std::weak_ptr<Stream>(stream)]() {
            if (auto live = weak.lock()) {
                beast::get_lowest_layer(*live).close();
            }
        });
        return token;
    }

    void forgetSocket(std::uint64_t token) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            sockets.erase(token);
        }
        drained.notify_all();
    }

    std::vector<std::function<void()>> socketClosers() const {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::function<void()>> out;
        out.reserve(sockets.size());
        for (const auto& [token, closer] : sockets) {
            out.push_back(closer);
        }
        return out;
    }

    // An SSE id no live or reserved stream holds.
    std::string reserveStreamId() {
        std::lock_guard<std::mutex> lock(mutex);
        std::string id = MakeSessionId("sse");
        while (streams.count(id) > 0 || reserved.count(id) > 0) {
            id = MakeSessionId("sse");
        }
        reserved.insert(id);
        return id;
    }

    void dropReservation(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex);
        reserved.erase(id);
    }

    void registerStream(const std::shared_ptr<SseStream>& s) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            reserved.erase(s->id);
            if (!streams.emplace(s->id, s).second) {
                throw std::logic_error("SSE session id already registered: " + s->id);
            }
        }
        LOG_INFO("SSE session {} connected", s->id);
        if (openedHandler) {
            openedHandler(s->id);
        }
    }

    void unregisterStream(const std::shared_ptr<SseStream>& s) {
        bool removed = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = streams.find(s->id);
            if (it != streams.end() && it->second == s) {
                streams.erase(it);
                removed = true;
            }
        }
        drained.notify_all();
        if (removed) {
            LOG_INFO("SSE session {} disconnected", s->id);
            if (closedHandler) {
                closedHandler(s->id);
            }
        }
    }

    // Opens a per-request session under an id no other anonymous request holds.
    std::string openAnonymous() {
        std::string id;
        {
            std::lock_guard<std::mutex> lock(mutex);
            id = MakeSessionId("http");
            while (!anonymous.insert(id).second) {
                id = MakeSessionId("http");
            }
        }
        if (openedHandler) {
            openedHandler(id);
        }
        return id;
    }

    void closeAnonymous(const std::string& id) {
        bool removed = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            removed = anonymous.erase(id) > 0;
        }
        if (removed && closedHandler) {
            closedHandler(id);
        }
    }

    std::shared_ptr<SseStream> findStream(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = streams.find(id);
        return it == streams.end() ? nullptr : it->second;
    }

    std::vector<std::shared_ptr<SseStream>> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::shared_ptr<SseStream>> out;
        out.reserve(streams.size());
        for (const auto& [id, s] : streams) {
            out.push_back(s);
        }
        return out;
    }

    void wake(const std::shared_ptr<SseStream>& s) {
        net::post(ioc, [s]() { s->wake.cancel(); });
    }

    bool push(const std::shared_ptr<SseStream>& s, const std::string& payload) {
        if (!s->push(payload)) {
            return false;
        }
        wake(s);
        return true;
    }

    std::string statusJson() const {
        JSONValue::Object obj;
        JSONValue::Array ids;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto& [id, s] : streams) {
                ids.push_back(std::make_shared<JSONValue>(id));
            }
        }
        obj["type"] = std::make_shared<JSONValue>(std::string("http"));
        obj["host"] = std::make_shared<JSONValue>(info.host);
        obj["port"] = std::make_shared<JSONValue>(static_cast<int64_t>(info.port));
        obj["running"] = std::make_shared<JSONValue>(running.load());
        obj["connectionCount"] = std::make_shared<JSONValue>(static_cast<int64_t>(ids.size()));
        obj["sessions"] = std::make_shared<JSONValue>(std::move(ids));
        return SerializeJSON(JSONValue{std::move(obj)});
    }

    /////////////////////////////////////////// Requests ///////////////////////////////////////////

    net::awaitable<Response> handleMessage(const Request& req) {
        std::string sessionId;
        bool isAnonymous = false;
        auto header = req.find(kSessionIdHeader);
        if (header != req.end()) {
            sessionId = std::string(header->value());
            if (!findStream(sessionId)) {
                co_return jsonResponse(req, http::status::not_found, "{\"error\":\"Unknown session\"}");
            }
        } else {
            sessionId = openAnonymous();
            isAnonymous = true;
        }

        std::optional<std::string> reply;
        bool failed = false;
        try {
            reply = co_await net::co_spawn(workers,
                [self = shared_from_this(), sessionId, body = req.body()]() -> net::awaitable<std::optional<std::string>> {
                    if (!self->messageHandler) {
                        co_return std::nullopt;
                    }
                    co_return self->messageHandler(sessionId, body);
                },
                net::use_awaitable);
        } catch (const std::exception& e) {
            LOG_ERROR("HTTP message handler failed for {}: {}", sessionId, e.what());
            failed = true;
        }
        if (isAnonymous) {
            closeAnonymous(sessionId);
        }
        if (failed) {
            co_return jsonResponse(req, http::status::internal_server_error, "{\"error\":\"Internal error\"}");
        }
        if (!reply.has_value()) {
            Response accepted{http::status::accepted, req.version()};
            accepted.set(http::field::server, "embedmcp");
            accepted.keep_alive(false);
            accepted.prepare_payload();
            co_return accepted;
        }
        Response res = jsonResponse(req, http::status::ok, std::move(reply.value()));
        if (!isAnonymous) {
            res.set(kSessionIdHeader, sessionId);
        }
        co_return res;
    }

    net::awaitable<Response> makeResponse(const Request& req) {
        const std::string target = stripQuery(req.target());
        if (target == opts.messagePath) {
            if (req.method() != http::verb::post) {
                co_return methodNotAllowed(req, "POST");
            }
            co_return co_await handleMessage(req);
        }
        if (target == opts.eventsPath) {
            co_return methodNotAllowed(req, "GET");
        }
        if (target == opts.statusPath) {
            if (req.method() != http::verb::get) {
                co_return methodNotAllowed(req, "GET");
            }
            co_return jsonResponse(req, http::status::ok, statusJson());
        }
        if (target == opts.healthPath) {
            if (req.method() != http::verb::get) {
                co_return methodNotAllowed(req, "GET");
            }
            co_return jsonResponse(req, http::status::ok, "{\"status\":\"healthy\"}");
        }
        co_return jsonResponse(req, http::status::not_found, "{\"error\":\"Not found\"}");
    }

    template <class Stream>
    static net::awaitable<void> writeText(Stream& stream, std::string text) {
        co_await net::async_write(stream, net::buffer(text), net::use_awaitable);
    }

    template <class Stream>
    net::awaitable<void> serveEvents(Stream& stream, const Request& req) {
        auto sse = std::make_shared<SseStream>(ioc, reserveStreamId());

        http::response<http::empty_body> res{http::status::ok, req.version()};
        res.set(http::field::server, "embedmcp");
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-cache");
        res.set(kSessionIdHeader, sse->id);
        res.keep_alive(true);
        http::response_serializer<http::empty_body> sr{res};
        try {
            co_await http::async_write_header(stream, sr, net::use_awaitable);
        } catch (const std::exception&) {
            dropReservation(sse->id);
            throw;
        }

        registerStream(sse);
        try {
            co_await writeText(stream, formatEvent("{\"type\":\"connection\",\"id\":\"" + sse->id + "\"}"));
            for (;;) {
                std::deque<std::string> batch;
                bool closing = false;
                {
                    std::lock_guard<std::mutex> lock(sse->mutex);
                    batch.swap(sse->queue);
                    closing = sse->closing;
                }
                if (!batch.empty()) {
                    for (const auto& payload : batch) {
                        co_await writeText(stream, formatEvent(payload));
                    }
                    continue;
                }
                if (closing) {
                    co_await writeText(stream, std::string("event: close\ndata: {\"reason\":\"") + kShutdownReason + "\"}\n\n");
                    break;
                }
                sse->wake.expires_after(opts.keepAlive);
                boost::system::error_code ec;
                co_await sse->wake.async_wait(net::redirect_error(net::use_awaitable, ec));
                if (!ec) {
                    co_await writeText(stream, ": ping\n\n");
                }
            }
        } catch (const boost::system::system_error& e) {
            LOG_DEBUG("SSE session {} ended: {}", sse->id, e.what());
        } catch (const std::exception& e) {
            setError(std::string("SSE session error: ") + e.what());
        }
        unregisterStream(sse);
    }

    template <class Stream>
    net::awaitable<void> serve(Stream& stream) {
        beast::flat_buffer buffer;
        http::request_parser<http::string_body> parser;
        parser.body_limit(opts.maxBodyBytes);
        beast::get_lowest_layer(stream).expires_after(kReadTimeout);
        co_await http::async_read(stream, buffer, parser, net::use_awaitable);
        beast::get_lowest_layer(stream).expires_never();
        Request req = parser.release();

        if (stripQuery(req.target()) == opts.eventsPath && req.method() == http::verb::get) {
            co_await serveEvents(stream, req);
            co_return;
        }
        Response res = co_await makeResponse(req);
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    void reportSessionError(const char* kind, const boost::system::system_error& e) {
        if (!running.load() || isBenignDisconnect(e.code())) {
            // Suppress shutdown-related and peer hang-up errors
            LOG_DEBUG("HttpSseChannel {} session ended: {}", kind, e.what());
        } else {
            setError(std::string("HttpSseChannel ") + kind + " session error: " + e.what());
        }
    }

    using PlainStream = beast::tcp_stream;
    using TlsStream = beast::ssl_stream<beast::tcp_stream>;

    net::awaitable<void> session_plain(std::shared_ptr<PlainStream> stream, std::uint64_t token) {
        try {
            co_await serve(*stream);
            boost::system::error_code ec;
            stream->socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const boost::system::system_error& e) {
            reportSessionError("plain", e);
        } catch (const std::exception& e) {
            setError(std::string("HttpSseChannel plain session error: ") + e.what());
        }
        forgetSocket(token);
        co_return;
    }

    net::awaitable<void> session_tls(std::shared_ptr<TlsStream> stream, std::uint64_t token) {
        try {
            beast::get_lowest_layer(*stream).expires_after(kReadTimeout);
            co_await stream->async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serve(*stream);
            boost::system::error_code ec;
            beast::get_lowest_layer(*stream).expires_after(std::chrono::seconds(5));
            co_await stream->async_shutdown(net::redirect_error(net::use_awaitable, ec));
        } catch (const boost::system::system_error& e) {
            reportSessionError("TLS", e);
        } catch (const std::exception& e) {
            setError(std::string("HttpSseChannel TLS session error: ") + e.what());
        }
        forgetSocket(token);
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                // Tracked from here on so Stop() can close it whatever state the request is in.
                if (sslCtx) {
                    auto stream = std::make_shared<TlsStream>(std::move(socket), *sslCtx);
                    const auto token = trackSocket(stream);
                    net::co_spawn(ioc, session_tls(std::move(stream), token), net::detached);
                } else {
                    auto stream = std::make_shared<PlainStream>(std::move(socket));
                    const auto token = trackSocket(stream);
                    net::co_spawn(ioc, session_plain(std::move(stream), token), net::detached);
                }
            }
        } catch (const boost::system::system_error& e) {
            if (!running.load()) {
                // Suppress shutdown-related errors (operation_aborted when the acceptor is closed)
                LOG_DEBUG("HttpSseChannel accept suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HttpSseChannel accept error: ") + e.what());
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
                LOG_ERROR("HttpSseChannel io loop error: {}", e.what());
            }
        }
    }

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////

    ChannelInfo start() {
        if (running.load() || stopped.load()) {
            throw std::logic_error("HttpSseChannel cannot be started twice");
        }
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(opts.address, std::to_string(opts.port));
        tcp::endpoint ep = *results.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen(net::socket_base::max_listen_connections);

        info.type = "http";
        info.host = opts.address;
        info.port = acceptor->local_endpoint().port();
        info.path = opts.messagePath;

        running.store(true);
        net::co_spawn(ioc, acceptLoop(), net::detached);
        ioThread = std::thread([this]() { runIo(); });
        LOG_INFO("HTTP/SSE channel listening on {}://{}:{}", opts.scheme, info.host, info.port);
        return info;
    }

    void stop() {
        if (stopped.exchange(true)) {
            return;
        }
        if (!running.exchange(false)) {
            return;
        }
        net::post(ioc, [self = shared_from_this()]() {
            boost::system::error_code ec;
            self->acceptor->close(ec);
        });

        for (auto& s : snapshot()) {
            {
                std::lock_guard<std::mutex> lock(s->mutex);
                s->closing = true;
            }
            wake(s);
        }
        // Streams send their close event; in-flight requests may still answer within the grace period.
        {
            std::unique_lock<std::mutex> lock(mutex);
            drained.wait_for(lock, opts.shutdownGrace, [this]() { return sockets.empty(); });
        }
        auto closers = socketClosers();
        if (!closers.empty()) {
            LOG_WARN("HTTP/SSE channel force-closing {} connections", closers.size());
            for (auto& closer : closers) {
                net::post(ioc, closer);
            }
            std::unique_lock<std::mutex> lock(mutex);
            drained.wait_for(lock, std::chrono::milliseconds(250), [this]() { return sockets.empty(); });
        }

        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }

        // The io thread is gone: close sockets whose coroutine never ran again.
        for (auto& closer : socketClosers()) {
            closer();
        }

        std::vector<std::string> leftover;
        {
            std::lock_guard<std::mutex> lock(mutex);
            sockets.clear();
            reserved.clear();
            for (const auto& [id, s] : streams) {
                leftover.push_back(id);
            }
            leftover.insert(leftover.end(), anonymous.begin(), anonymous.end());
            streams.clear();
            anonymous.clear();
        }
        for (const auto& id : leftover) {
            if (closedHandler) {
                closedHandler(id);
            }
        }
        LOG_INFO("HTTP/SSE channel stopped");
    }
};

HttpSseChannel::HttpSseChannel(const Options& opts, net::thread_pool& workers)
    : pImpl(std::make_shared<Impl>(opts, workers)) {}

HttpSseChannel::~HttpSseChannel() {
    pImpl->stop();
}

std::future<ChannelInfo> HttpSseChannel::Start() {
    std::promise<ChannelInfo> ready;
    auto fut = ready.get_future();
    try {
        ready.set_value(pImpl->start());
    } catch (const std::exception& e) {
        LOG_ERROR("HTTP/SSE channel failed to start on {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        ready.set_exception(std::current_exception());
    }
    return fut;
}

std::future<void> HttpSseChannel::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    pImpl->stop();
    done.set_value();
    return fut;
}

bool HttpSseChannel::IsRunning() const {
    return pImpl->running.load();
}

std::size_t HttpSseChannel::Broadcast(const std::string& payload) {
    auto streams = pImpl->snapshot();
    std::size_t delivered = 0;
    for (auto& s : streams) {
        if (pImpl->push(s, payload)) {
            ++delivered;
        } else {
            LOG_WARN("SSE broadcast skipped closing session {}", s->id);
        }
    }
    if (delivered == 0 && !streams.empty()) {
        throw errors::ChannelError("SSE broadcast failed for all " + std::to_string(streams.size()) + " sessions");
    }
    return delivered;
}

bool HttpSseChannel::SendTo(const std::string& sessionId, const std::string& payload) {
    auto s = pImpl->findStream(sessionId);
    if (!s) {
        return false;
    }
    return pImpl->push(s, payload);
}

bool HttpSseChannel::HasSession(const std::string& sessionId) const {
    return pImpl->findStream(sessionId) != nullptr;
}

std::size_t HttpSseChannel::ConnectionCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->streams.size();
}

ChannelInfo HttpSseChannel::Info() const {
    if (pImpl->running.load()) {
        return pImpl->info;
    }
    ChannelInfo configured{"http", pImpl->opts.address, pImpl->opts.port, pImpl->opts.messagePath};
    return configured;
}

void HttpSseChannel::SetMessageHandler(MessageHandler handler) {
    pImpl->messageHandler = std::move(handler);
}

void HttpSseChannel::SetSessionOpenedHandler(SessionHandler handler) {
    pImpl->openedHandler = std::move(handler);
}

void HttpSseChannel::SetSessionClosedHandler(SessionHandler handler) {
    pImpl->closedHandler = std::move(handler);
}

void HttpSseChannel::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

} // namespace embedmcp
