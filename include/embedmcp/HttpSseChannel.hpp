//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpSseChannel.hpp
// Purpose: HTTP POST request endpoint plus Server-Sent Events push stream (Boost.Beast, optional TLS 1.3)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/thread_pool.hpp>

#include "embedmcp/Channel.h"

namespace embedmcp {

// Request header naming the SSE session a POST belongs to.
constexpr const char* kSessionIdHeader = "Mcp-Session-Id";

class HttpSseChannel : public IChannel {
public:
    //==========================================================================================================
    // Options
    // Purpose: Bind address/port, endpoint paths, TLS files and stream timing.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port; 0 selects an ephemeral port reported by Start()
    //   messagePath: POST endpoint taking one JSON-RPC message per call
    //   eventsPath: GET endpoint opening an SSE stream (one session per stream)
    //   statusPath/healthPath: GET diagnostics
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   keepAlive: Interval of ": ping" comments on idle streams
    //   shutdownGrace: How long Stop() waits for streams to finish before force-closing them
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8081};
        std::string messagePath{"/mcp/message"};
        std::string eventsPath{"/mcp/events"};
        std::string statusPath{"/mcp/status"};
        std::string healthPath{"/health"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        std::chrono::milliseconds keepAlive{5000};
        std::chrono::milliseconds shutdownGrace{2000};
        std::size_t maxBodyBytes{4 * 1024 * 1024};
    };

    // Throws when scheme is https and the certificate or key cannot be loaded.
    HttpSseChannel(const Options& opts, boost::asio::thread_pool& workers);
    ~HttpSseChannel() override;

    HttpSseChannel(const HttpSseChannel&) = delete;
    HttpSseChannel& operator=(const HttpSseChannel&) = delete;

    std::future<ChannelInfo> Start() override;
    std::future<void> Stop() override;
    bool IsRunning() const override;

    // Delivers to SSE streams; anonymous POST sessions cannot receive pushes.
    std::size_t Broadcast(const std::string& payload) override;
    bool SendTo(const std::string& sessionId, const std::string& payload) override;
    bool HasSession(const std::string& sessionId) const override;
    std::size_t ConnectionCount() const override;
    ChannelInfo Info() const override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetSessionOpenedHandler(SessionHandler handler) override;
    void SetSessionClosedHandler(SessionHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace embedmcp
