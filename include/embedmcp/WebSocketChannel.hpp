//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketChannel.hpp
// Purpose: Multi-client JSON-RPC channel over WebSocket using Boost.Beast
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/thread_pool.hpp>

#include "embedmcp/Channel.h"
#include "embedmcp/Protocol.h"

namespace embedmcp {

class WebSocketChannel : public IChannel {
public:
    //==========================================================================================================
    // Options
    // Purpose: Bind address/port, upgrade path and limits.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port; 0 selects an ephemeral port reported by Start()
    //   path: Only upgrades on this path are accepted; others get HTTP 404
    //   serverInfo: Sent in the notifications/connection handshake
    //   shutdownGrace: How long Stop() waits for close handshakes before force-closing sockets
    //   maxMessageBytes: Largest inbound frame accepted
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8080};
        std::string path{"/mcp"};
        Implementation serverInfo{"embedmcp", "0.0.0"};
        std::chrono::milliseconds shutdownGrace{2000};
        std::size_t maxMessageBytes{4 * 1024 * 1024};
    };

    // workers runs the message handler; it must outlive the channel's Stop().
    WebSocketChannel(const Options& opts, boost::asio::thread_pool& workers);
    ~WebSocketChannel() override;

    WebSocketChannel(const WebSocketChannel&) = delete;
    WebSocketChannel& operator=(const WebSocketChannel&) = delete;

    std::future<ChannelInfo> Start() override;
    std::future<void> Stop() override;
    bool IsRunning() const override;

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
