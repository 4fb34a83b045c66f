//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Channel.h
// Purpose: Multi-client transport channel interface shared by the WebSocket and HTTP/SSE channels
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <optional>
#include <string>

namespace embedmcp {

//==========================================================================================================
// ChannelInfo
// Purpose: Where a started channel is listening. port is the bound port (resolved when 0 was requested).
//==========================================================================================================
struct ChannelInfo {
    std::string type;   // "websocket" or "http"
    std::string host;
    std::uint16_t port{0};
    std::string path;
};

//==========================================================================================================
// IChannel
// Purpose: Server-side channel owning a listener and many client sessions.
// Notes:
//   - Handlers must be set before Start().
//   - The message handler returns the serialized reply for the session, or nullopt when none is due.
//==========================================================================================================
class IChannel {
public:
    virtual ~IChannel() = default;

    using MessageHandler = std::function<std::optional<std::string>(const std::string& sessionId,
                                                                    const std::string& payload)>;
    using SessionHandler = std::function<void(const std::string& sessionId)>;
    using ErrorHandler = std::function<void(const std::string& error)>;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////

    //==========================================================================================================
    // Binds and starts accepting.
    // Returns:
    //   Future with the bound address; carries the bind error (boost::system::system_error) on failure.
    //==========================================================================================================
    virtual std::future<ChannelInfo> Start() = 0;

    //==========================================================================================================
    // Closes every session (WebSocket close 1001 or SSE close event) and releases the listener.
    // Idempotent. Sessions still open after the grace period are force-closed.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    virtual bool IsRunning() const = 0;

    /////////////////////////////////////////// Delivery ///////////////////////////////////////////

    //==========================================================================================================
    // Best-effort delivery to every open session.
    // Returns:
    //   Number of sessions the payload was queued for.
    // Throws:
    //   errors::ChannelError when sessions exist but every attempt failed.
    //==========================================================================================================
    virtual std::size_t Broadcast(const std::string& payload) = 0;

    // Queues payload for one session. Returns false for unknown or closing sessions.
    virtual bool SendTo(const std::string& sessionId, const std::string& payload) = 0;

    virtual bool HasSession(const std::string& sessionId) const = 0;
    virtual std::size_t ConnectionCount() const = 0;
    virtual ChannelInfo Info() const = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    virtual void SetMessageHandler(MessageHandler handler) = 0;
    virtual void SetSessionOpenedHandler(SessionHandler handler) = 0;
    virtual void SetSessionClosedHandler(SessionHandler handler) = 0;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

} // namespace embedmcp
