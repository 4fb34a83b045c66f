//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: Embedded MCP server wiring channels, dispatch, outbound correlation and subscriptions
//==========================================================================================================

#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "embedmcp/Channel.h"
#include "embedmcp/FileAccessPolicy.h"
#include "embedmcp/Protocol.h"
#include "embedmcp/Providers.h"
#include "embedmcp/ServerConfig.h"
#include "embedmcp/SessionRegistry.h"
#include "embedmcp/TransportManager.h"
#include "embedmcp/subscriptions/SubscriptionManager.h"
#include "embedmcp/subscriptions/WatchBackend.h"

namespace embedmcp {

//==========================================================================================================
// Server
// Purpose: Owns everything a running embedded server needs: the background scheduler, the access policy,
//          the subscription manager, the outbound correlator, the method dispatcher, the inbound worker
//          pool and the WebSocket and HTTP/SSE channels.
// Notes:
//   - Providers are borrowed; they must outlive Stop().
//   - A Server runs once: Start() after Stop() throws std::logic_error.
//   - Closing a session releases its subscriptions and fails its pending outbound requests.
//==========================================================================================================
class Server {
public:
    struct Providers {
        IToolProvider* tools{nullptr};
        IResourceProvider* resources{nullptr};
        IPromptProvider* prompts{nullptr};
    };

    // watchBackend replaces the inotify backend (tests inject fakes); null selects inotify.
    Server(ServerConfig config, Implementation serverInfo, Providers providers,
           std::unique_ptr<subscriptions::IWatchBackend> watchBackend = nullptr);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the configured channels.
    // Returns:
    //   Future with the info of every channel that bound. Carries the startup error when none could.
    //==========================================================================================================
    std::future<std::vector<ChannelInfo>> Start();
    // Closes every session, drains the worker pool and tears down subscriptions. Idempotent.
    std::future<void> Stop();
    bool IsRunning() const;

    // Application background/foreground: stops watchers and pollers but keeps subscriptions.
    void Suspend();
    void Resume();

    /////////////////////////////////////////// Server-initiated traffic ///////////////////////////////////////////
    //==========================================================================================================
    // Sends sampling/createMessage to a session.
    // Returns:
    //   Future with the decoded result, or errors::TimeoutError / errors::ChannelError / errors::McpException.
    //==========================================================================================================
    std::future<CreateMessageResult> RequestCreateMessage(
        const std::string& sessionId, const CreateMessageParams& params,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Arbitrary request to a session, retried per ServerConfig::retry on timeout or channel failure.
    std::future<JSONValue> SendRequest(const std::string& sessionId, const std::string& method,
                                       std::optional<JSONValue> params = std::nullopt);

    bool Notify(const std::string& sessionId, const std::string& method,
                std::optional<JSONValue> params = std::nullopt);
    // Returns deliveries over all channels; 0 when not running.
    std::size_t BroadcastNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    void NotifyToolsListChanged();
    void NotifyResourcesListChanged();
    void NotifyPromptsListChanged();

    /////////////////////////////////////////// Introspection ///////////////////////////////////////////
    const ServerConfig& Config() const;
    FileAccessPolicy& AccessPolicy();
    subscriptions::SubscriptionManager& Subscriptions();
    const SessionRegistry& Sessions() const;
    std::vector<ChannelStatus> Status() const;
    std::size_t PendingOutboundCount() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace embedmcp
