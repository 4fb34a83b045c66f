//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportManager.h
// Purpose: Runs several named channels side by side behind one broadcast/send surface
//==========================================================================================================

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "embedmcp/Channel.h"

namespace embedmcp {

//==========================================================================================================
// ChannelStatus
// Purpose: Snapshot of one managed channel.
//==========================================================================================================
struct ChannelStatus {
    std::string name;
    std::string type;
    std::string host;
    std::uint16_t port{0};
    std::string path;
    bool running{false};
    std::size_t connectionCount{0};
    std::size_t activeConnections{0};
};

class TransportManager {
public:
    TransportManager() = default;
    ~TransportManager();

    TransportManager(const TransportManager&) = delete;
    TransportManager& operator=(const TransportManager&) = delete;

    // Throws std::logic_error while running or when the name is already taken.
    void AddChannel(const std::string& name, std::shared_ptr<IChannel> channel);
    // Throws std::logic_error while running.
    bool RemoveChannel(const std::string& name);
    std::shared_ptr<IChannel> GetChannel(const std::string& name) const;
    std::vector<std::string> ChannelNames() const;

    //==========================================================================================================
    // Starts every channel in insertion order. A channel that fails to bind is logged and skipped.
    // Returns:
    //   Info of the channels that started
    // Throws:
    //   std::runtime_error when none started (the bind error of the last channel is included)
    //   std::logic_error when already running
    //==========================================================================================================
    std::vector<ChannelInfo> StartAll();
    void StopAll();
    bool IsRunning() const;

    // Sum of deliveries over running channels; throws errors::ChannelError only when every channel failed.
    std::size_t Broadcast(const std::string& payload);
    // Routes to the channel owning the session.
    bool SendTo(const std::string& sessionId, const std::string& payload);
    std::size_t ConnectionCount() const;
    std::vector<ChannelStatus> Status() const;

private:
    std::vector<std::pair<std::string, std::shared_ptr<IChannel>>> snapshot() const;

    mutable std::mutex mutex;
    std::vector<std::pair<std::string, std::shared_ptr<IChannel>>> channels;
    std::atomic<bool> running{false};
};

} // namespace embedmcp
