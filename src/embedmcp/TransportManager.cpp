//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/embedmcp/TransportManager.cpp
// Purpose: Runs several named channels side by side behind one broadcast/send surface
//==========================================================================================================

#include <stdexcept>

#include "embedmcp/TransportManager.h"
#include "embedmcp/errors/Errors.h"
#include "logging/Logger.h"

namespace embedmcp {

TransportManager::~TransportManager() {
    StopAll();
}

std::vector<std::pair<std::string, std::shared_ptr<IChannel>>> TransportManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return channels;
}

void TransportManager::AddChannel(const std::string& name, std::shared_ptr<IChannel> channel) {
    if (!channel) {
        throw std::invalid_argument("TransportManager: null channel " + name);
    }
    std::lock_guard<std::mutex> lock(mutex);
    if (running.load()) {
        throw std::logic_error("Cannot add channels while the transport manager is running");
    }
    for (const auto& [existing, ch] : channels) {
        if (existing == name) {
            throw std::logic_error("Channel already registered: " + name);
        }
    }
    channels.emplace_back(name, std::move(channel));
    LOG_DEBUG("Added channel: {}", name);
}

bool TransportManager::RemoveChannel(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex);
    if (running.load()) {
        throw std::logic_error("Cannot remove channels while the transport manager is running");
    }
    for (auto it = channels.begin(); it != channels.end(); ++it) {
        if (it->first == name) {
            channels.erase(it);
            LOG_DEBUG("Removed channel: {}", name);
            return true;
        }
    }
    return false;
}

std::shared_ptr<IChannel> TransportManager::GetChannel(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& [n, ch] : channels) {
        if (n == name) {
            return ch;
        }
    }
    return nullptr;
}

std::vector<std::string> TransportManager::ChannelNames() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> names;
    names.reserve(channels.size());
    for (const auto& [n, ch] : channels) {
        names.push_back(n);
    }
    return names;
}

std::vector<ChannelInfo> TransportManager::StartAll() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (running.exchange(true)) {
            throw std::logic_error("Transport manager is already running");
        }
    }
    auto all = snapshot();
    LOG_INFO("Starting {} channels", all.size());

    std::vector<ChannelInfo> started;
    std::string lastError = "no channels configured";
    for (auto& [name, channel] : all) {
        try {
            ChannelInfo info = channel->Start().get();
            LOG_INFO("Channel '{}' started on {}:{}", name, info.host, info.port);
            started.push_back(std::move(info));
        } catch (const std::exception& e) {
            lastError = name + ": " + e.what();
            LOG_ERROR("Channel '{}' failed to start: {}", name, e.what());
        }
    }
    if (started.empty()) {
        running.store(false);
        throw std::runtime_error("No channel could be started (" + lastError + ")");
    }
    if (started.size() < all.size()) {
        LOG_WARN("{} of {} channels failed to start", all.size() - started.size(), all.size());
    }
    LOG_INFO("Transport manager started with {}/{} channels", started.size(), all.size());
    return started;
}

void TransportManager::StopAll() {
    if (!running.exchange(false)) {
        return;
    }
    for (auto& [name, channel] : snapshot()) {
        if (!channel->IsRunning()) {
            continue;
        }
        try {
            channel->Stop().get();
            LOG_INFO("Channel '{}' stopped", name);
        } catch (const std::exception& e) {
            LOG_ERROR("Channel '{}' failed to stop cleanly: {}", name, e.what());
        }
    }
    LOG_INFO("Transport manager stopped");
}

bool TransportManager::IsRunning() const {
    return running.load();
}

std::size_t TransportManager::Broadcast(const std::string& payload) {
    if (!running.load()) {
        throw std::logic_error("Transport manager is not running");
    }
    std::size_t delivered = 0;
    std::size_t attempted = 0;
    std::size_t failed = 0;
    for (auto& [name, channel] : snapshot()) {
        if (!channel->IsRunning()) {
            LOG_DEBUG("Channel '{}' is not running, skipping broadcast", name);
            continue;
        }
        ++attempted;
        try {
            delivered += channel->Broadcast(payload);
        } catch (const std::exception& e) {
            ++failed;
            LOG_WARN("Broadcast via channel '{}' failed: {}", name, e.what());
        }
    }
    if (attempted > 0 && failed == attempted) {
        throw errors::ChannelError("All channels failed to broadcast");
    }
    return delivered;
}

bool TransportManager::SendTo(const std::string& sessionId, const std::string& payload) {
    for (auto& [name, channel] : snapshot()) {
        if (channel->IsRunning() && channel->HasSession(sessionId)) {
            return channel->SendTo(sessionId, payload);
        }
    }
    LOG_DEBUG("No channel owns session {}", sessionId);
    return false;
}

std::size_t TransportManager::ConnectionCount() const {
    std::size_t total = 0;
    for (const auto& [name, channel] : snapshot()) {
        total += channel->ConnectionCount();
    }
    return total;
}

std::vector<ChannelStatus> TransportManager::Status() const {
    std::vector<ChannelStatus> out;
    for (const auto& [name, channel] : snapshot()) {
        ChannelInfo info = channel->Info();
        ChannelStatus status;
        status.name = name;
        status.type = info.type;
        status.host = info.host;
        status.port = info.port;
        status.path = info.path;
        status.running = channel->IsRunning();
        status.connectionCount = channel->ConnectionCount();
        status.activeConnections = status.running ? status.connectionCount : 0;
        out.push_back(std::move(status));
    }
    return out;
}

} // namespace embedmcp
