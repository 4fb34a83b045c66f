//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionRegistry.cpp
// Purpose: Session bookkeeping (ids, timestamps, initialization) shared by the channels
//==========================================================================================================

#include <atomic>
#include <cstdint>
#include <random>

#include "embedmcp/SessionRegistry.h"

namespace embedmcp {

namespace {
constexpr std::uint64_t kSuffixBase = 1000;
constexpr std::uint64_t kSuffixSpan = 9000;

// Random start so ids from separate processes rarely line up.
std::atomic<std::uint64_t>& suffixSequence() {
    static std::atomic<std::uint64_t> sequence{std::random_device{}() % kSuffixSpan};
    return sequence;
}
} // namespace

std::string MakeSessionId(const std::string& prefix) {
    const std::uint64_t suffix = kSuffixBase + suffixSequence().fetch_add(1) % kSuffixSpan;
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return prefix + "_" + std::to_string(ms) + "_" + std::to_string(suffix);
}

bool SessionRegistry::Open(const std::string& id, const std::string& channel) {
    const auto now = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(mutex);
    return sessions.emplace(id, SessionRecord{id, channel, now, now, false}).second;
}

bool SessionRegistry::Close(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    return sessions.erase(id) > 0;
}

void SessionRegistry::Touch(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(id);
    if (it != sessions.end()) {
        it->second.lastActivity = std::chrono::system_clock::now();
    }
}

void SessionRegistry::MarkInitialized(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(id);
    if (it != sessions.end()) {
        it->second.initialized = true;
    }
}

std::optional<SessionRecord> SessionRegistry::Get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(id);
    if (it == sessions.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t SessionRegistry::Count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return sessions.size();
}

std::vector<std::string> SessionRegistry::Ids() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> ids;
    ids.reserve(sessions.size());
    for (const auto& [id, record] : sessions) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace embedmcp
