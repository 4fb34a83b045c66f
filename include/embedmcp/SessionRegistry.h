//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionRegistry.h
// Purpose: Session bookkeeping (ids, timestamps, initialization) shared by the channels
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace embedmcp {

// Generates "<prefix>_<epoch-ms>_<1000..9999>". The suffix walks a process-wide sequence, so ids
// repeat only after 9000 calls inside one millisecond; channels still check new ids against live ones.
std::string MakeSessionId(const std::string& prefix);

struct SessionRecord {
    std::string id;
    std::string channel;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point lastActivity;
    bool initialized{false};
};

class SessionRegistry {
public:
    // Returns false when the id is already registered.
    bool Open(const std::string& id, const std::string& channel);
    bool Close(const std::string& id);
    void Touch(const std::string& id);
    void MarkInitialized(const std::string& id);

    std::optional<SessionRecord> Get(const std::string& id) const;
    std::size_t Count() const;
    std::vector<std::string> Ids() const;

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, SessionRecord> sessions;
};

} // namespace embedmcp
