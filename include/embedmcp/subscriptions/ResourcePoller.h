//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourcePoller.h
// Purpose: Adaptive fingerprint polling for resources without an OS change source
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "embedmcp/JSONRPCTypes.h"

namespace embedmcp {

class BackgroundScheduler;

namespace subscriptions {

//==========================================================================================================
// PollSettings
// Purpose: Interval policy. Failures multiply the interval by backoffFactor up to ceiling; the interval
//          never drops below floor and returns to base after a successful poll.
//==========================================================================================================
struct PollSettings {
    std::chrono::milliseconds base{15000};
    std::chrono::milliseconds ceiling{60000};
    std::chrono::milliseconds floor{5000};
    double backoffFactor{1.5};
};

// Interval to use after one more consecutive failure.
std::chrono::milliseconds NextBackoffInterval(std::chrono::milliseconds current, const PollSettings& settings);

// Order-independent structural hash of a JSON value (object members are hashed in key order).
std::size_t FingerprintJSON(const JSONValue& value);

//==========================================================================================================
// ResourcePoller
// Purpose: Periodically computes a fingerprint and reports changes and failures.
// Notes:
//   - The first fingerprint is taken when Start() runs; a failure there records an empty fingerprint,
//     and the next successful read is adopted without reporting a change.
//   - Reads and callbacks run on the scheduler's blocking pool without internal locks held; only the
//     interval timer lives on the scheduler's io_context.
//==========================================================================================================
class ResourcePoller : public std::enable_shared_from_this<ResourcePoller> {
public:
    // Returns the current fingerprint; throws on read failure.
    using FingerprintFunction = std::function<std::size_t()>;

    struct Callbacks {
        std::function<void()> onChanged;
        std::function<void(unsigned consecutiveFailures, const std::string& error)> onFailure;
        std::function<void(unsigned previousFailures)> onRecovered;
    };

    static std::shared_ptr<ResourcePoller> Create(BackgroundScheduler& scheduler, std::string uri,
                                                  PollSettings settings, FingerprintFunction fingerprint,
                                                  Callbacks callbacks);
    ~ResourcePoller();

    void Start();
    void Stop();

    const std::string& Uri() const { return uri; }
    std::chrono::milliseconds CurrentInterval() const;
    unsigned ConsecutiveFailures() const;

private:
    ResourcePoller(BackgroundScheduler& scheduler, std::string uri, PollSettings settings,
                   FingerprintFunction fingerprint, Callbacks callbacks);

    void scheduleLocked();
    void baseline();
    void tick();

    struct TimerHolder;

    BackgroundScheduler& scheduler;
    std::string uri;
    PollSettings settings;
    FingerprintFunction fingerprint;
    Callbacks callbacks;

    mutable std::mutex mutex;
    std::unique_ptr<TimerHolder> timer;
    std::optional<std::size_t> lastFingerprint;
    std::chrono::milliseconds interval;
    unsigned failures{0};
    bool stopped{false};
};

} // namespace subscriptions
} // namespace embedmcp
