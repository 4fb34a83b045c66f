//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SubscriptionManager.h
// Purpose: Resource subscription lifecycle, change detection (watch or poll) and debounced change stream
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "embedmcp/Providers.h"
#include "embedmcp/subscriptions/ResourcePoller.h"
#include "embedmcp/subscriptions/WatchBackend.h"

namespace embedmcp {

class BackgroundScheduler;

namespace subscriptions {

enum class SubscribeResult { Ok, AccessDenied, LimitExceeded };
enum class SubscriptionState { Unsubscribed, Subscribing, Active, Degraded };
enum class ChangeStrategy { FileWatch, Poll };

const char* ToString(SubscribeResult result);
const char* ToString(SubscriptionState state);
const char* ToString(ChangeStrategy strategy);

struct SubscriptionOptions {
    std::chrono::milliseconds debounce{500};
    std::chrono::milliseconds pollBase{15000};
    std::chrono::milliseconds pollCeiling{60000};
    std::chrono::milliseconds pollFloor{5000};
    std::size_t maxWatchers{50};
    unsigned degradedThreshold{3};

    PollSettings Poll() const;
};

struct ResourceChanged {
    std::string uri;
    std::chrono::system_clock::time_point timestamp;
};

// Emitted when a subscription enters or leaves Degraded. level is "warning" or "info".
struct SubscriptionDiagnostic {
    std::string uri;
    SubscriptionState state;
    std::string level;
    std::string message;
};

struct SubscriptionInfo {
    std::string uri;
    ChangeStrategy strategy;
    SubscriptionState state;
    std::size_t sessionCount{0};
    unsigned consecutiveFailures{0};
    std::chrono::milliseconds interval{0};
    std::optional<std::string> localPath;
};

//==========================================================================================================
// ISubscriptionService
// Purpose: The slice of the manager that request dispatch needs for resources/subscribe and
//          resources/unsubscribe.
//==========================================================================================================
class ISubscriptionService {
public:
    virtual ~ISubscriptionService() = default;
    virtual SubscribeResult Subscribe(const std::string& sessionId, const std::string& uri) = 0;
    // Returns true when the session was subscribed to uri.
    virtual bool Unsubscribe(const std::string& sessionId, const std::string& uri) = 0;
};

//==========================================================================================================
// ResourceChangeStream
// Purpose: Pull-side view of the change stream. Each stream sees events published after it was opened.
//==========================================================================================================
class ResourceChangeStream {
public:
    // Waits up to timeout for the next event; nullopt on timeout or after Close().
    std::optional<ResourceChanged> Next(std::chrono::milliseconds timeout);

    void Close();
    bool IsClosed() const;

    // Queues an event for this reader. Ignored once closed.
    void Publish(const ResourceChanged& event);

private:
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<ResourceChanged> queue;
    bool closed{false};
};

//==========================================================================================================
// SubscriptionManager
// Purpose: Owns one watcher or poller per subscribed URI, shared by every session subscribed to it.
// Notes:
//   - Subscribe validates against the access policy before allocating anything.
//   - File URIs resolved by the policy get an OS watch, counted against maxWatchers; everything else is
//     polled through the resource provider.
//   - Raw change signals are debounced per URI before reaching listeners.
//   - Listener callbacks run on BackgroundScheduler threads (the io_context or, for poll diagnostics,
//     the blocking pool) with no manager lock held.
//==========================================================================================================
class SubscriptionManager : public ISubscriptionService {
public:
    using ChangeListener = std::function<void(const ResourceChanged&)>;
    using DiagnosticListener = std::function<void(const SubscriptionDiagnostic&)>;
    using ListenerId = std::size_t;

    // provider may be null; polled URIs then fail (and degrade) until the manager is torn down.
    SubscriptionManager(const IAccessPolicy& policy, IResourceProvider* provider, IWatchBackend& backend,
                        BackgroundScheduler& scheduler, SubscriptionOptions options = SubscriptionOptions());
    ~SubscriptionManager() override;

    SubscriptionManager(const SubscriptionManager&) = delete;
    SubscriptionManager& operator=(const SubscriptionManager&) = delete;

    // Throws std::logic_error after Shutdown().
    SubscribeResult Subscribe(const std::string& sessionId, const std::string& uri) override;
    bool Unsubscribe(const std::string& sessionId, const std::string& uri) override;

    // Drops the session from every subscription; returns how many it held.
    std::size_t ReleaseSession(const std::string& sessionId);

    // Stops all watchers and pollers but keeps subscriptions. Resume() drops URIs the policy no longer
    // allows, then re-classifies and reattaches the rest.
    void Suspend();
    void Resume();
    bool IsSuspended() const;

    void Shutdown();

    ListenerId AddChangeListener(ChangeListener listener);
    void RemoveChangeListener(ListenerId id);
    ListenerId AddDiagnosticListener(DiagnosticListener listener);
    void RemoveDiagnosticListener(ListenerId id);

    std::shared_ptr<ResourceChangeStream> OpenStream();

    std::vector<std::string> SessionsFor(const std::string& uri) const;
    std::vector<std::string> SubscriptionsOf(const std::string& sessionId) const;
    std::optional<SubscriptionInfo> Info(const std::string& uri) const;
    std::size_t ActiveWatchCount() const;
    std::size_t ActivePollCount() const;
    const SubscriptionOptions& Options() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace subscriptions
} // namespace embedmcp
