//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SubscriptionManager.cpp
// Purpose: Resource subscription lifecycle, change detection (watch or poll) and debounced change stream
//==========================================================================================================

#include <algorithm>
#include <cstdint>
#include <map>
#include <set>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <boost/asio/steady_timer.hpp>

#include "embedmcp/Scheduler.hpp"
#include "embedmcp/subscriptions/Debouncer.h"
#include "embedmcp/subscriptions/SubscriptionManager.h"
#include "logging/Logger.h"

namespace embedmcp {
namespace subscriptions {
namespace net = boost::asio;

const char* ToString(SubscribeResult result) {
    switch (result) {
        case SubscribeResult::Ok: return "ok";
        case SubscribeResult::AccessDenied: return "access-denied";
        case SubscribeResult::LimitExceeded: return "limit-exceeded";
    }
    return "unknown";
}

const char* ToString(SubscriptionState state) {
    switch (state) {
        case SubscriptionState::Unsubscribed: return "unsubscribed";
        case SubscriptionState::Subscribing: return "subscribing";
        case SubscriptionState::Active: return "active";
        case SubscriptionState::Degraded: return "degraded";
    }
    return "unknown";
}

const char* ToString(ChangeStrategy strategy) {
    switch (strategy) {
        case ChangeStrategy::FileWatch: return "watch";
        case ChangeStrategy::Poll: return "poll";
    }
    return "unknown";
}

PollSettings SubscriptionOptions::Poll() const {
    PollSettings settings;
    settings.base = pollBase;
    settings.ceiling = pollCeiling;
    settings.floor = pollFloor;
    return settings;
}

/////////////////////////////////////////// ResourceChangeStream ///////////////////////////////////////////

std::optional<ResourceChanged> ResourceChangeStream::Next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, timeout, [this]() { return closed || !queue.empty(); });
    if (queue.empty()) {
        return std::nullopt;
    }
    ResourceChanged event = std::move(queue.front());
    queue.pop_front();
    return event;
}

void ResourceChangeStream::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
        queue.clear();
    }
    cv.notify_all();
}

bool ResourceChangeStream::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
}

void ResourceChangeStream::Publish(const ResourceChanged& event) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return;
        }
        queue.push_back(event);
    }
    cv.notify_one();
}

/////////////////////////////////////////// SubscriptionManager ////////////////////////////////////////////

class SubscriptionManager::Impl : public std::enable_shared_from_this<Impl> {
public:
    struct Entry {
        std::string uri;
        std::set<std::string> sessions;
        ChangeStrategy strategy{ChangeStrategy::Poll};
        SubscriptionState state{SubscriptionState::Subscribing};
        std::optional<std::string> localPath;
        std::unique_ptr<IResourceWatcher> watcher;
        std::shared_ptr<ResourcePoller> poller;
        std::unique_ptr<net::steady_timer> reattachTimer;
        unsigned failures{0};
        std::chrono::milliseconds reattachInterval{0};
        // Identifies the current watcher/poller; callbacks carrying an older token are ignored.
        std::uint64_t token{0};
    };

    const IAccessPolicy& policy;
    IResourceProvider* provider;
    IWatchBackend& backend;
    BackgroundScheduler& scheduler;
    SubscriptionOptions options;
    std::unique_ptr<Debouncer> debouncer;

    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<Entry>> entries;
    std::map<std::string, std::set<std::string>> bySession;
    std::size_t watchSlots{0};
    std::uint64_t nextToken{0};
    bool suspended{false};
    bool shutdown{false};

    std::mutex listenerMutex;
    std::map<ListenerId, ChangeListener> changeListeners;
    std::map<ListenerId, DiagnosticListener> diagnosticListeners;
    std::vector<std::weak_ptr<ResourceChangeStream>> streams;
    ListenerId nextListenerId{0};

    Impl(const IAccessPolicy& p, IResourceProvider* prov, IWatchBackend& b, BackgroundScheduler& s,
         SubscriptionOptions o)
        : policy(p), provider(prov), backend(b), scheduler(s), options(o) {}

    void init() {
        debouncer = std::make_unique<Debouncer>(scheduler, options.debounce,
            [weak = weak_from_this()](const std::string& uri) {
                if (auto self = weak.lock()) {
                    self->emitChange(uri);
                }
            });
    }

    ///////////////////////////////////////// attach / detach ////////////////////////////////////////////

    // Attaches the OS watch. Returns false (and leaves the entry without a watcher) on failure.
    bool attachWatchLocked(Entry& entry, std::string& error) {
        entry.token = ++nextToken;
        try {
            entry.watcher = backend.Watch(*entry.localPath,
                [weak = weak_from_this(), uri = entry.uri, token = entry.token](WatchEvent event) {
                    if (auto self = weak.lock()) {
                        self->onWatchEvent(uri, token, event);
                    }
                });
            return true;
        } catch (const std::system_error& e) {
            error = e.what();
            LOG_WARN("Watch on {} failed: {}", *entry.localPath, error);
            return false;
        }
    }

    void startPollerLocked(Entry& entry) {
        entry.token = ++nextToken;
        const std::string uri = entry.uri;
        const std::uint64_t token = entry.token;
        std::weak_ptr<Impl> weak = weak_from_this();
        IResourceProvider* prov = provider;

        ResourcePoller::Callbacks callbacks;
        callbacks.onChanged = [weak, uri, token]() {
            if (auto self = weak.lock()) {
                self->onPolledChange(uri, token);
            }
        };
        callbacks.onFailure = [weak, uri, token](unsigned failures, const std::string& error) {
            if (auto self = weak.lock()) {
                self->onPollFailure(uri, token, failures, error);
            }
        };
        callbacks.onRecovered = [weak, uri, token](unsigned) {
            if (auto self = weak.lock()) {
                self->onPollRecovered(uri, token);
            }
        };
        entry.poller = ResourcePoller::Create(scheduler, uri, options.Poll(),
            [prov, uri]() -> std::size_t {
                if (prov == nullptr) {
                    throw std::runtime_error("no resource provider for " + uri);
                }
                return FingerprintJSON(ToJSON(prov->ReadResource(uri)));
            },
            std::move(callbacks));
        entry.poller->Start();
    }

    // Starts change detection for an entry whose strategy is already decided.
    std::optional<SubscriptionDiagnostic> activateLocked(Entry& entry) {
        entry.failures = 0;
        if (entry.strategy == ChangeStrategy::Poll) {
            startPollerLocked(entry);
            entry.state = SubscriptionState::Active;
            return std::nullopt;
        }
        std::string error;
        if (attachWatchLocked(entry, error)) {
            entry.state = SubscriptionState::Active;
            return std::nullopt;
        }
        entry.failures = 1;
        entry.state = SubscriptionState::Degraded;
        entry.reattachInterval = std::max(options.pollFloor, options.pollBase);
        scheduleReattachLocked(entry);
        return SubscriptionDiagnostic{entry.uri, entry.state, "warning", "File watch unavailable: " + error};
    }

    void deactivateLocked(Entry& entry) {
        ++entry.token;
        entry.watcher.reset();
        if (entry.poller) {
            entry.poller->Stop();
            entry.poller.reset();
        }
        if (entry.reattachTimer) {
            entry.reattachTimer->cancel();
            entry.reattachTimer.reset();
        }
    }

    void scheduleReattachLocked(Entry& entry) {
        entry.reattachTimer = std::make_unique<net::steady_timer>(scheduler.Context());
        entry.reattachTimer->expires_after(entry.reattachInterval);
        entry.reattachTimer->async_wait(
            [weak = weak_from_this(), uri = entry.uri, token = entry.token](const boost::system::error_code& ec) {
                if (ec == net::error::operation_aborted) {
                    return;
                }
                if (auto self = weak.lock()) {
                    self->reattach(uri, token);
                }
            });
    }

    void removeEntryLocked(std::map<std::string, std::shared_ptr<Entry>>::iterator it) {
        Entry& entry = *it->second;
        deactivateLocked(entry);
        if (entry.strategy == ChangeStrategy::FileWatch) {
            --watchSlots;
        }
        debouncer->Cancel(entry.uri);
        LOG_DEBUG("Released subscription for {}", entry.uri);
        entries.erase(it);
    }

    // Looks up the entry a callback belongs to; nullptr when it was torn down or re-armed since.
    Entry* currentLocked(const std::string& uri, std::uint64_t token) {
        auto it = entries.find(uri);
        if (it == entries.end() || it->second->token != token || shutdown || suspended) {
            return nullptr;
        }
        return it->second.get();
    }

    /////////////////////////////////////////// callbacks ////////////////////////////////////////////////

    void onWatchEvent(const std::string& uri, std::uint64_t token, WatchEvent event) {
        std::optional<SubscriptionDiagnostic> diagnostic;
        {
            std::lock_guard<std::mutex> lock(mutex);
            Entry* entry = currentLocked(uri, token);
            if (entry == nullptr) {
                return;
            }
            if (event == WatchEvent::Lost) {
                ++entry->token;
                entry->watcher.reset();
                entry->failures = 1;
                entry->state = SubscriptionState::Degraded;
                entry->reattachInterval = std::max(options.pollFloor, options.pollBase);
                scheduleReattachLocked(*entry);
                diagnostic = SubscriptionDiagnostic{uri, entry->state, "warning", "File watch lost"};
            }
            debouncer->Signal(uri);
        }
        if (diagnostic) {
            emitDiagnostic(*diagnostic);
        }
    }

    void reattach(const std::string& uri, std::uint64_t token) {
        std::optional<SubscriptionDiagnostic> diagnostic;
        {
            std::lock_guard<std::mutex> lock(mutex);
            Entry* entry = currentLocked(uri, token);
            if (entry == nullptr) {
                return;
            }
            entry->reattachTimer.reset();
            std::string error;
            if (attachWatchLocked(*entry, error)) {
                LOG_INFO("Watch on {} restored after {} failures", uri, entry->failures);
                entry->failures = 0;
                entry->state = SubscriptionState::Active;
                diagnostic = SubscriptionDiagnostic{uri, entry->state, "info", "File watch restored"};
                // The file may have changed while unobserved.
                debouncer->Signal(uri);
            } else {
                ++entry->failures;
                entry->reattachInterval = NextBackoffInterval(entry->reattachInterval, options.Poll());
                scheduleReattachLocked(*entry);
            }
        }
        if (diagnostic) {
            emitDiagnostic(*diagnostic);
        }
    }

    void onPolledChange(const std::string& uri, std::uint64_t token) {
        std::lock_guard<std::mutex> lock(mutex);
        if (currentLocked(uri, token) != nullptr) {
            debouncer->Signal(uri);
        }
    }

    void onPollFailure(const std::string& uri, std::uint64_t token, unsigned failures, const std::string& error) {
        std::optional<SubscriptionDiagnostic> diagnostic;
        {
            std::lock_guard<std::mutex> lock(mutex);
            Entry* entry = currentLocked(uri, token);
            if (entry == nullptr) {
                return;
            }
            entry->failures = failures;
            if (failures >= options.degradedThreshold && entry->state == SubscriptionState::Active) {
                entry->state = SubscriptionState::Degraded;
                LOG_WARN("Subscription {} degraded after {} failed polls: {}", uri, failures, error);
                diagnostic = SubscriptionDiagnostic{uri, entry->state, "warning",
                                                    "Polling failing repeatedly: " + error};
            }
        }
        if (diagnostic) {
            emitDiagnostic(*diagnostic);
        }
    }

    void onPollRecovered(const std::string& uri, std::uint64_t token) {
        std::optional<SubscriptionDiagnostic> diagnostic;
        {
            std::lock_guard<std::mutex> lock(mutex);
            Entry* entry = currentLocked(uri, token);
            if (entry == nullptr) {
                return;
            }
            entry->failures = 0;
            if (entry->state == SubscriptionState::Degraded) {
                entry->state = SubscriptionState::Active;
                LOG_INFO("Subscription {} recovered", uri);
                diagnostic = SubscriptionDiagnostic{uri, entry->state, "info", "Polling recovered"};
            }
        }
        if (diagnostic) {
            emitDiagnostic(*diagnostic);
        }
    }

    ////////////////////////////////////////////// emit //////////////////////////////////////////////////

    void emitChange(const std::string& uri) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (shutdown || entries.find(uri) == entries.end()) {
                return;
            }
        }
        ResourceChanged event{uri, std::chrono::system_clock::now()};
        std::vector<ChangeListener> listeners;
        std::vector<std::shared_ptr<ResourceChangeStream>> live;
        {
            std::lock_guard<std::mutex> lock(listenerMutex);
            for (const auto& [id, listener] : changeListeners) {
                listeners.push_back(listener);
            }
            std::erase_if(streams, [&live](const std::weak_ptr<ResourceChangeStream>& weak) {
                auto stream = weak.lock();
                if (!stream || stream->IsClosed()) {
                    return true;
                }
                live.push_back(std::move(stream));
                return false;
            });
        }
        LOG_DEBUG("Resource changed: {}", uri);
        for (auto& stream : live) {
            stream->Publish(event);
        }
        for (auto& listener : listeners) {
            try {
                listener(event);
            } catch (const std::exception& e) {
                LOG_ERROR("Change listener for {} threw: {}", uri, e.what());
            }
        }
    }

    void emitDiagnostic(const SubscriptionDiagnostic& diagnostic) {
        std::vector<DiagnosticListener> listeners;
        {
            std::lock_guard<std::mutex> lock(listenerMutex);
            for (const auto& [id, listener] : diagnosticListeners) {
                listeners.push_back(listener);
            }
        }
        for (auto& listener : listeners) {
            try {
                listener(diagnostic);
            } catch (const std::exception& e) {
                LOG_ERROR("Diagnostic listener for {} threw: {}", diagnostic.uri, e.what());
            }
        }
    }

    ////////////////////////////////////////// operations ////////////////////////////////////////////////

    SubscribeResult subscribe(const std::string& sessionId, const std::string& uri) {
        if (!policy.IsAccessible(uri)) {
            LOG_WARN("Subscribe to {} denied for session {}", uri, sessionId);
            return SubscribeResult::AccessDenied;
        }
        std::optional<std::string> localPath = policy.ResolveLocalPath(uri);

        std::optional<SubscriptionDiagnostic> diagnostic;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (shutdown) {
                throw std::logic_error("SubscriptionManager is shut down");
            }
            auto it = entries.find(uri);
            if (it != entries.end()) {
                it->second->sessions.insert(sessionId);
                bySession[sessionId].insert(uri);
                return SubscribeResult::Ok;
            }
            if (localPath.has_value() && watchSlots >= options.maxWatchers) {
                LOG_WARN("Watch limit {} reached; rejecting {}", options.maxWatchers, uri);
                return SubscribeResult::LimitExceeded;
            }

            auto entry = std::make_shared<Entry>();
            entry->uri = uri;
            entry->localPath = localPath;
            entry->strategy = localPath.has_value() ? ChangeStrategy::FileWatch : ChangeStrategy::Poll;
            if (entry->strategy == ChangeStrategy::FileWatch) {
                ++watchSlots;
            }
            if (!suspended) {
                diagnostic = activateLocked(*entry);
            }
            entry->sessions.insert(sessionId);
            entries.emplace(uri, entry);
            bySession[sessionId].insert(uri);
            LOG_INFO("Subscribed {} via {} (session {})", uri, ToString(entry->strategy), sessionId);
        }
        if (diagnostic) {
            emitDiagnostic(*diagnostic);
        }
        return SubscribeResult::Ok;
    }

    bool unsubscribeLocked(const std::string& sessionId, const std::string& uri) {
        auto it = entries.find(uri);
        if (it == entries.end()) {
            return false;
        }
        if (it->second->sessions.erase(sessionId) == 0) {
            return false;
        }
        if (it->second->sessions.empty()) {
            removeEntryLocked(it);
        }
        return true;
    }

    bool unsubscribe(const std::string& sessionId, const std::string& uri) {
        std::lock_guard<std::mutex> lock(mutex);
        auto s = bySession.find(sessionId);
        if (s != bySession.end()) {
            s->second.erase(uri);
            if (s->second.empty()) {
                bySession.erase(s);
            }
        }
        return unsubscribeLocked(sessionId, uri);
    }

    std::size_t releaseSession(const std::string& sessionId) {
        std::lock_guard<std::mutex> lock(mutex);
        auto s = bySession.find(sessionId);
        if (s == bySession.end()) {
            return 0;
        }
        std::set<std::string> uris = std::move(s->second);
        bySession.erase(s);
        std::size_t released = 0;
        for (const auto& uri : uris) {
            if (unsubscribeLocked(sessionId, uri)) {
                ++released;
            }
        }
        if (released > 0) {
            LOG_DEBUG("Session {} released {} subscriptions", sessionId, released);
        }
        return released;
    }

    void suspend() {
        std::lock_guard<std::mutex> lock(mutex);
        if (suspended || shutdown) {
            return;
        }
        suspended = true;
        for (auto& [uri, entry] : entries) {
            deactivateLocked(*entry);
        }
        debouncer->CancelAll();
        LOG_INFO("Subscriptions suspended ({} uris)", entries.size());
    }

    void resume() {
        std::vector<SubscriptionDiagnostic> diagnostics;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!suspended || shutdown) {
                return;
            }
            suspended = false;
            // Roots may have changed while suspended; URIs no longer accessible are dropped for every
            // session before anything is re-armed.
            std::vector<std::string> denied;
            for (const auto& [uri, entry] : entries) {
                if (!policy.IsAccessible(uri)) {
                    denied.push_back(uri);
                }
            }
            for (const auto& uri : denied) {
                auto it = entries.find(uri);
                for (const auto& sessionId : it->second->sessions) {
                    auto s = bySession.find(sessionId);
                    if (s != bySession.end()) {
                        s->second.erase(uri);
                        if (s->second.empty()) {
                            bySession.erase(s);
                        }
                    }
                }
                LOG_WARN("Dropping subscription to {}: no longer accessible", uri);
                removeEntryLocked(it);
            }
            for (auto& [uri, entry] : entries) {
                std::optional<std::string> localPath = policy.ResolveLocalPath(uri);
                if (entry->strategy == ChangeStrategy::FileWatch && !localPath.has_value()) {
                    entry->strategy = ChangeStrategy::Poll;
                    --watchSlots;
                } else if (entry->strategy == ChangeStrategy::Poll && localPath.has_value() &&
                           watchSlots < options.maxWatchers) {
                    entry->strategy = ChangeStrategy::FileWatch;
                    ++watchSlots;
                }
                entry->localPath = entry->strategy == ChangeStrategy::FileWatch ? localPath : std::nullopt;
                if (auto d = activateLocked(*entry)) {
                    diagnostics.push_back(std::move(*d));
                }
            }
            LOG_INFO("Subscriptions resumed ({} uris)", entries.size());
        }
        for (const auto& d : diagnostics) {
            emitDiagnostic(d);
        }
    }

    void shutdownAll() {
        std::vector<std::shared_ptr<ResourceChangeStream>> live;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (shutdown) {
                return;
            }
            shutdown = true;
            for (auto& [uri, entry] : entries) {
                deactivateLocked(*entry);
            }
            entries.clear();
            bySession.clear();
            watchSlots = 0;
            debouncer->CancelAll();
        }
        {
            std::lock_guard<std::mutex> lock(listenerMutex);
            for (auto& weak : streams) {
                if (auto stream = weak.lock()) {
                    live.push_back(std::move(stream));
                }
            }
            streams.clear();
            changeListeners.clear();
            diagnosticListeners.clear();
        }
        for (auto& stream : live) {
            stream->Close();
        }
    }
};

SubscriptionManager::SubscriptionManager(const IAccessPolicy& policy, IResourceProvider* provider,
                                         IWatchBackend& backend, BackgroundScheduler& scheduler,
                                         SubscriptionOptions options)
    : pImpl(std::make_shared<Impl>(policy, provider, backend, scheduler, options)) {
    pImpl->init();
}

SubscriptionManager::~SubscriptionManager() {
    pImpl->shutdownAll();
}

SubscribeResult SubscriptionManager::Subscribe(const std::string& sessionId, const std::string& uri) {
    return pImpl->subscribe(sessionId, uri);
}

bool SubscriptionManager::Unsubscribe(const std::string& sessionId, const std::string& uri) {
    return pImpl->unsubscribe(sessionId, uri);
}

std::size_t SubscriptionManager::ReleaseSession(const std::string& sessionId) {
    return pImpl->releaseSession(sessionId);
}

void SubscriptionManager::Suspend() {
    pImpl->suspend();
}

void SubscriptionManager::Resume() {
    pImpl->resume();
}

bool SubscriptionManager::IsSuspended() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->suspended;
}

void SubscriptionManager::Shutdown() {
    pImpl->shutdownAll();
}

SubscriptionManager::ListenerId SubscriptionManager::AddChangeListener(ChangeListener listener) {
    std::lock_guard<std::mutex> lock(pImpl->listenerMutex);
    const ListenerId id = ++pImpl->nextListenerId;
    pImpl->changeListeners.emplace(id, std::move(listener));
    return id;
}

void SubscriptionManager::RemoveChangeListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(pImpl->listenerMutex);
    pImpl->changeListeners.erase(id);
}

SubscriptionManager::ListenerId SubscriptionManager::AddDiagnosticListener(DiagnosticListener listener) {
    std::lock_guard<std::mutex> lock(pImpl->listenerMutex);
    const ListenerId id = ++pImpl->nextListenerId;
    pImpl->diagnosticListeners.emplace(id, std::move(listener));
    return id;
}

void SubscriptionManager::RemoveDiagnosticListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(pImpl->listenerMutex);
    pImpl->diagnosticListeners.erase(id);
}

std::shared_ptr<ResourceChangeStream> SubscriptionManager::OpenStream() {
    auto stream = std::make_shared<ResourceChangeStream>();
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->shutdown) {
            stream->Close();
            return stream;
        }
    }
    std::lock_guard<std::mutex> lock(pImpl->listenerMutex);
    pImpl->streams.push_back(stream);
    return stream;
}

std::vector<std::string> SubscriptionManager::SessionsFor(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->entries.find(uri);
    if (it == pImpl->entries.end()) {
        return {};
    }
    return std::vector<std::string>(it->second->sessions.begin(), it->second->sessions.end());
}

std::vector<std::string> SubscriptionManager::SubscriptionsOf(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->bySession.find(sessionId);
    if (it == pImpl->bySession.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::optional<SubscriptionInfo> SubscriptionManager::Info(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->entries.find(uri);
    if (it == pImpl->entries.end()) {
        return std::nullopt;
    }
    const Impl::Entry& entry = *it->second;
    SubscriptionInfo info;
    info.uri = entry.uri;
    info.strategy = entry.strategy;
    info.state = entry.state;
    info.sessionCount = entry.sessions.size();
    info.consecutiveFailures = entry.failures;
    info.localPath = entry.localPath;
    if (entry.poller) {
        info.interval = entry.poller->CurrentInterval();
    } else if (entry.state == SubscriptionState::Degraded) {
        info.interval = entry.reattachInterval;
    }
    return info;
}

std::size_t SubscriptionManager::ActiveWatchCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->watchSlots;
}

std::size_t SubscriptionManager::ActivePollCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->entries.size() - pImpl->watchSlots;
}

const SubscriptionOptions& SubscriptionManager::Options() const {
    return pImpl->options;
}

} // namespace subscriptions
} // namespace embedmcp
