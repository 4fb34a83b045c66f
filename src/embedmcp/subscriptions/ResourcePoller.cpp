//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourcePoller.cpp
// Purpose: Adaptive fingerprint polling for resources without an OS change source
//==========================================================================================================

#include <algorithm>
#include <functional>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include "embedmcp/Scheduler.hpp"
#include "embedmcp/subscriptions/ResourcePoller.h"
#include "logging/Logger.h"

namespace embedmcp {
namespace subscriptions {
namespace net = boost::asio;

namespace {
void hashCombine(std::size_t& seed, std::size_t v) {
    seed ^= v + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

void hashValue(std::size_t& seed, const JSONValue& value) {
    hashCombine(seed, value.value.index());
    std::visit([&seed](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            hashCombine(seed, 0);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            hashCombine(seed, v.size());
            for (const auto& item : v) {
                if (item) hashValue(seed, *item); else hashCombine(seed, 0);
            }
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            std::vector<std::string_view> keys;
            keys.reserve(v.size());
            for (const auto& [k, child] : v) keys.push_back(k);
            std::sort(keys.begin(), keys.end());
            hashCombine(seed, keys.size());
            for (auto k : keys) {
                hashCombine(seed, std::hash<std::string_view>{}(k));
                const auto& child = v.at(std::string(k));
                if (child) hashValue(seed, *child); else hashCombine(seed, 0);
            }
        } else {
            hashCombine(seed, std::hash<T>{}(v));
        }
    }, value.value);
}
} // namespace

std::chrono::milliseconds NextBackoffInterval(std::chrono::milliseconds current, const PollSettings& settings) {
    auto grown = std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(static_cast<double>(current.count()) * settings.backoffFactor));
    return std::max(settings.floor, std::min(settings.ceiling, grown));
}

std::size_t FingerprintJSON(const JSONValue& value) {
    std::size_t seed = 0;
    hashValue(seed, value);
    return seed;
}

struct ResourcePoller::TimerHolder {
    explicit TimerHolder(net::io_context& ioc) : timer(ioc) {}
    net::steady_timer timer;
};

std::shared_ptr<ResourcePoller> ResourcePoller::Create(BackgroundScheduler& scheduler, std::string uri,
                                                       PollSettings settings, FingerprintFunction fingerprint,
                                                       Callbacks callbacks) {
    return std::shared_ptr<ResourcePoller>(new ResourcePoller(scheduler, std::move(uri), settings,
                                                              std::move(fingerprint), std::move(callbacks)));
}

ResourcePoller::ResourcePoller(BackgroundScheduler& scheduler, std::string uri, PollSettings settings,
                               FingerprintFunction fingerprint, Callbacks callbacks)
    : scheduler(scheduler), uri(std::move(uri)), settings(settings), fingerprint(std::move(fingerprint)),
      callbacks(std::move(callbacks)), timer(std::make_unique<TimerHolder>(scheduler.Context())),
      interval(std::max(settings.floor, settings.base)) {}

ResourcePoller::~ResourcePoller() = default;

void ResourcePoller::Start() {
    LOG_DEBUG("Polling {} every {}ms", uri, interval.count());
    net::post(scheduler.BlockingPool(), [weak = weak_from_this()]() {
        if (auto self = weak.lock()) {
            self->baseline();
        }
    });
}

void ResourcePoller::Stop() {
    std::lock_guard<std::mutex> lock(mutex);
    if (stopped) {
        return;
    }
    stopped = true;
    timer->timer.cancel();
}

std::chrono::milliseconds ResourcePoller::CurrentInterval() const {
    std::lock_guard<std::mutex> lock(mutex);
    return interval;
}

unsigned ResourcePoller::ConsecutiveFailures() const {
    std::lock_guard<std::mutex> lock(mutex);
    return failures;
}

void ResourcePoller::scheduleLocked() {
    if (stopped) {
        return;
    }
    timer->timer.expires_after(interval);
    timer->timer.async_wait([weak = weak_from_this()](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        auto self = weak.lock();
        if (!self) {
            return;
        }
        // The fingerprint read may block; keep it off the timer threads.
        net::post(self->scheduler.BlockingPool(), [weak]() {
            if (auto poller = weak.lock()) {
                poller->tick();
            }
        });
    });
}

void ResourcePoller::baseline() {
    std::optional<std::size_t> fp;
    try {
        fp = fingerprint();
    } catch (const std::exception& e) {
        LOG_DEBUG("Initial read of {} failed: {}", uri, e.what());
    }
    std::lock_guard<std::mutex> lock(mutex);
    // nullopt is the empty fingerprint: the first successful read becomes the baseline.
    lastFingerprint = fp;
    scheduleLocked();
}

void ResourcePoller::tick() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopped) {
            return;
        }
    }
    std::optional<std::size_t> fp;
    std::string error;
    try {
        fp = fingerprint();
    } catch (const std::exception& e) {
        error = e.what();
    }

    bool changed = false;
    unsigned failureCount = 0;
    unsigned recoveredFrom = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopped) {
            return;
        }
        if (fp.has_value()) {
            recoveredFrom = failures;
            failures = 0;
            interval = std::max(settings.floor, settings.base);
            changed = lastFingerprint.has_value() && lastFingerprint != fp;
            lastFingerprint = fp;
        } else {
            failureCount = ++failures;
            interval = NextBackoffInterval(interval, settings);
        }
        scheduleLocked();
    }

    if (!fp.has_value()) {
        LOG_DEBUG("Poll of {} failed ({} consecutive): {}", uri, failureCount, error);
        if (callbacks.onFailure) callbacks.onFailure(failureCount, error);
        return;
    }
    if (recoveredFrom > 0 && callbacks.onRecovered) {
        callbacks.onRecovered(recoveredFrom);
    }
    if (changed && callbacks.onChanged) {
        callbacks.onChanged();
    }
}

} // namespace subscriptions
} // namespace embedmcp
