//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Debouncer.cpp
// Purpose: Per-key fixed-window coalescing of raw change signals
//==========================================================================================================

#include <mutex>
#include <unordered_map>

#include <boost/asio/steady_timer.hpp>

#include "embedmcp/Scheduler.hpp"
#include "embedmcp/subscriptions/Debouncer.h"
#include "logging/Logger.h"

namespace embedmcp {
namespace subscriptions {
namespace net = boost::asio;

class Debouncer::Impl : public std::enable_shared_from_this<Impl> {
public:
    BackgroundScheduler& scheduler;
    std::chrono::milliseconds window;
    Callback callback;

    mutable std::mutex mutex;
    // Open windows; the timer pointer doubles as the window's identity.
    std::unordered_map<std::string, std::shared_ptr<net::steady_timer>> open;
    bool stopped{false};

    Impl(BackgroundScheduler& s, std::chrono::milliseconds w, Callback cb)
        : scheduler(s), window(w), callback(std::move(cb)) {}

    void signal(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopped || open.find(key) != open.end()) {
            return;
        }
        auto timer = std::make_shared<net::steady_timer>(scheduler.Context());
        timer->expires_after(window);
        timer->async_wait([weak = weak_from_this(), key, timer](const boost::system::error_code& ec) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            if (auto self = weak.lock()) {
                self->fire(key, timer.get());
            }
        });
        open.emplace(key, std::move(timer));
    }

    void fire(const std::string& key, const net::steady_timer* timer) {
        Callback cb;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = open.find(key);
            if (stopped || it == open.end() || it->second.get() != timer) {
                return;
            }
            open.erase(it);
            cb = callback;
        }
        LOG_DEBUG("Debounce window closed for {}", key);
        if (cb) {
            cb(key);
        }
    }

    void cancel(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = open.find(key);
        if (it != open.end()) {
            it->second->cancel();
            open.erase(it);
        }
    }

    void cancelAll() {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto& [key, timer] : open) {
            timer->cancel();
        }
        open.clear();
    }
};

Debouncer::Debouncer(BackgroundScheduler& scheduler, std::chrono::milliseconds window, Callback callback)
    : pImpl(std::make_shared<Impl>(scheduler, window, std::move(callback))) {}

Debouncer::~Debouncer() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->stopped = true;
    }
    pImpl->cancelAll();
}

void Debouncer::Signal(const std::string& key) {
    pImpl->signal(key);
}

void Debouncer::Cancel(const std::string& key) {
    pImpl->cancel(key);
}

void Debouncer::CancelAll() {
    pImpl->cancelAll();
}

std::size_t Debouncer::OpenWindows() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->open.size();
}

std::chrono::milliseconds Debouncer::Window() const {
    return pImpl->window;
}

} // namespace subscriptions
} // namespace embedmcp
