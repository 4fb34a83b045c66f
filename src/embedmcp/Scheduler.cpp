//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Scheduler.cpp
// Purpose: Shared background io_context
//==========================================================================================================

#include <algorithm>
#include <exception>

#include "embedmcp/Scheduler.hpp"
#include "logging/Logger.h"

namespace embedmcp {

BackgroundScheduler::BackgroundScheduler(std::size_t count, std::size_t blockingThreads)
    : blocking(blockingThreads == 0 ? 1 : blockingThreads) {
    FUNC_SCOPE();
    if (count == 0) {
        count = 1;
    }
    work.emplace(boost::asio::make_work_guard(ioc));
    running.store(true);
    threads.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        threads.emplace_back([this]() {
            for (;;) {
                try {
                    ioc.run();
                    break;
                } catch (const std::exception& e) {
                    // A throwing handler must not take the scheduler down; keep serving.
                    LOG_ERROR("Scheduler handler exception: {}", e.what());
                }
            }
        });
    }
}

BackgroundScheduler::~BackgroundScheduler() {
    Stop();
}

void BackgroundScheduler::Stop() {
    std::lock_guard<std::mutex> lock(stopMutex);
    if (!running.exchange(false)) {
        return;
    }
    LOG_DEBUG("Scheduler stopping");
    // Reads still in flight finish; queued ones are dropped.
    blocking.stop();
    blocking.join();
    work.reset();
    ioc.stop();
    const auto self = std::this_thread::get_id();
    for (auto& t : threads) {
        if (!t.joinable()) {
            continue;
        }
        if (t.get_id() == self) {
            // Stop() issued from a handler: the thread unwinds on its own once run() returns.
            t.detach();
        } else {
            t.join();
        }
    }
    threads.clear();
}

bool BackgroundScheduler::InSchedulerThread() const {
    const auto self = std::this_thread::get_id();
    return std::any_of(threads.begin(), threads.end(), [&](const std::thread& t) { return t.get_id() == self; });
}

} // namespace embedmcp
