//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Scheduler.hpp
// Purpose: Shared background io_context driving timers, pollers, debounce windows and watch callbacks
//==========================================================================================================

#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

namespace embedmcp {

//==========================================================================================================
// BackgroundScheduler
// Purpose: Owns an io_context and the threads running it. Components obtain the executor and schedule
//          steady_timer waits and descriptor reads on it. Calls that may block (provider reads) go to
//          the separate blocking pool so they never delay a timer.
// Notes:
//   - Threads start in the constructor and are joined by Stop() or the destructor.
//   - Stop() is idempotent; handlers still queued at that point are destroyed without running.
//==========================================================================================================
class BackgroundScheduler {
public:
    explicit BackgroundScheduler(std::size_t threads = 2, std::size_t blockingThreads = 2);
    ~BackgroundScheduler();

    BackgroundScheduler(const BackgroundScheduler&) = delete;
    BackgroundScheduler& operator=(const BackgroundScheduler&) = delete;

    boost::asio::io_context& Context() { return ioc; }
    boost::asio::io_context::executor_type GetExecutor() { return ioc.get_executor(); }
    boost::asio::thread_pool& BlockingPool() { return blocking; }

    void Stop();
    bool IsRunning() const { return running.load(); }

    // true when called from one of the scheduler threads.
    bool InSchedulerThread() const;

private:
    boost::asio::io_context ioc;
    boost::asio::thread_pool blocking;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work;
    std::vector<std::thread> threads;
    std::atomic<bool> running{false};
    std::mutex stopMutex;
};

} // namespace embedmcp
