//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Debouncer.h
// Purpose: Per-key fixed-window coalescing of raw change signals
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace embedmcp {

class BackgroundScheduler;

namespace subscriptions {

//==========================================================================================================
// Debouncer
// Purpose: The first Signal(key) opens a window of fixed length; further signals for that key inside
//          the window are absorbed. When the window closes the callback fires once for the key.
// Notes:
//   - The window is not extended by later signals, so a continuous stream of changes still yields one
//     event per window.
//   - Callbacks run on the BackgroundScheduler.
//==========================================================================================================
class Debouncer {
public:
    using Callback = std::function<void(const std::string& key)>;

    Debouncer(BackgroundScheduler& scheduler, std::chrono::milliseconds window, Callback callback);
    ~Debouncer();

    Debouncer(const Debouncer&) = delete;
    Debouncer& operator=(const Debouncer&) = delete;

    void Signal(const std::string& key);

    // Drops an open window without firing.
    void Cancel(const std::string& key);
    void CancelAll();

    std::size_t OpenWindows() const;
    std::chrono::milliseconds Window() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace subscriptions
} // namespace embedmcp
