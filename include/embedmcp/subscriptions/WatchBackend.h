//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WatchBackend.h
// Purpose: Abstraction over OS file change notification
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>

namespace embedmcp {
namespace subscriptions {

enum class WatchEvent {
    Changed,  // the watched file was modified, created, replaced or removed
    Lost      // the OS watch itself went away (directory removed or unmounted); needs reattach
};

using WatchCallback = std::function<void(WatchEvent)>;

//==========================================================================================================
// IResourceWatcher
// Purpose: Handle for one active file watch. Destroying the handle detaches the watch. A callback that
//          was already dispatched may still complete afterwards.
//==========================================================================================================
class IResourceWatcher {
public:
    virtual ~IResourceWatcher() = default;
    virtual const std::string& Path() const = 0;
};

//==========================================================================================================
// IWatchBackend
// Purpose: Creates file watches.
//==========================================================================================================
class IWatchBackend {
public:
    virtual ~IWatchBackend() = default;

    //==========================================================================================================
    // Watch
    // Purpose: Observes a single file path. The callback may run on any thread.
    // Throws:
    //   std::system_error when the OS refuses the watch (missing parent directory, inotify limits).
    //==========================================================================================================
    virtual std::unique_ptr<IResourceWatcher> Watch(const std::string& path, WatchCallback callback) = 0;
};

} // namespace subscriptions
} // namespace embedmcp
