//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InotifyWatchBackend.hpp
// Purpose: Linux inotify implementation of IWatchBackend
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "embedmcp/subscriptions/WatchBackend.h"

namespace embedmcp {

class BackgroundScheduler;

namespace subscriptions {

//==========================================================================================================
// InotifyWatchBackend
// Purpose: One inotify descriptor read asynchronously on the BackgroundScheduler.
// Notes:
//   - Each file watch registers the file's parent directory and filters events by file name, so
//     editors that replace files by rename are still observed.
//   - Files in the same directory share one kernel watch.
//   - Mask: MODIFY | DELETE | MOVED_FROM | MOVED_TO | CREATE | DELETE_SELF | MOVE_SELF | CLOSE_WRITE.
//   - Removal or move of the directory itself reports WatchEvent::Lost to its file watches.
// Throws:
//   std::system_error from the constructor when inotify_init1 fails.
//==========================================================================================================
class InotifyWatchBackend : public IWatchBackend {
public:
    explicit InotifyWatchBackend(BackgroundScheduler& scheduler);
    ~InotifyWatchBackend() override;

    InotifyWatchBackend(const InotifyWatchBackend&) = delete;
    InotifyWatchBackend& operator=(const InotifyWatchBackend&) = delete;

    std::unique_ptr<IResourceWatcher> Watch(const std::string& path, WatchCallback callback) override;

    // Number of kernel watches (distinct directories) currently held.
    std::size_t DirectoryWatchCount() const;

    static std::uint32_t EventMask();

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace subscriptions
} // namespace embedmcp
