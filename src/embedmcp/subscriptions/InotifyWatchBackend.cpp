//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InotifyWatchBackend.cpp
// Purpose: Linux inotify implementation of IWatchBackend
//==========================================================================================================

#include <cerrno>
#include <climits>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sys/inotify.h>
#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "embedmcp/Scheduler.hpp"
#include "embedmcp/subscriptions/InotifyWatchBackend.hpp"
#include "logging/Logger.h"

namespace embedmcp {
namespace subscriptions {
namespace net = boost::asio;
namespace fs = std::filesystem;

namespace {
constexpr std::uint32_t kWatchMask = IN_MODIFY | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO | IN_CREATE |
                                     IN_DELETE_SELF | IN_MOVE_SELF | IN_CLOSE_WRITE;
constexpr std::uint32_t kLostMask = IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED | IN_UNMOUNT;
constexpr std::size_t kReadBufferSize = 16 * (sizeof(struct inotify_event) + NAME_MAX + 1);
} // namespace

class InotifyWatchBackend::Impl : public std::enable_shared_from_this<Impl> {
public:
    struct FileWatch {
        std::uint64_t id;
        std::string name;
        WatchCallback callback;
    };
    struct DirWatch {
        std::string dir;
        std::vector<FileWatch> files;
    };

    //==========================================================================================================
    // Watcher
    // Purpose: Handle returned to callers; detaches its file watch on destruction.
    //==========================================================================================================
    class Watcher : public IResourceWatcher {
    public:
        Watcher(std::weak_ptr<Impl> owner, int wd, std::uint64_t id, std::string path)
            : owner(std::move(owner)), wd(wd), id(id), path(std::move(path)) {}
        ~Watcher() override {
            if (auto impl = owner.lock()) {
                impl->remove(wd, id);
            }
        }
        const std::string& Path() const override { return path; }

    private:
        std::weak_ptr<Impl> owner;
        int wd;
        std::uint64_t id;
        std::string path;
    };

    net::posix::stream_descriptor descriptor;
    mutable std::mutex mutex;
    std::unordered_map<int, DirWatch> byWd;
    std::unordered_map<std::string, int> wdByDir;
    std::uint64_t nextId{0};
    bool closed{false};

    Impl(BackgroundScheduler& scheduler, int fd) : descriptor(scheduler.Context(), fd) {}

    void start() {
        net::co_spawn(descriptor.get_executor(), readLoop(shared_from_this()), net::detached);
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return;
        }
        closed = true;
        byWd.clear();
        wdByDir.clear();
        boost::system::error_code ec;
        descriptor.cancel(ec);
        descriptor.close(ec);
    }

    std::unique_ptr<IResourceWatcher> watch(const std::string& path, WatchCallback callback) {
        fs::path p(path);
        std::string dir = p.parent_path().string();
        if (dir.empty()) {
            dir = "/";
        }
        std::string name = p.filename().string();

        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            throw std::system_error(ECANCELED, std::generic_category(), "inotify backend closed");
        }
        int wd = -1;
        auto it = wdByDir.find(dir);
        if (it != wdByDir.end()) {
            wd = it->second;
        } else {
            wd = ::inotify_add_watch(descriptor.native_handle(), dir.c_str(), kWatchMask);
            if (wd < 0) {
                throw std::system_error(errno, std::generic_category(), "inotify_add_watch " + dir);
            }
            wdByDir[dir] = wd;
            byWd[wd].dir = dir;
            LOG_DEBUG("inotify: watching directory {} (wd={})", dir, wd);
        }
        const std::uint64_t id = ++nextId;
        byWd[wd].files.push_back(FileWatch{id, name, std::move(callback)});
        return std::make_unique<Watcher>(weak_from_this(), wd, id, path);
    }

    void remove(int wd, std::uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = byWd.find(wd);
        if (it == byWd.end()) {
            return;
        }
        auto& files = it->second.files;
        std::erase_if(files, [id](const FileWatch& f) { return f.id == id; });
        if (files.empty()) {
            LOG_DEBUG("inotify: releasing directory {} (wd={})", it->second.dir, wd);
            if (!closed) {
                ::inotify_rm_watch(descriptor.native_handle(), wd);
            }
            wdByDir.erase(it->second.dir);
            byWd.erase(it);
        }
    }

    void dispatch(const char* buf, std::size_t len) {
        std::vector<std::pair<WatchCallback, WatchEvent>> pending;
        {
            std::lock_guard<std::mutex> lock(mutex);
            std::size_t offset = 0;
            while (offset + sizeof(struct inotify_event) <= len) {
                // Headers are copied out; the read buffer carries no alignment guarantee.
                struct inotify_event header;
                std::memcpy(&header, buf + offset, sizeof(header));
                const char* nameStart = buf + offset + sizeof(header);
                offset += sizeof(header) + header.len;
                if (offset > len) {
                    LOG_WARN("inotify: truncated event record");
                    break;
                }

                if (header.mask & IN_Q_OVERFLOW) {
                    // Events were dropped; report a change to everyone.
                    LOG_WARN("inotify: event queue overflow");
                    for (const auto& [wd, d] : byWd) {
                        for (const auto& f : d.files) pending.emplace_back(f.callback, WatchEvent::Changed);
                    }
                    continue;
                }
                auto it = byWd.find(header.wd);
                if (it == byWd.end()) {
                    continue;
                }
                if (header.mask & kLostMask) {
                    LOG_WARN("inotify: lost watch on {} (mask=0x{:x})", it->second.dir, header.mask);
                    for (const auto& f : it->second.files) pending.emplace_back(f.callback, WatchEvent::Lost);
                    if (!(header.mask & IN_IGNORED)) {
                        ::inotify_rm_watch(descriptor.native_handle(), header.wd);
                    }
                    wdByDir.erase(it->second.dir);
                    byWd.erase(it);
                    continue;
                }
                if (header.len == 0) {
                    continue;
                }
                const std::string name(nameStart, ::strnlen(nameStart, header.len));
                for (const auto& f : it->second.files) {
                    if (f.name == name) {
                        pending.emplace_back(f.callback, WatchEvent::Changed);
                    }
                }
            }
        }
        for (auto& [cb, event] : pending) {
            try {
                cb(event);
            } catch (const std::exception& e) {
                LOG_ERROR("inotify: watch callback threw: {}", e.what());
            }
        }
    }

    static net::awaitable<void> readLoop(std::shared_ptr<Impl> self) {
        std::vector<char> buf(kReadBufferSize);
        try {
            for (;;) {
                std::size_t n = co_await self->descriptor.async_read_some(net::buffer(buf), net::use_awaitable);
                self->dispatch(buf.data(), n);
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == net::error::operation_aborted || e.code() == net::error::bad_descriptor) {
                LOG_DEBUG("inotify: read loop ended: {}", e.what());
            } else {
                LOG_ERROR("inotify: read failed: {}", e.what());
            }
        }
        co_return;
    }
};

InotifyWatchBackend::InotifyWatchBackend(BackgroundScheduler& scheduler) {
    int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "inotify_init1");
    }
    pImpl = std::make_shared<Impl>(scheduler, fd);
    pImpl->start();
}

InotifyWatchBackend::~InotifyWatchBackend() {
    pImpl->close();
}

std::unique_ptr<IResourceWatcher> InotifyWatchBackend::Watch(const std::string& path, WatchCallback callback) {
    return pImpl->watch(path, std::move(callback));
}

std::size_t InotifyWatchBackend::DirectoryWatchCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->byWd.size();
}

std::uint32_t InotifyWatchBackend::EventMask() {
    return kWatchMask;
}

} // namespace subscriptions
} // namespace embedmcp
