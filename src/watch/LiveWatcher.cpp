#include "watch/LiveWatcher.hpp"
#include "catalog/CatalogStore.hpp"
#include "database/errors.hpp"
#include "jobs/JobTracker.hpp"
#include "types/FileRecord.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>
#include <vector>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace vc::types;

namespace vc::watch {

namespace {
    constexpr uint32_t kDirMask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_FROM |
                                  IN_MOVED_TO | IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;

    std::system_error sysError(const std::string& what) {
        return std::system_error(errno, std::generic_category(), what);
    }
}

std::optional<Event::Type> classify(const uint32_t mask) {
    if (mask & IN_ISDIR) return std::nullopt;
    if (mask & (IN_CREATE | IN_MOVED_TO)) return Event::Type::CREATED;
    if (mask & (IN_DELETE | IN_MOVED_FROM)) return Event::Type::DELETED;
    if (mask & (IN_MODIFY | IN_CLOSE_WRITE)) return Event::Type::MODIFIED;
    return std::nullopt;
}

LiveWatcher::Session::~Session() {
    if (fd >= 0) ::close(fd);
}

LiveWatcher::LiveWatcher(catalog::CatalogStore& store, jobs::JobTracker& tracker, config::WatcherConfig cfg,
                         std::shared_ptr<spdlog::logger> log)
    : store_(store), tracker_(tracker), cfg_(cfg), log_(std::move(log)) {}

void LiveWatcher::record(Session& s, const Event::Type type, const fs::path& path) {
    std::optional<FileRecord> row;
    if (type != Event::Type::DELETED) {
        FileRecord r;
        if (r.statFrom(path)) row = std::move(r);
    }

    try {
        store_.recordChange(Event(type, path.string(), s.root.string(), s.volumeId), row);
        ++s.progress.events_recorded;
        ++s.progress.files_processed;
        s.progress.last_path = path.string();
    } catch (const database::StoreBusy& e) {
        ++s.progress.errors;
        log_->error("[LiveWatcher] write_dropped volume={} path={} error={}", s.volumeId, path.string(), e.what());
    }
}

void LiveWatcher::addWatches(Session& s, const fs::path& dir, const bool emitCreated) {
    const auto add = [&](const fs::path& d) {
        const int wd = ::inotify_add_watch(s.fd, d.c_str(), kDirMask);
        if (wd < 0) {
            // ENOSPC is max_user_watches; the rest of the tree stays covered
            log_->warn("[LiveWatcher] add_watch_failed path={} error={}", d.string(), std::strerror(errno));
            return false;
        }
        s.watches[wd] = d;
        return true;
    };

    if (!add(dir) || !cfg_.recursive) return;

    const auto& filter = store_.fileFilter();
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code tec;
        if (entry.is_symlink(tec)) continue;
        if (entry.is_directory(tec)) {
            if (filter.ignored(entry.path())) it.disable_recursion_pending();
            else add(entry.path());
        } else if (emitCreated && entry.is_regular_file(tec)) {
            // files that landed before the watch on a new subdirectory existed
            record(s, Event::Type::CREATED, entry.path());
        }
    }
}

void LiveWatcher::dropWatchesUnder(Session& s, const fs::path& dir) {
    const auto prefix = dir.string() + "/";
    for (auto it = s.watches.begin(); it != s.watches.end();) {
        const auto p = it->second.string();
        if (p == dir.string() || p.compare(0, prefix.size(), prefix) == 0) {
            ::inotify_rm_watch(s.fd, it->first);
            it = s.watches.erase(it);
        } else ++it;
    }
}

void LiveWatcher::dispatch(Session& s, const int wd, const uint32_t mask, const std::string& name) {
    if (mask & IN_Q_OVERFLOW) {
        log_->warn("[LiveWatcher] queue_overflow volume={} root={}, some events were lost", s.volumeId, s.root.string());
        return;
    }

    if (mask & IN_UNMOUNT) {
        s.terminal = "volume unmounted";
        return;
    }

    if (mask & IN_IGNORED) {
        s.watches.erase(wd);
        if (wd == s.rootWd) s.terminal = "watched directory removed";
        return;
    }

    if (wd == s.rootWd && (mask & (IN_DELETE_SELF | IN_MOVE_SELF))) {
        s.terminal = "watched directory removed";
        return;
    }

    const auto dirIt = s.watches.find(wd);
    if (dirIt == s.watches.end() || name.empty()) return;
    const auto path = dirIt->second / name;

    if (mask & IN_ISDIR) {
        if (!cfg_.recursive) return;
        if (mask & (IN_CREATE | IN_MOVED_TO)) {
            if (!store_.fileFilter().ignored(path)) addWatches(s, path, true);
        } else if (mask & IN_MOVED_FROM) {
            dropWatchesUnder(s, path);
        }
        return;
    }

    if (const auto type = classify(mask)) record(s, *type, path);
}

WatchResult LiveWatcher::watch(const std::string& volumeId, const fs::path& directory, const std::string& jobId,
                               const std::atomic<bool>& cancel) {
    WatchResult result;
    Session s;
    s.volumeId = volumeId;
    s.root = directory;

    const auto settle = [&](const Job::Status status, const std::string& reason) {
        result.status = status;
        result.reason = reason;
        result.events_recorded = s.progress.events_recorded;
        result.errors = s.progress.errors;
        if (status == Job::Status::FAILED) tracker_.fail(jobId, reason, s.progress);
        else tracker_.stop(jobId, reason, s.progress);
        log_->info("[LiveWatcher] watch_{} volume={} job={} reason={} events={}",
                   Job::toString(status), volumeId, jobId, reason, s.progress.events_recorded);
        return result;
    };

    if (tracker_.markRunning(jobId) != jobs::Transition::Applied) {
        const auto job = tracker_.get(jobId);
        result.status = job ? job->status : Job::Status::STOPPED;
        result.reason = "job no longer pending";
        return result;
    }

    try {
        std::error_code ec;
        if (!fs::is_directory(directory, ec)) return settle(Job::Status::STOPPED, "volume unavailable");

        s.fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (s.fd < 0) throw sysError("inotify_init1");

        s.rootWd = ::inotify_add_watch(s.fd, directory.c_str(), kDirMask);
        if (s.rootWd < 0) {
            if (errno == ENOENT || errno == ENODEV) return settle(Job::Status::STOPPED, "volume unavailable");
            throw sysError("inotify_add_watch " + directory.string());
        }
        s.watches[s.rootWd] = directory;

        if (cfg_.recursive) {
            const auto& filter = store_.fileFilter();
            fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec), end;
            for (; !ec && it != end; it.increment(ec)) {
                std::error_code tec;
                if (it->is_symlink(tec) || !it->is_directory(tec)) continue;
                if (filter.ignored(it->path())) {
                    it.disable_recursion_pending();
                    continue;
                }
                if (const int wd = ::inotify_add_watch(s.fd, it->path().c_str(), kDirMask); wd >= 0)
                    s.watches[wd] = it->path();
            }
        }

        log_->info("[LiveWatcher] watch_started volume={} job={} directory={} watches={}",
                   volumeId, jobId, directory.string(), s.watches.size());

        std::vector<char> buf(64 * 1024);
        auto lastBeat = std::chrono::steady_clock::now();
        pollfd pfd{s.fd, POLLIN, 0};

        while (!cancel.load()) {
            const int rc = ::poll(&pfd, 1, static_cast<int>(cfg_.poll_timeout.count()));
            if (rc < 0) {
                if (errno == EINTR) continue;
                throw sysError("poll");
            }

            if (rc > 0 && (pfd.revents & POLLIN)) {
                while (true) {
                    const auto n = ::read(s.fd, buf.data(), buf.size());
                    if (n < 0) {
                        if (errno == EAGAIN || errno == EWOULDBLOCK) break;
                        if (errno == EINTR) continue;
                        throw sysError("read inotify");
                    }
                    if (n == 0) break;

                    for (ssize_t off = 0; off < n;) {
                        const auto* ev = reinterpret_cast<const inotify_event*>(buf.data() + off);
                        const std::string name = ev->len ? std::string(ev->name) : std::string{};
                        dispatch(s, ev->wd, ev->mask, name);
                        off += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);
                    }
                }
            }

            if (s.terminal) return settle(Job::Status::STOPPED, *s.terminal);

            if (const auto now = std::chrono::steady_clock::now(); now - lastBeat >= cfg_.heartbeat_interval) {
                try {
                    tracker_.heartbeat(jobId, s.progress);
                } catch (const database::StoreBusy& e) {
                    log_->warn("[LiveWatcher] heartbeat_dropped job={} error={}", jobId, e.what());
                }
                lastBeat = now;
            }
        }

        return settle(Job::Status::STOPPED, "cancelled");
    } catch (const std::exception& e) {
        log_->error("[LiveWatcher] watch_error volume={} job={} error={}", volumeId, jobId, e.what());
        return settle(Job::Status::FAILED, e.what());
    }
}

}
