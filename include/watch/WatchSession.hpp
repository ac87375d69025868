#pragma once

#include "watch/LiveWatcher.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace vc::watch {

// One watch job on its own thread, with an interrupt flag.
class WatchSession {
public:
    WatchSession(LiveWatcher& watcher, std::string volumeId, std::filesystem::path directory, std::string jobId,
                 std::shared_ptr<spdlog::logger> log);
    ~WatchSession();

    WatchSession(const WatchSession&) = delete;
    WatchSession& operator=(const WatchSession&) = delete;

    void start();

    // Raises the interrupt flag and joins; the watcher settles the job as stopped.
    void stop();

    // True once the watch loop returned, whether cancelled or not.
    [[nodiscard]] bool finished() const { return finished_.load(); }
    [[nodiscard]] std::optional<WatchResult> result() const;

    [[nodiscard]] const std::string& volumeId() const { return volumeId_; }
    [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }
    [[nodiscard]] const std::string& jobId() const { return jobId_; }

private:
    LiveWatcher& watcher_;
    std::string volumeId_;
    std::filesystem::path directory_;
    std::string jobId_;
    std::shared_ptr<spdlog::logger> log_;

    std::thread worker_;
    std::atomic<bool> interruptFlag_{false};
    std::atomic<bool> finished_{false};
    mutable std::mutex mutex_;
    std::optional<WatchResult> result_;
};

}
