#include "watch/WatchSession.hpp"

using namespace vc::watch;

WatchSession::WatchSession(LiveWatcher& watcher, std::string volumeId, std::filesystem::path directory,
                           std::string jobId, std::shared_ptr<spdlog::logger> log)
    : watcher_(watcher), volumeId_(std::move(volumeId)), directory_(std::move(directory)), jobId_(std::move(jobId)),
      log_(std::move(log)) {}

WatchSession::~WatchSession() {
    stop();
}

void WatchSession::start() {
    if (worker_.joinable()) return;

    worker_ = std::thread([this] {
        try {
            auto res = watcher_.watch(volumeId_, directory_, jobId_, interruptFlag_);
            std::scoped_lock lock(mutex_);
            result_ = std::move(res);
        } catch (const std::exception& e) {
            log_->error("[WatchSession] watch on {} ended with an error: {}", directory_.string(), e.what());
            std::scoped_lock lock(mutex_);
            result_ = WatchResult{types::Job::Status::FAILED, e.what(), 0, 0};
        }
        finished_.store(true);
    });
}

void WatchSession::stop() {
    interruptFlag_.store(true);
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();
}

std::optional<WatchResult> WatchSession::result() const {
    std::scoped_lock lock(mutex_);
    return result_;
}
