#include "services/AsyncService.hpp"

using namespace vc::services;

AsyncService::AsyncService(std::string serviceName, std::shared_ptr<spdlog::logger> log)
    : serviceName_(std::move(serviceName)), log_(std::move(log)) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();   // previous loop ended on its own

    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log_->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    log_->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    {
        std::scoped_lock lock(waitMutex_);
        interruptFlag_.store(true);
    }
    waitCv_.notify_all();

    // Only join if we're not calling stop() from the same thread
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        log_->info("[{}] Stopping service...", serviceName_);
        worker_.join();
        log_->info("[{}] Service stopped.", serviceName_);
    }

    running_.store(false);
}

bool AsyncService::waitFor(const std::chrono::milliseconds d) {
    std::unique_lock lock(waitMutex_);
    return !waitCv_.wait_for(lock, d, [this] { return interruptFlag_.load(); });
}
