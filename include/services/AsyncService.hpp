#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>

namespace vc::services {

class AsyncService {
public:
    AsyncService(std::string serviceName, std::shared_ptr<spdlog::logger> log);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

protected:
    std::string serviceName_;
    std::shared_ptr<spdlog::logger> log_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    // Sleeps up to `d`; returns false as soon as stop() is requested.
    bool waitFor(std::chrono::milliseconds d);

private:
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
};

}
