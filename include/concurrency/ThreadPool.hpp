#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>

namespace vc::concurrency {

// Fixed-size worker pool; the worker count caps concurrent tasks.
class ThreadPool {
public:
    ThreadPool(unsigned int nThreads, std::shared_ptr<spdlog::logger> log);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Lets queued tasks run to completion, then joins the workers.
    void stop();

    void submit(std::shared_ptr<Task> task);

    [[nodiscard]] size_t queueDepth() const;
    [[nodiscard]] unsigned int workerCount() const;
    [[nodiscard]] unsigned int busyCount() const { return busy_.load(); }

private:
    void spawnWorker();

    std::shared_ptr<spdlog::logger> log_;
    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
    std::atomic<unsigned int> busy_{0};
};

}
