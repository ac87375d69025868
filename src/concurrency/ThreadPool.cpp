#include "concurrency/ThreadPool.hpp"

#include <stdexcept>

using namespace vc::concurrency;

ThreadPool::ThreadPool(const unsigned int nThreads, std::shared_ptr<spdlog::logger> log)
    : log_(std::move(log)) {
    const unsigned int n = nThreads == 0 ? 1 : nThreads;
    for (unsigned int i = 0; i < n; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) return;
        stopFlag.store(true);
    }
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) throw std::runtime_error("ThreadPool is stopped");
        queue.push(std::move(task));
    }
    cv.notify_one();
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (task) {
                ++busy_;
                try {
                    (*task)();
                } catch (const std::exception& e) {
                    log_->error("[ThreadPool] Task threw: {}", e.what());
                }
                --busy_;
            }
        }
    });
}
