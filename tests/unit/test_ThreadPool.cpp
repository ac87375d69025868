#include <gtest/gtest.h>
#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

#include <chrono>
#include <future>
#include <stdexcept>

using namespace vc::concurrency;
using namespace std::chrono_literals;

namespace {

struct ProbeTask final : Task {
    std::atomic<int>& running;
    std::atomic<int>& peak;
    std::atomic<int>& done;

    ProbeTask(std::atomic<int>& r, std::atomic<int>& p, std::atomic<int>& d) : running(r), peak(p), done(d) {}

    void operator()() override {
        const int now = ++running;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(20ms);
        --running;
        ++done;
    }
};

struct ThrowingTask final : Task {
    void operator()() override { throw std::runtime_error("task exploded"); }
};

struct SignalTask final : Task {
    std::promise<void> promise;
    void operator()() override { promise.set_value(); }
};

}

TEST(ThreadPool, SingleWorkerRunsTasksSerially) {
    std::atomic<int> running{0}, peak{0}, done{0};
    {
        ThreadPool pool(1, vc::logging::LogRegistry::scanner());
        for (int i = 0; i < 5; ++i) pool.submit(std::make_shared<ProbeTask>(running, peak, done));
        pool.stop();
    }
    EXPECT_EQ(done.load(), 5);
    EXPECT_EQ(peak.load(), 1);
}

TEST(ThreadPool, NeverExceedsWorkerCount) {
    std::atomic<int> running{0}, peak{0}, done{0};
    ThreadPool pool(3, vc::logging::LogRegistry::scanner());
    EXPECT_EQ(pool.workerCount(), 3u);
    for (int i = 0; i < 12; ++i) pool.submit(std::make_shared<ProbeTask>(running, peak, done));
    pool.stop();
    EXPECT_EQ(done.load(), 12);
    EXPECT_LE(peak.load(), 3);
    EXPECT_EQ(pool.queueDepth(), 0u);
}

TEST(ThreadPool, ZeroThreadsMeansOne) {
    ThreadPool pool(0, vc::logging::LogRegistry::scanner());
    EXPECT_EQ(pool.workerCount(), 1u);
}

TEST(ThreadPool, ThrowingTaskDoesNotKillWorker) {
    ThreadPool pool(1, vc::logging::LogRegistry::scanner());
    pool.submit(std::make_shared<ThrowingTask>());
    auto signal = std::make_shared<SignalTask>();
    auto fut = signal->promise.get_future();
    pool.submit(signal);
    EXPECT_EQ(fut.wait_for(5s), std::future_status::ready);
}

TEST(ThreadPool, SubmitAfterStopThrows) {
    ThreadPool pool(2, vc::logging::LogRegistry::scanner());
    pool.stop();
    EXPECT_THROW(pool.submit(std::make_shared<ThrowingTask>()), std::runtime_error);
    EXPECT_NO_THROW(pool.stop());
}
