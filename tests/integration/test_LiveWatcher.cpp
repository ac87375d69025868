#include "StoreFixture.hpp"
#include "logging/LogRegistry.hpp"
#include "watch/LiveWatcher.hpp"
#include "watch/WatchSession.hpp"

#include <chrono>
#include <functional>
#include <thread>

namespace fs = std::filesystem;
using namespace vc;
using namespace vc::types;
using namespace std::chrono_literals;

namespace {

bool eventually(const std::function<bool()>& cond, const std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(25ms);
    }
    return cond();
}

}

class LiveWatcherTest : public test::StoreFixture {
protected:
    std::unique_ptr<watch::LiveWatcher> watcher;
    std::unique_ptr<watch::WatchSession> session;
    fs::path volume;

    void SetUp() override {
        StoreFixture::SetUp();
        if (IsSkipped()) return;
        watcher = std::make_unique<watch::LiveWatcher>(*store, *tracker, cfg.watcher, logging::LogRegistry::watcher());
        volume = makeDir("vol");
    }

    void TearDown() override {
        if (session) session->stop();
        session.reset();
        watcher.reset();
        StoreFixture::TearDown();
    }

    void startSession() {
        const auto job = tracker->start(Job::Type::WATCH, "vol-1", volume.string());
        ASSERT_TRUE(job);
        session = std::make_unique<watch::WatchSession>(*watcher, "vol-1", volume, job.job_id,
                                                        logging::LogRegistry::watcher());
        session->start();

        // the watch is live once a probe file shows up in the log
        int n = 0;
        ASSERT_TRUE(eventually([&] {
            writeFile("vol/probe-" + std::to_string(n++), "p");
            return store->tallyEvents("vol-1").created > 0;
        }));
    }

    std::optional<FileRecord> file(const std::string& rel) const { return store->getFile("vol-1", (volume / rel).string()); }
};

TEST_F(LiveWatcherTest, RecordsCreateAndDelete) {
    startSession();

    writeFile("vol/report.txt", "draft");
    ASSERT_TRUE(eventually([&] { return file("report.txt").has_value(); }));
    EXPECT_FALSE(file("report.txt")->is_deleted);

    fs::remove(volume / "report.txt");
    ASSERT_TRUE(eventually([&] {
        const auto f = file("report.txt");
        return f && f->is_deleted;
    }));

    EXPECT_GE(store->tallyEvents("vol-1").deleted, 1);
    EXPECT_TRUE(store->countersConsistent("vol-1"));
}

TEST_F(LiveWatcherTest, FollowsNewSubdirectories) {
    startSession();

    fs::create_directories(volume / "album");
    ASSERT_TRUE(eventually([&] {
        writeFile("vol/album/photo.jpg", "jpeg");
        return file("album/photo.jpg").has_value();
    }));
}

TEST_F(LiveWatcherTest, IgnoredNamesStayOutOfFiles) {
    startSession();

    writeFile("vol/.DS_Store", "meta");
    writeFile("vol/visible.txt", "x");
    ASSERT_TRUE(eventually([&] { return file("visible.txt").has_value(); }));
    EXPECT_FALSE(file(".DS_Store").has_value());
}

TEST_F(LiveWatcherTest, StopSettlesJobAsStopped) {
    startSession();
    session->stop();

    ASSERT_TRUE(session->finished());
    const auto result = session->result();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, Job::Status::STOPPED);
    EXPECT_EQ(result->reason, "cancelled");
    EXPECT_EQ(tracker->get(session->jobId())->status, Job::Status::STOPPED);
}

TEST_F(LiveWatcherTest, RemovedRootEndsTheWatch) {
    startSession();
    fs::remove_all(volume);

    ASSERT_TRUE(eventually([&] { return session->finished(); }));
    const auto result = session->result();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, Job::Status::STOPPED);
    EXPECT_EQ(result->reason, "watched directory removed");
}

TEST_F(LiveWatcherTest, MissingDirectoryStopsImmediately) {
    const auto job = tracker->start(Job::Type::WATCH, "vol-1", "/gone");
    ASSERT_TRUE(job);
    const std::atomic<bool> cancel{false};
    const auto result = watcher->watch("vol-1", workDir / "gone", job.job_id, cancel);
    EXPECT_EQ(result.status, Job::Status::STOPPED);
    EXPECT_EQ(result.reason, "volume unavailable");
}
