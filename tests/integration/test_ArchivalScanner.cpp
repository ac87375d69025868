#include "StoreFixture.hpp"
#include "logging/LogRegistry.hpp"
#include "scan/ArchivalScanner.hpp"

#include <atomic>
#include <map>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace vc;
using namespace vc::types;

class ArchivalScannerTest : public test::StoreFixture {
protected:
    std::unique_ptr<scan::ArchivalScanner> scanner;
    fs::path volume;

    void SetUp() override {
        StoreFixture::SetUp();
        if (IsSkipped()) return;

        scanner = std::make_unique<scan::ArchivalScanner>(*store, *tracker, cfg.scanner, logging::LogRegistry::scanner());
        volume = makeDir("vol");
        writeFile("vol/a.txt", "hello");
        writeFile("vol/sub/b.txt", "abc");
        writeFile("vol/sub/deeper/c.bin", std::string(1024, 'x'));
        writeFile("vol/.DS_Store", "meta");
        writeFile("vol/cache.tmp/inside.txt", "skipped with its directory");
        fs::create_symlink(volume / "a.txt", volume / "link-to-a");
    }

    void TearDown() override {
        scanner.reset();
        StoreFixture::TearDown();
    }

    scan::ScanStats runScan(const std::atomic<bool>& cancel) {
        const auto job = tracker->start(Job::Type::SCAN, "vol-1", volume.string());
        EXPECT_TRUE(job);
        EXPECT_EQ(tracker->markRunning(job.job_id), jobs::Transition::Applied);
        return scanner->scan("vol-1", volume, job.job_id, cancel);
    }

    scan::ScanStats runScan() {
        const std::atomic<bool> cancel{false};
        return runScan(cancel);
    }

    std::map<std::string, FileRecord> snapshot() const {
        std::map<std::string, FileRecord> out;
        for (auto& f : store->listFiles("vol-1", 0)) out.emplace(f.path, std::move(f));
        return out;
    }
};

TEST_F(ArchivalScannerTest, RecordsRegularFilesOnly) {
    const auto stats = runScan();
    EXPECT_EQ(stats.status, Job::Status::COMPLETED);
    EXPECT_EQ(stats.files_seen, 3u);
    EXPECT_EQ(stats.files_recorded, 3u);
    EXPECT_EQ(stats.bytes, 5u + 3u + 1024u);
    EXPECT_EQ(stats.errors, 0u);

    const auto files = snapshot();
    EXPECT_EQ(files.size(), 3u);
    EXPECT_TRUE(files.contains((volume / "sub/deeper/c.bin").string()));
    EXPECT_FALSE(files.contains((volume / "link-to-a").string()));
    EXPECT_FALSE(files.contains((volume / ".DS_Store").string()));
    EXPECT_EQ(files.at((volume / "a.txt").string()).size_bytes, 5);
    EXPECT_EQ(files.at((volume / "a.txt").string()).directory, volume.string());

    const auto job = tracker->get(stats.job_id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, Job::Status::COMPLETED);
    EXPECT_EQ(job->progress.files_processed, 3u);
    EXPECT_EQ(job->progress.total_known, 3u);

    EXPECT_EQ(store->tallyEvents("vol-1").discovered, 3);
}

TEST_F(ArchivalScannerTest, RescanOfUnchangedTreeChangesNothing) {
    runScan();
    const auto before = snapshot();

    const auto again = runScan();
    EXPECT_EQ(again.status, Job::Status::COMPLETED);
    const auto after = snapshot();

    ASSERT_EQ(before.size(), after.size());
    for (const auto& [path, row] : before) {
        const auto& other = after.at(path);
        EXPECT_EQ(row.size_bytes, other.size_bytes) << path;
        EXPECT_EQ(row.modified_time, other.modified_time) << path;
        EXPECT_EQ(row.created_time, other.created_time) << path;
        EXPECT_EQ(row.is_deleted, other.is_deleted) << path;
        EXPECT_EQ(row.last_event_timestamp, other.last_event_timestamp) << path;
    }
}

TEST_F(ArchivalScannerTest, RescanPicksUpChangedFiles) {
    runScan();
    writeFile("vol/a.txt", "hello, world");
    runScan();
    EXPECT_EQ(store->getFile("vol-1", (volume / "a.txt").string())->size_bytes, 12);
}

TEST_F(ArchivalScannerTest, CancelledScanSettlesAsStopped) {
    const std::atomic<bool> cancel{true};
    const auto stats = runScan(cancel);
    EXPECT_EQ(stats.status, Job::Status::STOPPED);
    EXPECT_EQ(stats.error, "cancelled");
    EXPECT_EQ(tracker->get(stats.job_id)->status, Job::Status::STOPPED);
}

TEST_F(ArchivalScannerTest, MissingRootIsAStopNotAFailure) {
    const auto job = tracker->start(Job::Type::SCAN, "vol-gone", "/nowhere");
    ASSERT_TRUE(job);
    tracker->markRunning(job.job_id);

    const std::atomic<bool> cancel{false};
    const auto stats = scanner->scan("vol-gone", workDir / "unplugged", job.job_id, cancel);
    EXPECT_EQ(stats.status, Job::Status::STOPPED);
    EXPECT_EQ(stats.error, "volume unavailable");

    const auto stored = tracker->get(job.job_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, Job::Status::STOPPED);
    EXPECT_EQ(stored->error_message, "volume unavailable");
}

TEST_F(ArchivalScannerTest, UnreadableRootFailsTheJob) {
    if (::geteuid() == 0) GTEST_SKIP() << "root reads through directory permissions";

    fs::permissions(volume, fs::perms::none);
    const auto stats = runScan();
    fs::permissions(volume, fs::perms::owner_all);

    EXPECT_EQ(stats.status, Job::Status::FAILED);
    EXPECT_EQ(stats.files_seen, 0u);
    EXPECT_NE(stats.error.find(volume.string()), std::string::npos);

    const auto job = tracker->get(stats.job_id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, Job::Status::FAILED);
    EXPECT_FALSE(job->error_message.empty());
    EXPECT_TRUE(snapshot().empty());
}
