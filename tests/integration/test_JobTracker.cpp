#include "StoreFixture.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <sys/wait.h>
#include <unistd.h>

using namespace vc;
using namespace vc::jobs;
using namespace vc::types;
using S = Job::Status;

namespace {

// A pid that existed a moment ago and is now reaped.
int deadPid() {
    const pid_t child = ::fork();
    if (child == 0) ::_exit(0);
    int status = 0;
    ::waitpid(child, &status, 0);
    return static_cast<int>(child);
}

}

class JobTrackerTest : public test::StoreFixture {};

TEST_F(JobTrackerTest, SecondActiveJobForSameSlotIsRefused) {
    const auto first = tracker->start(Job::Type::SCAN, "vol-1", "/mnt/a");
    ASSERT_TRUE(first);

    const auto second = tracker->start(Job::Type::SCAN, "vol-1", "/mnt/a");
    EXPECT_FALSE(second);
    EXPECT_EQ(second.active_job_id, first.job_id);

    // other type or other volume is a different slot
    EXPECT_TRUE(tracker->start(Job::Type::WATCH, "vol-1", "/mnt/a"));
    EXPECT_TRUE(tracker->start(Job::Type::SCAN, "vol-2", "/mnt/b"));

    ASSERT_EQ(tracker->markRunning(first.job_id), Transition::Applied);
    ASSERT_EQ(tracker->complete(first.job_id, {}), Transition::Applied);
    EXPECT_TRUE(tracker->start(Job::Type::SCAN, "vol-1", "/mnt/a"));
}

TEST_F(JobTrackerTest, StateMachineIsEnforcedInTheStore) {
    const auto job = tracker->start(Job::Type::SCAN, "vol-1", "/mnt/a");
    ASSERT_TRUE(job);

    EXPECT_EQ(tracker->complete(job.job_id, {}), Transition::Conflict);   // pending cannot complete
    EXPECT_EQ(tracker->markRunning(job.job_id), Transition::Applied);
    EXPECT_EQ(tracker->markRunning(job.job_id), Transition::Conflict);

    JobProgress progress;
    progress.files_processed = 12;
    progress.last_path = "/mnt/a/z";
    EXPECT_EQ(tracker->fail(job.job_id, "disk on fire", progress), Transition::Applied);
    EXPECT_EQ(tracker->stop(job.job_id), Transition::Conflict);
    EXPECT_EQ(tracker->markRunning("no-such-job"), Transition::NotFound);

    const auto stored = tracker->get(job.job_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, S::FAILED);
    EXPECT_EQ(stored->error_message, "disk on fire");
    EXPECT_EQ(stored->progress.files_processed, 12u);
    EXPECT_GT(stored->completed_at, 0);
    const auto active = tracker->active();
    EXPECT_TRUE(std::none_of(active.begin(), active.end(), [&](const Job& j) { return j.job_id == job.job_id; }));
}

TEST_F(JobTrackerTest, PendingJobMayBeStoppedDirectly) {
    const auto job = tracker->start(Job::Type::WATCH, "vol-1", "/mnt/a");
    ASSERT_TRUE(job);
    EXPECT_EQ(tracker->stop(job.job_id, std::string("volume unavailable")), Transition::Applied);
    EXPECT_EQ(tracker->get(job.job_id)->status, S::STOPPED);
}

TEST_F(JobTrackerTest, HeartbeatOnlyWhileActive) {
    const auto job = tracker->start(Job::Type::SCAN, "vol-1", "/mnt/a");
    ASSERT_TRUE(job);
    tracker->markRunning(job.job_id);

    JobProgress progress;
    progress.files_processed = 3;
    EXPECT_TRUE(tracker->heartbeat(job.job_id, progress));
    EXPECT_EQ(tracker->get(job.job_id)->progress.files_processed, 3u);

    tracker->complete(job.job_id, progress);
    EXPECT_FALSE(tracker->heartbeat(job.job_id, progress));
}

TEST_F(JobTrackerTest, RecoverStopsOrphansFromDeadProcesses) {
    const auto orphanId = JobTracker::newJobId();
    const auto created = store->createJob(orphanId, Job::Type::SCAN, "/mnt/a", "vol-1", deadPid(), tracker->ownerHost());
    ASSERT_TRUE(created.created.has_value());
    store->transitionJob(orphanId, S::RUNNING, std::nullopt, std::nullopt);

    const auto live = tracker->start(Job::Type::WATCH, "vol-1", "/mnt/a");
    ASSERT_TRUE(live);

    JobTracker fresh(*store, cfg.jobs, logging::LogRegistry::jobs());
    EXPECT_EQ(fresh.recover(), 1u);

    const auto orphan = store->getJob(orphanId);
    ASSERT_TRUE(orphan.has_value());
    EXPECT_EQ(orphan->status, S::STOPPED);
    EXPECT_EQ(orphan->error_message, "owner process exited");

    const auto active = fresh.active();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].job_id, live.job_id);
}

TEST_F(JobTrackerTest, ForeignHostJobsAreLeftAlone) {
    const auto id = JobTracker::newJobId();
    store->createJob(id, Job::Type::SCAN, "/mnt/a", "vol-1", deadPid(), "some-other-host");
    EXPECT_EQ(tracker->recover(), 0u);
    EXPECT_EQ(store->getJob(id)->status, S::PENDING);
}

TEST_F(JobTrackerTest, StalledRunningJobsAreReported) {
    const auto job = tracker->start(Job::Type::WATCH, "vol-1", "/mnt/a");
    ASSERT_TRUE(job);
    tracker->markRunning(job.job_id);

    EXPECT_TRUE(tracker->stalled(util::now()).empty());
    const auto later = tracker->stalled(util::now() + cfg.jobs.stall_after.count() + 5);
    ASSERT_EQ(later.size(), 1u);
    EXPECT_EQ(later[0].job_id, job.job_id);
}

TEST_F(JobTrackerTest, ListJobsFilters) {
    const auto a = tracker->start(Job::Type::SCAN, "vol-1", "/mnt/a");
    const auto b = tracker->start(Job::Type::WATCH, "vol-2", "/mnt/b");
    ASSERT_TRUE(a && b);
    tracker->markRunning(b.job_id);

    JobFilter running;
    running.statuses = {S::RUNNING};
    const auto onlyRunning = store->listJobs(running);
    ASSERT_EQ(onlyRunning.size(), 1u);
    EXPECT_EQ(onlyRunning[0].job_id, b.job_id);

    JobFilter byVolume;
    byVolume.volume_id = "vol-1";
    byVolume.type = Job::Type::SCAN;
    const auto scans = store->listJobs(byVolume);
    ASSERT_EQ(scans.size(), 1u);
    EXPECT_EQ(scans[0].job_id, a.job_id);

    EXPECT_EQ(store->listJobs({}).size(), 2u);
}
