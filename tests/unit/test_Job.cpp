#include <gtest/gtest.h>
#include "types/Job.hpp"
#include "types/Event.hpp"

#include <nlohmann/json.hpp>

using namespace vc::types;
using S = Job::Status;

TEST(JobStatus, LegalTransitions) {
    EXPECT_TRUE(Job::canTransition(S::PENDING, S::RUNNING));
    EXPECT_TRUE(Job::canTransition(S::PENDING, S::FAILED));
    EXPECT_TRUE(Job::canTransition(S::PENDING, S::STOPPED));
    EXPECT_TRUE(Job::canTransition(S::RUNNING, S::COMPLETED));
    EXPECT_TRUE(Job::canTransition(S::RUNNING, S::FAILED));
    EXPECT_TRUE(Job::canTransition(S::RUNNING, S::STOPPED));
}

TEST(JobStatus, TerminalStatesAreFinal) {
    for (const auto from : {S::COMPLETED, S::FAILED, S::STOPPED})
        for (const auto to : {S::PENDING, S::RUNNING, S::COMPLETED, S::FAILED, S::STOPPED})
            EXPECT_FALSE(Job::canTransition(from, to)) << Job::toString(from) << " -> " << Job::toString(to);
}

TEST(JobStatus, NoSkippingOrGoingBack) {
    EXPECT_FALSE(Job::canTransition(S::PENDING, S::COMPLETED));
    EXPECT_FALSE(Job::canTransition(S::RUNNING, S::PENDING));
    EXPECT_FALSE(Job::canTransition(S::RUNNING, S::RUNNING));
}

TEST(JobStatus, AllowedSources) {
    EXPECT_EQ(Job::allowedSources(S::RUNNING), std::vector<S>{S::PENDING});
    EXPECT_EQ(Job::allowedSources(S::COMPLETED), std::vector<S>{S::RUNNING});
    EXPECT_EQ(Job::allowedSources(S::STOPPED), (std::vector<S>{S::PENDING, S::RUNNING}));
    EXPECT_TRUE(Job::allowedSources(S::PENDING).empty());
}

TEST(JobStatus, StringsRoundTrip) {
    for (const auto s : {S::PENDING, S::RUNNING, S::COMPLETED, S::FAILED, S::STOPPED}) {
        S parsed = S::PENDING;
        ASSERT_TRUE(Job::tryParse(Job::toString(s), parsed));
        EXPECT_EQ(parsed, s);
    }
    S out = S::RUNNING;
    EXPECT_FALSE(Job::tryParse("paused", out));
    EXPECT_EQ(out, S::RUNNING);

    Job::Type t = Job::Type::SCAN;
    EXPECT_TRUE(Job::tryParse("watch", t));
    EXPECT_EQ(t, Job::Type::WATCH);
}

TEST(Job, LooksStalledOnlyWhenRunningAndQuiet) {
    Job job;
    job.status = S::RUNNING;
    job.updated_at = 1000;
    EXPECT_FALSE(job.looksStalled(1050, 90));
    EXPECT_TRUE(job.looksStalled(1090, 90));

    job.status = S::PENDING;
    EXPECT_FALSE(job.looksStalled(5000, 90));

    job.status = S::RUNNING;
    job.updated_at = 0;
    EXPECT_FALSE(job.looksStalled(5000, 90));
}

TEST(Job, JsonCarriesNullsForUnsetFields) {
    Job job;
    job.job_id = "abc";
    job.type = Job::Type::WATCH;
    job.status = S::RUNNING;
    job.started_at = 86400;
    job.progress.files_processed = 7;

    const nlohmann::json j = job;
    EXPECT_EQ(j["job_type"], "watch");
    EXPECT_EQ(j["status"], "running");
    EXPECT_EQ(j["started_at"], "1970-01-02T00:00:00Z");
    EXPECT_TRUE(j["completed_at"].is_null());
    EXPECT_TRUE(j["owner_pid"].is_null());
    EXPECT_TRUE(j["error_message"].is_null());
    EXPECT_EQ(j["progress"]["files_processed"], 7);
}

TEST(JobProgress, FromJsonToleratesMissingKeys) {
    const auto p = nlohmann::json::parse(R"({"files_processed": 3, "last_path": "/a"})").get<JobProgress>();
    EXPECT_EQ(p.files_processed, 3u);
    EXPECT_EQ(p.last_path, "/a");
    EXPECT_EQ(p.errors, 0u);
}

TEST(EventType, ParsesWireNames) {
    Event::Type t = Event::Type::DISCOVERED;
    EXPECT_TRUE(Event::tryParse("deleted", t));
    EXPECT_EQ(t, Event::Type::DELETED);
    EXPECT_FALSE(Event::tryParse("renamed", t));
    EXPECT_EQ(Event::toString(Event::Type::MODIFIED), "modified");
}
