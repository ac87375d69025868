#include "scan/ScanTask.hpp"
#include "jobs/JobTracker.hpp"

using namespace vc::scan;
using namespace vc::types;

void ScanTask::operator()() {
    ScanStats stats;
    stats.volume_id = volumeId;
    stats.job_id = jobId;

    try {
        if (cancel->load()) {
            tracker.stop(jobId, std::string("cancelled"));
            stats.status = Job::Status::STOPPED;
            stats.error = "cancelled";
            promise.set_value(stats);
            return;
        }

        if (const auto t = tracker.markRunning(jobId); t != jobs::Transition::Applied) {
            // stopped while still queued
            const auto job = tracker.get(jobId);
            stats.status = job ? job->status : Job::Status::STOPPED;
            stats.error = job ? job->error_message : std::string("job not found");
            promise.set_value(stats);
            return;
        }

        promise.set_value(scanner.scan(volumeId, root, jobId, *cancel));
    } catch (const std::exception& e) {
        stats.status = Job::Status::FAILED;
        stats.error = e.what();
        try {
            tracker.fail(jobId, e.what());
        } catch (const std::exception& inner) {
            stats.error += std::string("; ") + inner.what();
        }
        promise.set_value(stats);
    }
}
