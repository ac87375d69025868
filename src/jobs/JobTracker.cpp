#include "jobs/JobTracker.hpp"
#include "catalog/CatalogStore.hpp"
#include "util/timestamp.hpp"

#include <cerrno>
#include <csignal>
#include <climits>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

using namespace vc::types;

namespace vc::jobs {

namespace {
    std::string hostName() {
        char buf[HOST_NAME_MAX + 1] = {};
        if (::gethostname(buf, sizeof(buf) - 1) != 0) return "unknown";
        return buf;
    }
}

std::string_view toString(const Transition t) noexcept {
    switch (t) {
    case Transition::Applied: return "applied";
    case Transition::Conflict: return "conflict";
    case Transition::NotFound: return "not_found";
    }
    return "conflict";
}

JobTracker::JobTracker(catalog::CatalogStore& store, config::JobsConfig cfg, std::shared_ptr<spdlog::logger> log)
    : store_(store), cfg_(cfg), log_(std::move(log)), pid_(static_cast<int>(::getpid())), host_(hostName()) {}

std::string JobTracker::newJobId() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

bool JobTracker::processAlive(const int pid) {
    if (pid <= 0) return false;
    if (::kill(pid, 0) == 0) return true;
    return errno != ESRCH;   // EPERM: alive, owned by someone else
}

JobStart JobTracker::start(const Job::Type type, const std::string& volumeId, const std::string& path) {
    const auto id = newJobId();
    const auto res = store_.createJob(id, type, path, volumeId, pid_, host_);

    JobStart out;
    if (res.active) {
        out.active_job_id = res.active->job_id;
        log_->info("[JobTracker] already_active type={} volume={} job={}",
                   Job::toString(type), volumeId, out.active_job_id);
        return out;
    }

    {
        std::lock_guard lock(mutex_);
        active_[id] = *res.created;
    }
    out.job_id = id;
    out.started = true;
    log_->info("[JobTracker] job_created type={} volume={} job={} path={}", Job::toString(type), volumeId, id, path);
    return out;
}

Transition JobTracker::move(const std::string& jobId, const Job::Status to, const std::optional<std::string>& error,
                            const std::optional<JobProgress>& progress) {
    if (const auto updated = store_.transitionJob(jobId, to, error, progress)) {
        {
            std::lock_guard lock(mutex_);
            if (updated->isActive()) active_[jobId] = *updated;
            else active_.erase(jobId);
        }
        log_->info("[JobTracker] job_{} job={} volume={}{}", Job::toString(to), jobId, updated->volume_id,
                   error ? " error=" + *error : std::string{});
        return Transition::Applied;
    }

    const auto current = store_.getJob(jobId);
    if (!current) {
        log_->warn("[JobTracker] transition_unknown_job job={} to={}", jobId, Job::toString(to));
        return Transition::NotFound;
    }

    {
        std::lock_guard lock(mutex_);
        if (!current->isActive()) active_.erase(jobId);
    }
    log_->debug("[JobTracker] transition_conflict job={} from={} to={}",
                jobId, Job::toString(current->status), Job::toString(to));
    return Transition::Conflict;
}

Transition JobTracker::markRunning(const std::string& jobId) {
    return move(jobId, Job::Status::RUNNING, std::nullopt, std::nullopt);
}

bool JobTracker::heartbeat(const std::string& jobId, const JobProgress& progress) {
    const bool ok = store_.heartbeatJob(jobId, progress);
    if (ok) {
        std::lock_guard lock(mutex_);
        if (const auto it = active_.find(jobId); it != active_.end()) {
            it->second.progress = progress;
            it->second.updated_at = util::now();
        }
    }
    log_->debug("[JobTracker] heartbeat job={} files={} last_path={} accepted={}",
                jobId, progress.files_processed, progress.last_path, ok);
    return ok;
}

Transition JobTracker::complete(const std::string& jobId, const JobProgress& progress) {
    return move(jobId, Job::Status::COMPLETED, std::nullopt, progress);
}

Transition JobTracker::fail(const std::string& jobId, const std::string& error, const std::optional<JobProgress>& progress) {
    return move(jobId, Job::Status::FAILED, error, progress);
}

Transition JobTracker::stop(const std::string& jobId, const std::optional<std::string>& reason,
                            const std::optional<JobProgress>& progress) {
    return move(jobId, Job::Status::STOPPED, reason, progress);
}

size_t JobTracker::recover() {
    const auto jobs = store_.listActiveJobs();
    size_t stopped = 0;

    std::map<std::string, Job> index;
    for (const auto& job : jobs) {
        const bool ours = job.owner_host == host_;
        const bool orphaned = ours && job.owner_pid && *job.owner_pid != pid_ && !processAlive(*job.owner_pid);
        if (orphaned) {
            if (store_.transitionJob(job.job_id, Job::Status::STOPPED, std::string("owner process exited"), std::nullopt)) {
                ++stopped;
                log_->info("[JobTracker] orphan_stopped job={} volume={} pid={}", job.job_id, job.volume_id, *job.owner_pid);
            }
            continue;
        }
        index.emplace(job.job_id, job);
    }

    {
        std::lock_guard lock(mutex_);
        active_ = std::move(index);
    }
    log_->info("[JobTracker] recovered active={} stopped={}", jobs.size() - stopped, stopped);
    return stopped;
}

std::vector<Job> JobTracker::stalled(const std::time_t now) const {
    std::vector<Job> out;
    for (const auto& job : store_.listJobs({{Job::Status::RUNNING}, std::nullopt, {}, 0}))
        if (job.looksStalled(now, cfg_.stall_after.count())) out.push_back(job);
    return out;
}

std::vector<Job> JobTracker::active() const {
    std::lock_guard lock(mutex_);
    std::vector<Job> out;
    out.reserve(active_.size());
    for (const auto& [_, job] : active_) out.push_back(job);
    return out;
}

std::optional<Job> JobTracker::get(const std::string& jobId) const {
    return store_.getJob(jobId);
}

}
