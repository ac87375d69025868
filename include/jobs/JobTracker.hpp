#pragma once

#include "config/Config.hpp"
#include "types/Job.hpp"

#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <spdlog/spdlog.h>

namespace vc::catalog { class CatalogStore; }

namespace vc::jobs {

enum class Transition : uint8_t {
    Applied,
    Conflict,   // job exists but is not in a state that allows the move; benign
    NotFound
};

std::string_view toString(Transition t) noexcept;

struct JobStart {
    std::string job_id;          // set when started
    std::string active_job_id;   // set when refused because this job already holds the slot
    bool started{false};

    explicit operator bool() const noexcept { return started; }
};

// Lifecycle of scan and watch jobs. The store is authoritative; the in-memory
// index only mirrors active jobs for cheap status reads.
class JobTracker {
public:
    JobTracker(catalog::CatalogStore& store, config::JobsConfig cfg, std::shared_ptr<spdlog::logger> log);

    // Refuses a second pending/running job for the same (volume_id, type).
    JobStart start(types::Job::Type type, const std::string& volumeId, const std::string& path);

    Transition markRunning(const std::string& jobId);
    bool heartbeat(const std::string& jobId, const types::JobProgress& progress);
    Transition complete(const std::string& jobId, const types::JobProgress& progress);
    Transition fail(const std::string& jobId, const std::string& error,
                    const std::optional<types::JobProgress>& progress = std::nullopt);
    Transition stop(const std::string& jobId, const std::optional<std::string>& reason = std::nullopt,
                    const std::optional<types::JobProgress>& progress = std::nullopt);

    // Rebuilds the active index from the store and stops jobs this host owned
    // whose process is gone. Returns the number of jobs stopped.
    size_t recover();

    [[nodiscard]] std::vector<types::Job> stalled(std::time_t now) const;
    [[nodiscard]] std::vector<types::Job> active() const;
    [[nodiscard]] std::optional<types::Job> get(const std::string& jobId) const;

    [[nodiscard]] int ownerPid() const noexcept { return pid_; }
    [[nodiscard]] const std::string& ownerHost() const noexcept { return host_; }

    static std::string newJobId();
    static bool processAlive(int pid);

private:
    catalog::CatalogStore& store_;
    config::JobsConfig cfg_;
    std::shared_ptr<spdlog::logger> log_;
    int pid_;
    std::string host_;

    mutable std::mutex mutex_;
    std::map<std::string, types::Job> active_;

    Transition move(const std::string& jobId, types::Job::Status to, const std::optional<std::string>& error,
                    const std::optional<types::JobProgress>& progress);
};

}
