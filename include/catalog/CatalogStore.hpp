#pragma once

#include "config/Config.hpp"
#include "database/Migrator.hpp"
#include "database/Queries/EventQueries.hpp"
#include "database/Queries/VolumeQueries.hpp"
#include "types/Event.hpp"
#include "types/FileRecord.hpp"
#include "types/Job.hpp"
#include "types/Volume.hpp"
#include "types/VolumeIdentity.hpp"
#include "util/fileFilters.hpp"

#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace vc::database { class Transactions; }

namespace vc::catalog {

struct JobCreateResult {
    std::optional<types::Job> created;
    std::optional<types::Job> active;   // set when an active job already held the slot
};

// Pure refresh rule: enough events since the last probe, or the last probe is too old (or never happened).
bool usageRefreshDue(const database::UsageState& state, std::time_t now, const config::CatalogConfig& cfg);

// statvfs on the directory; nullopt when it cannot be probed.
std::optional<types::DiskUsage> probeDiskUsage(const std::filesystem::path& dir);

// The durable catalog. Every public operation is one transaction; writes go
// through the single-writer gate in database::Transactions.
class CatalogStore {
public:
    CatalogStore(config::Config cfg, std::shared_ptr<spdlog::logger> log, std::shared_ptr<spdlog::logger> dbLog);
    ~CatalogStore();

    // Applies migrations, then prepares statements. Call once before anything else.
    void init();
    database::MigrationReport migrate();

    // Event row plus volume counters, atomically.
    int64_t recordEvent(const types::Event& event);

    // Event, counters and the matching files row in one transaction, then a usage refresh if due.
    // For deletes `file` is ignored; for other types a missing `file` records the event only.
    int64_t recordChange(const types::Event& event, const std::optional<types::FileRecord>& file);

    void upsertFile(const types::FileRecord& file);
    void markFileDeleted(const std::string& volumeId, const std::string& path, const std::string& directory,
                         std::time_t at);
    void persistIdentity(const types::VolumeIdentity& identity);

    // Returns true when the usage snapshot was refreshed.
    bool refreshUsageIfDue(const std::string& volumeId);

    std::vector<types::VolumeSummary> summarizeByVolume();
    std::vector<types::Volume> listVolumes();
    std::optional<types::Volume> getVolume(const std::string& volumeId);
    std::vector<types::Event> listRecentEvents(std::optional<std::time_t> since, unsigned int limit);
    std::vector<types::FileRecord> listFiles(const std::string& volumeId, unsigned int limit);
    std::optional<types::FileRecord> getFile(const std::string& volumeId, const std::string& path);
    database::EventCounts tallyEvents(const std::string& volumeId);

    void recomputeCounters(const std::string& volumeId);
    bool countersConsistent(const std::string& volumeId);

    // Job rows. State-machine rules live in jobs::JobTracker.
    JobCreateResult createJob(const std::string& jobId, types::Job::Type type, const std::string& path,
                              const std::string& volumeId, int ownerPid, const std::string& ownerHost);
    std::optional<types::Job> transitionJob(const std::string& jobId, types::Job::Status to,
                                            const std::optional<std::string>& errorMessage,
                                            const std::optional<types::JobProgress>& progress);
    bool heartbeatJob(const std::string& jobId, const types::JobProgress& progress);
    std::optional<types::Job> getJob(const std::string& jobId);
    std::vector<types::Job> listJobs(const types::JobFilter& filter);
    std::vector<types::Job> listActiveJobs();

    [[nodiscard]] const util::FileFilter& fileFilter() const { return filter_; }
    [[nodiscard]] const config::Config& config() const { return cfg_; }

private:
    config::Config cfg_;
    std::shared_ptr<spdlog::logger> log_;
    std::shared_ptr<spdlog::logger> dbLog_;
    std::unique_ptr<database::Transactions> tx_;
    util::FileFilter filter_;
    bool initialized_ = false;

    void refreshUsage(const std::string& volumeId, const database::UsageState& state);
};

}
