#include "catalog/CatalogStore.hpp"
#include "database/Transactions.hpp"
#include "database/Queries/FileQueries.hpp"
#include "database/Queries/JobQueries.hpp"
#include "util/timestamp.hpp"

#include <sys/statvfs.h>

using namespace vc::database;
using namespace vc::types;
using namespace vc::util;

namespace vc::catalog {

bool usageRefreshDue(const UsageState& state, const std::time_t now, const config::CatalogConfig& cfg) {
    if (state.events_since_refresh >= static_cast<int64_t>(cfg.usage_refresh_events)) return true;
    if (state.usage_refreshed_at == 0) return true;
    return now - state.usage_refreshed_at >= cfg.usage_refresh_interval.count();
}

std::optional<DiskUsage> probeDiskUsage(const std::filesystem::path& dir) {
    struct statvfs vfs{};
    if (::statvfs(dir.c_str(), &vfs) != 0) return std::nullopt;
    const auto frsize = static_cast<int64_t>(vfs.f_frsize ? vfs.f_frsize : vfs.f_bsize);
    DiskUsage u;
    u.total_bytes = static_cast<int64_t>(vfs.f_blocks) * frsize;
    u.free_bytes = static_cast<int64_t>(vfs.f_bavail) * frsize;
    u.used_bytes = static_cast<int64_t>(vfs.f_blocks - vfs.f_bfree) * frsize;
    return u;
}

CatalogStore::CatalogStore(config::Config cfg, std::shared_ptr<spdlog::logger> log, std::shared_ptr<spdlog::logger> dbLog)
    : cfg_(std::move(cfg)),
      log_(std::move(log)),
      dbLog_(std::move(dbLog)),
      tx_(std::make_unique<Transactions>(cfg_.database, dbLog_)),
      filter_(cfg_.catalog.ignore_names, cfg_.catalog.ignore_suffixes) {}

CatalogStore::~CatalogStore() = default;

MigrationReport CatalogStore::migrate() {
    const Migrator migrator(cfg_.database.migrations_dir, cfg_.database.schema, dbLog_);
    return tx_->withWriter([&](pqxx::connection& conn) { return migrator.apply(conn); });
}

void CatalogStore::init() {
    if (initialized_) return;
    const auto report = migrate();
    if (!report.applied.empty())
        log_->info("[CatalogStore] migrations_applied count={} schema={}", report.applied.size(), cfg_.database.schema);
    tx_->init();
    initialized_ = true;
}

int64_t CatalogStore::recordEvent(const Event& event) {
    return recordChange(event, std::nullopt);
}

int64_t CatalogStore::recordChange(const Event& event, const std::optional<FileRecord>& file) {
    const bool catalogued = !filter_.ignored(event.path);

    const auto [eventId, state] = tx_->write("CatalogStore::recordChange", [&](pqxx::work& txn) {
        const auto id = EventQueries::insert(txn, event);
        auto usage = VolumeQueries::bumpCounters(txn, event);

        if (catalogued) {
            if (event.type == Event::Type::DELETED) {
                FileQueries::markDeleted(txn, event.volume_id, event.path, event.directory, event.timestamp);
            } else if (file) {
                FileRecord row = *file;
                row.volume_id = event.volume_id;
                row.path = event.path;
                row.directory = event.directory;
                row.last_event_type = event.type;
                row.last_event_timestamp = event.timestamp;
                FileQueries::upsert(txn, row);
            }
        }
        return std::make_pair(id, usage);
    });

    log_->trace("[CatalogStore] event_recorded id={} type={} volume={} path={}",
                eventId, Event::toString(event.type), event.volume_id, event.path);

    if (usageRefreshDue(state, now(), cfg_.catalog)) refreshUsage(event.volume_id, state);
    return eventId;
}

void CatalogStore::upsertFile(const FileRecord& file) {
    if (filter_.ignored(file.path)) return;
    tx_->write("CatalogStore::upsertFile", [&](pqxx::work& txn) { FileQueries::upsert(txn, file); });
}

void CatalogStore::markFileDeleted(const std::string& volumeId, const std::string& path, const std::string& directory,
                                   const std::time_t at) {
    if (filter_.ignored(path)) return;
    tx_->write("CatalogStore::markFileDeleted", [&](pqxx::work& txn) {
        FileQueries::markDeleted(txn, volumeId, path, directory, at);
    });
}

void CatalogStore::persistIdentity(const VolumeIdentity& identity) {
    if (identity.volume_id.empty()) throw std::invalid_argument("persistIdentity: empty volume_id");
    tx_->write("CatalogStore::persistIdentity", [&](pqxx::work& txn) {
        VolumeQueries::upsertIdentity(txn, identity);
    });
    log_->debug("[CatalogStore] identity_persisted volume={} directory={}", identity.volume_id, identity.directory);
}

bool CatalogStore::refreshUsageIfDue(const std::string& volumeId) {
    const auto state = tx_->read("CatalogStore::usageState", [&](pqxx::read_transaction& txn) {
        return VolumeQueries::usageState(txn, volumeId);
    });
    if (!state || !usageRefreshDue(*state, now(), cfg_.catalog)) return false;
    refreshUsage(volumeId, *state);
    return true;
}

void CatalogStore::refreshUsage(const std::string& volumeId, const UsageState& state) {
    // Probe outside the gate, statvfs can block on a sleeping disk
    const auto usage = probeDiskUsage(state.directory);
    if (!usage) {
        log_->debug("[CatalogStore] usage_probe_failed volume={} directory={}", volumeId, state.directory);
        return;
    }
    tx_->write("CatalogStore::refreshUsage", [&](pqxx::work& txn) {
        VolumeQueries::updateUsage(txn, volumeId, *usage, now());
    });
    log_->debug("[CatalogStore] usage_refreshed volume={} total={} used={} free={}",
                volumeId, usage->total_bytes, usage->used_bytes, usage->free_bytes);
}

std::vector<VolumeSummary> CatalogStore::summarizeByVolume() {
    return tx_->read("CatalogStore::summarizeByVolume", [](pqxx::read_transaction& txn) {
        return VolumeQueries::summarize(txn);
    });
}

std::vector<Volume> CatalogStore::listVolumes() {
    return tx_->read("CatalogStore::listVolumes", [](pqxx::read_transaction& txn) {
        return VolumeQueries::list(txn);
    });
}

std::optional<Volume> CatalogStore::getVolume(const std::string& volumeId) {
    return tx_->read("CatalogStore::getVolume", [&](pqxx::read_transaction& txn) {
        return VolumeQueries::get(txn, volumeId);
    });
}

std::vector<Event> CatalogStore::listRecentEvents(const std::optional<std::time_t> since, const unsigned int limit) {
    return tx_->read("CatalogStore::listRecentEvents", [&](pqxx::read_transaction& txn) {
        return EventQueries::listRecent(txn, since, limit);
    });
}

std::vector<FileRecord> CatalogStore::listFiles(const std::string& volumeId, const unsigned int limit) {
    return tx_->read("CatalogStore::listFiles", [&](pqxx::read_transaction& txn) {
        return FileQueries::list(txn, volumeId, limit);
    });
}

std::optional<FileRecord> CatalogStore::getFile(const std::string& volumeId, const std::string& path) {
    return tx_->read("CatalogStore::getFile", [&](pqxx::read_transaction& txn) {
        return FileQueries::get(txn, volumeId, path);
    });
}

EventCounts CatalogStore::tallyEvents(const std::string& volumeId) {
    return tx_->read("CatalogStore::tallyEvents", [&](pqxx::read_transaction& txn) {
        return EventQueries::tally(txn, volumeId);
    });
}

void CatalogStore::recomputeCounters(const std::string& volumeId) {
    const bool found = tx_->write("CatalogStore::recomputeCounters", [&](pqxx::work& txn) {
        return VolumeQueries::recount(txn, volumeId);
    });
    if (!found) throw std::runtime_error("Unknown volume: " + volumeId);
    log_->info("[CatalogStore] counters_recomputed volume={}", volumeId);
}

bool CatalogStore::countersConsistent(const std::string& volumeId) {
    return tx_->read("CatalogStore::countersConsistent", [&](pqxx::read_transaction& txn) {
        const auto volume = VolumeQueries::get(txn, volumeId);
        if (!volume) return false;
        const auto t = EventQueries::tally(txn, volumeId);
        return volume->event_count == t.total && volume->created_count == t.created &&
               volume->modified_count == t.modified && volume->deleted_count == t.deleted;
    });
}

JobCreateResult CatalogStore::createJob(const std::string& jobId, const Job::Type type, const std::string& path,
                                        const std::string& volumeId, const int ownerPid, const std::string& ownerHost) {
    return tx_->write("CatalogStore::createJob", [&](pqxx::work& txn) {
        JobQueries::lockSlot(txn, volumeId, type);
        JobCreateResult result;
        if (auto active = JobQueries::findActive(txn, volumeId, type)) {
            result.active = std::move(active);
            return result;
        }
        result.created = JobQueries::insert(txn, jobId, type, path, volumeId, ownerPid, ownerHost);
        return result;
    });
}

std::optional<Job> CatalogStore::transitionJob(const std::string& jobId, const Job::Status to,
                                               const std::optional<std::string>& errorMessage,
                                               const std::optional<JobProgress>& progress) {
    return tx_->write("CatalogStore::transitionJob", [&](pqxx::work& txn) {
        return JobQueries::transition(txn, jobId, to, errorMessage, progress);
    });
}

bool CatalogStore::heartbeatJob(const std::string& jobId, const JobProgress& progress) {
    return tx_->write("CatalogStore::heartbeatJob", [&](pqxx::work& txn) {
        return JobQueries::heartbeat(txn, jobId, progress);
    });
}

std::optional<Job> CatalogStore::getJob(const std::string& jobId) {
    return tx_->read("CatalogStore::getJob", [&](pqxx::read_transaction& txn) {
        return JobQueries::get(txn, jobId);
    });
}

std::vector<Job> CatalogStore::listJobs(const JobFilter& filter) {
    return tx_->read("CatalogStore::listJobs", [&](pqxx::read_transaction& txn) {
        return JobQueries::list(txn, filter);
    });
}

std::vector<Job> CatalogStore::listActiveJobs() {
    return tx_->read("CatalogStore::listActiveJobs", [](pqxx::read_transaction& txn) {
        return JobQueries::listActive(txn);
    });
}

}
