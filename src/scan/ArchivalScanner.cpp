#include "scan/ArchivalScanner.hpp"
#include "catalog/CatalogStore.hpp"
#include "database/errors.hpp"
#include "jobs/JobTracker.hpp"
#include "types/Event.hpp"
#include "types/FileRecord.hpp"

#include <chrono>
#include <system_error>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace vc::types;

namespace vc::scan {

void to_json(nlohmann::json& j, const ScanStats& s) {
    j = {
        {"volume_id", s.volume_id},
        {"job_id", s.job_id},
        {"files_seen", s.files_seen},
        {"files_recorded", s.files_recorded},
        {"errors", s.errors},
        {"bytes", s.bytes},
        {"status", std::string(Job::toString(s.status))},
        {"duration_ms", s.duration_ms}
    };
    if (!s.error.empty()) j["error"] = s.error;
}

bool isVolumeGone(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::no_such_device ||
           ec == std::errc::no_such_device_or_address || ec == std::errc::io_error;
}

ArchivalScanner::ArchivalScanner(catalog::CatalogStore& store, jobs::JobTracker& tracker, config::ScannerConfig cfg,
                                 std::shared_ptr<spdlog::logger> log)
    : store_(store), tracker_(tracker), cfg_(cfg), log_(std::move(log)) {}

void ArchivalScanner::recordFile(const std::string& volumeId, const fs::path& root, const fs::path& file,
                                 ScanStats& stats, JobProgress& progress) {
    ++stats.files_seen;
    progress.files_processed = stats.files_seen;
    progress.last_path = file.string();

    // stat before touching the store so the write gate never waits on the disk
    FileRecord row;
    if (!row.statFrom(file)) {
        log_->debug("[ArchivalScanner] vanished_during_scan path={}", file.string());
        return;
    }
    if (row.size_bytes) stats.bytes += static_cast<uint64_t>(*row.size_bytes);

    try {
        store_.recordChange(Event(Event::Type::DISCOVERED, file.string(), root.string(), volumeId), row);
        ++stats.files_recorded;
        progress.events_recorded = stats.files_recorded;
    } catch (const database::StoreBusy& e) {
        // one dropped write does not fail the job
        ++stats.errors;
        progress.errors = stats.errors;
        log_->error("[ArchivalScanner] write_dropped volume={} path={} error={}", volumeId, file.string(), e.what());
    }
}

ScanStats ArchivalScanner::scan(const std::string& volumeId, const fs::path& root, const std::string& jobId,
                                const std::atomic<bool>& cancel) {
    const auto started = std::chrono::steady_clock::now();
    ScanStats stats;
    stats.volume_id = volumeId;
    stats.job_id = jobId;
    JobProgress progress;

    const auto finish = [&](const Job::Status status, const std::string& error = {}) {
        stats.status = status;
        stats.error = error;
        stats.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        progress.total_known = stats.files_seen;

        switch (status) {
        case Job::Status::COMPLETED: tracker_.complete(jobId, progress); break;
        case Job::Status::FAILED: tracker_.fail(jobId, error, progress); break;
        default: tracker_.stop(jobId, error.empty() ? std::nullopt : std::optional(error), progress); break;
        }

        log_->info("[ArchivalScanner] scan_{} volume={} job={} files={} recorded={} errors={} bytes={} duration_ms={}",
                   Job::toString(status), volumeId, jobId, stats.files_seen, stats.files_recorded, stats.errors,
                   stats.bytes, stats.duration_ms);
        return stats;
    };

    log_->info("[ArchivalScanner] scan_started volume={} job={} root={}", volumeId, jobId, root.string());

    const auto& filter = store_.fileFilter();
    auto options = fs::directory_options::skip_permission_denied;
    if (cfg_.follow_symlinks) options |= fs::directory_options::follow_directory_symlink;

    try {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            if (ec && !isVolumeGone(ec)) return finish(Job::Status::FAILED, ec.message());
            return finish(Job::Status::STOPPED, "volume unavailable");
        }

        // skip_permission_denied would turn an unreadable root into an empty walk
        if (fs::directory_iterator rootIt(root, ec); ec) {
            if (isVolumeGone(ec)) return finish(Job::Status::STOPPED, "volume unavailable");
            return finish(Job::Status::FAILED, root.string() + ": " + ec.message());
        }

        fs::recursive_directory_iterator it(root, options, ec), end;
        if (ec) {
            if (isVolumeGone(ec)) return finish(Job::Status::STOPPED, "volume unavailable");
            return finish(Job::Status::FAILED, ec.message());
        }

        for (; it != end; it.increment(ec)) {
            if (ec) {
                // an unreadable subtree costs that subtree only, unless the volume itself is gone
                std::error_code rootEc;
                if (!fs::exists(root, rootEc)) return finish(Job::Status::STOPPED, "volume unavailable");
                ++stats.errors;
                progress.errors = stats.errors;
                log_->warn("[ArchivalScanner] walk_error volume={} error={}", volumeId, ec.message());
                ec.clear();
                continue;
            }

            if (cancel.load()) return finish(Job::Status::STOPPED, "cancelled");

            const auto& entry = *it;
            if (filter.ignored(entry.path())) {
                if (entry.is_directory(ec)) it.disable_recursion_pending();
                ec.clear();
                continue;
            }

            std::error_code typeEc;
            if (!entry.is_regular_file(typeEc) || entry.is_symlink(typeEc)) continue;

            recordFile(volumeId, root, entry.path(), stats, progress);

            if (stats.files_seen % cfg_.progress_every == 0) {
                try {
                    tracker_.heartbeat(jobId, progress);
                } catch (const database::StoreBusy& e) {
                    log_->warn("[ArchivalScanner] heartbeat_dropped job={} error={}", jobId, e.what());
                }
            }
        }
    } catch (const fs::filesystem_error& e) {
        if (isVolumeGone(e.code())) return finish(Job::Status::STOPPED, "volume unavailable");
        return finish(Job::Status::FAILED, e.what());
    }

    if (cancel.load()) return finish(Job::Status::STOPPED, "cancelled");
    return finish(Job::Status::COMPLETED);
}

}
