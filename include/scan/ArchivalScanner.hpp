#pragma once

#include "config/Config.hpp"
#include "types/Job.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <nlohmann/json_fwd.hpp>
#include <spdlog/spdlog.h>

namespace vc::catalog { class CatalogStore; }
namespace vc::jobs { class JobTracker; }

namespace vc::scan {

struct ScanStats {
    std::string volume_id;
    std::string job_id;
    uint64_t files_seen{0};
    uint64_t files_recorded{0};
    uint64_t errors{0};
    uint64_t bytes{0};
    types::Job::Status status{types::Job::Status::PENDING};
    std::string error;
    int64_t duration_ms{0};
};

void to_json(nlohmann::json& j, const ScanStats& s);

// One-shot backfill of a volume. Every regular file yields a `discovered`
// event plus a files upsert; an unchanged tree re-scans to no net change.
class ArchivalScanner {
public:
    ArchivalScanner(catalog::CatalogStore& store, jobs::JobTracker& tracker, config::ScannerConfig cfg,
                    std::shared_ptr<spdlog::logger> log);

    // Runs the walk and settles the job: completed, stopped (cancelled or the
    // volume went away) or failed (any other I/O error). Never throws for I/O.
    ScanStats scan(const std::string& volumeId, const std::filesystem::path& root, const std::string& jobId,
                   const std::atomic<bool>& cancel);

private:
    catalog::CatalogStore& store_;
    jobs::JobTracker& tracker_;
    config::ScannerConfig cfg_;
    std::shared_ptr<spdlog::logger> log_;

    void recordFile(const std::string& volumeId, const std::filesystem::path& root,
                    const std::filesystem::path& file, ScanStats& stats, types::JobProgress& progress);
};

// ENOENT/ENODEV/ENXIO/EIO on the root itself: media was pulled, not an error.
bool isVolumeGone(const std::error_code& ec);

}
