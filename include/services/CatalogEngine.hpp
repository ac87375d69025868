#pragma once

#include "config/Config.hpp"
#include "scan/ArchivalScanner.hpp"
#include "watch/LiveWatcher.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include <spdlog/spdlog.h>

namespace vc::catalog { class CatalogStore; }
namespace vc::jobs { class JobTracker; }
namespace vc::identity { class IdentityResolver; }
namespace vc::concurrency { class ThreadPool; }
namespace vc::scan { struct ScanTask; }
namespace vc::watch { class WatchSession; }

namespace vc::services {

class DiscoveryLoop;

struct EngineLoggers {
    std::shared_ptr<spdlog::logger> engine;
    std::shared_ptr<spdlog::logger> scanner;
    std::shared_ptr<spdlog::logger> watcher;
    std::shared_ptr<spdlog::logger> discovery;
};

struct WatchTarget {
    std::filesystem::path directory;
    std::string volume_id;
    bool auto_discovered{false};
};

struct TargetStatus {
    WatchTarget target;
    bool watching{false};
    std::string watch_job_id;
    std::optional<watch::WatchResult> watch_result;
    std::string scan_state;                 // none, pending, running, or the final job status
    std::optional<scan::ScanStats> scan;
};

void to_json(nlohmann::json& j, const TargetStatus& s);

// Owns the per-volume work: scans on the bounded pool, one watch session per
// directory, and the optional discovery loop feeding both.
class CatalogEngine {
public:
    CatalogEngine(catalog::CatalogStore& store, jobs::JobTracker& tracker,
                  std::shared_ptr<identity::IdentityResolver> resolver, config::Config cfg, EngineLoggers logs);
    ~CatalogEngine();

    CatalogEngine(const CatalogEngine&) = delete;
    CatalogEngine& operator=(const CatalogEngine&) = delete;

    // Recovers orphaned jobs and loads the known volumes from the store.
    void init();

    // Resolves and persists the identity (unless `volumeId` is given) and
    // registers the directory; starts its watch when the engine is running.
    WatchTarget addDirectory(const std::filesystem::path& path, const std::optional<std::string>& volumeId = std::nullopt);
    bool removeDirectory(const std::filesystem::path& path);

    // Queues one scan job per target on the pool. A target that already has
    // an active scan counts as satisfied. With `wait`, blocks for the results.
    std::vector<scan::ScanStats> runInitialScans(const std::vector<std::filesystem::path>& targets = {},
                                                 bool wait = true);

    void startAll();
    // Final: cancels scans, stops watches and discovery, drains the pool.
    void stopAll();

    [[nodiscard]] std::vector<TargetStatus> status();
    [[nodiscard]] std::vector<std::filesystem::path> currentPaths() const;
    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] unsigned int scanWorkers() const { return workers_; }
    [[nodiscard]] concurrency::ThreadPool& scanPool();

    void enableAutoDiscovery(const std::vector<std::filesystem::path>& roots, bool scanNew,
                             std::chrono::seconds interval);
    void disableAutoDiscovery();

    // Discovery hooks
    void attach(const std::filesystem::path& path, bool scanNew);
    // Drops watch sessions that ended on their own; auto-discovered targets are
    // forgotten with them, and their scans cancelled, so discovery can
    // re-attach the volume when it returns.
    size_t reap();

private:
    struct ScanHandle {
        std::shared_ptr<scan::ScanTask> task;
        std::shared_future<scan::ScanStats> result;
    };

    catalog::CatalogStore& store_;
    jobs::JobTracker& tracker_;
    std::shared_ptr<identity::IdentityResolver> resolver_;
    config::Config cfg_;
    EngineLoggers logs_;
    unsigned int workers_;

    scan::ArchivalScanner scanner_;
    watch::LiveWatcher watcher_;
    std::unique_ptr<concurrency::ThreadPool> pool_;
    std::unique_ptr<DiscoveryLoop> discovery_;

    mutable std::mutex mutex_;
    std::map<std::filesystem::path, WatchTarget> targets_;
    std::map<std::filesystem::path, std::unique_ptr<watch::WatchSession>> sessions_;
    std::map<std::filesystem::path, ScanHandle> scans_;
    std::map<std::string, std::string> knownVolumes_;   // volume_id -> last directory
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};

    WatchTarget registerDirectory(const std::filesystem::path& path, const std::optional<std::string>& volumeId,
                                  bool autoDiscovered);
    void startWatch(const WatchTarget& target);
    static std::filesystem::path normalize(const std::filesystem::path& p);
};

}
