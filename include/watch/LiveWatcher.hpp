#pragma once

#include "config/Config.hpp"
#include "types/Event.hpp"
#include "types/Job.hpp"

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace vc::catalog { class CatalogStore; }
namespace vc::jobs { class JobTracker; }

namespace vc::watch {

struct WatchResult {
    types::Job::Status status{types::Job::Status::STOPPED};
    std::string reason;
    uint64_t events_recorded{0};
    uint64_t errors{0};
};

// Maps an inotify mask to the event it records for a non-directory entry.
std::optional<types::Event::Type> classify(uint32_t mask);

// inotify-backed watch of one directory tree. Blocks in watch() until the
// cancel flag is raised or the directory goes away.
class LiveWatcher {
public:
    LiveWatcher(catalog::CatalogStore& store, jobs::JobTracker& tracker, config::WatcherConfig cfg,
                std::shared_ptr<spdlog::logger> log);

    // Marks the job running, pumps events, then settles it: stopped on cancel
    // or disappearance, failed on anything unexpected.
    WatchResult watch(const std::string& volumeId, const std::filesystem::path& directory, const std::string& jobId,
                      const std::atomic<bool>& cancel);

private:
    catalog::CatalogStore& store_;
    jobs::JobTracker& tracker_;
    config::WatcherConfig cfg_;
    std::shared_ptr<spdlog::logger> log_;

    struct Session {
        int fd{-1};
        int rootWd{-1};
        std::string volumeId;
        std::filesystem::path root;
        std::map<int, std::filesystem::path> watches;
        types::JobProgress progress;
        std::optional<std::string> terminal;   // set once the root is gone

        ~Session();
    };

    void addWatches(Session& s, const std::filesystem::path& dir, bool emitCreated);
    void dropWatchesUnder(Session& s, const std::filesystem::path& dir);
    void dispatch(Session& s, int wd, uint32_t mask, const std::string& name);
    void record(Session& s, types::Event::Type type, const std::filesystem::path& path);
};

}
