#include "services/DiscoveryLoop.hpp"
#include "services/CatalogEngine.hpp"

#include <algorithm>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace vc::services {

bool isMountPoint(const fs::path& dir) {
    struct stat self{}, parent{};
    if (::stat(dir.c_str(), &self) != 0 || !S_ISDIR(self.st_mode)) return false;
    if (::stat((dir / "..").c_str(), &parent) != 0) return false;
    return self.st_dev != parent.st_dev || self.st_ino == parent.st_ino;
}

std::set<fs::path> collectMounts(const std::vector<fs::path>& roots, const MountPredicate& isMount) {
    std::set<fs::path> found;
    for (const auto& root : roots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) continue;

        for (fs::directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
             !ec && it != end; it.increment(ec)) {
            std::error_code dec;
            if (!it->is_directory(dec)) continue;
            auto resolved = fs::weakly_canonical(it->path(), dec);
            if (dec) continue;
            if (isMount(resolved)) found.insert(std::move(resolved));
        }
    }
    return found;
}

DiscoveryLoop::DiscoveryLoop(CatalogEngine& engine, std::vector<fs::path> roots, const bool scanNew,
                             const std::chrono::seconds interval, std::shared_ptr<spdlog::logger> log,
                             MountPredicate isMount)
    : AsyncService("DiscoveryLoop", std::move(log)),
      engine_(engine),
      roots_(std::move(roots)),
      scanNew_(scanNew),
      interval_(std::max(interval, std::chrono::seconds(1))),
      isMount_(std::move(isMount)) {}

DiscoveryLoop::~DiscoveryLoop() {
    stop();
}

std::set<fs::path> DiscoveryLoop::autoPaths() const {
    std::scoped_lock lock(tickMutex_);
    return autoPaths_;
}

void DiscoveryLoop::runLoop() {
    while (!interruptFlag_.load()) {
        try {
            tick();
        } catch (const std::exception& e) {
            log_->error("[DiscoveryLoop] tick_failed error={}", e.what());
        }
        if (!waitFor(interval_)) break;
    }
}

void DiscoveryLoop::tick() {
    std::scoped_lock lock(tickMutex_);

    engine_.reap();

    const auto discovered = collectMounts(roots_, isMount_);
    const auto attachedList = engine_.currentPaths();
    const std::set<fs::path> attached(attachedList.begin(), attachedList.end());

    std::vector<fs::path> appeared;
    for (const auto& p : discovered)
        if (!attached.contains(p)) appeared.push_back(p);

    for (const auto& p : appeared) {
        try {
            engine_.attach(p, scanNew_);
            autoPaths_.insert(p);
            log_->info("[DiscoveryLoop] mount_appeared path={}", p.string());
        } catch (const std::exception& e) {
            // left out of autoPaths_, so the next tick retries
            log_->error("[DiscoveryLoop] attach_failed path={} error={}", p.string(), e.what());
        }
    }

    for (auto it = autoPaths_.begin(); it != autoPaths_.end();) {
        if (discovered.contains(*it)) {
            ++it;
            continue;
        }
        log_->info("[DiscoveryLoop] mount_vanished path={}", it->string());
        engine_.removeDirectory(*it);
        it = autoPaths_.erase(it);
    }
}

}
