#include "services/CatalogEngine.hpp"
#include "services/DiscoveryLoop.hpp"
#include "catalog/CatalogStore.hpp"
#include "concurrency/ThreadPool.hpp"
#include "identity/IdentityResolver.hpp"
#include "jobs/JobTracker.hpp"
#include "scan/ScanTask.hpp"
#include "watch/WatchSession.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <thread>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace vc::types;

namespace vc::services {

void to_json(nlohmann::json& j, const TargetStatus& s) {
    j = {
        {"path", s.target.directory.string()},
        {"volume_id", s.target.volume_id},
        {"auto_discovered", s.target.auto_discovered},
        {"watching", s.watching},
        {"scan_state", s.scan_state}
    };
    if (!s.watch_job_id.empty()) j["watch_job_id"] = s.watch_job_id;
    if (s.watch_result) j["watch_result"] = {
        {"status", std::string(Job::toString(s.watch_result->status))},
        {"reason", s.watch_result->reason},
        {"events_recorded", s.watch_result->events_recorded}
    };
    if (s.scan) j["scan"] = *s.scan;
}

CatalogEngine::CatalogEngine(catalog::CatalogStore& store, jobs::JobTracker& tracker,
                             std::shared_ptr<identity::IdentityResolver> resolver, config::Config cfg,
                             EngineLoggers logs)
    : store_(store),
      tracker_(tracker),
      resolver_(std::move(resolver)),
      cfg_(std::move(cfg)),
      logs_(std::move(logs)),
      workers_(cfg_.scanner.max_scan_workers ? cfg_.scanner.max_scan_workers
                                             : std::max(1u, std::thread::hardware_concurrency())),
      scanner_(store_, tracker_, cfg_.scanner, logs_.scanner),
      watcher_(store_, tracker_, cfg_.watcher, logs_.watcher),
      pool_(std::make_unique<concurrency::ThreadPool>(workers_, logs_.scanner)) {}

CatalogEngine::~CatalogEngine() {
    stopAll();
}

fs::path CatalogEngine::normalize(const fs::path& p) {
    std::error_code ec;
    auto out = fs::weakly_canonical(fs::absolute(p, ec), ec);
    if (ec) return p.lexically_normal();
    return out;
}

void CatalogEngine::init() {
    const auto orphans = tracker_.recover();
    const auto volumes = store_.listVolumes();

    {
        std::scoped_lock lock(mutex_);
        for (const auto& v : volumes) knownVolumes_[v.volume_id] = v.directory;
    }

    logs_.engine->info("[CatalogEngine] initialized known_volumes={} orphaned_jobs_stopped={} scan_workers={}",
                       volumes.size(), orphans, workers_);
}

WatchTarget CatalogEngine::addDirectory(const fs::path& path, const std::optional<std::string>& volumeId) {
    return registerDirectory(path, volumeId, false);
}

WatchTarget CatalogEngine::registerDirectory(const fs::path& path, const std::optional<std::string>& volumeId,
                                             const bool autoDiscovered) {
    const auto dir = normalize(path);

    {
        std::scoped_lock lock(mutex_);
        if (const auto it = targets_.find(dir); it != targets_.end()) return it->second;
    }

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) throw std::invalid_argument("Not a directory: " + dir.string());

    auto identity = resolver_->resolve(dir);
    if (volumeId && !volumeId->empty()) identity.volume_id = *volumeId;
    store_.persistIdentity(identity);

    WatchTarget target{dir, identity.volume_id, autoDiscovered};

    {
        std::scoped_lock lock(mutex_);
        if (const auto known = knownVolumes_.find(target.volume_id);
            known != knownVolumes_.end() && known->second != dir.string())
            logs_.engine->info("[CatalogEngine] volume_remounted volume={} previous={} current={}",
                               target.volume_id, known->second, dir.string());
        knownVolumes_[target.volume_id] = dir.string();

        const auto [it, inserted] = targets_.emplace(dir, target);
        if (!inserted) return it->second;
    }

    logs_.engine->info("[CatalogEngine] directory_added path={} volume={} auto={}",
                       dir.string(), target.volume_id, autoDiscovered);

    if (running_.load()) startWatch(target);
    return target;
}

bool CatalogEngine::removeDirectory(const fs::path& path) {
    const auto dir = normalize(path);
    std::unique_ptr<watch::WatchSession> session;
    std::shared_ptr<scan::ScanTask> scanTask;

    {
        std::scoped_lock lock(mutex_);
        if (targets_.erase(dir) == 0) return false;
        if (const auto it = sessions_.find(dir); it != sessions_.end()) {
            session = std::move(it->second);
            sessions_.erase(it);
        }
        if (const auto it = scans_.find(dir); it != scans_.end()) {
            scanTask = it->second.task;
            scans_.erase(it);
        }
    }

    if (scanTask) scanTask->interrupt();
    if (session) session->stop();

    logs_.engine->info("[CatalogEngine] directory_removed path={}", dir.string());
    return true;
}

std::vector<scan::ScanStats> CatalogEngine::runInitialScans(const std::vector<fs::path>& targets, const bool wait) {
    if (stopped_.load()) throw std::runtime_error("CatalogEngine is stopped");

    std::vector<WatchTarget> chosen;
    {
        std::scoped_lock lock(mutex_);
        if (targets.empty()) {
            for (const auto& [_, t] : targets_) chosen.push_back(t);
        } else {
            for (const auto& p : targets) {
                const auto it = targets_.find(normalize(p));
                if (it == targets_.end()) throw std::invalid_argument("Directory is not registered: " + p.string());
                chosen.push_back(it->second);
            }
        }
    }

    std::vector<scan::ScanStats> results;
    std::vector<ScanHandle> queued;

    for (const auto& t : chosen) {
        const auto start = tracker_.start(Job::Type::SCAN, t.volume_id, t.directory.string());
        if (!start) {
            // already satisfied by the scan that holds the slot
            scan::ScanStats s;
            s.volume_id = t.volume_id;
            s.job_id = start.active_job_id;
            const auto job = tracker_.get(start.active_job_id);
            s.status = job ? job->status : Job::Status::PENDING;
            s.error = "scan already active";
            results.push_back(std::move(s));
            continue;
        }

        auto task = std::make_shared<scan::ScanTask>(scanner_, tracker_, t.volume_id, t.directory, start.job_id);
        ScanHandle handle{task, task->getFuture().share()};
        {
            std::scoped_lock lock(mutex_);
            scans_[t.directory] = handle;
        }

        try {
            pool_->submit(task);
        } catch (const std::exception&) {
            tracker_.stop(start.job_id, std::string("engine stopped"));
            throw;
        }
        queued.push_back(std::move(handle));
    }

    logs_.engine->info("[CatalogEngine] initial_scan_queued targets={} queued={} workers={}",
                       chosen.size(), queued.size(), workers_);

    for (const auto& h : queued) {
        if (wait) {
            results.push_back(h.result.get());
            continue;
        }
        scan::ScanStats s;
        s.volume_id = h.task->volumeId;
        s.job_id = h.task->jobId;
        s.status = Job::Status::PENDING;
        results.push_back(std::move(s));
    }

    return results;
}

void CatalogEngine::startWatch(const WatchTarget& target) {
    {
        std::scoped_lock lock(mutex_);
        if (const auto it = sessions_.find(target.directory); it != sessions_.end() && !it->second->finished()) return;
    }

    const auto start = tracker_.start(Job::Type::WATCH, target.volume_id, target.directory.string());
    if (!start) {
        logs_.engine->info("[CatalogEngine] watch_already_active path={} job={}",
                           target.directory.string(), start.active_job_id);
        return;
    }

    auto session = std::make_unique<watch::WatchSession>(watcher_, target.volume_id, target.directory,
                                                         start.job_id, logs_.watcher);
    session->start();

    std::unique_ptr<watch::WatchSession> previous;
    {
        std::scoped_lock lock(mutex_);
        auto& slot = sessions_[target.directory];
        previous = std::move(slot);
        slot = std::move(session);
    }
}

void CatalogEngine::startAll() {
    if (stopped_.load()) throw std::runtime_error("CatalogEngine is stopped");
    running_.store(true);

    std::vector<WatchTarget> snapshot;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [_, t] : targets_) snapshot.push_back(t);
    }

    for (const auto& t : snapshot) startWatch(t);
    logs_.engine->info("[CatalogEngine] Started {} watchers", snapshot.size());
}

void CatalogEngine::stopAll() {
    if (stopped_.exchange(true)) return;

    logs_.engine->info("[CatalogEngine] Stopping all watchers...");
    disableAutoDiscovery();

    std::vector<std::unique_ptr<watch::WatchSession>> sessions;
    std::vector<std::shared_ptr<scan::ScanTask>> scans;
    {
        std::scoped_lock lock(mutex_);
        for (auto& [_, s] : sessions_) sessions.push_back(std::move(s));
        sessions_.clear();
        for (const auto& [_, h] : scans_) scans.push_back(h.task);
    }

    for (const auto& task : scans) task->interrupt();
    for (const auto& s : sessions) if (s) s->stop();

    // queued scans see their cancel flag and settle as stopped
    pool_->stop();
    running_.store(false);
    logs_.engine->info("[CatalogEngine] stopped watchers={} scans={}", sessions.size(), scans.size());
}

std::vector<TargetStatus> CatalogEngine::status() {
    std::map<std::string, Job::Status> active;
    for (const auto& job : tracker_.active()) active[job.job_id] = job.status;

    std::scoped_lock lock(mutex_);
    std::vector<TargetStatus> out;
    for (const auto& [dir, target] : targets_) {
        TargetStatus st;
        st.target = target;
        st.scan_state = "none";

        if (const auto it = sessions_.find(dir); it != sessions_.end() && it->second) {
            st.watching = !it->second->finished();
            st.watch_job_id = it->second->jobId();
            st.watch_result = it->second->result();
        }

        if (const auto it = scans_.find(dir); it != scans_.end()) {
            const auto& h = it->second;
            if (h.result.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                st.scan = h.result.get();
                st.scan_state = std::string(Job::toString(st.scan->status));
            } else if (const auto a = active.find(h.task->jobId); a != active.end()) {
                st.scan_state = std::string(Job::toString(a->second));
            } else {
                st.scan_state = "pending";
            }
        }
        out.push_back(std::move(st));
    }
    return out;
}

concurrency::ThreadPool& CatalogEngine::scanPool() {
    return *pool_;
}

std::vector<fs::path> CatalogEngine::currentPaths() const {
    std::scoped_lock lock(mutex_);
    std::vector<fs::path> out;
    out.reserve(targets_.size());
    for (const auto& [dir, _] : targets_) out.push_back(dir);
    return out;
}

size_t CatalogEngine::reap() {
    std::vector<std::unique_ptr<watch::WatchSession>> dead;
    std::vector<std::shared_ptr<scan::ScanTask>> orphanedScans;
    {
        std::scoped_lock lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (!it->second || !it->second->finished()) {
                ++it;
                continue;
            }
            if (const auto t = targets_.find(it->first); t != targets_.end() && t->second.auto_discovered) {
                targets_.erase(t);
                // nothing else will cancel this volume's scan once the target is gone
                if (const auto s = scans_.find(it->first); s != scans_.end()) {
                    orphanedScans.push_back(s->second.task);
                    scans_.erase(s);
                }
            }
            dead.push_back(std::move(it->second));
            it = sessions_.erase(it);
        }
    }

    for (const auto& task : orphanedScans) task->interrupt();

    for (const auto& s : dead) {
        const auto res = s->result();
        logs_.engine->info("[CatalogEngine] watcher_reaped path={} volume={} status={} reason={}",
                           s->directory().string(), s->volumeId(),
                           res ? Job::toString(res->status) : std::string_view("unknown"),
                           res ? res->reason : std::string{});
    }
    return dead.size();
}

void CatalogEngine::attach(const fs::path& path, const bool scanNew) {
    const auto target = registerDirectory(path, std::nullopt, true);
    if (scanNew) runInitialScans({target.directory}, false);
}

void CatalogEngine::enableAutoDiscovery(const std::vector<fs::path>& roots, const bool scanNew,
                                        const std::chrono::seconds interval) {
    std::vector<fs::path> unique;
    std::set<fs::path> seen;
    for (const auto& r : roots) {
        auto n = normalize(r);
        if (seen.insert(n).second) unique.push_back(std::move(n));
    }
    if (unique.empty()) return;

    disableAutoDiscovery();

    discovery_ = std::make_unique<DiscoveryLoop>(*this, unique, scanNew, interval, logs_.discovery);
    // attach what is already mounted before the loop starts ticking
    discovery_->tick();
    discovery_->start();
}

void CatalogEngine::disableAutoDiscovery() {
    if (!discovery_) return;
    discovery_->stop();
    discovery_.reset();
}

}
