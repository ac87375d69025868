#pragma once

#include "services/AsyncService.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <set>
#include <vector>

namespace vc::services {

class CatalogEngine;

// true when `dir` is the root of a mounted filesystem
using MountPredicate = std::function<bool(const std::filesystem::path& dir)>;

// stat-based check: the directory sits on a different device than its parent,
// or is its own parent
bool isMountPoint(const std::filesystem::path& dir);

// Immediate subdirectories of each root that satisfy `isMount`. Missing or
// unreadable roots contribute nothing.
std::set<std::filesystem::path> collectMounts(const std::vector<std::filesystem::path>& roots,
                                              const MountPredicate& isMount = isMountPoint);

// Polls the configured roots and attaches/detaches volumes on the engine as
// they come and go. Each tick is idempotent.
class DiscoveryLoop final : public AsyncService {
public:
    DiscoveryLoop(CatalogEngine& engine, std::vector<std::filesystem::path> roots, bool scanNew,
                  std::chrono::seconds interval, std::shared_ptr<spdlog::logger> log,
                  MountPredicate isMount = isMountPoint);
    ~DiscoveryLoop() override;

    // One poll; exposed so enabling discovery can attach current mounts synchronously.
    void tick();

    [[nodiscard]] std::set<std::filesystem::path> autoPaths() const;

protected:
    void runLoop() override;

private:
    CatalogEngine& engine_;
    std::vector<std::filesystem::path> roots_;
    bool scanNew_;
    std::chrono::seconds interval_;
    MountPredicate isMount_;

    mutable std::mutex tickMutex_;
    std::set<std::filesystem::path> autoPaths_;
};

}
