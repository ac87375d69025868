#pragma once

#include "concurrency/Task.hpp"
#include "scan/ArchivalScanner.hpp"

#include <atomic>
#include <filesystem>
#include <future>
#include <memory>
#include <string>

namespace vc::scan {

// A queued scan. The job stays pending until a pool worker picks it up, so
// the job table shows exactly which scans hold a worker.
struct ScanTask final : concurrency::Task {
    ArchivalScanner& scanner;
    jobs::JobTracker& tracker;
    std::string volumeId;
    std::filesystem::path root;
    std::string jobId;
    std::shared_ptr<std::atomic<bool>> cancel;
    std::promise<ScanStats> promise;

    ScanTask(ArchivalScanner& scanner, jobs::JobTracker& tracker, std::string volumeId, std::filesystem::path root,
             std::string jobId)
        : scanner(scanner), tracker(tracker), volumeId(std::move(volumeId)), root(std::move(root)),
          jobId(std::move(jobId)), cancel(std::make_shared<std::atomic<bool>>(false)) {}

    std::future<ScanStats> getFuture() { return promise.get_future(); }

    void interrupt() const { cancel->store(true); }

    void operator()() override;
};

}
