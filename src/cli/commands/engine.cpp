#include "cli/commands.hpp"
#include "cli/Context.hpp"
#include "cli/Router.hpp"
#include "cli/Table.hpp"
#include "cli/argsHelpers.hpp"
#include "logging/LogRegistry.hpp"
#include "services/CatalogEngine.hpp"

#include <algorithm>
#include <csignal>
#include <ctime>
#include <system_error>
#include <pthread.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace vc::types;

namespace vc::cli {

namespace {

void applyWorkers(const CommandCall& call, Context& ctx) {
    const auto raw = optVal(call, std::vector<std::string>{"workers", "w"});
    if (!raw) return;
    const auto n = parseUInt(*raw);
    if (!n || *n == 0) throw std::invalid_argument("--workers expects a positive integer, got '" + *raw + "'");
    ctx.mutableConfig().scanner.max_scan_workers = *n;
}

std::vector<fs::path> toPaths(const std::vector<std::string>& raw) {
    return {raw.begin(), raw.end()};
}

std::string renderScans(const std::vector<scan::ScanStats>& results) {
    Table t({{"VOLUME", Align::Left, 40, true}, {"STATUS"}, {"FILES", Align::Right}, {"RECORDED", Align::Right},
             {"ERRORS", Align::Right}, {"SIZE", Align::Right}, {"MS", Align::Right}, {"NOTE", Align::Left, 48, true}});
    for (const auto& s : results)
        t.add_row({s.volume_id, std::string(Job::toString(s.status)), std::to_string(s.files_seen),
                   std::to_string(s.files_recorded), std::to_string(s.errors),
                   humanBytes(static_cast<int64_t>(s.bytes)), std::to_string(s.duration_ms), s.error});
    return t.render();
}

CommandResult handleScan(const CommandCall& call, Context& ctx) {
    if (call.positionals.empty()) throw std::invalid_argument("scan expects at least one DIR");
    applyWorkers(call, ctx);

    auto& engine = ctx.engine();
    std::vector<fs::path> dirs;
    for (const auto& p : toPaths(call.positionals)) dirs.push_back(engine.addDirectory(p).directory);

    const auto results = engine.runInitialScans(dirs, true);
    const bool anyFailed = std::ranges::any_of(results, [](const auto& s) { return s.status == Job::Status::FAILED; });

    CommandResult res = hasFlag(call, "json") ? okJson(results) : ok(renderScans(results));
    if (anyFailed) {
        res.exit_code = 1;
        res.stderr_text = "one or more scans failed";
    }
    return res;
}

CommandResult handleRun(const CommandCall& call, Context& ctx) {
    applyWorkers(call, ctx);
    const auto& cfg = ctx.config();

    auto roots = toPaths(optVals(call, "discover"));
    if (roots.empty()) roots = cfg.discovery.roots;
    if (call.positionals.empty() && roots.empty())
        throw std::invalid_argument("run needs at least one DIR, a --discover ROOT, or discovery.roots in the config");

    const bool scanFirst = !hasFlag(call, "no-scan") && cfg.scanner.auto_scan;

    // Block before any worker thread exists so only this thread receives them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (const int rc = ::pthread_sigmask(SIG_BLOCK, &signals, nullptr); rc != 0)
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask");

    auto& engine = ctx.engine();
    const auto log = logging::LogRegistry::volcat();

    std::vector<fs::path> dirs;
    for (const auto& p : toPaths(call.positionals)) dirs.push_back(engine.addDirectory(p).directory);

    engine.startAll();
    if (scanFirst && !dirs.empty()) engine.runInitialScans(dirs, false);
    if (!roots.empty()) engine.enableAutoDiscovery(roots, scanFirst, cfg.discovery.poll_interval);

    log->info("[volcat] running directories={} discovery_roots={} scan={} workers={}",
              dirs.size(), roots.size(), scanFirst, engine.scanWorkers());

    int received = 0;
    while (true) {
        const timespec tick{1, 0};
        const int sig = ::sigtimedwait(&signals, nullptr, &tick);
        if (sig > 0) {
            received = sig;
            break;
        }

        if (roots.empty()) {
            engine.reap();
            const auto st = engine.status();
            if (std::ranges::none_of(st, [](const auto& s) { return s.watching; })) {
                log->warn("[volcat] every watcher has ended, exiting");
                break;
            }
        }
    }

    if (received) log->info("[volcat] received {}, shutting down", received == SIGINT ? "SIGINT" : "SIGTERM");
    const auto summary = engine.status();
    engine.stopAll();

    if (hasFlag(call, "json")) return okJson(summary);

    std::string out;
    for (const auto& s : summary)
        out += fmt::format("{}  {}  scan={}{}\n", s.target.directory.string(), s.target.volume_id, s.scan_state,
                           s.watch_result ? " watch=" + s.watch_result->reason : std::string{});
    return ok(out);
}

}

void registerEngineCommands(Router& r, Context& ctx) {
    r.registerCommand("run", {"Watch directories (and discovered mounts) until interrupted",
        "run [DIR...] [--no-scan] [--discover ROOT]... [--workers N] [--json]",
        [&ctx](const CommandCall& c) { return handleRun(c, ctx); }, {"watch"}, {"no-scan", "json"}});

    r.registerCommand("scan", {"One-shot archival scan of each DIR", "scan DIR... [--workers N] [--json]",
        [&ctx](const CommandCall& c) { return handleScan(c, ctx); }, {}, {"json"}});
}

}
