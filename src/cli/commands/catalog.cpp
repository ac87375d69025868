#include "cli/commands.hpp"
#include "cli/Context.hpp"
#include "cli/Router.hpp"
#include "cli/Table.hpp"
#include "cli/argsHelpers.hpp"
#include "catalog/CatalogStore.hpp"
#include "util/timestamp.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace vc::types;

namespace vc::cli {

namespace {

std::string usageCell(const std::optional<DiskUsage>& u) {
    if (!u) return "-";
    return fmt::format("{} / {}", humanBytes(u->used_bytes), humanBytes(u->total_bytes));
}

std::string renderSummaries(const std::vector<VolumeSummary>& rows) {
    if (rows.empty()) return "No volumes catalogued yet.\n";

    Table t({{"VOLUME", Align::Left, 40, true},
             {"DIRECTORY", Align::Left, 40, true},
             {"TOTAL", Align::Right},
             {"CREATED", Align::Right},
             {"MODIFIED", Align::Right},
             {"DELETED", Align::Right},
             {"LAST EVENT"},
             {"USAGE"}});
    for (const auto& s : rows)
        t.add_row({s.volume_id, s.directory, std::to_string(s.total), std::to_string(s.created),
                   std::to_string(s.modified), std::to_string(s.deleted), formatTime(s.last_event_timestamp),
                   usageCell(s.usage)});
    return t.render();
}

CommandResult handleStatus(const CommandCall& call, Context& ctx) {
    auto& store = ctx.store();
    const auto summaries = store.summarizeByVolume();
    const auto active = store.listActiveJobs();

    if (hasFlag(call, "json")) return okJson({{"volumes", summaries}, {"active_jobs", active}});

    std::string out = renderSummaries(summaries);
    out += fmt::format("\n{} active job(s)\n", active.size());
    for (const auto& j : active)
        out += fmt::format("  {} {} {} files={} last={}\n", Job::toString(j.type), Job::toString(j.status),
                           j.volume_id, j.progress.files_processed, j.progress.last_path);
    return ok(out);
}

CommandResult handleEvents(const CommandCall& call, Context& ctx) {
    std::optional<std::time_t> since;
    if (const auto raw = optVal(call, "since")) {
        const auto ts = util::parseTimestampFromString(*raw);
        if (ts == 0) throw std::invalid_argument("--since expects an ISO-8601 timestamp, got '" + *raw + "'");
        since = ts;
    }
    const auto limit = limitOpt(call, 20);

    const auto events = ctx.store().listRecentEvents(since, limit);
    if (hasFlag(call, "json")) return okJson(events);
    if (events.empty()) return ok("No events.\n");

    Table t({{"ID", Align::Right}, {"TIME"}, {"TYPE"}, {"VOLUME", Align::Left, 32, true}, {"PATH", Align::Left, 72, true}});
    for (const auto& e : events)
        t.add_row({std::to_string(e.id), formatTime(e.timestamp), std::string(Event::toString(e.type)), e.volume_id, e.path});
    return ok(t.render());
}

CommandResult handleFiles(const CommandCall& call, Context& ctx) {
    if (call.positionals.size() != 1) throw std::invalid_argument("files expects exactly one VOLUME");
    const auto& volumeId = call.positionals.front();
    const auto limit = limitOpt(call, 50);

    const auto files = ctx.store().listFiles(volumeId, limit);
    if (hasFlag(call, "json")) return okJson(files);
    if (files.empty()) return ok(fmt::format("No files recorded for {}.\n", volumeId));

    Table t({{"PATH", Align::Left, 72, true}, {"SIZE", Align::Right}, {"MODIFIED"}, {"LAST EVENT"}, {"DELETED"}});
    for (const auto& f : files)
        t.add_row({f.path, f.size_bytes ? humanBytes(*f.size_bytes) : "-",
                   f.modified_time ? formatTime(*f.modified_time) : "-",
                   std::string(Event::toString(f.last_event_type)), f.is_deleted ? "yes" : "no"});
    return ok(t.render());
}

CommandResult handleVolumes(const CommandCall& call, Context& ctx) {
    const auto volumes = ctx.store().listVolumes();
    if (hasFlag(call, "json")) return okJson(volumes);
    if (volumes.empty()) return ok("No volumes catalogued yet.\n");

    Table t({{"VOLUME", Align::Left, 40, true}, {"DIRECTORY", Align::Left, 40, true}, {"DEVICE"}, {"LABEL"},
             {"EVENTS", Align::Right}, {"USAGE"}});
    for (const auto& v : volumes)
        t.add_row({v.volume_id, v.directory, v.identity.device.empty() ? "-" : v.identity.device,
                   v.identity.fs_label.empty() ? "-" : v.identity.fs_label, std::to_string(v.event_count),
                   usageCell(v.usage)});
    return ok(t.render());
}

CommandResult handleRecount(const CommandCall& call, Context& ctx) {
    if (call.positionals.size() != 1) throw std::invalid_argument("recount expects exactly one VOLUME");
    const auto& volumeId = call.positionals.front();
    auto& store = ctx.store();

    const bool wasConsistent = store.countersConsistent(volumeId);
    store.recomputeCounters(volumeId);
    const auto t = store.tallyEvents(volumeId);

    if (hasFlag(call, "json"))
        return okJson({{"volume_id", volumeId}, {"was_consistent", wasConsistent}, {"total", t.total},
                       {"created", t.created}, {"modified", t.modified}, {"deleted", t.deleted},
                       {"discovered", t.discovered}});
    return ok(fmt::format("{}: counters {} (total={} created={} modified={} deleted={} discovered={})\n", volumeId,
                          wasConsistent ? "already consistent" : "repaired", t.total, t.created, t.modified,
                          t.deleted, t.discovered));
}

CommandResult handleMigrate(const CommandCall& call, Context& ctx) {
    const auto report = ctx.rawStore().migrate();
    if (hasFlag(call, "json"))
        return okJson({{"applied", report.applied}, {"already_applied", report.already_applied},
                       {"changed", report.changed}});

    std::string out;
    for (const auto& m : report.applied) out += fmt::format("applied  {}\n", m);
    for (const auto& m : report.changed) out += fmt::format("changed  {} (not re-run)\n", m);
    out += fmt::format("{} applied, {} already up to date\n", report.applied.size(), report.already_applied.size());
    return ok(out);
}

}

void registerCatalogCommands(Router& r, Context& ctx) {
    r.registerCommand("status", {"Per-volume event totals and active jobs", "status [--json]",
        [&ctx](const CommandCall& c) { return handleStatus(c, ctx); }, {"st"}, {"json"}});

    r.registerCommand("events", {"Most recent events", "events [--since TS] [--limit N] [--json]",
        [&ctx](const CommandCall& c) { return handleEvents(c, ctx); }, {"log"}, {"json"}});

    r.registerCommand("files", {"Files recorded for a volume", "files VOLUME [--limit N] [--json]",
        [&ctx](const CommandCall& c) { return handleFiles(c, ctx); }, {}, {"json"}});

    r.registerCommand("volumes", {"Known volumes with identity and usage", "volumes [--json]",
        [&ctx](const CommandCall& c) { return handleVolumes(c, ctx); }, {"vols"}, {"json"}});

    r.registerCommand("recount", {"Rebuild a volume's counters from the event log", "recount VOLUME [--json]",
        [&ctx](const CommandCall& c) { return handleRecount(c, ctx); }, {}, {"json"}});

    r.registerCommand("migrate", {"Apply pending schema migrations", "migrate [--json]",
        [&ctx](const CommandCall& c) { return handleMigrate(c, ctx); }, {}, {"json"}});
}

}
