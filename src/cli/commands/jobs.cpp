#include "cli/commands.hpp"
#include "cli/Context.hpp"
#include "cli/Router.hpp"
#include "cli/Table.hpp"
#include "cli/argsHelpers.hpp"
#include "catalog/CatalogStore.hpp"
#include "util/timestamp.hpp"

#include <sstream>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace vc::types;

namespace vc::cli {

namespace {

JobFilter parseJobFilter(const CommandCall& call) {
    JobFilter filter;
    filter.limit = limitOpt(call, 0);

    if (const auto raw = optVal(call, "status")) {
        std::stringstream ss(*raw);
        std::string part;
        while (std::getline(ss, part, ',')) {
            if (part.empty()) continue;
            Job::Status s;
            if (!Job::tryParse(part, s)) throw std::invalid_argument("Unknown job status: " + part);
            filter.statuses.push_back(s);
        }
    } else if (!hasFlag(call, "all")) {
        filter.statuses = {Job::Status::PENDING, Job::Status::RUNNING};
    }

    if (const auto raw = optVal(call, "type")) {
        Job::Type t;
        if (!Job::tryParse(*raw, t)) throw std::invalid_argument("Unknown job type: " + *raw);
        filter.type = t;
    }

    if (const auto raw = optVal(call, "volume")) filter.volume_id = *raw;
    return filter;
}

CommandResult handleJobs(const CommandCall& call, Context& ctx) {
    const auto filter = parseJobFilter(call);
    const auto jobs = ctx.store().listJobs(filter);
    const auto now = util::now();
    const auto stallAfter = ctx.config().jobs.stall_after.count();

    if (hasFlag(call, "json")) {
        auto arr = nlohmann::json::array();
        for (const auto& j : jobs) {
            nlohmann::json row = j;
            row["stalled"] = j.looksStalled(now, stallAfter);
            arr.push_back(std::move(row));
        }
        return okJson(arr);
    }

    if (jobs.empty()) return ok("No matching jobs.\n");

    Table t({{"JOB", Align::Left, 36}, {"TYPE"}, {"STATUS"}, {"VOLUME", Align::Left, 32, true},
             {"FILES", Align::Right}, {"UPDATED"}, {"NOTE", Align::Left, 48, true}});
    for (const auto& j : jobs) {
        std::string note = j.error_message;
        if (j.looksStalled(now, stallAfter)) note = note.empty() ? "stalled" : "stalled: " + note;
        t.add_row({j.job_id, std::string(Job::toString(j.type)), std::string(Job::toString(j.status)), j.volume_id,
                   std::to_string(j.progress.files_processed), formatTime(j.updated_at), note});
    }
    return ok(t.render());
}

}

void registerJobCommands(Router& r, Context& ctx) {
    r.registerCommand("jobs", {"Scan and watch jobs (active by default)",
        "jobs [--all] [--status S[,S]] [--type scan|watch] [--volume V] [--limit N] [--json]",
        [&ctx](const CommandCall& c) { return handleJobs(c, ctx); }, {}, {"json", "all"}});
}

}
