#include "types/Job.hpp"
#include "util/timestamp.hpp"

#include <pqxx/row>
#include <nlohmann/json.hpp>

using namespace vc::util;

namespace {
    std::time_t ts_or_zero(const pqxx::row& r, const char* col) {
        const auto f = r[col];
        return f.is_null() ? 0 : parsePostgresTimestamp(f.as<std::string>());
    }

    std::string as_or_empty(const pqxx::row& r, const char* col) {
        const auto f = r[col];
        return f.is_null() ? std::string{} : f.as<std::string>();
    }
}

namespace vc::types {

Job::Job(const pqxx::row& row)
    : job_id(row["job_id"].as<std::string>()),
      path(as_or_empty(row, "path")),
      volume_id(as_or_empty(row, "volume_id")),
      owner_pid(row["owner_pid"].is_null() ? std::nullopt : std::optional<int>(row["owner_pid"].as<int>())),
      owner_host(as_or_empty(row, "owner_host")),
      error_message(as_or_empty(row, "error_message")),
      started_at(ts_or_zero(row, "started_at")),
      updated_at(ts_or_zero(row, "updated_at")),
      completed_at(ts_or_zero(row, "completed_at")) {
    if (auto t = Type::SCAN; tryParse(row["job_type"].as<std::string>(), t)) type = t;
    if (auto s = Status::PENDING; tryParse(row["status"].as<std::string>(), s)) status = s;
    if (!row["progress"].is_null()) {
        const auto j = nlohmann::json::parse(row["progress"].as<std::string>(), nullptr, false);
        if (j.is_object()) progress = j.get<JobProgress>();
    }
}

bool Job::canTransition(const Status from, const Status to) noexcept {
    switch (from) {
    case Status::PENDING:
        return to == Status::RUNNING || to == Status::FAILED || to == Status::STOPPED;
    case Status::RUNNING:
        return to == Status::COMPLETED || to == Status::FAILED || to == Status::STOPPED;
    default:
        return false;
    }
}

std::vector<Job::Status> Job::allowedSources(const Status to) {
    std::vector<Status> out;
    for (const auto from : {Status::PENDING, Status::RUNNING, Status::COMPLETED, Status::FAILED, Status::STOPPED})
        if (canTransition(from, to)) out.push_back(from);
    return out;
}

std::string_view Job::toString(const Type t) noexcept {
    return t == Type::WATCH ? "watch" : "scan";
}

std::string_view Job::toString(const Status s) noexcept {
    switch (s) {
    case Status::PENDING: return "pending";
    case Status::RUNNING: return "running";
    case Status::COMPLETED: return "completed";
    case Status::FAILED: return "failed";
    case Status::STOPPED: return "stopped";
    }
    return "pending";
}

bool Job::tryParse(const std::string_view s, Type& out) noexcept {
    if (s == "scan") { out = Type::SCAN; return true; }
    if (s == "watch") { out = Type::WATCH; return true; }
    return false;
}

bool Job::tryParse(const std::string_view s, Status& out) noexcept {
    if (s == "pending") { out = Status::PENDING; return true; }
    if (s == "running") { out = Status::RUNNING; return true; }
    if (s == "completed") { out = Status::COMPLETED; return true; }
    if (s == "failed") { out = Status::FAILED; return true; }
    if (s == "stopped") { out = Status::STOPPED; return true; }
    return false;
}

void to_json(nlohmann::json& j, const JobProgress& p) {
    j = {
        {"files_processed", p.files_processed},
        {"total_known", p.total_known},
        {"last_path", p.last_path},
        {"events_recorded", p.events_recorded},
        {"errors", p.errors}
    };
}

void from_json(const nlohmann::json& j, JobProgress& p) {
    p.files_processed = j.value("files_processed", uint64_t{0});
    p.total_known = j.value("total_known", uint64_t{0});
    p.last_path = j.value("last_path", "");
    p.events_recorded = j.value("events_recorded", uint64_t{0});
    p.errors = j.value("errors", uint64_t{0});
}

void to_json(nlohmann::json& j, const Job& job) {
    const auto ts = [](const std::time_t t) { return t ? nlohmann::json(timestampToString(t)) : nlohmann::json(nullptr); };
    j = {
        {"job_id", job.job_id},
        {"job_type", Job::toString(job.type)},
        {"path", job.path},
        {"volume_id", job.volume_id},
        {"status", Job::toString(job.status)},
        {"progress", job.progress},
        {"owner_pid", job.owner_pid ? nlohmann::json(*job.owner_pid) : nlohmann::json(nullptr)},
        {"owner_host", job.owner_host},
        {"error_message", job.error_message.empty() ? nlohmann::json(nullptr) : nlohmann::json(job.error_message)},
        {"started_at", ts(job.started_at)},
        {"updated_at", ts(job.updated_at)},
        {"completed_at", ts(job.completed_at)}
    };
}

}
