#include "database/Queries/JobQueries.hpp"

#include <pqxx/pqxx>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace vc::database;
using namespace vc::types;

namespace {
    std::string slotKey(const std::string& volumeId, const Job::Type type) {
        return fmt::format("volcat.job|{}|{}", volumeId, Job::toString(type));
    }

    // Postgres text[] literal; status names never need quoting.
    std::string statusArray(const std::vector<Job::Status>& statuses) {
        std::vector<std::string_view> names;
        for (const auto s : statuses) names.push_back(Job::toString(s));
        return fmt::format("{{{}}}", fmt::join(names, ","));
    }
}

void JobQueries::lockSlot(pqxx::transaction_base& txn, const std::string& volumeId, const Job::Type type) {
    txn.exec(pqxx::prepped{"job.lock_slot"}, pqxx::params{slotKey(volumeId, type)});
}

std::optional<Job> JobQueries::findActive(pqxx::transaction_base& txn, const std::string& volumeId,
                                          const Job::Type type) {
    const auto res = txn.exec(pqxx::prepped{"job.find_active"},
                              pqxx::params{volumeId, std::string(Job::toString(type))});
    if (res.empty()) return std::nullopt;
    return Job(res.one_row());
}

Job JobQueries::insert(pqxx::transaction_base& txn, const std::string& jobId, const Job::Type type,
                       const std::string& path, const std::string& volumeId, const int ownerPid,
                       const std::string& ownerHost) {
    const pqxx::params p {
        jobId,
        std::string(Job::toString(type)),
        path,
        volumeId,
        ownerPid,
        ownerHost
    };
    return Job(txn.exec(pqxx::prepped{"job.insert"}, p).one_row());
}

std::optional<Job> JobQueries::transition(pqxx::transaction_base& txn, const std::string& jobId, const Job::Status to,
                                          const std::optional<std::string>& errorMessage,
                                          const std::optional<JobProgress>& progress) {
    const auto sources = Job::allowedSources(to);
    if (sources.empty()) return std::nullopt;

    const std::optional<std::string> progressJson =
        progress ? std::optional<std::string>(nlohmann::json(*progress).dump()) : std::nullopt;

    const pqxx::params p {
        jobId,
        std::string(Job::toString(to)),
        errorMessage,
        progressJson,
        statusArray(sources)
    };
    const auto res = txn.exec(pqxx::prepped{"job.transition"}, p);
    if (res.empty()) return std::nullopt;
    return Job(res.one_row());
}

bool JobQueries::heartbeat(pqxx::transaction_base& txn, const std::string& jobId, const JobProgress& progress) {
    const auto res = txn.exec(pqxx::prepped{"job.heartbeat"}, pqxx::params{jobId, nlohmann::json(progress).dump()});
    return !res.empty();
}

std::optional<Job> JobQueries::get(pqxx::transaction_base& txn, const std::string& jobId) {
    const auto res = txn.exec(pqxx::prepped{"job.get"}, pqxx::params{jobId});
    if (res.empty()) return std::nullopt;
    return Job(res.one_row());
}

std::vector<Job> JobQueries::list(pqxx::transaction_base& txn, const JobFilter& filter) {
    const pqxx::params p {
        filter.statuses.empty() ? std::nullopt : std::optional<std::string>(statusArray(filter.statuses)),
        filter.type ? std::optional<std::string>(std::string(Job::toString(*filter.type))) : std::nullopt,
        filter.volume_id.empty() ? std::nullopt : std::optional<std::string>(filter.volume_id),
        filter.limit == 0 ? std::nullopt : std::optional<int64_t>(filter.limit)
    };
    std::vector<Job> out;
    for (const auto& row : txn.exec(pqxx::prepped{"job.list"}, p)) out.emplace_back(row);
    return out;
}

std::vector<Job> JobQueries::listActive(pqxx::transaction_base& txn) {
    std::vector<Job> out;
    for (const auto& row : txn.exec(pqxx::prepped{"job.list_active"}, pqxx::params{})) out.emplace_back(row);
    return out;
}
