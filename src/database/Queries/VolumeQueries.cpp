#include "database/Queries/VolumeQueries.hpp"
#include "types/Event.hpp"
#include "types/Volume.hpp"
#include "types/VolumeIdentity.hpp"
#include "util/timestamp.hpp"

#include <pqxx/pqxx>
#include <nlohmann/json.hpp>

using namespace vc::database;
using namespace vc::types;
using namespace vc::util;

namespace {
    std::optional<std::string> orNull(const std::string& s) {
        return s.empty() ? std::nullopt : std::optional<std::string>(s);
    }

    UsageState usageFromRow(const pqxx::row& row, std::string directory) {
        return {
            std::move(directory),
            row["events_since_refresh"].as<int64_t>(),
            row["usage_refreshed_at"].is_null() ? 0 : parsePostgresTimestamp(row["usage_refreshed_at"].as<std::string>())
        };
    }
}

UsageState VolumeQueries::bumpCounters(pqxx::transaction_base& txn, const Event& event) {
    const pqxx::params p {
        event.volume_id,
        event.directory,
        event.type == Event::Type::CREATED ? 1 : 0,
        event.type == Event::Type::MODIFIED ? 1 : 0,
        event.type == Event::Type::DELETED ? 1 : 0,
        timestampToString(event.timestamp)
    };
    const auto row = txn.exec(pqxx::prepped{"volume.bump_counters"}, p).one_row();
    return usageFromRow(row, event.directory);
}

void VolumeQueries::upsertIdentity(pqxx::transaction_base& txn, const VolumeIdentity& id) {
    const nlohmann::json payload = id;
    const pqxx::params p {
        id.volume_id,
        id.directory,
        orNull(id.device),
        orNull(id.mount_point),
        orNull(id.fs_type),
        orNull(id.fs_uuid),
        orNull(id.fs_label),
        orNull(id.fs_version),
        orNull(id.serial),
        orNull(id.model),
        orNull(id.vendor),
        orNull(id.wwn),
        orNull(id.pt_uuid),
        orNull(id.part_uuid),
        orNull(id.maj_min),
        payload.dump(),
        timestampToString(id.refreshed_at ? id.refreshed_at : now())
    };
    txn.exec(pqxx::prepped{"volume.upsert_identity"}, p).no_rows();
}

std::optional<UsageState> VolumeQueries::usageState(pqxx::transaction_base& txn, const std::string& volumeId) {
    const auto res = txn.exec(pqxx::prepped{"volume.usage_state"}, pqxx::params{volumeId});
    if (res.empty()) return std::nullopt;
    const auto row = res.one_row();
    return usageFromRow(row, row["directory"].as<std::string>());
}

void VolumeQueries::updateUsage(pqxx::transaction_base& txn, const std::string& volumeId, const DiskUsage& usage,
                                const std::time_t refreshedAt) {
    const pqxx::params p {
        volumeId,
        usage.total_bytes,
        usage.used_bytes,
        usage.free_bytes,
        timestampToString(refreshedAt)
    };
    txn.exec(pqxx::prepped{"volume.update_usage"}, p).no_rows();
}

std::optional<Volume> VolumeQueries::get(pqxx::transaction_base& txn, const std::string& volumeId) {
    const auto res = txn.exec(pqxx::prepped{"volume.get"}, pqxx::params{volumeId});
    if (res.empty()) return std::nullopt;
    return Volume(res.one_row());
}

std::vector<Volume> VolumeQueries::list(pqxx::transaction_base& txn) {
    std::vector<Volume> out;
    for (const auto& row : txn.exec(pqxx::prepped{"volume.list"}, pqxx::params{})) out.emplace_back(row);
    return out;
}

std::vector<VolumeSummary> VolumeQueries::summarize(pqxx::transaction_base& txn) {
    std::vector<VolumeSummary> out;
    for (const auto& row : txn.exec(pqxx::prepped{"volume.summary"}, pqxx::params{})) out.emplace_back(row);
    return out;
}

bool VolumeQueries::recount(pqxx::transaction_base& txn, const std::string& volumeId) {
    return !txn.exec(pqxx::prepped{"volume.recount"}, pqxx::params{volumeId}).empty();
}
