#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace pqxx { class transaction_base; }
namespace vc::types {
struct Event;
struct Volume;
struct VolumeSummary;
struct VolumeIdentity;
struct DiskUsage;
}

namespace vc::database {

struct UsageState {
    std::string directory;
    int64_t events_since_refresh{0};
    std::time_t usage_refreshed_at{0};   // 0 = never
};

struct VolumeQueries {
    // Creates the row on first sight, then counts the event against it.
    static UsageState bumpCounters(pqxx::transaction_base& txn, const types::Event& event);
    static void upsertIdentity(pqxx::transaction_base& txn, const types::VolumeIdentity& identity);
    static std::optional<UsageState> usageState(pqxx::transaction_base& txn, const std::string& volumeId);
    static void updateUsage(pqxx::transaction_base& txn, const std::string& volumeId, const types::DiskUsage& usage,
                            std::time_t refreshedAt);
    static std::optional<types::Volume> get(pqxx::transaction_base& txn, const std::string& volumeId);
    static std::vector<types::Volume> list(pqxx::transaction_base& txn);
    static std::vector<types::VolumeSummary> summarize(pqxx::transaction_base& txn);
    static bool recount(pqxx::transaction_base& txn, const std::string& volumeId);
};

}
