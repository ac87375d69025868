#pragma once

#include "types/VolumeIdentity.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace pqxx { class row; }

namespace vc::types {

struct DiskUsage {
    int64_t total_bytes{0};
    int64_t used_bytes{0};
    int64_t free_bytes{0};
};

struct Volume {
    std::string volume_id;
    std::string directory;
    std::optional<int64_t> label_index;   // stable number printed on labels

    int64_t event_count{0};
    int64_t created_count{0};
    int64_t modified_count{0};
    int64_t deleted_count{0};
    std::time_t last_event_timestamp{0};

    std::optional<DiskUsage> usage;
    std::time_t usage_refreshed_at{0};
    int64_t events_since_refresh{0};

    VolumeIdentity identity;

    Volume() = default;
    explicit Volume(const pqxx::row& row);
};

// One row of the per-volume aggregation over the event log, joined with the
// persisted usage and identity snapshot.
struct VolumeSummary {
    std::string volume_id;
    std::string directory;
    int64_t total{0};
    int64_t created{0};
    int64_t modified{0};
    int64_t deleted{0};
    int64_t discovered{0};
    std::time_t last_event_timestamp{0};
    std::optional<DiskUsage> usage;
    std::time_t usage_refreshed_at{0};
    std::string device;
    std::string fs_uuid;
    std::string fs_label;
    std::string serial;
    std::string model;
    std::string vendor;

    VolumeSummary() = default;
    explicit VolumeSummary(const pqxx::row& row);
};

void to_json(nlohmann::json& j, const DiskUsage& u);
void to_json(nlohmann::json& j, const Volume& v);
void to_json(nlohmann::json& j, const VolumeSummary& s);

}
