#include "types/Volume.hpp"
#include "util/timestamp.hpp"

#include <pqxx/row>
#include <nlohmann/json.hpp>

using namespace vc::util;

namespace {
    template <typename T>
    T as_or_default(const pqxx::row& r, const char* col, T def) {
        const auto f = r[col];
        return f.is_null() ? def : f.as<T>();
    }

    std::string as_or_empty(const pqxx::row& r, const char* col) {
        const auto f = r[col];
        return f.is_null() ? std::string{} : f.as<std::string>();
    }

    std::time_t ts_or_zero(const pqxx::row& r, const char* col) {
        const auto f = r[col];
        return f.is_null() ? 0 : parsePostgresTimestamp(f.as<std::string>());
    }

    std::optional<vc::types::DiskUsage> usage_of(const pqxx::row& r) {
        if (r["usage_total_bytes"].is_null()) return std::nullopt;
        return vc::types::DiskUsage{
            r["usage_total_bytes"].as<int64_t>(),
            as_or_default<int64_t>(r, "usage_used_bytes", 0),
            as_or_default<int64_t>(r, "usage_free_bytes", 0)
        };
    }

    nlohmann::json ts_json(const std::time_t t) {
        return t ? nlohmann::json(timestampToString(t)) : nlohmann::json(nullptr);
    }
}

namespace vc::types {

Volume::Volume(const pqxx::row& row)
    : volume_id(row["volume_id"].as<std::string>()),
      directory(row["directory"].as<std::string>()),
      label_index(row["label_index"].is_null() ? std::nullopt : std::optional(row["label_index"].as<int64_t>())),
      event_count(as_or_default<int64_t>(row, "event_count", 0)),
      created_count(as_or_default<int64_t>(row, "created_count", 0)),
      modified_count(as_or_default<int64_t>(row, "modified_count", 0)),
      deleted_count(as_or_default<int64_t>(row, "deleted_count", 0)),
      last_event_timestamp(ts_or_zero(row, "last_event_timestamp")),
      usage(usage_of(row)),
      usage_refreshed_at(ts_or_zero(row, "usage_refreshed_at")),
      events_since_refresh(as_or_default<int64_t>(row, "events_since_refresh", 0)) {
    identity.volume_id = volume_id;
    identity.directory = directory;
    identity.device = as_or_empty(row, "mount_device");
    identity.mount_point = as_or_empty(row, "mount_point");
    identity.fs_type = as_or_empty(row, "fs_type");
    identity.fs_uuid = as_or_empty(row, "fs_uuid");
    identity.fs_label = as_or_empty(row, "fs_label");
    identity.fs_version = as_or_empty(row, "fs_version");
    identity.serial = as_or_empty(row, "serial");
    identity.model = as_or_empty(row, "model");
    identity.vendor = as_or_empty(row, "vendor");
    identity.wwn = as_or_empty(row, "wwn");
    identity.pt_uuid = as_or_empty(row, "pt_uuid");
    identity.part_uuid = as_or_empty(row, "part_uuid");
    identity.maj_min = as_or_empty(row, "maj_min");
    identity.refreshed_at = ts_or_zero(row, "identity_refreshed_at");
    if (!row["identity_json"].is_null()) {
        const auto payload = nlohmann::json::parse(row["identity_json"].as<std::string>(), nullptr, false);
        if (payload.is_object() && payload.contains("raw") && payload["raw"].is_object())
            identity.raw = payload["raw"].get<std::map<std::string, std::string>>();
    }
}

VolumeSummary::VolumeSummary(const pqxx::row& row)
    : volume_id(row["volume_id"].as<std::string>()),
      directory(as_or_empty(row, "directory")),
      total(as_or_default<int64_t>(row, "total", 0)),
      created(as_or_default<int64_t>(row, "created", 0)),
      modified(as_or_default<int64_t>(row, "modified", 0)),
      deleted(as_or_default<int64_t>(row, "deleted", 0)),
      discovered(as_or_default<int64_t>(row, "discovered", 0)),
      last_event_timestamp(ts_or_zero(row, "last_event_timestamp")),
      usage(usage_of(row)),
      usage_refreshed_at(ts_or_zero(row, "usage_refreshed_at")),
      device(as_or_empty(row, "mount_device")),
      fs_uuid(as_or_empty(row, "fs_uuid")),
      fs_label(as_or_empty(row, "fs_label")),
      serial(as_or_empty(row, "serial")),
      model(as_or_empty(row, "model")),
      vendor(as_or_empty(row, "vendor")) {}

void to_json(nlohmann::json& j, const DiskUsage& u) {
    j = {
        {"total_bytes", u.total_bytes},
        {"used_bytes", u.used_bytes},
        {"free_bytes", u.free_bytes}
    };
}

void to_json(nlohmann::json& j, const Volume& v) {
    j = {
        {"volume_id", v.volume_id},
        {"directory", v.directory},
        {"label_index", v.label_index ? nlohmann::json(*v.label_index) : nlohmann::json(nullptr)},
        {"event_count", v.event_count},
        {"created_count", v.created_count},
        {"modified_count", v.modified_count},
        {"deleted_count", v.deleted_count},
        {"last_event_timestamp", ts_json(v.last_event_timestamp)},
        {"usage", v.usage ? nlohmann::json(*v.usage) : nlohmann::json(nullptr)},
        {"usage_refreshed_at", ts_json(v.usage_refreshed_at)},
        {"events_since_refresh", v.events_since_refresh},
        {"identity", v.identity}
    };
}

void to_json(nlohmann::json& j, const VolumeSummary& s) {
    j = {
        {"volume_id", s.volume_id},
        {"directory", s.directory},
        {"total", s.total},
        {"created", s.created},
        {"modified", s.modified},
        {"deleted", s.deleted},
        {"discovered", s.discovered},
        {"last_event_timestamp", ts_json(s.last_event_timestamp)},
        {"usage", s.usage ? nlohmann::json(*s.usage) : nlohmann::json(nullptr)},
        {"usage_refreshed_at", ts_json(s.usage_refreshed_at)},
        {"device", s.device},
        {"uuid", s.fs_uuid},
        {"label", s.fs_label},
        {"serial", s.serial},
        {"model", s.model},
        {"vendor", s.vendor}
    };
}

}
