#include "database/DBConnection.hpp"

using namespace vc::database;

void DBConnection::initPreparedVolumes() const {
    // First event for a volume creates its row; later events bump counters in place.
    // label_index is handed out on insert only and never rewritten.
    conn_->prepare("volume.bump_counters",
                   "INSERT INTO volumes (volume_id, directory, event_count, created_count, modified_count, "
                   "                     deleted_count, last_event_timestamp, events_since_refresh, label_index) "
                   "VALUES ($1, $2, 1, $3, $4, $5, $6::timestamptz, 1, "
                   "        (SELECT COALESCE(MAX(label_index), 0) + 1 FROM volumes)) "
                   "ON CONFLICT (volume_id) DO UPDATE SET "
                   "  directory = EXCLUDED.directory, "
                   "  event_count = volumes.event_count + 1, "
                   "  created_count = volumes.created_count + EXCLUDED.created_count, "
                   "  modified_count = volumes.modified_count + EXCLUDED.modified_count, "
                   "  deleted_count = volumes.deleted_count + EXCLUDED.deleted_count, "
                   "  last_event_timestamp = GREATEST(volumes.last_event_timestamp, EXCLUDED.last_event_timestamp), "
                   "  events_since_refresh = volumes.events_since_refresh + 1 "
                   "RETURNING events_since_refresh, usage_refreshed_at");

    conn_->prepare("volume.upsert_identity",
                   "INSERT INTO volumes (volume_id, directory, mount_device, mount_point, fs_type, fs_uuid, "
                   "                     fs_label, fs_version, serial, model, vendor, wwn, pt_uuid, part_uuid, "
                   "                     maj_min, identity_json, identity_refreshed_at, label_index) "
                   "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16::jsonb, "
                   "        $17::timestamptz, (SELECT COALESCE(MAX(label_index), 0) + 1 FROM volumes)) "
                   "ON CONFLICT (volume_id) DO UPDATE SET "
                   "  directory = EXCLUDED.directory, "
                   "  mount_device = EXCLUDED.mount_device, "
                   "  mount_point = EXCLUDED.mount_point, "
                   "  fs_type = EXCLUDED.fs_type, "
                   "  fs_uuid = EXCLUDED.fs_uuid, "
                   "  fs_label = EXCLUDED.fs_label, "
                   "  fs_version = EXCLUDED.fs_version, "
                   "  serial = EXCLUDED.serial, "
                   "  model = EXCLUDED.model, "
                   "  vendor = EXCLUDED.vendor, "
                   "  wwn = EXCLUDED.wwn, "
                   "  pt_uuid = EXCLUDED.pt_uuid, "
                   "  part_uuid = EXCLUDED.part_uuid, "
                   "  maj_min = EXCLUDED.maj_min, "
                   "  identity_json = EXCLUDED.identity_json, "
                   "  identity_refreshed_at = EXCLUDED.identity_refreshed_at");

    conn_->prepare("volume.usage_state",
                   "SELECT directory, events_since_refresh, usage_refreshed_at FROM volumes WHERE volume_id = $1");

    conn_->prepare("volume.update_usage",
                   "UPDATE volumes SET usage_total_bytes = $2, usage_used_bytes = $3, usage_free_bytes = $4, "
                   "  usage_refreshed_at = $5::timestamptz, events_since_refresh = 0 "
                   "WHERE volume_id = $1");

    conn_->prepare("volume.get", "SELECT * FROM volumes WHERE volume_id = $1");

    conn_->prepare("volume.list", "SELECT * FROM volumes ORDER BY volume_id");

    conn_->prepare("volume.summary",
                   "SELECT v.volume_id, v.directory, "
                   "  COALESCE(e.total, 0) AS total, COALESCE(e.created, 0) AS created, "
                   "  COALESCE(e.modified, 0) AS modified, COALESCE(e.deleted, 0) AS deleted, "
                   "  COALESCE(e.discovered, 0) AS discovered, "
                   "  COALESCE(e.last_ts, v.last_event_timestamp) AS last_event_timestamp, "
                   "  v.usage_total_bytes, v.usage_used_bytes, v.usage_free_bytes, v.usage_refreshed_at, "
                   "  v.mount_device, v.fs_uuid, v.fs_label, v.serial, v.model, v.vendor "
                   "FROM volumes v "
                   "LEFT JOIN ("
                   "  SELECT volume_id, COUNT(*) AS total, "
                   "    COUNT(*) FILTER (WHERE event_type = 'created') AS created, "
                   "    COUNT(*) FILTER (WHERE event_type = 'modified') AS modified, "
                   "    COUNT(*) FILTER (WHERE event_type = 'deleted') AS deleted, "
                   "    COUNT(*) FILTER (WHERE event_type = 'discovered') AS discovered, "
                   "    MAX(timestamp) AS last_ts "
                   "  FROM events GROUP BY volume_id"
                   ") e ON e.volume_id = v.volume_id "
                   "ORDER BY v.volume_id");

    // Rebuilds the counters from the event log, the log being authoritative.
    conn_->prepare("volume.recount",
                   "UPDATE volumes v SET "
                   "  event_count = e.total, created_count = e.created, modified_count = e.modified, "
                   "  deleted_count = e.deleted, last_event_timestamp = e.last_ts "
                   "FROM ("
                   "  SELECT COUNT(*) AS total, "
                   "    COUNT(*) FILTER (WHERE event_type = 'created') AS created, "
                   "    COUNT(*) FILTER (WHERE event_type = 'modified') AS modified, "
                   "    COUNT(*) FILTER (WHERE event_type = 'deleted') AS deleted, "
                   "    MAX(timestamp) AS last_ts "
                   "  FROM events WHERE volume_id = $1"
                   ") e "
                   "WHERE v.volume_id = $1 "
                   "RETURNING v.event_count");
}
