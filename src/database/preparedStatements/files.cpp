#include "database/DBConnection.hpp"

using namespace vc::database;

void DBConnection::initPreparedFiles() const {
    // A 'discovered' write over an unchanged live row touches nothing, so re-scans are no-ops.
    conn_->prepare("file.upsert",
                   "INSERT INTO files (volume_id, path, directory, size_bytes, modified_time, created_time, "
                   "                   last_event_timestamp, last_event_type, is_deleted) "
                   "VALUES ($1, $2, $3, $4, $5::timestamptz, $6::timestamptz, $7::timestamptz, $8, FALSE) "
                   "ON CONFLICT (volume_id, path) DO UPDATE SET "
                   "  directory = EXCLUDED.directory, "
                   "  size_bytes = EXCLUDED.size_bytes, "
                   "  modified_time = EXCLUDED.modified_time, "
                   "  created_time = EXCLUDED.created_time, "
                   "  last_event_timestamp = EXCLUDED.last_event_timestamp, "
                   "  last_event_type = EXCLUDED.last_event_type, "
                   "  is_deleted = FALSE "
                   "WHERE EXCLUDED.last_event_type <> 'discovered' "
                   "   OR files.is_deleted "
                   "   OR files.size_bytes IS DISTINCT FROM EXCLUDED.size_bytes "
                   "   OR files.modified_time IS DISTINCT FROM EXCLUDED.modified_time "
                   "   OR files.created_time IS DISTINCT FROM EXCLUDED.created_time");

    // Keeps size and times; an unknown path becomes a tombstone row.
    conn_->prepare("file.mark_deleted",
                   "INSERT INTO files (volume_id, path, directory, last_event_timestamp, last_event_type, is_deleted) "
                   "VALUES ($1, $2, $3, $4::timestamptz, 'deleted', TRUE) "
                   "ON CONFLICT (volume_id, path) DO UPDATE SET "
                   "  last_event_timestamp = EXCLUDED.last_event_timestamp, "
                   "  last_event_type = 'deleted', "
                   "  is_deleted = TRUE");

    conn_->prepare("file.get", "SELECT * FROM files WHERE volume_id = $1 AND path = $2");

    conn_->prepare("file.list", "SELECT * FROM files WHERE volume_id = $1 ORDER BY path LIMIT $2");
}
