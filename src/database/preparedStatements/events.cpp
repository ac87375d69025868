#include "database/DBConnection.hpp"

using namespace vc::database;

void DBConnection::initPreparedEvents() const {
    conn_->prepare("event.insert",
                   "INSERT INTO events (timestamp, event_type, path, directory, volume_id, process_id) "
                   "VALUES ($1::timestamptz, $2, $3, $4, $5, $6) RETURNING id");

    // $1 NULL = no lower bound, $2 NULL = no limit
    conn_->prepare("event.list_recent",
                   "SELECT * FROM events "
                   "WHERE ($1::timestamptz IS NULL OR timestamp >= $1::timestamptz) "
                   "ORDER BY id DESC LIMIT $2");

    conn_->prepare("event.tally_for_volume",
                   "SELECT COUNT(*) AS total, "
                   "  COUNT(*) FILTER (WHERE event_type = 'created') AS created, "
                   "  COUNT(*) FILTER (WHERE event_type = 'modified') AS modified, "
                   "  COUNT(*) FILTER (WHERE event_type = 'deleted') AS deleted, "
                   "  COUNT(*) FILTER (WHERE event_type = 'discovered') AS discovered, "
                   "  MAX(timestamp) AS last_event_timestamp "
                   "FROM events WHERE volume_id = $1");
}
