#include "database/DBConnection.hpp"

using namespace vc::database;

void DBConnection::initPreparedJobs() const {
    // Serializes concurrent starts for one (volume_id, job_type) slot until commit
    conn_->prepare("job.lock_slot", "SELECT pg_advisory_xact_lock(hashtext($1))");

    conn_->prepare("job.find_active",
                   "SELECT * FROM jobs WHERE volume_id = $1 AND job_type = $2 "
                   "AND status IN ('pending', 'running') ORDER BY started_at LIMIT 1");

    conn_->prepare("job.insert",
                   "INSERT INTO jobs (job_id, job_type, path, volume_id, status, progress, owner_pid, owner_host, "
                   "                  started_at, updated_at) "
                   "VALUES ($1, $2, $3, $4, 'pending', '{}'::jsonb, $5, $6, NOW(), NOW()) "
                   "RETURNING *");

    // $5 is the set of statuses the job may currently hold; no row back means the move was refused.
    conn_->prepare("job.transition",
                   "UPDATE jobs SET "
                   "  status = $2::text, "
                   "  error_message = COALESCE($3, error_message), "
                   "  progress = COALESCE($4::jsonb, progress), "
                   "  updated_at = NOW(), "
                   "  completed_at = CASE WHEN $2::text IN ('completed', 'failed', 'stopped') "
                   "                      THEN NOW() ELSE completed_at END "
                   "WHERE job_id = $1 AND status = ANY($5::text[]) "
                   "RETURNING *");

    conn_->prepare("job.heartbeat",
                   "UPDATE jobs SET progress = $2::jsonb, updated_at = NOW() "
                   "WHERE job_id = $1 AND status IN ('pending', 'running') "
                   "RETURNING job_id");

    conn_->prepare("job.get", "SELECT * FROM jobs WHERE job_id = $1");

    conn_->prepare("job.list",
                   "SELECT * FROM jobs "
                   "WHERE ($1::text[] IS NULL OR status = ANY($1::text[])) "
                   "  AND ($2::text IS NULL OR job_type = $2::text) "
                   "  AND ($3::text IS NULL OR volume_id = $3::text) "
                   "ORDER BY started_at DESC, job_id LIMIT $4");

    conn_->prepare("job.list_active",
                   "SELECT * FROM jobs WHERE status IN ('pending', 'running') ORDER BY started_at");
}
