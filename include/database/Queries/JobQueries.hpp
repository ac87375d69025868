#pragma once

#include "types/Job.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pqxx { class transaction_base; }

namespace vc::database {

struct JobQueries {
    // Blocks until no other transaction holds the (volume_id, job_type) slot.
    static void lockSlot(pqxx::transaction_base& txn, const std::string& volumeId, types::Job::Type type);
    static std::optional<types::Job> findActive(pqxx::transaction_base& txn, const std::string& volumeId,
                                                types::Job::Type type);
    static types::Job insert(pqxx::transaction_base& txn, const std::string& jobId, types::Job::Type type,
                             const std::string& path, const std::string& volumeId, int ownerPid,
                             const std::string& ownerHost);

    // Applies the move only if the job holds one of the allowed source statuses.
    static std::optional<types::Job> transition(pqxx::transaction_base& txn, const std::string& jobId,
                                                types::Job::Status to,
                                                const std::optional<std::string>& errorMessage,
                                                const std::optional<types::JobProgress>& progress);
    static bool heartbeat(pqxx::transaction_base& txn, const std::string& jobId, const types::JobProgress& progress);
    static std::optional<types::Job> get(pqxx::transaction_base& txn, const std::string& jobId);
    static std::vector<types::Job> list(pqxx::transaction_base& txn, const types::JobFilter& filter);
    static std::vector<types::Job> listActive(pqxx::transaction_base& txn);
};

}
