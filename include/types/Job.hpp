#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace pqxx { class row; }

namespace vc::types {

struct JobProgress {
    uint64_t files_processed{0};
    uint64_t total_known{0};
    std::string last_path;
    uint64_t events_recorded{0};
    uint64_t errors{0};
};

struct Job {
    enum class Type : uint8_t {
        SCAN,
        WATCH
    };

    // pending -> running -> {completed | failed | stopped}
    enum class Status : uint8_t {
        PENDING,
        RUNNING,
        COMPLETED,
        FAILED,
        STOPPED
    };

    std::string job_id;
    Type type{Type::SCAN};
    std::string path;
    std::string volume_id;
    Status status{Status::PENDING};
    JobProgress progress;
    std::optional<int> owner_pid;
    std::string owner_host;
    std::string error_message;
    std::time_t started_at{0};
    std::time_t updated_at{0};
    std::time_t completed_at{0};

    Job() = default;
    explicit Job(const pqxx::row& row);

    [[nodiscard]] bool isActive() const noexcept { return isActive(status); }
    [[nodiscard]] bool isTerminal() const noexcept { return !isActive(status); }

    // Running and no heartbeat for stall_after_seconds
    [[nodiscard]] bool looksStalled(std::time_t now, std::time_t stall_after_seconds) const noexcept {
        if (status != Status::RUNNING) return false;
        if (updated_at == 0) return false;
        return now > updated_at && (now - updated_at) >= stall_after_seconds;
    }

    [[nodiscard]] static bool isActive(Status s) noexcept { return s == Status::PENDING || s == Status::RUNNING; }
    [[nodiscard]] static bool canTransition(Status from, Status to) noexcept;
    // Statuses a job must currently hold for a move to `to` to be accepted.
    [[nodiscard]] static std::vector<Status> allowedSources(Status to);

    static std::string_view toString(Type t) noexcept;
    static std::string_view toString(Status s) noexcept;
    static bool tryParse(std::string_view s, Type& out) noexcept;
    static bool tryParse(std::string_view s, Status& out) noexcept;
};

struct JobFilter {
    std::vector<Job::Status> statuses;   // empty = any
    std::optional<Job::Type> type;
    std::string volume_id;
    unsigned int limit{0};               // 0 = no limit
};

void to_json(nlohmann::json& j, const JobProgress& p);
void from_json(const nlohmann::json& j, JobProgress& p);
void to_json(nlohmann::json& j, const Job& job);

}
