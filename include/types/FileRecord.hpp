#pragma once

#include "types/Event.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace pqxx { class row; }

namespace vc::types {

struct FileRecord {
    std::string volume_id;
    std::string path;
    std::string directory;
    std::optional<int64_t> size_bytes;
    std::optional<std::time_t> modified_time;
    std::optional<std::time_t> created_time;   // st_ctime, the inode change time on Linux
    std::time_t last_event_timestamp{0};
    Event::Type last_event_type{Event::Type::DISCOVERED};
    bool is_deleted{false};

    FileRecord() = default;
    explicit FileRecord(const pqxx::row& row);

    // Fills size and times from lstat(); returns false when the path is gone.
    bool statFrom(const std::filesystem::path& p);
};

void to_json(nlohmann::json& j, const FileRecord& f);

}
