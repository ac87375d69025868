#include "types/FileRecord.hpp"
#include "util/timestamp.hpp"

#include <sys/stat.h>
#include <pqxx/row>
#include <nlohmann/json.hpp>

using namespace vc::types;
using namespace vc::util;

namespace {
    std::optional<std::time_t> tsOrNull(const pqxx::row& r, const char* col) {
        const auto f = r[col];
        if (f.is_null()) return std::nullopt;
        return parsePostgresTimestamp(f.as<std::string>());
    }
}

FileRecord::FileRecord(const pqxx::row& row)
    : volume_id(row["volume_id"].as<std::string>()),
      path(row["path"].as<std::string>()),
      directory(row["directory"].as<std::string>()),
      size_bytes(row["size_bytes"].is_null() ? std::nullopt : std::optional<int64_t>(row["size_bytes"].as<int64_t>())),
      modified_time(tsOrNull(row, "modified_time")),
      created_time(tsOrNull(row, "created_time")),
      last_event_timestamp(tsOrNull(row, "last_event_timestamp").value_or(0)),
      is_deleted(row["is_deleted"].as<bool>()) {
    if (!row["last_event_type"].is_null())
        if (auto t = Event::Type::DISCOVERED; Event::tryParse(row["last_event_type"].as<std::string>(), t))
            last_event_type = t;
}

bool FileRecord::statFrom(const std::filesystem::path& p) {
    struct stat st{};
    if (::lstat(p.c_str(), &st) != 0) return false;
    size_bytes = static_cast<int64_t>(st.st_size);
    modified_time = st.st_mtime;
    created_time = st.st_ctime;
    return true;
}

void vc::types::to_json(nlohmann::json& j, const FileRecord& f) {
    j = {
        {"volume_id", f.volume_id},
        {"path", f.path},
        {"directory", f.directory},
        {"size_bytes", f.size_bytes ? nlohmann::json(*f.size_bytes) : nlohmann::json(nullptr)},
        {"modified_time", f.modified_time ? nlohmann::json(timestampToString(*f.modified_time)) : nlohmann::json(nullptr)},
        {"created_time", f.created_time ? nlohmann::json(timestampToString(*f.created_time)) : nlohmann::json(nullptr)},
        {"last_event_timestamp", timestampToString(f.last_event_timestamp)},
        {"last_event_type", Event::toString(f.last_event_type)},
        {"is_deleted", f.is_deleted},
    };
}
