#include "types/Event.hpp"
#include "util/timestamp.hpp"

#include <pqxx/row>
#include <nlohmann/json.hpp>

using namespace vc::types;
using namespace vc::util;

Event::Event(const Type type, std::string path, std::string directory, std::string volume_id)
    : timestamp(now()),
      type(type),
      path(std::move(path)),
      directory(std::move(directory)),
      volume_id(std::move(volume_id)) {}

Event::Event(const pqxx::row& row)
    : id(row["id"].as<int64_t>()),
      timestamp(parsePostgresTimestamp(row["timestamp"].as<std::string>())),
      path(row["path"].as<std::string>()),
      directory(row["directory"].as<std::string>()),
      volume_id(row["volume_id"].as<std::string>()),
      process_id(row["process_id"].is_null() ? std::nullopt : std::optional<int>(row["process_id"].as<int>())) {
    if (auto t = Type::DISCOVERED; tryParse(row["event_type"].as<std::string>(), t)) type = t;
}

std::string_view Event::toString(const Type t) noexcept {
    switch (t) {
    case Type::CREATED: return "created";
    case Type::MODIFIED: return "modified";
    case Type::DELETED: return "deleted";
    case Type::DISCOVERED: return "discovered";
    }
    return "discovered";
}

bool Event::tryParse(const std::string_view s, Type& out) noexcept {
    if (s == "created") { out = Type::CREATED; return true; }
    if (s == "modified") { out = Type::MODIFIED; return true; }
    if (s == "deleted") { out = Type::DELETED; return true; }
    if (s == "discovered") { out = Type::DISCOVERED; return true; }
    return false;
}

void vc::types::to_json(nlohmann::json& j, const Event& e) {
    j = {
        {"id", e.id},
        {"timestamp", timestampToString(e.timestamp)},
        {"event_type", Event::toString(e.type)},
        {"path", e.path},
        {"directory", e.directory},
        {"volume_id", e.volume_id},
    };
    if (e.process_id) j["process_id"] = *e.process_id;
    else j["process_id"] = nullptr;
}
