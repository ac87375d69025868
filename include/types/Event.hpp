#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace pqxx { class row; }

namespace vc::types {

struct Event {
    enum class Type : uint8_t {
        CREATED,
        MODIFIED,
        DELETED,
        DISCOVERED
    };

    int64_t id{0};
    std::time_t timestamp{0};
    Type type{Type::DISCOVERED};
    std::string path;
    std::string directory;   // watched root, not the file's parent
    std::string volume_id;
    std::optional<int> process_id;

    Event() = default;
    Event(Type type, std::string path, std::string directory, std::string volume_id);
    explicit Event(const pqxx::row& row);

    static std::string_view toString(Type t) noexcept;
    static bool tryParse(std::string_view s, Type& out) noexcept;
};

void to_json(nlohmann::json& j, const Event& e);

}
