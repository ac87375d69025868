#include "types/VolumeIdentity.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace vc::util;

namespace vc::types {

void to_json(nlohmann::json& j, const VolumeIdentity& v) {
    j = {
        {"volume_id", v.volume_id},
        {"directory", v.directory},
        {"mount_point", v.mount_point},
        {"device", v.device},
        {"fs_type", v.fs_type},
        {"maj_min", v.maj_min},
        {"uuid", v.fs_uuid},
        {"label", v.fs_label},
        {"fs_version", v.fs_version},
        {"serial", v.serial},
        {"model", v.model},
        {"vendor", v.vendor},
        {"wwn", v.wwn},
        {"pt_uuid", v.pt_uuid},
        {"part_uuid", v.part_uuid},
        {"raw", v.raw},
        {"refreshed_at", v.refreshed_at ? nlohmann::json(timestampToString(v.refreshed_at)) : nlohmann::json(nullptr)}
    };
}

void from_json(const nlohmann::json& j, VolumeIdentity& v) {
    v.volume_id = j.value("volume_id", "");
    v.directory = j.value("directory", "");
    v.mount_point = j.value("mount_point", "");
    v.device = j.value("device", "");
    v.fs_type = j.value("fs_type", "");
    v.maj_min = j.value("maj_min", "");
    v.fs_uuid = j.value("uuid", "");
    v.fs_label = j.value("label", "");
    v.fs_version = j.value("fs_version", "");
    v.serial = j.value("serial", "");
    v.model = j.value("model", "");
    v.vendor = j.value("vendor", "");
    v.wwn = j.value("wwn", "");
    v.pt_uuid = j.value("pt_uuid", "");
    v.part_uuid = j.value("part_uuid", "");
    if (j.contains("raw") && j["raw"].is_object()) v.raw = j["raw"].get<std::map<std::string, std::string>>();
    if (j.contains("refreshed_at") && j["refreshed_at"].is_string())
        v.refreshed_at = parseTimestampFromString(j["refreshed_at"].get<std::string>());
}

}
