#pragma once

#include <ctime>
#include <map>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace vc::types {

// Everything the resolver learned about the volume behind a directory.
// Empty strings mean "not available", never an error.
struct VolumeIdentity {
    std::string volume_id;
    std::string directory;     // canonical directory that was resolved
    std::string mount_point;
    std::string device;        // mount source, e.g. /dev/sdb1
    std::string fs_type;
    std::string maj_min;

    std::string fs_uuid;
    std::string fs_label;
    std::string fs_version;
    std::string serial;
    std::string model;
    std::string vendor;
    std::string wwn;
    std::string pt_uuid;
    std::string part_uuid;

    std::map<std::string, std::string> raw;   // opaque probe payload
    std::time_t refreshed_at{0};

    [[nodiscard]] bool hasHardwareIdentity() const noexcept {
        return !fs_uuid.empty() || !part_uuid.empty() || !serial.empty();
    }
};

void to_json(nlohmann::json& j, const VolumeIdentity& v);
void from_json(const nlohmann::json& j, VolumeIdentity& v);

}
