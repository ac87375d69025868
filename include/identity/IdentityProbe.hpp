#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vc::identity {

struct MountInfo {
    std::string mount_point;
    std::string source;    // device path or pseudo source ("tmpfs", "server:/export")
    std::string fs_type;
    std::string maj_min;
};

struct BlockDeviceInfo {
    std::string fs_uuid;
    std::string fs_label;
    std::string fs_version;
    std::string serial;
    std::string model;
    std::string vendor;
    std::string wwn;
    std::string pt_uuid;
    std::string part_uuid;
    std::map<std::string, std::string> raw;
};

// Platform capability the resolver composes identities from. Implementations
// may throw on I/O trouble; the resolver treats any failure as "not available".
class IdentityProbe {
public:
    virtual ~IdentityProbe() = default;

    // Mount containing `directory`, nullopt when there is no mount table entry.
    virtual std::optional<MountInfo> probeMount(const std::filesystem::path& directory) const = 0;

    virtual std::optional<BlockDeviceInfo> probeBlockDevice(const MountInfo& mount) const = 0;

    virtual std::vector<MountInfo> listMounts() const = 0;
};

}
