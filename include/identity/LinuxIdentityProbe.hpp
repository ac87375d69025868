#pragma once

#include "identity/IdentityProbe.hpp"

namespace vc::identity {

// Reads mountinfo, the udev database, /dev/disk/by-* links and sysfs. Every
// path is taken relative to `sysroot` so a fixture tree can stand in for /.
class LinuxIdentityProbe final : public IdentityProbe {
public:
    explicit LinuxIdentityProbe(std::filesystem::path sysroot = "/");

    std::optional<MountInfo> probeMount(const std::filesystem::path& directory) const override;
    std::optional<BlockDeviceInfo> probeBlockDevice(const MountInfo& mount) const override;
    std::vector<MountInfo> listMounts() const override;

    // "\040" style escapes as written by the kernel in mountinfo
    static std::string decodeMountEscapes(const std::string& s);
    static std::optional<MountInfo> parseMountInfoLine(const std::string& line);

private:
    std::filesystem::path sysroot_;

    [[nodiscard]] std::filesystem::path host(const std::filesystem::path& abs) const;
    void readUdev(const std::string& majMin, BlockDeviceInfo& out) const;
    void readDiskLinks(const std::string& source, BlockDeviceInfo& out) const;
    void readSysfs(const std::string& majMin, BlockDeviceInfo& out) const;
};

}
