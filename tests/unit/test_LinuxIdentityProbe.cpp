#include <gtest/gtest.h>
#include "identity/IdentityResolver.hpp"
#include "identity/LinuxIdentityProbe.hpp"
#include "logging/LogRegistry.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace fs = std::filesystem;
using namespace vc::identity;

class LinuxIdentityProbeTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() / ("volcat_sysroot_" + std::to_string(std::random_device{}()));
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void write(const fs::path& rel, const std::string& content) const {
        const auto p = root / rel;
        fs::create_directories(p.parent_path());
        std::ofstream out(p);
        out << content;
    }

    void seedUsbDisk() const {
        write("proc/self/mountinfo",
              "22 1 8:1 / / rw,relatime shared:1 - ext4 /dev/sda1 rw\n"
              "40 22 8:17 / /mnt/usb rw,nosuid shared:20 - ext4 /dev/sdb1 rw\n"
              "41 22 0:45 / /mnt/my\\040stick rw shared:21 - vfat /dev/sdc1 rw\n"
              "42 22 0:46 / /run/user/1000 rw shared:22 - tmpfs tmpfs rw\n");

        write("run/udev/data/b8:17",
              "S:disk/by-uuid/6f1c-aa\n"
              "E:ID_FS_UUID=6f1c-aa\n"
              "E:ID_FS_LABEL=ARCHIVE\n"
              "E:ID_FS_VERSION=1.0\n"
              "E:ID_SERIAL_SHORT=WX12345\n"
              "E:ID_MODEL=Elements\n"
              "E:ID_PART_ENTRY_UUID=0fa1-01\n");

        fs::create_directories(root / "sys/devices/sdb/sdb1");
        write("sys/devices/sdb/device/vendor", "WD      \n");
        write("sys/devices/sdb/device/model", "Elements 25A2\n");
        fs::create_directories(root / "sys/dev/block");
        fs::create_symlink("../../devices/sdb/sdb1", root / "sys/dev/block/8:17");
    }
};

TEST_F(LinuxIdentityProbeTest, ParsesMountInfoLineWithOptionalFields) {
    const auto m = LinuxIdentityProbe::parseMountInfoLine(
        "36 35 98:0 /mnt1 /mnt/parent rw,noatime master:1 - ext3 /dev/root rw,errors=continue");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->maj_min, "98:0");
    EXPECT_EQ(m->mount_point, "/mnt/parent");
    EXPECT_EQ(m->fs_type, "ext3");
    EXPECT_EQ(m->source, "/dev/root");
}

TEST_F(LinuxIdentityProbeTest, RejectsTruncatedLine) {
    EXPECT_FALSE(LinuxIdentityProbe::parseMountInfoLine("36 35 98:0 /").has_value());
    EXPECT_FALSE(LinuxIdentityProbe::parseMountInfoLine("36 35 98:0 / /mnt rw shared:1 ext3").has_value());
}

TEST_F(LinuxIdentityProbeTest, DecodesOctalEscapes) {
    EXPECT_EQ(LinuxIdentityProbe::decodeMountEscapes("/mnt/my\\040stick"), "/mnt/my stick");
    EXPECT_EQ(LinuxIdentityProbe::decodeMountEscapes("/plain"), "/plain");
}

TEST_F(LinuxIdentityProbeTest, LongestMountPrefixWins) {
    seedUsbDisk();
    const LinuxIdentityProbe probe(root);

    const auto m = probe.probeMount("/mnt/usb/photos/2024");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->mount_point, "/mnt/usb");
    EXPECT_EQ(m->source, "/dev/sdb1");

    const auto rootMount = probe.probeMount("/mnt/usbextra");
    ASSERT_TRUE(rootMount.has_value());
    EXPECT_EQ(rootMount->mount_point, "/");

    const auto spaced = probe.probeMount("/mnt/my stick/a");
    ASSERT_TRUE(spaced.has_value());
    EXPECT_EQ(spaced->mount_point, "/mnt/my stick");
}

TEST_F(LinuxIdentityProbeTest, ReadsUdevAndSysfs) {
    seedUsbDisk();
    const LinuxIdentityProbe probe(root);

    const auto dev = probe.probeBlockDevice({"/mnt/usb", "/dev/sdb1", "ext4", "8:17"});
    ASSERT_TRUE(dev.has_value());
    EXPECT_EQ(dev->fs_uuid, "6f1c-aa");
    EXPECT_EQ(dev->fs_label, "ARCHIVE");
    EXPECT_EQ(dev->fs_version, "1.0");
    EXPECT_EQ(dev->serial, "WX12345");
    EXPECT_EQ(dev->model, "Elements");        // udev wins over sysfs
    EXPECT_EQ(dev->vendor, "WD");             // sysfs fills what udev lacked
    EXPECT_EQ(dev->part_uuid, "0fa1-01");
    EXPECT_EQ(dev->raw.at("udev.ID_FS_LABEL"), "ARCHIVE");
    EXPECT_EQ(dev->raw.at("sysfs.model"), "Elements 25A2");
}

TEST_F(LinuxIdentityProbeTest, DiskLinksFillGapsWithoutUdev) {
    write("proc/self/mountinfo", "41 22 0:45 / /mnt/stick rw shared:21 - vfat /dev/sdc1 rw\n");
    fs::create_directories(root / "dev/disk/by-uuid");
    fs::create_directories(root / "dev/disk/by-label");
    fs::create_symlink("../../sdc1", root / "dev/disk/by-uuid/ABCD-1234");
    fs::create_symlink("../../sdc1", root / "dev/disk/by-label/MY\\x20STICK");
    fs::create_symlink("../../sdd1", root / "dev/disk/by-label/OTHER");

    const LinuxIdentityProbe probe(root);
    const auto dev = probe.probeBlockDevice({"/mnt/stick", "/dev/sdc1", "vfat", "0:45"});
    ASSERT_TRUE(dev.has_value());
    EXPECT_EQ(dev->fs_uuid, "ABCD-1234");
    EXPECT_EQ(dev->fs_label, "MY STICK");
}

TEST_F(LinuxIdentityProbeTest, EmptySysrootDegradesToPath) {
    auto probe = std::make_shared<LinuxIdentityProbe>(root);
    EXPECT_TRUE(probe->listMounts().empty());
    EXPECT_FALSE(probe->probeMount("/mnt/usb").has_value());

    const IdentityResolver resolver(probe, vc::logging::LogRegistry::identity());
    vc::types::VolumeIdentity id;
    EXPECT_NO_THROW(id = resolver.resolve(root));
    EXPECT_EQ(id.volume_id, "path=" + fs::weakly_canonical(root).string());
}

TEST_F(LinuxIdentityProbeTest, ResolverPrefersFsUuidFromFixture) {
    seedUsbDisk();
    const IdentityResolver resolver(std::make_shared<LinuxIdentityProbe>(root), vc::logging::LogRegistry::identity());
    const auto id = resolver.resolve("/mnt/usb/photos");
    EXPECT_EQ(id.volume_id, "uuid=6f1c-aa");
    EXPECT_EQ(id.mount_point, "/mnt/usb");
    EXPECT_EQ(id.vendor, "WD");
}
