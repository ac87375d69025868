#include <gtest/gtest.h>
#include "identity/IdentityResolver.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace vc::identity;
using vc::types::VolumeIdentity;

namespace {

class FakeProbe final : public IdentityProbe {
public:
    std::optional<MountInfo> mount;
    std::optional<BlockDeviceInfo> device;
    bool throwOnMount = false;
    bool throwOnDevice = false;

    std::optional<MountInfo> probeMount(const std::filesystem::path&) const override {
        if (throwOnMount) throw std::runtime_error("mountinfo unreadable");
        return mount;
    }

    std::optional<BlockDeviceInfo> probeBlockDevice(const MountInfo&) const override {
        if (throwOnDevice) throw std::runtime_error("udev unreadable");
        return device;
    }

    std::vector<MountInfo> listMounts() const override { return mount ? std::vector{*mount} : std::vector<MountInfo>{}; }
};

MountInfo usbMount() { return {"/mnt/usb", "/dev/sdb1", "ext4", "8:17"}; }

}

TEST(ComposeVolumeId, FsUuidWins) {
    VolumeIdentity id;
    id.fs_uuid = "1234-ABCD";
    id.part_uuid = "part-1";
    id.serial = "S1";
    id.device = "/dev/sdb1";
    EXPECT_EQ(composeVolumeId(id), "uuid=1234-ABCD");
}

TEST(ComposeVolumeId, PartUuidBeforeSerial) {
    VolumeIdentity id;
    id.part_uuid = "0fa1-02";
    id.serial = "S1";
    EXPECT_EQ(composeVolumeId(id), "partuuid=0fa1-02");
}

TEST(ComposeVolumeId, SerialCarriesOptionalQualifiersInOrder) {
    VolumeIdentity id;
    id.serial = "WD-123";
    id.model = "Elements";
    id.vendor = "WD";
    id.fs_version = "1.0";
    EXPECT_EQ(composeVolumeId(id), "serial=WD-123|model=Elements|vendor=WD|fsver=1.0");

    id.model.clear();
    id.fs_version.clear();
    EXPECT_EQ(composeVolumeId(id), "serial=WD-123|vendor=WD");
}

TEST(ComposeVolumeId, DeviceOnlyWhenSourceIsAPath) {
    VolumeIdentity id;
    id.device = "/dev/mapper/vault";
    id.directory = "/srv/data";
    EXPECT_EQ(composeVolumeId(id), "device=/dev/mapper/vault");

    id.device = "tmpfs";
    EXPECT_EQ(composeVolumeId(id), "path=/srv/data");
}

TEST(ComposeVolumeId, FallsBackToPath) {
    VolumeIdentity id;
    id.directory = "/home/me/photos";
    EXPECT_EQ(composeVolumeId(id), "path=/home/me/photos");
}

TEST(IdentityResolver, FillsIdentityFromProbe) {
    auto probe = std::make_shared<FakeProbe>();
    probe->mount = usbMount();
    BlockDeviceInfo dev;
    dev.fs_uuid = "c0ffee";
    dev.fs_label = "ARCHIVE";
    dev.serial = "XYZ";
    dev.raw["udev.ID_FS_TYPE"] = "ext4";
    probe->device = dev;

    const IdentityResolver resolver(probe, vc::logging::LogRegistry::identity());
    const auto id = resolver.resolve("/");

    EXPECT_EQ(id.volume_id, "uuid=c0ffee");
    EXPECT_EQ(id.mount_point, "/mnt/usb");
    EXPECT_EQ(id.device, "/dev/sdb1");
    EXPECT_EQ(id.fs_type, "ext4");
    EXPECT_EQ(id.fs_label, "ARCHIVE");
    EXPECT_EQ(id.serial, "XYZ");
    EXPECT_EQ(id.raw.at("udev.ID_FS_TYPE"), "ext4");
    EXPECT_EQ(id.raw.at("mount.source"), "/dev/sdb1");
    EXPECT_TRUE(id.hasHardwareIdentity());
    EXPECT_GT(id.refreshed_at, 0);
}

TEST(IdentityResolver, MissingBlockInfoDegradesToDevice) {
    auto probe = std::make_shared<FakeProbe>();
    probe->mount = usbMount();

    const IdentityResolver resolver(probe, vc::logging::LogRegistry::identity());
    const auto id = resolver.resolve("/");
    EXPECT_EQ(id.volume_id, "device=/dev/sdb1");
    EXPECT_FALSE(id.hasHardwareIdentity());
}

TEST(IdentityResolver, ProbeFailuresNeverEscape) {
    auto probe = std::make_shared<FakeProbe>();
    probe->throwOnMount = true;

    const IdentityResolver resolver(probe, vc::logging::LogRegistry::identity());
    VolumeIdentity id;
    EXPECT_NO_THROW(id = resolver.resolve("/"));
    EXPECT_EQ(id.volume_id, "path=/");

    probe->throwOnMount = false;
    probe->mount = usbMount();
    probe->throwOnDevice = true;
    EXPECT_NO_THROW(id = resolver.resolve("/"));
    EXPECT_EQ(id.volume_id, "device=/dev/sdb1");
}

TEST(IdentityResolver, SameDirectoryResolvesToSameId) {
    auto probe = std::make_shared<FakeProbe>();
    probe->mount = usbMount();
    BlockDeviceInfo dev;
    dev.part_uuid = "9e8d-01";
    probe->device = dev;

    const IdentityResolver resolver(probe, vc::logging::LogRegistry::identity());
    EXPECT_EQ(resolver.resolve("/").volume_id, resolver.resolve("/").volume_id);
}

TEST(IdentityResolver, RemountedDeviceKeepsItsId) {
    auto probe = std::make_shared<FakeProbe>();
    BlockDeviceInfo dev;
    dev.fs_uuid = "5e1f-77aa";
    probe->device = dev;
    const IdentityResolver resolver(probe, vc::logging::LogRegistry::identity());

    probe->mount = MountInfo{"/mnt/a", "/dev/sdb1", "exfat", "8:17"};
    const auto first = resolver.resolve("/mnt/a");

    // same filesystem, different slot and mount point
    probe->mount = MountInfo{"/media/b", "/dev/sdc1", "exfat", "8:33"};
    const auto second = resolver.resolve("/media/b");

    EXPECT_EQ(first.volume_id, "uuid=5e1f-77aa");
    EXPECT_EQ(second.volume_id, first.volume_id);
    EXPECT_EQ(first.mount_point, "/mnt/a");
    EXPECT_EQ(second.mount_point, "/media/b");
    EXPECT_NE(first.directory, second.directory);
}

TEST(IdentityResolver, SuggestionsCarryTheirVolumeId) {
    auto probe = std::make_shared<FakeProbe>();
    probe->mount = usbMount();
    BlockDeviceInfo dev;
    dev.fs_uuid = "c0ffee";
    probe->device = dev;
    const IdentityResolver resolver(probe, vc::logging::LogRegistry::identity());

    const auto suggestions = resolver.suggest();
    ASSERT_EQ(suggestions.size(), 1u);
    EXPECT_EQ(suggestions[0].path, "/mnt/usb");
    EXPECT_EQ(suggestions[0].volume_id, "uuid=c0ffee");
}

TEST(IdentityResolver, NoMediaMountsMeansNoSuggestions) {
    auto probe = std::make_shared<FakeProbe>();
    probe->mount = MountInfo{"/", "/dev/sda1", "ext4", "8:1"};
    const IdentityResolver resolver(probe, vc::logging::LogRegistry::identity());
    EXPECT_TRUE(resolver.suggest().empty());
}
