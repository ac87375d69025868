#include "identity/IdentityResolver.hpp"
#include "identity/labels.hpp"
#include "util/timestamp.hpp"

#include <system_error>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace vc::identity {

std::string composeVolumeId(const types::VolumeIdentity& id) {
    if (!id.fs_uuid.empty()) return "uuid=" + id.fs_uuid;
    if (!id.part_uuid.empty()) return "partuuid=" + id.part_uuid;
    if (!id.serial.empty()) {
        std::string out = "serial=" + id.serial;
        if (!id.model.empty()) out += "|model=" + id.model;
        if (!id.vendor.empty()) out += "|vendor=" + id.vendor;
        if (!id.fs_version.empty()) out += "|fsver=" + id.fs_version;
        return out;
    }
    if (id.device.find('/') != std::string::npos) return "device=" + id.device;
    return "path=" + id.directory;
}

void to_json(nlohmann::json& j, const DirectorySuggestion& s) {
    j = {{"path", s.path}, {"volume_id", s.volume_id}};
}

IdentityResolver::IdentityResolver(std::shared_ptr<IdentityProbe> probe, std::shared_ptr<spdlog::logger> log)
    : probe_(std::move(probe)), log_(std::move(log)) {}

types::VolumeIdentity IdentityResolver::resolve(const fs::path& directory) const {
    types::VolumeIdentity id;
    id.refreshed_at = util::now();

    std::error_code ec;
    auto canonical = fs::weakly_canonical(fs::absolute(directory, ec), ec);
    if (ec) canonical = directory.lexically_normal();
    id.directory = canonical.string();

    std::optional<MountInfo> mount;
    try {
        mount = probe_->probeMount(canonical);
    } catch (const std::exception& e) {
        log_->debug("[IdentityResolver] mount_probe_failed directory={} error={}", id.directory, e.what());
    }

    if (mount) {
        id.mount_point = mount->mount_point;
        id.device = mount->source;
        id.fs_type = mount->fs_type;
        id.maj_min = mount->maj_min;
        id.raw["mount.point"] = mount->mount_point;
        id.raw["mount.source"] = mount->source;
        id.raw["mount.fstype"] = mount->fs_type;
        id.raw["mount.maj_min"] = mount->maj_min;

        try {
            if (const auto dev = probe_->probeBlockDevice(*mount)) {
                id.fs_uuid = dev->fs_uuid;
                id.fs_label = dev->fs_label;
                id.fs_version = dev->fs_version;
                id.serial = dev->serial;
                id.model = dev->model;
                id.vendor = dev->vendor;
                id.wwn = dev->wwn;
                id.pt_uuid = dev->pt_uuid;
                id.part_uuid = dev->part_uuid;
                id.raw.insert(dev->raw.begin(), dev->raw.end());
            }
        } catch (const std::exception& e) {
            log_->debug("[IdentityResolver] block_probe_failed device={} error={}", mount->source, e.what());
        }
    } else {
        log_->debug("[IdentityResolver] no_mount_entry directory={}", id.directory);
    }

    id.volume_id = composeVolumeId(id);
    if (!id.hasHardwareIdentity())
        log_->info("[IdentityResolver] degraded_identity directory={} volume={}", id.directory, id.volume_id);
    return id;
}

std::vector<DirectorySuggestion> IdentityResolver::suggest() const {
    std::vector<MountInfo> mounts;
    try {
        mounts = probe_->listMounts();
    } catch (const std::exception& e) {
        log_->debug("[IdentityResolver] mount_listing_failed error={}", e.what());
        return {};
    }

    std::vector<DirectorySuggestion> out;
    for (auto& mp : suggestMountPoints(mounts)) {
        auto volumeId = resolve(mp).volume_id;
        out.push_back({std::move(mp), std::move(volumeId)});
    }
    return out;
}

}
