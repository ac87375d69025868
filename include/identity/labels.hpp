#pragma once

#include "identity/IdentityProbe.hpp"
#include "types/VolumeIdentity.hpp"

#include <string>
#include <vector>

namespace vc::identity {

// Short anchor for printed labels, stable across exports.
// Source preference: partuuid, partition table uuid, fs uuid, then the volume id.
std::string deriveHumanId(const types::VolumeIdentity& id);

// Mount points that look like attached media (/mnt, /media, /run/media).
std::vector<std::string> suggestMountPoints(const std::vector<MountInfo>& mounts);

}
