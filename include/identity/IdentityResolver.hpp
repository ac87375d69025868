#pragma once

#include "identity/IdentityProbe.hpp"
#include "types/VolumeIdentity.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include <spdlog/spdlog.h>

namespace vc::identity {

// Builds the stable volume id from whatever the probe found. The precedence is
// load-bearing: changing it re-keys every existing catalog.
//   1. uuid=<fs uuid>
//   2. partuuid=<partition uuid>
//   3. serial=<s>[|model=<m>][|vendor=<v>][|fsver=<f>]
//   4. device=<mount source>   (only when the source is a path)
//   5. path=<canonical directory>
std::string composeVolumeId(const types::VolumeIdentity& id);

struct DirectorySuggestion {
    std::string path;
    std::string volume_id;
};

void to_json(nlohmann::json& j, const DirectorySuggestion& s);

class IdentityResolver {
public:
    IdentityResolver(std::shared_ptr<IdentityProbe> probe, std::shared_ptr<spdlog::logger> log);

    // Never throws; probe failures fall further down the chain.
    [[nodiscard]] types::VolumeIdentity resolve(const std::filesystem::path& directory) const;

    // Attached-media mount points, each with the id it would be catalogued under.
    [[nodiscard]] std::vector<DirectorySuggestion> suggest() const;

private:
    std::shared_ptr<IdentityProbe> probe_;
    std::shared_ptr<spdlog::logger> log_;
};

}
