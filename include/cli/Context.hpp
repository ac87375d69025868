#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>

namespace vc::catalog { class CatalogStore; }
namespace vc::jobs { class JobTracker; }
namespace vc::identity { class IdentityResolver; }
namespace vc::services { class CatalogEngine; }

namespace vc::cli {

// What a command may need, built on first use so `help` or `config` never
// touch the database.
class Context {
public:
    Context(std::filesystem::path configPath, config::Config cfg);
    ~Context();

    [[nodiscard]] const std::filesystem::path& configPath() const { return configPath_; }
    [[nodiscard]] const config::Config& config() const { return cfg_; }
    config::Config& mutableConfig() { return cfg_; }

    // Migrated and prepared
    catalog::CatalogStore& store();
    // Unprepared, for `migrate` only
    catalog::CatalogStore& rawStore();
    jobs::JobTracker& tracker();
    std::shared_ptr<identity::IdentityResolver> resolver();
    services::CatalogEngine& engine();

private:
    std::filesystem::path configPath_;
    config::Config cfg_;

    std::unique_ptr<catalog::CatalogStore> store_;
    bool storeReady_ = false;
    std::unique_ptr<jobs::JobTracker> tracker_;
    std::shared_ptr<identity::IdentityResolver> resolver_;
    std::unique_ptr<services::CatalogEngine> engine_;
};

}
