#include "cli/Context.hpp"
#include "catalog/CatalogStore.hpp"
#include "identity/IdentityResolver.hpp"
#include "identity/LinuxIdentityProbe.hpp"
#include "jobs/JobTracker.hpp"
#include "logging/LogRegistry.hpp"
#include "services/CatalogEngine.hpp"

using namespace vc::cli;
using namespace vc::logging;

Context::Context(std::filesystem::path configPath, config::Config cfg)
    : configPath_(std::move(configPath)), cfg_(std::move(cfg)) {}

Context::~Context() {
    // engine threads reference the store and tracker
    engine_.reset();
    tracker_.reset();
}

vc::catalog::CatalogStore& Context::rawStore() {
    if (!store_) store_ = std::make_unique<catalog::CatalogStore>(cfg_, LogRegistry::catalog(), LogRegistry::db());
    return *store_;
}

vc::catalog::CatalogStore& Context::store() {
    auto& s = rawStore();
    if (!storeReady_) {
        s.init();
        storeReady_ = true;
    }
    return s;
}

vc::jobs::JobTracker& Context::tracker() {
    if (!tracker_) tracker_ = std::make_unique<jobs::JobTracker>(store(), cfg_.jobs, LogRegistry::jobs());
    return *tracker_;
}

std::shared_ptr<vc::identity::IdentityResolver> Context::resolver() {
    if (!resolver_)
        resolver_ = std::make_shared<identity::IdentityResolver>(std::make_shared<identity::LinuxIdentityProbe>("/"),
                                                                 LogRegistry::identity());
    return resolver_;
}

vc::services::CatalogEngine& Context::engine() {
    if (!engine_) {
        engine_ = std::make_unique<services::CatalogEngine>(
            store(), tracker(), resolver(), cfg_,
            services::EngineLoggers{LogRegistry::volcat(), LogRegistry::scanner(), LogRegistry::watcher(),
                                    LogRegistry::discovery()});
        engine_->init();
    }
    return *engine_;
}
