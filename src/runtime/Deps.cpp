#include "runtime/Deps.hpp"
#include "config/Config.hpp"
#include "coordinator/Coordinator.hpp"
#include "state/FileStateStore.hpp"
#include "rotation/LogrotateEngine.hpp"
#include "retention/RetentionCleaner.hpp"
#include "logging/LogRegistry.hpp"

using namespace lw::runtime;
using namespace lw::logging;

Deps Deps::fromConfig(const config::Config& cfg) {
    LogRegistry::config()->debug("[Deps] environment={} rules={} state={} log_dir={}",
                                 cfg.environment, cfg.rotation.rules_path.string(),
                                 cfg.rotation.state_path.string(), cfg.retention.log_dir.string());

    Deps deps;
    deps.stateStore = std::make_shared<state::FileStateStore>(state::FileStateStore::Options{
        .path = cfg.rotation.state_path,
        .expected_owner = cfg.rotation.state_owner_uid
    });
    deps.rotationEngine = std::make_shared<rotation::LogrotateEngine>(rotation::LogrotateEngine::optionsFrom(cfg.rotation));
    deps.cleanupPass = std::make_shared<retention::RetentionCleaner>(retention::RetentionCleaner::optionsFrom(cfg));
    return deps;
}

std::unique_ptr<lw::coordinator::Coordinator> Deps::makeCoordinator() const {
    return std::make_unique<coordinator::Coordinator>(stateStore, rotationEngine, cleanupPass);
}
