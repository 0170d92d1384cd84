#pragma once

#include <memory>

namespace lw::config { struct Config; }
namespace lw::state { class StateStore; }
namespace lw::rotation { class RotationEngine; }
namespace lw::retention { class CleanupPass; }
namespace lw::coordinator { class Coordinator; }

namespace lw::runtime {

struct Deps {
    std::shared_ptr<state::StateStore> stateStore;
    std::shared_ptr<rotation::RotationEngine> rotationEngine;
    std::shared_ptr<retention::CleanupPass> cleanupPass;

    // FileStateStore + LogrotateEngine + RetentionCleaner, as configured
    static Deps fromConfig(const config::Config& cfg);

    [[nodiscard]] std::unique_ptr<coordinator::Coordinator> makeCoordinator() const;
};

}
