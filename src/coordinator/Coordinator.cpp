#include "coordinator/Coordinator.hpp"
#include "state/StateStore.hpp"
#include "rotation/RotationEngine.hpp"
#include "retention/CleanupPass.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace lw::coordinator;
using namespace lw::runtime;
using namespace lw::logging;
using lw::state::StateAccess;

Coordinator::Coordinator(std::shared_ptr<state::StateStore> store,
                         std::shared_ptr<rotation::RotationEngine> engine,
                         std::shared_ptr<retention::CleanupPass> cleaner)
    : store_(std::move(store)), engine_(std::move(engine)), cleaner_(std::move(cleaner)) {
    if (!store_ || !engine_ || !cleaner_)
        throw std::invalid_argument("Coordinator: state store, rotation engine and cleanup pass are required");
}

int Coordinator::run() {
    const auto log = LogRegistry::coordinator();
    outcomes_.clear();

    log->info("[Coordinator] Starting log maintenance ({} then {})", engine_->name(), cleaner_->name());

    if (const int code = rotationPhase(); code != 0) {
        // No recorded outcome means the state store stopped rotation before it ran
        if (outcomes_.empty()) log->info("[Coordinator] Cleanup skipped, state store unusable (exit code {})", code);
        else log->info("[Coordinator] Cleanup skipped after rotation failure (exit code {})", code);
        return code;
    }

    const int code = cleanupPhase();
    log->info("[Coordinator] Log maintenance finished, exit code {}", code);
    return code;
}

int Coordinator::rotateOnly() {
    outcomes_.clear();
    return rotationPhase();
}

int Coordinator::cleanupOnly() {
    outcomes_.clear();
    return cleanupPhase();
}

int Coordinator::checkState() const {
    if (const auto code = preflight()) return *code;
    LogRegistry::state()->info("[Coordinator] State store {} usable", store_->location().string());
    return 0;
}

std::optional<int> Coordinator::preflight() const {
    const auto access = store_->check();
    if (access == StateAccess::Ready) return std::nullopt;

    if (access == StateAccess::Absent) {
        LogRegistry::state()->info("[Coordinator] State store {} absent, first run", store_->location().string());
        return std::nullopt;
    }

    LogRegistry::state()->error("[Coordinator] State store {} has {}, refusing to rotate",
                                store_->location().string(), to_string(access));
    return state::exitCodeFor(access);
}

int Coordinator::rotationPhase() {
    if (const auto code = preflight()) return *code;

    try {
        const auto outcome = engine_->rotate(*store_);
        record(Phase::Rotation, outcome);
        return outcome.status();
    } catch (const state::StateStoreError& e) {
        LogRegistry::state()->error("[Coordinator] State store unusable: {}", e.what());
        return e.exitCode();
    }
}

int Coordinator::cleanupPhase() {
    const auto outcome = cleaner_->cleanup();
    record(Phase::Cleanup, outcome);
    return outcome.status();
}

void Coordinator::record(const Phase phase, const PhaseOutcome& outcome) {
    outcomes_.push_back({phase, outcome.status(), std::chrono::system_clock::now()});

    const auto log = phase == Phase::Rotation ? LogRegistry::rotation() : LogRegistry::cleanup();
    if (outcome.ok()) log->info("[Coordinator] {} phase succeeded (status 0)", to_string(phase));
    else log->error("[Coordinator] {} phase failed with status {}", to_string(phase), outcome.status());
}
