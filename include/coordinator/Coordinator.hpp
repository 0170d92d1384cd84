#pragma once

#include "runtime/PhaseOutcome.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace lw::state { class StateStore; }
namespace lw::rotation { class RotationEngine; }
namespace lw::retention { class CleanupPass; }

namespace lw::coordinator {

struct RunOutcome {
    runtime::Phase phase;
    int status;
    std::chrono::system_clock::time_point timestamp;
};

// Rotation, then cleanup only if rotation succeeded. The exit code is 0 or the
// status of the first failing phase, passed through unchanged. No retries:
// the next scheduled invocation is the retry.
class Coordinator {
public:
    Coordinator(std::shared_ptr<state::StateStore> store,
                std::shared_ptr<rotation::RotationEngine> engine,
                std::shared_ptr<retention::CleanupPass> cleaner);

    [[nodiscard]] int run();

    // Single phases, for the rotate/cleanup subcommands
    [[nodiscard]] int rotateOnly();
    [[nodiscard]] int cleanupOnly();

    // State-store access check alone; 0 when ready or absent
    [[nodiscard]] int checkState() const;

    [[nodiscard]] const std::vector<RunOutcome>& outcomes() const { return outcomes_; }

private:
    std::shared_ptr<state::StateStore> store_;
    std::shared_ptr<rotation::RotationEngine> engine_;
    std::shared_ptr<retention::CleanupPass> cleaner_;
    std::vector<RunOutcome> outcomes_;

    // Returns an exit code when the state store rules out rotating at all.
    [[nodiscard]] std::optional<int> preflight() const;

    [[nodiscard]] int rotationPhase();
    [[nodiscard]] int cleanupPhase();

    void record(runtime::Phase phase, const runtime::PhaseOutcome& outcome);
};

}
