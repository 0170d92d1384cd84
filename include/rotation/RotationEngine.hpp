#pragma once

#include "runtime/PhaseOutcome.hpp"

#include <string_view>

namespace lw::state { class StateStore; }

namespace lw::rotation {

// Applies rotation rules to the log artifacts; treated as a black box.
// Throws state::StateStoreError when its bookkeeping is unusable.
class RotationEngine {
public:
    virtual ~RotationEngine() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    virtual runtime::PhaseOutcome rotate(state::StateStore& store) = 0;
};

}
