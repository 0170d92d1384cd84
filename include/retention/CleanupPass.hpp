#pragma once

#include "runtime/PhaseOutcome.hpp"

#include <string_view>

namespace lw::retention {

class CleanupPass {
public:
    virtual ~CleanupPass() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    // Success when there is nothing to clean.
    virtual runtime::PhaseOutcome cleanup() = 0;
};

}
