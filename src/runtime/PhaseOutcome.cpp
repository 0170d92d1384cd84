#include "runtime/PhaseOutcome.hpp"

#include <stdexcept>

using namespace lw::runtime;

PhaseOutcome PhaseOutcome::failure(const int status) {
    if (status == 0) throw std::invalid_argument("PhaseOutcome: failure status must be non-zero");
    return {Kind::Failure, status};
}
