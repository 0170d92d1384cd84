#pragma once

#include <string_view>

namespace lw::runtime {

enum class Phase { Rotation, Cleanup };

constexpr std::string_view to_string(const Phase p) {
    switch (p) {
        case Phase::Rotation: return "rotation";
        case Phase::Cleanup: return "cleanup";
    }
    return "?";
}

// Success, or Failure carrying the phase's non-zero status.
class PhaseOutcome {
public:
    enum class Kind { Success, Failure };

    static PhaseOutcome success() { return PhaseOutcome(Kind::Success, 0); }

    // Throws std::invalid_argument for status 0.
    static PhaseOutcome failure(int status);

    static PhaseOutcome fromStatus(const int status) {
        return status == 0 ? success() : PhaseOutcome(Kind::Failure, status);
    }

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool ok() const { return kind_ == Kind::Success; }
    [[nodiscard]] int status() const { return status_; }

    bool operator==(const PhaseOutcome&) const = default;

private:
    PhaseOutcome(const Kind kind, const int status) : kind_(kind), status_(status) {}

    Kind kind_;
    int status_;
};

}
