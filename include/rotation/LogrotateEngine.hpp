#pragma once

#include "rotation/RotationEngine.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace lw::config { struct RotationConfig; }

namespace lw::rotation {

// Runs the system logrotate(8) against the rule file, pointing it at the
// state store with -s.
class LogrotateEngine final : public RotationEngine {
public:
    struct Options {
        std::filesystem::path binary = "/usr/sbin/logrotate";
        std::filesystem::path rules_path;
        std::vector<std::string> command_prefix;   // e.g. {"sudo", "-n"}
        bool verbose = false;
        bool force = false;
    };

    explicit LogrotateEngine(Options opts);

    static Options optionsFrom(const config::RotationConfig& cfg);

    [[nodiscard]] std::string_view name() const override { return "logrotate"; }
    runtime::PhaseOutcome rotate(state::StateStore& store) override;

    [[nodiscard]] std::vector<std::string> commandLine(const state::StateStore& store) const;

    // Empty, or starting with logrotate's own header line.
    static bool isValidState(std::string_view content);

private:
    Options opts_;

    static int spawn(const std::vector<std::string>& argv);
};

}
