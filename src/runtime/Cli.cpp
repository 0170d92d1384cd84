#include "runtime/Cli.hpp"
#include "runtime/Deps.hpp"
#include "runtime/ExitCode.hpp"
#include "config/Config.hpp"
#include "coordinator/Coordinator.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>

using namespace lw::logging;

namespace lw::runtime {

Invocation parseArgs(const std::vector<std::string>& args) {
    Invocation inv;
    bool commandSeen = false;

    for (const auto& arg : args) {
        if (arg == "--dry-run") {
            inv.dry_run = true;
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            inv.command = Command::Help;
            return inv;
        }
        if (commandSeen) throw UsageError(fmt::format("unexpected argument '{}'", arg));

        if (arg == "run") inv.command = Command::Run;
        else if (arg == "rotate") inv.command = Command::Rotate;
        else if (arg == "cleanup") inv.command = Command::Cleanup;
        else if (arg == "check-state") inv.command = Command::CheckState;
        else if (arg == "help") inv.command = Command::Help;
        else throw UsageError(fmt::format("unknown command '{}'", arg));
        commandSeen = true;
    }

    if (inv.dry_run && inv.command != Command::Run && inv.command != Command::Cleanup)
        throw UsageError("--dry-run only applies to 'run' and 'cleanup'");

    return inv;
}

std::string usage() {
    return "usage: logwarden [command] [--dry-run]\n"
           "\n"
           "commands:\n"
           "  run           rotate logs, then apply retention (default)\n"
           "  rotate        rotation phase only\n"
           "  cleanup       retention phase only\n"
           "  check-state   verify the rotation state store\n"
           "  help          show this message\n"
           "\n"
           "configuration: $LOGWARDEN_CONFIG or /etc/logwarden/config.yaml\n";
}

int execute(const Invocation& inv, const config::Config& cfg) {
    auto effective = cfg;
    if (inv.dry_run) effective.retention.dry_run = true;

    const auto deps = Deps::fromConfig(effective);
    const auto coordinator = deps.makeCoordinator();

    switch (inv.command) {
        case Command::Run: return coordinator->run();
        case Command::Rotate: return coordinator->rotateOnly();
        case Command::Cleanup: return coordinator->cleanupOnly();
        case Command::CheckState: return coordinator->checkState();
        case Command::Help:
            fmt::print("{}", usage());
            return 0;
    }

    LogRegistry::logwarden()->error("[Cli] Unhandled command");
    return toInt(ExitCode::Software);
}

}
