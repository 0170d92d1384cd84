// Runtime
#include "runtime/Cli.hpp"
#include "runtime/ExitCode.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <string>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

using namespace lw::config;
using namespace lw::logging;
using namespace lw::runtime;

int main(int argc, char** argv) {
    Invocation inv;
    try {
        inv = parseArgs(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const UsageError& e) {
        fmt::print(stderr, "logwarden: {}\n\n{}", e.what(), usage());
        return toInt(ExitCode::Usage);
    }

    if (inv.command == Command::Help) {
        fmt::print("{}", usage());
        return toInt(ExitCode::Success);
    }

    try {
        ConfigRegistry::init();
    } catch (const ConfigError& e) {
        spdlog::error("[logwarden] {}", e.what());
        return toInt(ExitCode::Config);
    }

    try {
        LogRegistry::init(ConfigRegistry::get().logging);
        LogRegistry::logwarden()->debug("[logwarden] environment: {}", ConfigRegistry::get().environment);

        const int code = execute(inv, ConfigRegistry::get());
        spdlog::shutdown();
        return code;
    } catch (const std::exception& e) {
        spdlog::critical("[logwarden] Fatal error: {}", e.what());
        return toInt(ExitCode::Software);
    }
}
