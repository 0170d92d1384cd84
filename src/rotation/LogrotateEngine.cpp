#include "rotation/LogrotateEngine.hpp"
#include "state/StateStore.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"
#include "runtime/ExitCode.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <sys/wait.h>
#include <unistd.h>

using namespace lw::rotation;
using namespace lw::runtime;
using namespace lw::state;
using namespace lw::logging;

namespace {
constexpr std::string_view STATE_HEADER = "logrotate state -- version";
}

LogrotateEngine::LogrotateEngine(Options opts) : opts_(std::move(opts)) {
    if (opts_.binary.empty()) throw std::invalid_argument("LogrotateEngine: binary is empty.");
    if (opts_.rules_path.empty()) throw std::invalid_argument("LogrotateEngine: rules_path is empty.");
}

LogrotateEngine::Options LogrotateEngine::optionsFrom(const config::RotationConfig& cfg) {
    return {
        .binary = cfg.logrotate_binary,
        .rules_path = cfg.rules_path,
        .command_prefix = cfg.command_prefix,
        .verbose = cfg.verbose,
        .force = cfg.force
    };
}

bool LogrotateEngine::isValidState(const std::string_view content) {
    const auto first = content.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return true;
    return content.substr(first).starts_with(STATE_HEADER);
}

std::vector<std::string> LogrotateEngine::commandLine(const StateStore& store) const {
    std::vector<std::string> argv(opts_.command_prefix.begin(), opts_.command_prefix.end());
    argv.push_back(opts_.binary.string());
    if (opts_.verbose) argv.emplace_back("-v");
    if (opts_.force) argv.emplace_back("-f");
    argv.emplace_back("-s");
    argv.push_back(store.location().string());
    argv.push_back(opts_.rules_path.string());
    return argv;
}

PhaseOutcome LogrotateEngine::rotate(StateStore& store) {
    const auto log = LogRegistry::rotation();

    if (store.check() == StateAccess::Absent) {
        log->info("[LogrotateEngine] State store {} absent, initializing", store.location().string());
        store.initialize();
    }

    if (const auto content = store.read(); content && !isValidState(*content))
        throw StateStoreError(fmt::format("State store {} does not hold logrotate state", store.location().string()),
                              toInt(ExitCode::DataError));

    std::error_code ec;
    if (!std::filesystem::is_regular_file(opts_.rules_path, ec)) {
        log->error("[LogrotateEngine] Rule file {} not found", opts_.rules_path.string());
        return PhaseOutcome::failure(toInt(ExitCode::Config));
    }

    const auto argv = commandLine(store);
    log->info("[LogrotateEngine] Running: {}", fmt::join(argv, " "));

    return PhaseOutcome::fromStatus(spawn(argv));
}

int LogrotateEngine::spawn(const std::vector<std::string>& argv) {
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    // Child inherits stdout; flush so lines stay ordered in the scheduler's capture
    LogRegistry::rotation()->flush();
    std::fflush(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        LogRegistry::rotation()->error("[LogrotateEngine] fork failed: {}", std::strerror(errno));
        return toInt(ExitCode::OsError);
    }

    if (pid == 0) {
        execvp(cargv[0], cargv.data());
        _exit(toInt(ExitCode::ExecFailed)); // exec failed
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        LogRegistry::rotation()->error("[LogrotateEngine] waitpid failed: {}", std::strerror(errno));
        return toInt(ExitCode::OsError);
    }

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) {
        LogRegistry::rotation()->error("[LogrotateEngine] {} killed by signal {}", argv.front(), WTERMSIG(status));
        return signalStatus(WTERMSIG(status));
    }
    return toInt(ExitCode::OsError);
}
