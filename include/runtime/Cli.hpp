#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace lw::config { struct Config; }

namespace lw::runtime {

enum class Command { Run, Rotate, Cleanup, CheckState, Help };

struct Invocation {
    Command command = Command::Run;
    bool dry_run = false;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// No arguments means Command::Run.
Invocation parseArgs(const std::vector<std::string>& args);

std::string usage();

// Builds the collaborators from cfg and runs the command; returns the exit code.
int execute(const Invocation& inv, const config::Config& cfg);

}
