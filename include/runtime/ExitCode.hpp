#pragma once

#include <sysexits.h>

namespace lw::runtime {

// Codes logwarden produces on its own. Phase failures never map through this
// table: the failing phase's status is passed through unchanged.
enum class ExitCode : int {
    Success    = EX_OK,
    Usage      = EX_USAGE,
    DataError  = EX_DATAERR,    // corrupt state store
    NoInput    = EX_NOINPUT,    // log directory missing
    Software   = EX_SOFTWARE,   // unexpected internal error
    OsError    = EX_OSERR,      // fork/wait failure
    CantCreate = EX_CANTCREAT,  // state store could not be initialized
    IoError    = EX_IOERR,
    NoPerm     = EX_NOPERM,     // state store owner or mode violation
    Config     = EX_CONFIG,
    ExecFailed = 127            // shell convention for "command not found / not executable"
};

constexpr int toInt(ExitCode code) { return static_cast<int>(code); }

// Shell convention for a child killed by a signal.
constexpr int signalStatus(const int signo) { return 128 + signo; }

}
