#pragma once
#include <string>
#include "protocol/run_execution_contract.hpp"
#include "runtime/deadline_supervisor.hpp"

namespace overseer::app {

    // Process exit codes of the overseer binary.
    enum ExitCode : int {
        kExitOk = 0,
        kExitFailed = 1,
        kExitUsage = 2,
        kExitTimedOut = 3,
        kExitPersistence = 6
    };

    // How a supervised run is reported: the run_summary status and the exit code.
    // A run that ran out of time is never reported as a failure.
    struct RunVerdict {
        std::string status;
        ExitCode exit_code = kExitOk;
        std::string message;
    };

    RunVerdict classify_outcome(const runtime::DeadlineResult<protocol::RunReport>& outcome);

    // A finished run whose summary could not be written exits with
    // kExitPersistence. A timeout or failure keeps its own code.
    ExitCode final_exit_code(const RunVerdict& verdict, bool summary_written);

    // Flushes stdout/stderr and ends the process through std::quick_exit, so
    // the Logger singleton is not destroyed under a still-running worker.
    [[noreturn]] void exit_without_teardown(int code);

} // namespace overseer::app
