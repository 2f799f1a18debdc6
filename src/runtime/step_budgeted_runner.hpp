#pragma once

#include <chrono>
#include <string>
#include "core/errors/run_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/collaborators.hpp"
#include "protocol/run_execution_contract.hpp"

namespace overseer::runtime {

// Keys under which agent history is handed to the PersistSink.
inline constexpr const char* kTrajectoryKey = "trajectory";
inline constexpr const char* kParseFixKey = "fix_parse_error";
inline constexpr const char* kCostHistoryKey = "cost_history";

// Drives one agent against one environment until the step budget or the
// time budget runs out, or the agent stops. History is persisted after the
// agent picks an action and before the environment applies it. A stop or
// error action on the first call persists nothing.
class StepBudgetedRunner {
public:
    explicit StepBudgetedRunner(core::logging::LogSink& log);

    core::errors::Result<protocol::RunReport> run(protocol::Agent& agent,
                                                  protocol::Environment& environment,
                                                  const protocol::Budget& budget,
                                                  protocol::PersistSink& persist) const;

private:
    core::errors::Status persist_history(const protocol::Agent& agent,
                                         protocol::PersistSink& persist) const;

    core::logging::LogSink& log_;
};

}  // namespace overseer::runtime
