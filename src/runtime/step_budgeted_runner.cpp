#include "runtime/step_budgeted_runner.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <sstream>
#include <nlohmann/json.hpp>

namespace overseer::runtime {

using protocol::ActionKind;
using protocol::RunReport;
using protocol::TerminationReason;

namespace {

std::chrono::milliseconds elapsed_since(
    const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
}

std::string format_reward(const double reward) {
    std::ostringstream out;
    out << reward;
    return out.str();
}

}  // namespace

StepBudgetedRunner::StepBudgetedRunner(core::logging::LogSink& log) : log_(log) {}

core::errors::Status StepBudgetedRunner::persist_history(
    const protocol::Agent& agent, protocol::PersistSink& persist) const {
    if (agent.has_trajectory()) {
        auto written = persist.write(kTrajectoryKey, agent.trajectory());
        if (core::errors::is_error(written)) {
            return written;
        }
    }
    if (agent.has_parse_fix_history()) {
        auto written = persist.write(kParseFixKey, agent.parse_fix_history());
        if (core::errors::is_error(written)) {
            return written;
        }
    }
    if (agent.has_cost_history()) {
        auto written = persist.write(kCostHistoryKey, agent.cost_history());
        if (core::errors::is_error(written)) {
            return written;
        }
    }
    return core::errors::ok();
}

core::errors::Result<RunReport> StepBudgetedRunner::run(
    protocol::Agent& agent, protocol::Environment& environment,
    const protocol::Budget& budget, protocol::PersistSink& persist) const {
    const auto started = std::chrono::steady_clock::now();
    const std::uint32_t total_steps = budget.max_steps;
    std::uint32_t steps_remaining = total_steps;
    std::optional<nlohmann::json> observation;

    RunReport report;
    log_.info("Runner: max steps " + std::to_string(total_steps) + ", time limit " +
              std::to_string(budget.time_limit.count()) + " ms");

    auto finish = [&](const TerminationReason reason) {
        report.reason = reason;
        report.elapsed = elapsed_since(started);
        log_.info("Runner: finished with " + protocol::to_string(reason) + " after " +
                  std::to_string(report.steps_completed) + " steps");
        return report;
    };

    while (steps_remaining > 0) {
        const std::uint32_t step_num = total_steps - steps_remaining + 1;
        const auto time_left = std::max(std::chrono::milliseconds(0),
                                        budget.time_limit - elapsed_since(started));
        if (time_left.count() == 0) {
            log_.warn("Runner: time limit (" + std::to_string(budget.time_limit.count()) +
                      " ms) exceeded before step " + std::to_string(step_num));
            return finish(TerminationReason::TimeExhausted);
        }

        log_.info("--- Step " + std::to_string(step_num) + "/" +
                  std::to_string(total_steps) + " ---");

        auto chosen = agent.act(observation, steps_remaining, time_left);
        if (core::errors::is_error(chosen)) {
            const auto& err = core::errors::get_error(chosen);
            log_.error("Runner: agent failed at step " + std::to_string(step_num) +
                       " [" + err.code + "]: " + err.message);
            return err;
        }
        const protocol::AgentAction action = core::errors::get_value(chosen);
        log_.info("Step " + std::to_string(step_num) + ": action received: " + action.tag);

        if (action.kind == ActionKind::Error) {
            report.detail = action.parameters.dump();
            log_.error("Step " + std::to_string(step_num) +
                       ": agent returned error: " + report.detail);
            return finish(TerminationReason::AgentError);
        }
        if (action.kind == ActionKind::Stop) {
            log_.warn("Step " + std::to_string(step_num) + ": agent indicated end");
            return finish(TerminationReason::AgentRequestedStop);
        }

        auto persisted = persist_history(agent, persist);
        if (core::errors::is_error(persisted)) {
            const auto& err = core::errors::get_error(persisted);
            log_.error("Runner: failed to persist history [" + err.code + "]: " +
                       err.message);
            return err;
        }

        auto applied = environment.step(action);
        if (core::errors::is_error(applied)) {
            const auto& err = core::errors::get_error(applied);
            log_.error("Runner: environment step " + std::to_string(step_num) +
                       " failed [" + err.code + "]: " + err.message);
            return err;
        }
        const auto& outcome = core::errors::get_value(applied);
        observation = outcome.observation;
        report.last_reward = outcome.reward;
        ++report.steps_completed;
        --steps_remaining;
        log_.info("Step " + std::to_string(step_num) +
                  ": environment step executed. Reward: " + format_reward(outcome.reward));
    }

    return finish(TerminationReason::StepsExhausted);
}

}  // namespace overseer::runtime
