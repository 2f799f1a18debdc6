#include <chrono>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include "agents/scripted_agent.hpp"
#include "app/cli_parser.hpp"
#include "app/run_outcome.hpp"
#include "core/config/run_id.hpp"
#include "core/errors/run_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/run_execution_contract.hpp"
#include "runtime/deadline_supervisor.hpp"
#include "runtime/step_budgeted_runner.hpp"
#include "session/history_store.hpp"
#include "tools/shell_environment.hpp"

namespace {

// Extra time the outer deadline allows beyond the step loop's own time
// budget, so the loop's between-step check normally ends the run first.
constexpr std::chrono::milliseconds kDeadlineSlack{5000};

void record_unfinished(overseer::session::HistoryStore& store, const std::string& run_id,
                       const std::string& status, const std::string& message) {
    auto written = store.write_unfinished_summary(run_id, status, message);
    if (overseer::core::errors::is_error(written)) {
        const auto& err = overseer::core::errors::get_error(written);
        LOG_ERROR("Failed to write run summary [" + err.code + "]: " + err.message);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = overseer::core::errors;
    namespace app = overseer::app;
    using overseer::protocol::RunReport;

    const std::string run_id = overseer::core::config::generate_run_id();
    overseer::core::logging::Logger::get().set_run_id(run_id);

    LOG_INFO("Overseer: bootstrapping...");
    auto parsed = overseer::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return app::kExitUsage;
    }
    const auto req = errors::get_value(parsed);
    if (req.verbose) {
        overseer::core::logging::Logger::get().set_min_level(
            overseer::core::logging::LogLevel::DEBUG);
    }

    std::error_code ec;
    std::filesystem::create_directories(req.output_dir, ec);
    if (ec) {
        LOG_ERROR("Unable to create output directory " + req.output_dir.string() + ": " +
                  ec.message());
        return app::kExitPersistence;
    }

    auto script = overseer::agents::ScriptedAgent::load_script(req.script_file);
    if (errors::is_error(script)) {
        const auto& err = errors::get_error(script);
        LOG_ERROR("Script error [" + err.code + "]: " + err.message);
        return app::kExitUsage;
    }

    // Shared ownership: the worker thread may outlive main's wait on a timeout.
    auto agent = std::make_shared<overseer::agents::ScriptedAgent>(errors::get_value(script));
    overseer::tools::ShellEnvironmentOptions env_options;
    env_options.workspace = req.working_directory;
    env_options.instruction = "Scripted run from " + req.script_file.string();
    env_options.step_timeout_ms = req.step_timeout_s * 1000;
    auto environment = std::make_shared<overseer::tools::ShellEnvironment>(env_options);
    auto store = std::make_shared<overseer::session::HistoryStore>(req.output_dir);

    auto initial = environment->reset();
    if (errors::is_error(initial)) {
        const auto& err = errors::get_error(initial);
        LOG_ERROR("Environment reset failed [" + err.code + "]: " + err.message);
        return app::kExitFailed;
    }

    overseer::protocol::Budget budget;
    budget.max_steps = req.max_steps;
    budget.time_limit = std::chrono::seconds(req.execution_timeout_s);
    LOG_INFO("Max steps: " + std::to_string(budget.max_steps) + ", timeout: " +
             std::to_string(req.execution_timeout_s) + "s");

    overseer::process::ReaperOptions reaper_options;
    reaper_options.grace_period = std::chrono::milliseconds(req.grace_period_ms);
    overseer::runtime::DeadlineSupervisor supervisor(
        overseer::core::logging::console_sink(), reaper_options);

    overseer::runtime::DeadlineTask<RunReport> task;
    task.label = "scripted agent run";
    task.deadline = budget.time_limit + kDeadlineSlack;
    task.work = [agent, environment, store, budget]() -> errors::Result<RunReport> {
        const overseer::runtime::StepBudgetedRunner runner(
            overseer::core::logging::console_sink());
        return runner.run(*agent, *environment, budget, *store);
    };

    overseer::runtime::DeadlineResult<RunReport> outcome = RunReport{};
    try {
        outcome = supervisor.run_with_deadline(std::move(task));
    } catch (const std::exception& e) {
        LOG_ERROR("Run crashed: " + std::string(e.what()));
        record_unfinished(*store, run_id, "failed", e.what());
        return app::kExitFailed;
    }

    const app::RunVerdict verdict = app::classify_outcome(outcome);
    if (verdict.exit_code == app::kExitTimedOut) {
        LOG_ERROR("Run timed out: " + verdict.message);
        record_unfinished(*store, run_id, verdict.status, verdict.message);
        // The abandoned worker may still be logging; skip static teardown.
        app::exit_without_teardown(verdict.exit_code);
    }
    if (verdict.exit_code == app::kExitFailed) {
        LOG_ERROR("Run failed " + verdict.message);
        record_unfinished(*store, run_id, verdict.status, verdict.message);
        return verdict.exit_code;
    }

    LOG_INFO("Run finished: " + verdict.message);
    auto summary = store->write_summary(run_id, overseer::runtime::get_value(outcome));
    if (errors::is_error(summary)) {
        const auto& err = errors::get_error(summary);
        LOG_ERROR("Failed to write run summary [" + err.code + "]: " + err.message);
    } else {
        LOG_INFO("Artifacts: " + errors::get_value(summary).parent_path().string());
    }
    return app::final_exit_code(verdict, !errors::is_error(summary));
}
