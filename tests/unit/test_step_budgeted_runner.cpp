#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "agents/scripted_agent.hpp"
#include "capturing_log_sink.hpp"
#include "core/config/run_id.hpp"
#include "core/errors/run_errors.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/collaborators.hpp"
#include "protocol/run_execution_contract.hpp"
#include "runtime/deadline_supervisor.hpp"
#include "runtime/step_budgeted_runner.hpp"
#include "session/history_store.hpp"
#include "tools/shell_environment.hpp"

namespace {

using overseer::core::errors::Error;
using overseer::core::errors::ErrorCategory;
using overseer::core::errors::Result;
using overseer::core::errors::Status;
using overseer::core::errors::get_error;
using overseer::core::errors::get_value;
using overseer::core::errors::is_error;
using overseer::protocol::AgentAction;
using overseer::protocol::Budget;
using overseer::protocol::RunReport;
using overseer::protocol::StepOutcome;
using overseer::protocol::TerminationReason;
using overseer::protocol::make_action;
using overseer::runtime::StepBudgetedRunner;
using overseer::testing::CapturingLogSink;
using nlohmann::json;

class MemorySink : public overseer::protocol::PersistSink {
public:
    Status write(const std::string& key, const json& value) override {
        if (fail_writes) {
            return Error{ErrorCategory::Persistence, "disk full", "history_write_failed"};
        }
        values[key] = value;
        ++writes[key];
        return overseer::core::errors::ok();
    }

    std::map<std::string, json> values;
    std::map<std::string, int> writes;
    bool fail_writes = false;
};

struct ActCall {
    std::uint32_t steps_remaining;
    std::chrono::milliseconds time_left;
    bool had_observation;
};

// Repeats one action; keeps whichever histories it is told to keep.
class RepeatingAgent : public overseer::protocol::Agent {
public:
    explicit RepeatingAgent(AgentAction action) : action_(std::move(action)) {}

    Result<AgentAction> act(const std::optional<json>& observation,
                            std::uint32_t steps_remaining,
                            std::chrono::milliseconds time_left) override {
        calls.push_back(ActCall{steps_remaining, time_left, observation.has_value()});
        if (fail_at_call != 0 && calls.size() == fail_at_call) {
            return Error{ErrorCategory::Execution, "unparseable response", "parse_failed"};
        }
        json turn;
        turn["action"] = action_.tag;
        turn["turn"] = calls.size();
        history_.push_back(turn);
        fixes_.push_back(json::object());
        costs_.push_back(0.01);
        return action_;
    }

    bool has_trajectory() const override { return keep_trajectory; }
    json trajectory() const override { return history_; }
    bool has_parse_fix_history() const override { return keep_fixes; }
    json parse_fix_history() const override { return fixes_; }
    bool has_cost_history() const override { return keep_costs; }
    json cost_history() const override { return costs_; }

    std::vector<ActCall> calls;
    std::size_t fail_at_call = 0;
    bool keep_trajectory = true;
    bool keep_fixes = true;
    bool keep_costs = true;

private:
    AgentAction action_;
    json history_ = json::array();
    json fixes_ = json::array();
    json costs_ = json::array();
};

class FakeEnvironment : public overseer::protocol::Environment {
public:
    explicit FakeEnvironment(const MemorySink* sink = nullptr) : sink_(sink) {}

    Result<json> reset() override { return json::object(); }

    Result<StepOutcome> step(const AgentAction& action) override {
        ++steps;
        if (sink_ != nullptr) {
            const auto it = sink_->values.find("trajectory");
            persisted_turns_at_step.push_back(
                it == sink_->values.end() ? 0 : static_cast<int>(it->second.size()));
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (fail_at_step != 0 && steps == fail_at_step) {
            return Error{ErrorCategory::Execution, "sandbox crashed", "env_failed"};
        }
        if (throw_at_step != 0 && steps == throw_at_step) {
            throw std::runtime_error("environment threw");
        }
        StepOutcome outcome;
        outcome.observation["action"] = action.tag;
        outcome.observation["step"] = steps;
        outcome.reward = 0.0;
        return outcome;
    }

    int steps = 0;
    int fail_at_step = 0;
    int throw_at_step = 0;
    std::chrono::milliseconds delay{0};
    std::vector<int> persisted_turns_at_step;

private:
    const MemorySink* sink_;
};

Budget make_budget(std::uint32_t steps, std::chrono::milliseconds time_limit) {
    Budget budget;
    budget.max_steps = steps;
    budget.time_limit = time_limit;
    return budget;
}

TEST(StepBudgetedRunnerTest, StopsWhenStepsExhausted) {
    CapturingLogSink log;
    MemorySink sink;
    RepeatingAgent agent(make_action("execute_code", {{"code", "pass"}}));
    FakeEnvironment env;

    const StepBudgetedRunner runner(log);
    auto result = runner.run(agent, env, make_budget(5, std::chrono::seconds(1000)), sink);
    ASSERT_FALSE(is_error(result));

    const auto& report = get_value(result);
    EXPECT_EQ(report.reason, TerminationReason::StepsExhausted);
    EXPECT_EQ(report.steps_completed, 5u);
    EXPECT_EQ(env.steps, 5);
    EXPECT_EQ(sink.values.at("trajectory").size(), 5u);
    EXPECT_EQ(sink.writes.at("trajectory"), 5);
    EXPECT_EQ(sink.writes.at("fix_parse_error"), 5);
    EXPECT_EQ(sink.writes.at("cost_history"), 5);
}

TEST(StepBudgetedRunnerTest, StopsWhenTimeExhausted) {
    CapturingLogSink log;
    MemorySink sink;
    RepeatingAgent agent(make_action("execute_code", {{"code", "pass"}}));
    FakeEnvironment env;
    env.delay = std::chrono::milliseconds(500);

    const StepBudgetedRunner runner(log);
    auto result =
        runner.run(agent, env, make_budget(100, std::chrono::milliseconds(200)), sink);
    ASSERT_FALSE(is_error(result));

    const auto& report = get_value(result);
    EXPECT_EQ(report.reason, TerminationReason::TimeExhausted);
    EXPECT_LE(report.steps_completed, 1u);
    EXPECT_LE(env.steps, 1);
    EXPECT_GE(report.elapsed, std::chrono::milliseconds(200));
}

TEST(StepBudgetedRunnerTest, StopOnFirstCallPersistsNothing) {
    CapturingLogSink log;
    MemorySink sink;
    RepeatingAgent agent(make_action("stop"));
    FakeEnvironment env;

    const StepBudgetedRunner runner(log);
    auto result = runner.run(agent, env, make_budget(10, std::chrono::seconds(60)), sink);
    ASSERT_FALSE(is_error(result));

    EXPECT_EQ(get_value(result).reason, TerminationReason::AgentRequestedStop);
    EXPECT_EQ(get_value(result).steps_completed, 0u);
    EXPECT_EQ(env.steps, 0);
    EXPECT_TRUE(sink.values.empty());
    EXPECT_EQ(agent.calls.size(), 1u);
}

TEST(StepBudgetedRunnerTest, ErrorActionEndsRunAsAgentError) {
    CapturingLogSink log;
    MemorySink sink;
    RepeatingAgent agent(make_action("Error", {{"reason", "too many retries"}}));
    FakeEnvironment env;

    const StepBudgetedRunner runner(log);
    auto result = runner.run(agent, env, make_budget(10, std::chrono::seconds(60)), sink);
    ASSERT_FALSE(is_error(result));

    const auto& report = get_value(result);
    EXPECT_EQ(report.reason, TerminationReason::AgentError);
    EXPECT_NE(report.detail.find("too many retries"), std::string::npos);
    EXPECT_EQ(env.steps, 0);
    EXPECT_TRUE(sink.values.empty());
}

TEST(StepBudgetedRunnerTest, BudgetsNeverIncrease) {
    CapturingLogSink log;
    MemorySink sink;
    RepeatingAgent agent(make_action("request_info"));
    FakeEnvironment env;
    env.delay = std::chrono::milliseconds(5);

    const StepBudgetedRunner runner(log);
    auto result = runner.run(agent, env, make_budget(6, std::chrono::seconds(60)), sink);
    ASSERT_FALSE(is_error(result));

    ASSERT_EQ(agent.calls.size(), 6u);
    EXPECT_FALSE(agent.calls.front().had_observation);
    for (std::size_t i = 0; i < agent.calls.size(); ++i) {
        EXPECT_EQ(agent.calls[i].steps_remaining, 6u - i);
        if (i > 0) {
            EXPECT_TRUE(agent.calls[i].had_observation);
            EXPECT_LE(agent.calls[i].time_left, agent.calls[i - 1].time_left);
        }
        EXPECT_LE(agent.calls[i].time_left, std::chrono::seconds(60));
    }
}

TEST(StepBudgetedRunnerTest, PersistsHistoryBeforeEnvironmentStep) {
    CapturingLogSink log;
    MemorySink sink;
    RepeatingAgent agent(make_action("validate_code", {{"code", "true"}}));
    FakeEnvironment env(&sink);

    const StepBudgetedRunner runner(log);
    auto result = runner.run(agent, env, make_budget(4, std::chrono::seconds(60)), sink);
    ASSERT_FALSE(is_error(result));

    // At step k the sink already holds the agent's k-th turn.
    ASSERT_EQ(env.persisted_turns_at_step.size(), 4u);
    for (std::size_t i = 0; i < env.persisted_turns_at_step.size(); ++i) {
        EXPECT_EQ(env.persisted_turns_at_step[i], static_cast<int>(i + 1));
    }
}

TEST(StepBudgetedRunnerTest, SkipsHistoriesTheAgentDoesNotKeep) {
    CapturingLogSink log;
    MemorySink sink;
    RepeatingAgent agent(make_action("execute_code", {{"code", "pass"}}));
    agent.keep_fixes = false;
    agent.keep_costs = false;
    FakeEnvironment env;

    const StepBudgetedRunner runner(log);
    auto result = runner.run(agent, env, make_budget(2, std::chrono::seconds(60)), sink);
    ASSERT_FALSE(is_error(result));

    EXPECT_EQ(sink.values.count("trajectory"), 1u);
    EXPECT_EQ(sink.values.count("fix_parse_error"), 0u);
    EXPECT_EQ(sink.values.count("cost_history"), 0u);
}

TEST(StepBudgetedRunnerTest, PropagatesEnvironmentFailureAfterPersisting) {
    CapturingLogSink log;
    MemorySink sink;
    RepeatingAgent agent(make_action("execute_code", {{"code", "pass"}}));
    FakeEnvironment env;
    env.fail_at_step = 3;

    const StepBudgetedRunner runner(log);
    auto result = runner.run(agent, env, make_budget(10, std::chrono::seconds(60)), sink);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "env_failed");

    EXPECT_EQ(env.steps, 3);
    EXPECT_EQ(sink.values.at("trajectory").size(), 3u);
    EXPECT_EQ(agent.calls.size(), 3u);
}

TEST(StepBudgetedRunnerTest, PropagatesEnvironmentException) {
    CapturingLogSink log;
    MemorySink sink;
    RepeatingAgent agent(make_action("execute_code", {{"code", "pass"}}));
    FakeEnvironment env;
    env.throw_at_step = 2;

    const StepBudgetedRunner runner(log);
    EXPECT_THROW(runner.run(agent, env, make_budget(10, std::chrono::seconds(60)), sink),
                 std::runtime_error);
    EXPECT_EQ(sink.values.at("trajectory").size(), 2u);
}

TEST(StepBudgetedRunnerTest, PropagatesAgentFailure) {
    CapturingLogSink log;
    MemorySink sink;
    RepeatingAgent agent(make_action("execute_code", {{"code", "pass"}}));
    agent.fail_at_call = 2;
    FakeEnvironment env;

    const StepBudgetedRunner runner(log);
    auto result = runner.run(agent, env, make_budget(10, std::chrono::seconds(60)), sink);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "parse_failed");
    EXPECT_EQ(env.steps, 1);
}

TEST(StepBudgetedRunnerTest, PersistFailureStopsBeforeEnvironmentStep) {
    CapturingLogSink log;
    MemorySink sink;
    sink.fail_writes = true;
    RepeatingAgent agent(make_action("execute_code", {{"code", "pass"}}));
    FakeEnvironment env;

    const StepBudgetedRunner runner(log);
    auto result = runner.run(agent, env, make_budget(10, std::chrono::seconds(60)), sink);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Persistence);
    EXPECT_EQ(env.steps, 0);
}

TEST(StepBudgetedRunnerTest, ZeroStepBudgetNeverAsksAgent) {
    CapturingLogSink log;
    MemorySink sink;
    RepeatingAgent agent(make_action("execute_code"));
    FakeEnvironment env;

    const StepBudgetedRunner runner(log);
    auto result = runner.run(agent, env, make_budget(0, std::chrono::seconds(60)), sink);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).reason, TerminationReason::StepsExhausted);
    EXPECT_TRUE(agent.calls.empty());
}

TEST(StepBudgetedRunnerTest, PersistsBinaryStepOutput) {
    CapturingLogSink log;
    const auto root = std::filesystem::current_path() /
                      (".tmp_runner_binary_" + overseer::core::config::generate_run_id());
    std::filesystem::create_directories(root);

    overseer::agents::ScriptedAgent agent(
        {make_action("execute_code", {{"code", "printf '\\377\\376'"}}),
         make_action("execute_code", {{"code", "true"}})});
    overseer::tools::ShellEnvironmentOptions options;
    options.workspace = root;
    overseer::tools::ShellEnvironment env(options);
    overseer::session::HistoryStore store(root);

    const StepBudgetedRunner runner(log);
    auto result = runner.run(agent, env, make_budget(5, std::chrono::seconds(60)), store);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).reason, TerminationReason::AgentRequestedStop);
    EXPECT_EQ(get_value(result).steps_completed, 2u);

    std::ifstream in(store.path_for("trajectory"));
    ASSERT_TRUE(in.is_open());
    const json trajectory = json::parse(in);
    ASSERT_EQ(trajectory.size(), 2u);
    EXPECT_EQ(trajectory[0].at("observation").at("stdout").get<std::string>(),
              "\xEF\xBF\xBD\xEF\xBF\xBD");

    for (const auto& entry : std::filesystem::directory_iterator(root / "agent_history")) {
        EXPECT_EQ(entry.path().filename().string().rfind(".", 0), std::string::npos)
            << entry.path();
    }

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

TEST(StepBudgetedRunnerTest, HangingStepIsCutOffByDeadlineSupervisor) {
    CapturingLogSink log;
    const auto root = std::filesystem::current_path() /
                      (".tmp_runner_deadline_" + overseer::core::config::generate_run_id());
    std::filesystem::create_directories(root);

    auto agent = std::make_shared<overseer::agents::ScriptedAgent>(
        std::vector<AgentAction>{make_action("execute_code", {{"code", "echo ok"}}),
                                 make_action("execute_code", {{"code", "sleep 60"}})});
    overseer::tools::ShellEnvironmentOptions options;
    options.workspace = root;
    options.step_timeout_ms = 0;
    auto env = std::make_shared<overseer::tools::ShellEnvironment>(options);
    auto store = std::make_shared<overseer::session::HistoryStore>(root);
    auto runner_log = std::make_shared<CapturingLogSink>();

    overseer::process::ReaperOptions reaper_options;
    reaper_options.grace_period = std::chrono::milliseconds(300);
    overseer::runtime::DeadlineSupervisor supervisor(log, reaper_options);

    overseer::runtime::DeadlineTask<RunReport> task;
    task.label = "hanging run";
    task.deadline = std::chrono::milliseconds(800);
    task.work = [agent, env, store, runner_log]() -> Result<RunReport> {
        const StepBudgetedRunner runner(*runner_log);
        return runner.run(*agent, *env, make_budget(5, std::chrono::seconds(60)), *store);
    };

    const auto result = supervisor.run_with_deadline(std::move(task));
    ASSERT_TRUE(overseer::runtime::timed_out(result));
    EXPECT_GE(overseer::runtime::get_timeout(result).reclaimed_processes, 1u);

    // Both turns were persisted before their environment steps ran.
    std::ifstream in(store->path_for("trajectory"));
    ASSERT_TRUE(in.is_open());
    const json trajectory = json::parse(in);
    ASSERT_EQ(trajectory.size(), 2u);
    EXPECT_EQ(trajectory[1].at("params").at("code").get<std::string>(), "sleep 60");

    // Give the abandoned worker time to notice its killed subprocess.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

}  // namespace
