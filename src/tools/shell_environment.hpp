#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/run_errors.hpp"
#include "protocol/collaborators.hpp"

namespace overseer::tools {

struct ShellEnvironmentOptions {
    std::filesystem::path workspace = ".";
    std::string instruction;
    std::uint32_t step_timeout_ms = 600000;
};

// Environment that executes agent-submitted shell code in a child process
// rooted in the workspace. Reward is 1.0 when the code exits with status 0.
class ShellEnvironment : public protocol::Environment {
public:
    explicit ShellEnvironment(ShellEnvironmentOptions options);

    core::errors::Result<nlohmann::json> reset() override;
    core::errors::Result<protocol::StepOutcome> step(
        const protocol::AgentAction& action) override;

    std::uint32_t executions() const { return executions_; }

private:
    core::errors::Result<protocol::StepOutcome> execute(const protocol::AgentAction& action,
                                                        bool validate_only);
    core::errors::Result<std::string> code_parameter(
        const protocol::AgentAction& action) const;
    nlohmann::json info() const;

    ShellEnvironmentOptions options_;
    std::uint32_t executions_ = 0;
};

}  // namespace overseer::tools
