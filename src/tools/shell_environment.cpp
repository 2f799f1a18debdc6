#include "tools/shell_environment.hpp"

#include <system_error>
#include <utility>
#include "tools/subprocess.hpp"

namespace overseer::tools {

using core::errors::Error;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::ActionKind;
using protocol::AgentAction;
using protocol::StepOutcome;

ShellEnvironment::ShellEnvironment(ShellEnvironmentOptions options)
    : options_(std::move(options)) {}

json ShellEnvironment::info() const {
    json payload;
    payload["instruction"] = options_.instruction;
    payload["workspace"] = options_.workspace.string();
    payload["step_timeout_ms"] = options_.step_timeout_ms;
    payload["executions"] = executions_;
    return payload;
}

core::errors::Result<json> ShellEnvironment::reset() {
    std::error_code ec;
    if (!std::filesystem::is_directory(options_.workspace, ec) || ec) {
        return Error{ErrorCategory::Input,
                     "Workspace is not a directory: " + options_.workspace.string(),
                     "invalid_workspace"};
    }
    executions_ = 0;
    return info();
}

core::errors::Result<std::string> ShellEnvironment::code_parameter(
    const AgentAction& action) const {
    const auto it = action.parameters.find("code");
    if (it == action.parameters.end() || !it->is_string()) {
        return Error{ErrorCategory::Input,
                     "Action '" + action.tag + "' requires a string 'code' parameter.",
                     "missing_code_parameter"};
    }
    return it->get<std::string>();
}

core::errors::Result<StepOutcome> ShellEnvironment::execute(const AgentAction& action,
                                                            const bool validate_only) {
    auto code = code_parameter(action);
    if (core::errors::is_error(code)) {
        return core::errors::get_error(code);
    }

    ProcessRequest request;
    if (validate_only) {
        request.argv = {"/bin/sh", "-n", "-c", core::errors::get_value(code)};
    } else {
        request.argv = {"/bin/sh", "-c", core::errors::get_value(code)};
    }
    request.working_directory = options_.workspace;
    request.timeout_ms = options_.step_timeout_ms;

    auto captured = run_process(request);
    if (core::errors::is_error(captured)) {
        return core::errors::get_error(captured);
    }
    const auto& capture = core::errors::get_value(captured);
    if (!validate_only) {
        ++executions_;
    }

    StepOutcome outcome;
    outcome.observation["action"] = action.tag;
    outcome.observation["exit_code"] = capture.exit_code;
    outcome.observation["timed_out"] = capture.timed_out;
    outcome.observation["stdout"] = capture.stdout_text;
    outcome.observation["stderr"] = capture.stderr_text;
    outcome.observation["duration_ms"] = capture.duration_ms;
    outcome.reward = (!capture.timed_out && capture.exit_code == 0) ? 1.0 : 0.0;
    return outcome;
}

core::errors::Result<StepOutcome> ShellEnvironment::step(const AgentAction& action) {
    switch (action.kind) {
        case ActionKind::RequestInfo: {
            StepOutcome outcome;
            outcome.observation = info();
            outcome.observation["action"] = action.tag;
            return outcome;
        }
        case ActionKind::ValidateCode:
            return execute(action, true);
        case ActionKind::ExecuteCode:
            return execute(action, false);
        default:
            return Error{ErrorCategory::Input,
                         "Unsupported action: '" + action.tag + "'",
                         "unsupported_action",
                         "Use request_info, validate_code or execute_code."};
    }
}

}  // namespace overseer::tools
