#pragma once
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace overseer::protocol {

    // Recognized action vocabulary. Anything else is passed to the
    // environment as Other and left for it to accept or reject.
    enum class ActionKind {
        RequestInfo,
        ValidateCode,
        ExecuteCode,
        Stop,
        Error,
        Other
    };

    // What the agent asks the environment to do next.
    struct AgentAction {
        std::string tag;            // e.g., "execute_code"
        ActionKind kind = ActionKind::Other;
        nlohmann::json parameters = nlohmann::json::object();
    };

    // What the environment hands back after applying an action.
    struct StepOutcome {
        nlohmann::json observation;
        double reward = 0.0;
    };

    inline ActionKind parse_action_kind(const std::string& tag) {
        if (tag == "request_info") return ActionKind::RequestInfo;
        if (tag == "validate_code") return ActionKind::ValidateCode;
        if (tag == "execute_code") return ActionKind::ExecuteCode;
        if (tag == "stop" || tag == "End" || tag == "end") return ActionKind::Stop;
        if (tag == "error" || tag == "Error") return ActionKind::Error;
        return ActionKind::Other;
    }

    inline AgentAction make_action(const std::string& tag,
                                   nlohmann::json parameters = nlohmann::json::object()) {
        return AgentAction{tag, parse_action_kind(tag), std::move(parameters)};
    }

    inline std::string to_string(const ActionKind kind) {
        switch (kind) {
            case ActionKind::RequestInfo:
                return "request_info";
            case ActionKind::ValidateCode:
                return "validate_code";
            case ActionKind::ExecuteCode:
                return "execute_code";
            case ActionKind::Stop:
                return "stop";
            case ActionKind::Error:
                return "error";
            case ActionKind::Other:
                return "other";
            default:
                return "unknown";
        }
    }

} // namespace overseer::protocol
