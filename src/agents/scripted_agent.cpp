#include "agents/scripted_agent.hpp"

#include <fstream>
#include <string>
#include <utility>

namespace overseer::agents {

using core::errors::Error;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::AgentAction;

ScriptedAgent::ScriptedAgent(std::vector<AgentAction> script)
    : script_(std::move(script)) {}

core::errors::Result<std::vector<AgentAction>> ScriptedAgent::parse_script(
    const json& document) {
    if (!document.is_array()) {
        return Error{ErrorCategory::Input, "Script must be a JSON array of actions.",
                     "invalid_script"};
    }

    std::vector<AgentAction> actions;
    actions.reserve(document.size());
    for (std::size_t i = 0; i < document.size(); ++i) {
        const auto& entry = document[i];
        const std::string where = "Script entry " + std::to_string(i);
        if (!entry.is_object()) {
            return Error{ErrorCategory::Input, where + " is not an object.",
                         "invalid_script"};
        }
        const auto tag = entry.find("action");
        if (tag == entry.end() || !tag->is_string() || tag->get<std::string>().empty()) {
            return Error{ErrorCategory::Input, where + " has no 'action' string.",
                         "invalid_script"};
        }
        json params = json::object();
        const auto found = entry.find("params");
        if (found != entry.end()) {
            if (!found->is_object()) {
                return Error{ErrorCategory::Input,
                             where + " has non-object 'params'.", "invalid_script"};
            }
            params = *found;
        }
        actions.push_back(protocol::make_action(tag->get<std::string>(), std::move(params)));
    }
    return actions;
}

core::errors::Result<std::vector<AgentAction>> ScriptedAgent::load_script(
    const std::filesystem::path& script_file) {
    std::ifstream in(script_file);
    if (!in.is_open()) {
        return Error{ErrorCategory::Input,
                     "Unable to open script file: " + script_file.string(),
                     "script_open_failed"};
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return Error{ErrorCategory::Input,
                     "Script file is not valid JSON: " + script_file.string(),
                     "script_parse_failed"};
    }
    return parse_script(document);
}

core::errors::Result<AgentAction> ScriptedAgent::act(
    const std::optional<json>& observation, const std::uint32_t steps_remaining,
    const std::chrono::milliseconds time_left) {
    if (observation.has_value() && !trajectory_.empty()) {
        trajectory_.back()["observation"] = observation.value();
    }

    AgentAction action = cursor_ < script_.size() ? script_[cursor_]
                                                  : protocol::make_action("stop");
    ++cursor_;

    json entry;
    entry["step"] = trajectory_.size() + 1;
    entry["action"] = action.tag;
    entry["params"] = action.parameters;
    entry["steps_remaining"] = steps_remaining;
    entry["time_left_ms"] = time_left.count();
    trajectory_.push_back(std::move(entry));
    return action;
}

}  // namespace overseer::agents
