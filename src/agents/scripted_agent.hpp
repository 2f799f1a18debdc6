#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/run_errors.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/collaborators.hpp"

namespace overseer::agents {

// Replays a fixed list of actions and answers "stop" once it runs out.
// Keeps a trajectory but no parse-fix or cost history.
class ScriptedAgent : public protocol::Agent {
public:
    explicit ScriptedAgent(std::vector<protocol::AgentAction> script);

    // Reads a JSON array of {"action": "...", "params": {...}} objects.
    static core::errors::Result<std::vector<protocol::AgentAction>> load_script(
        const std::filesystem::path& script_file);

    static core::errors::Result<std::vector<protocol::AgentAction>> parse_script(
        const nlohmann::json& document);

    core::errors::Result<protocol::AgentAction> act(
        const std::optional<nlohmann::json>& observation,
        std::uint32_t steps_remaining, std::chrono::milliseconds time_left) override;

    bool has_trajectory() const override { return true; }
    nlohmann::json trajectory() const override { return trajectory_; }

    std::size_t position() const { return cursor_; }

private:
    std::vector<protocol::AgentAction> script_;
    std::size_t cursor_ = 0;
    nlohmann::json trajectory_ = nlohmann::json::array();
};

}  // namespace overseer::agents
