#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/run_errors.hpp"
#include "protocol/action_contract.hpp"

namespace overseer::protocol {

// Decides the next action. Agent variants differ in which history they keep;
// each optional history is advertised through its has_*() query and only
// read when the query returns true.
class Agent {
public:
    virtual ~Agent() = default;

    virtual core::errors::Result<AgentAction> act(
        const std::optional<nlohmann::json>& observation,
        std::uint32_t steps_remaining, std::chrono::milliseconds time_left) = 0;

    virtual bool has_trajectory() const { return false; }
    virtual nlohmann::json trajectory() const { return nlohmann::json::array(); }

    virtual bool has_parse_fix_history() const { return false; }
    virtual nlohmann::json parse_fix_history() const { return nlohmann::json::array(); }

    virtual bool has_cost_history() const { return false; }
    virtual nlohmann::json cost_history() const { return nlohmann::json::array(); }
};

// Applies actions. Failures come back as errors, never as sentinel outcomes.
class Environment {
public:
    virtual ~Environment() = default;

    virtual core::errors::Result<nlohmann::json> reset() = 0;
    virtual core::errors::Result<StepOutcome> step(const AgentAction& action) = 0;
};

// Durable key/value store. Each write replaces the previous value wholesale.
class PersistSink {
public:
    virtual ~PersistSink() = default;

    virtual core::errors::Status write(const std::string& key,
                                       const nlohmann::json& value) = 0;
};

}  // namespace overseer::protocol
