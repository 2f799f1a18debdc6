#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace overseer::protocol {

// Why a step loop ended normally. A propagated failure is reported as the
// error side of the run's Result instead.
enum class TerminationReason {
    StepsExhausted,
    TimeExhausted,
    AgentRequestedStop,
    AgentError
};

struct Budget {
    std::uint32_t max_steps = 10;
    std::chrono::milliseconds time_limit{43200 * 1000};
};

struct RunReport {
    TerminationReason reason = TerminationReason::StepsExhausted;
    std::uint32_t steps_completed = 0;
    std::chrono::milliseconds elapsed{0};
    double last_reward = 0.0;
    std::string detail;
};

inline std::string to_string(const TerminationReason reason) {
    switch (reason) {
        case TerminationReason::StepsExhausted:
            return "steps_exhausted";
        case TerminationReason::TimeExhausted:
            return "time_exhausted";
        case TerminationReason::AgentRequestedStop:
            return "agent_requested_stop";
        case TerminationReason::AgentError:
            return "agent_error";
        default:
            return "unknown";
    }
}

}  // namespace overseer::protocol
