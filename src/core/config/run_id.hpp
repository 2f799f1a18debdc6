#pragma once
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace overseer::core::config {

    // "run-<unix seconds, hex>-<6 random hex digits>", e.g. "run-6710c3a2-04f1be".
    // Ids sort by start time, so summaries from one output root list in order.
    inline std::string generate_run_id(const std::string& prefix = "run-") {
        const auto started = std::chrono::duration_cast<std::chrono::seconds>(
                                 std::chrono::system_clock::now().time_since_epoch())
                                 .count();

        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<std::uint32_t> dis(0, 0xFFFFFF);

        std::ostringstream ss;
        ss << prefix << std::hex << static_cast<std::uint64_t>(started) << "-"
           << std::setw(6) << std::setfill('0') << dis(gen);
        return ss.str();
    }

} // namespace overseer::core::config
