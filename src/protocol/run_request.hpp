#pragma once
#include <string>
#include <filesystem>
#include <cstdint>

namespace overseer::protocol {

    // Validated command-line configuration for one supervised run
    struct RunRequest {
        std::filesystem::path script_file;
        std::filesystem::path output_dir = std::filesystem::current_path() / "output";
        std::filesystem::path working_directory = std::filesystem::current_path();
        uint32_t max_steps = 10;
        uint32_t execution_timeout_s = 43200;
        uint32_t step_timeout_s = 600;
        uint32_t grace_period_ms = 3000;
        bool verbose = false;
    };

} // namespace overseer::protocol
