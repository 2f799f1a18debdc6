#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/run_errors.hpp"

namespace overseer::tools {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

struct ProcessRequest {
    std::vector<std::string> argv;  // argv[0] is an absolute path
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 5000;  // 0 disables the per-process timeout
};

// Spawns argv as a child process in its own process group and captures its
// output. On timeout the whole group is killed. The child stays a
// descendant of the calling process for its whole life.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

// Convenience wrapper running `/bin/sh -c command`.
core::errors::Result<ProcessCapture> run_shell_command(
    const std::string& command, const std::filesystem::path& cwd,
    std::uint32_t timeout_ms);

}  // namespace overseer::tools
