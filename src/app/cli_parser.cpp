#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace overseer::app::cli {

    using namespace overseer::core::errors;
    using overseer::protocol::RunRequest;

    namespace {

    // Raw strings as they appeared on the command line
    struct RawCliOptions {
        std::optional<std::string> script;
        std::optional<std::string> output_dir;
        std::optional<std::string> cwd;
        std::optional<std::string> max_steps;
        std::optional<std::string> execution_timeout;
        std::optional<std::string> step_timeout;
        std::optional<std::string> grace_period;
        bool verbose = false;
    };

    Result<uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                   uint32_t min_value, uint32_t max_value) {
        uint32_t value = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end) {
            return Error{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
        }
        if (value < min_value || value > max_value) {
            return Error{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                         "Must be between " + std::to_string(min_value) + " and " + std::to_string(max_value) + "."};
        }
        return value;
    }

    Result<std::filesystem::path> existing_directory(const std::string& flag, const std::string& text) {
        std::filesystem::path p(text);
        std::error_code path_ec;
        const bool is_dir = std::filesystem::is_directory(p, path_ec);
        if (path_ec || !is_dir) {
            return Error{ErrorCategory::Input, flag + " does not exist or is not a directory", "invalid_path"};
        }
        std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
        if (path_ec) {
            return Error{ErrorCategory::Input, "Failed to canonicalize " + flag, "invalid_path"};
        }
        return canonical_path;
    }

    } // namespace

    Result<RunRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return Error{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: overseer run --script actions.json"};
        }

        std::string command = argv[1];
        if (command != "run") {
            return Error{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 1. Parser phase: just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<std::string>* slot = nullptr;
            if (args[i] == "--script") slot = &raw.script;
            else if (args[i] == "--output-dir") slot = &raw.output_dir;
            else if (args[i] == "--cwd") slot = &raw.cwd;
            else if (args[i] == "--max-steps") slot = &raw.max_steps;
            else if (args[i] == "--execution-timeout") slot = &raw.execution_timeout;
            else if (args[i] == "--step-timeout") slot = &raw.step_timeout;
            else if (args[i] == "--grace-period") slot = &raw.grace_period;
            else if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            } else {
                return Error{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }

            if (i + 1 >= args.size()) {
                return Error{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
            }
            *slot = args[++i];
        }

        // 2. Validator phase: enforce logic and bounds
        RunRequest req;
        req.verbose = raw.verbose;

        if (!raw.script.has_value()) {
            return Error{ErrorCategory::Input, "Must provide --script", "missing_required_flag"};
        }
        std::error_code script_ec;
        const bool script_is_file = std::filesystem::is_regular_file(raw.script.value(), script_ec);
        if (script_ec || !script_is_file) {
            return Error{ErrorCategory::Input, "Script file does not exist: " + raw.script.value(), "invalid_path"};
        }
        req.script_file = std::filesystem::absolute(raw.script.value());

        if (raw.max_steps) {
            auto steps = parse_bounded("--max-steps", raw.max_steps.value(), 1, 1000);
            if (is_error(steps)) return get_error(steps);
            req.max_steps = get_value(steps);
        }
        if (raw.execution_timeout) {
            auto timeout = parse_bounded("--execution-timeout", raw.execution_timeout.value(), 1, 7 * 24 * 3600);
            if (is_error(timeout)) return get_error(timeout);
            req.execution_timeout_s = get_value(timeout);
        }
        if (raw.step_timeout) {
            auto timeout = parse_bounded("--step-timeout", raw.step_timeout.value(), 0, 7 * 24 * 3600);
            if (is_error(timeout)) return get_error(timeout);
            req.step_timeout_s = get_value(timeout);
        }
        if (raw.grace_period) {
            auto grace = parse_bounded("--grace-period", raw.grace_period.value(), 0, 60000);
            if (is_error(grace)) return get_error(grace);
            req.grace_period_ms = get_value(grace);
        }

        if (raw.cwd) {
            auto cwd = existing_directory("--cwd", raw.cwd.value());
            if (is_error(cwd)) return get_error(cwd);
            req.working_directory = get_value(cwd);
        }

        // The output directory is created on demand; only reject files.
        if (raw.output_dir) {
            std::filesystem::path out(raw.output_dir.value());
            std::error_code out_ec;
            if (std::filesystem::exists(out, out_ec) && !std::filesystem::is_directory(out, out_ec)) {
                return Error{ErrorCategory::Input, "--output-dir points to a file", "invalid_path"};
            }
            req.output_dir = std::filesystem::absolute(out);
        }

        return req;
    }

} // namespace overseer::app::cli
