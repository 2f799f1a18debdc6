#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/run_id.hpp"
#include "core/errors/run_errors.hpp"

namespace {

using overseer::app::cli::parse_and_validate;
using overseer::core::errors::ErrorCategory;
using overseer::core::errors::get_error;
using overseer::core::errors::get_value;
using overseer::core::errors::is_error;
using overseer::protocol::RunRequest;

overseer::core::errors::Result<RunRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("overseer");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

class ScriptFile {
public:
    ScriptFile() {
        path_ = std::filesystem::current_path() /
                (".tmp_cli_script_" + overseer::core::config::generate_run_id() + ".json");
        std::ofstream out(path_);
        out << "[]";
    }

    ~ScriptFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenScriptMissing) {
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenScriptFileDoesNotExist) {
    auto result = parse_tokens({"run", "--script", "__no_such_script__.json"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    ScriptFile script;
    auto result = parse_tokens({"run", "--script", script.str(), "--max-steps"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    ScriptFile script;
    auto result = parse_tokens({"run", "--script", script.str(), "--agent-type", "aide"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenMaxStepsHasTrailingCharacters) {
    ScriptFile script;
    auto result = parse_tokens({"run", "--script", script.str(), "--max-steps", "12abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenMaxStepsOutOfBounds) {
    ScriptFile script;
    auto result = parse_tokens({"run", "--script", script.str(), "--max-steps", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenExecutionTimeoutIsZero) {
    ScriptFile script;
    auto result =
        parse_tokens({"run", "--script", script.str(), "--execution-timeout", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenCwdInvalid) {
    ScriptFile script;
    const auto missing_dir =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_test_dir__";
    auto result =
        parse_tokens({"run", "--script", script.str(), "--cwd", missing_dir.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, AppliesDefaults) {
    ScriptFile script;
    auto result = parse_tokens({"run", "--script", script.str()});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.max_steps, 10u);
    EXPECT_EQ(req.execution_timeout_s, 43200u);
    EXPECT_EQ(req.grace_period_ms, 3000u);
    EXPECT_FALSE(req.verbose);
    EXPECT_TRUE(req.script_file.is_absolute());
}

TEST(CliParserTest, ParsesFullRequest) {
    ScriptFile script;
    const auto cwd = std::filesystem::current_path();
    auto result = parse_tokens({"run", "--script", script.str(), "--cwd", cwd.string(),
                                "--output-dir", "out/run", "--max-steps", "42",
                                "--execution-timeout", "90", "--step-timeout", "15",
                                "--grace-period", "500", "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.max_steps, 42u);
    EXPECT_EQ(req.execution_timeout_s, 90u);
    EXPECT_EQ(req.step_timeout_s, 15u);
    EXPECT_EQ(req.grace_period_ms, 500u);
    EXPECT_TRUE(req.verbose);
    EXPECT_TRUE(req.output_dir.is_absolute());
    EXPECT_EQ(req.output_dir.filename(), "run");
    EXPECT_TRUE(std::filesystem::exists(req.working_directory));
}

}  // namespace
