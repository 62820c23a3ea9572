#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/agent_errors.hpp"

namespace {

using shopagent::app::cli::parse_and_validate;
using shopagent::core::errors::ErrorCategory;
using shopagent::core::errors::get_error;
using shopagent::core::errors::get_value;
using shopagent::core::errors::is_error;
using shopagent::protocol::RunRequest;

shopagent::core::errors::Result<RunRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("shop_agent");
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

class TempFile {
public:
    TempFile() {
        path_ = std::filesystem::current_path() /
                (".tmp_cli_parser_" + shopagent::core::config::generate_session_id() +
                 ".json");
        std::ofstream(path_) << "[]";
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

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

TEST(CliParserTest, FailsWhenTaskMissing) {
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenTaskBlank) {
    auto result = parse_tokens({"run", "--task", "   "});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"run", "--task", "Buy all GPUs", "--catalog"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"run", "--task", "Buy all GPUs", "--fast"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenMaxStepsNotNumeric) {
    auto result = parse_tokens({"run", "--task", "Buy all GPUs", "--max-steps", "abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenMaxStepsHasTrailingCharacters) {
    auto result = parse_tokens({"run", "--task", "Buy all GPUs", "--max-steps", "12abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenMaxStepsOutOfBounds) {
    auto zero = parse_tokens({"run", "--task", "Buy all GPUs", "--max-steps", "0"});
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "bounds_error");

    auto huge = parse_tokens({"run", "--task", "Buy all GPUs", "--max-steps", "1001"});
    ASSERT_TRUE(is_error(huge));
    EXPECT_EQ(get_error(huge).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenCwdInvalid) {
    const auto missing_dir =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_test_dir__";
    auto result = parse_tokens(
        {"run", "--task", "Buy all GPUs", "--cwd", missing_dir.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, FailsWhenPlanFileMissing) {
    auto result = parse_tokens(
        {"run", "--task", "Buy all GPUs", "--plan-file", "__missing_plan__.json"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ParsesValidTaskRequest) {
    const auto cwd = std::filesystem::current_path();
    auto result = parse_tokens({"run", "--task", "Buy all GPUs", "--cwd", cwd.string(),
                                "--max-steps", "42", "--simulate-race", "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.task_description, "Buy all GPUs");
    EXPECT_FALSE(req.plan_file.has_value());
    EXPECT_FALSE(req.catalog_file.has_value());
    EXPECT_EQ(req.max_steps, 42u);
    EXPECT_TRUE(req.simulate_race);
    EXPECT_TRUE(req.verbose);
    EXPECT_TRUE(std::filesystem::exists(req.working_directory));
}

TEST(CliParserTest, ParsesPlanAndCatalogFiles) {
    TempFile plan;
    TempFile catalog;
    auto result = parse_tokens({"run", "--task", "Buy all GPUs", "--plan-file",
                                plan.path().string(), "--catalog",
                                catalog.path().string()});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    ASSERT_TRUE(req.plan_file.has_value());
    EXPECT_EQ(req.plan_file.value(), plan.path());
    ASSERT_TRUE(req.catalog_file.has_value());
    EXPECT_EQ(req.catalog_file.value(), catalog.path());
    EXPECT_EQ(req.max_steps, 20u);
    EXPECT_FALSE(req.simulate_race);
    EXPECT_FALSE(req.verbose);
}

}  // namespace
