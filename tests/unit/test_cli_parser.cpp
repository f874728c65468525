#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/bridge_errors.hpp"

namespace {

using bridge::app::cli::CliRequest;
using bridge::app::cli::Command;
using bridge::app::cli::parse_and_validate;
using bridge::core::errors::ErrorCategory;
using bridge::core::errors::get_error;
using bridge::core::errors::get_value;
using bridge::core::errors::is_error;

bridge::core::errors::Result<CliRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("mcp_bridge");
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

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, StatusNeedsNoPositionals) {
    auto result = parse_tokens({"status"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).command, Command::Status);
    EXPECT_FALSE(get_value(result).config_path.has_value());
}

TEST(CliParserTest, ToolsRequiresServer) {
    auto missing = parse_tokens({"tools"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_required_argument");

    auto result = parse_tokens({"tools", "filesystem"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).command, Command::Tools);
    EXPECT_EQ(get_value(result).server, "filesystem");
}

TEST(CliParserTest, CallParsesServerToolAndArguments) {
    auto result = parse_tokens({"call", "filesystem", "read_file", "--args", "{\"path\": \"README.md\"}",
                                "--timeout-ms", "1500", "--log-level", "debug", "--config", "bridge.json"});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_EQ(req.command, Command::Call);
    EXPECT_EQ(req.server, "filesystem");
    EXPECT_EQ(req.tool, "read_file");
    EXPECT_EQ(req.arguments.at("path"), "README.md");
    EXPECT_EQ(req.timeout_ms.value(), 1500u);
    EXPECT_EQ(req.log_level.value(), "debug");
    EXPECT_EQ(req.config_path->string(), "bridge.json");
}

TEST(CliParserTest, CallWithoutArgsSendsEmptyObject) {
    auto result = parse_tokens({"call", "git", "git_status"});
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).arguments.is_object());
    EXPECT_TRUE(get_value(result).arguments.empty());
}

TEST(CliParserTest, FailsWhenArgsNotAnObject) {
    auto malformed = parse_tokens({"call", "git", "git_status", "--args", "{nope"});
    ASSERT_TRUE(is_error(malformed));
    EXPECT_EQ(get_error(malformed).code, "invalid_json");

    auto array = parse_tokens({"call", "git", "git_status", "--args", "[1, 2]"});
    ASSERT_TRUE(is_error(array));
    EXPECT_EQ(get_error(array).code, "invalid_json");
}

TEST(CliParserTest, FailsWhenArgsUsedOutsideCall) {
    auto result = parse_tokens({"tools", "git", "--args", "{}"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, FailsWhenTimeoutNotNumeric) {
    auto result = parse_tokens({"status", "--timeout-ms", "12abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenTimeoutOutOfBounds) {
    auto result = parse_tokens({"status", "--timeout-ms", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenLogLevelUnknown) {
    auto result = parse_tokens({"status", "--log-level", "chatty"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_log_level");
}

TEST(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_tokens({"status", "--config"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownFlagOrExtraPositional) {
    auto flag = parse_tokens({"status", "--verbose"});
    ASSERT_TRUE(is_error(flag));
    EXPECT_EQ(get_error(flag).code, "unknown_argument");

    auto extra = parse_tokens({"tools", "git", "extra"});
    ASSERT_TRUE(is_error(extra));
    EXPECT_EQ(get_error(extra).code, "unknown_argument");
}

}  // namespace
