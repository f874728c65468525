#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/bridge_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/bridge_errors.hpp"

namespace {

using bridge::core::config::BridgeConfig;
using bridge::core::config::default_config;
using bridge::core::config::load_config;
using bridge::core::config::parse_config;
using bridge::core::errors::ErrorCategory;
using bridge::core::errors::get_error;
using bridge::core::errors::get_value;
using bridge::core::errors::is_error;

TEST(BridgeConfigTest, DefaultConfigDescribesStockBackends) {
    const BridgeConfig config = default_config();
    ASSERT_EQ(config.servers.size(), 4u);
    EXPECT_EQ(config.servers[0].name, "filesystem");
    EXPECT_EQ(config.servers[0].command, "npx");
    EXPECT_EQ(config.servers[1].name, "git");
    EXPECT_EQ(config.servers[2].name, "git_analyzer");
    EXPECT_EQ(config.servers[3].name, "weather");
    EXPECT_EQ(config.request_timeout_ms, 30000u);
    EXPECT_EQ(config.client.protocol_version, "2024-11-05");
    ASSERT_TRUE(config.interaction_log.has_value());
}

TEST(BridgeConfigTest, ParsesFullDocument) {
    const std::string text = R"({
        "client": {"name": "bridge-test", "version": "2.0.0"},
        "protocol_version": "2025-03-26",
        "request_timeout_ms": 1500,
        "shutdown_grace_ms": 250,
        "interaction_log": null,
        "log_level": "debug",
        "servers": [
            {"name": "fs", "command": "npx", "args": ["server", "."], "cwd": "/tmp",
             "env": {"A": "1"}, "enabled": false, "timeout_ms": 900}
        ]
    })";
    auto parsed = parse_config(text);
    ASSERT_FALSE(is_error(parsed));
    const auto& config = get_value(parsed);
    EXPECT_EQ(config.client.name, "bridge-test");
    EXPECT_EQ(config.client.version, "2.0.0");
    EXPECT_EQ(config.client.protocol_version, "2025-03-26");
    EXPECT_EQ(config.request_timeout_ms, 1500u);
    EXPECT_EQ(config.shutdown_grace_ms, 250u);
    EXPECT_FALSE(config.interaction_log.has_value());
    EXPECT_EQ(config.log_level, "debug");
    ASSERT_EQ(config.servers.size(), 1u);
    const auto& server = config.servers[0];
    EXPECT_EQ(server.args.size(), 2u);
    EXPECT_EQ(server.working_directory->string(), "/tmp");
    EXPECT_EQ(server.env.at("A"), "1");
    EXPECT_FALSE(server.enabled);
    EXPECT_EQ(config.timeout_for("fs"), 900u);
    EXPECT_EQ(config.timeout_for("other"), 1500u);
}

TEST(BridgeConfigTest, RejectsMalformedJson) {
    auto parsed = parse_config("{\"servers\": [");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(parsed).code, "config_parse");
}

TEST(BridgeConfigTest, RequiresServersArray) {
    auto parsed = parse_config("{}");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "config_invalid");
}

TEST(BridgeConfigTest, RejectsServerWithoutCommand) {
    auto parsed = parse_config(R"({"servers": [{"name": "fs"}]})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "config_invalid");
    EXPECT_NE(get_error(parsed).message.find("command"), std::string::npos);
}

TEST(BridgeConfigTest, RejectsOutOfRangeTimeout) {
    auto parsed = parse_config(R"({"request_timeout_ms": 0, "servers": []})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "config_invalid");
}

TEST(BridgeConfigTest, RejectsUnknownLogLevel) {
    auto parsed = parse_config(R"({"log_level": "loud", "servers": []})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "config_invalid");
}

TEST(BridgeConfigTest, MissingFileIsConfigNotFound) {
    auto loaded = load_config(std::filesystem::current_path() / "__missing_bridge_config__.json");
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "config_not_found");
}

TEST(BridgeConfigTest, LoadsFromFile) {
    const auto path = std::filesystem::current_path() /
                      (".tmp_bridge_config_" + bridge::core::config::generate_session_id() + ".json");
    {
        std::ofstream out(path);
        out << R"({"servers": [{"name": "git", "command": "python3"}]})";
    }
    auto loaded = load_config(path);
    std::error_code ec;
    std::filesystem::remove(path, ec);

    ASSERT_FALSE(is_error(loaded));
    ASSERT_EQ(get_value(loaded).servers.size(), 1u);
    EXPECT_TRUE(get_value(loaded).servers[0].enabled);
}

TEST(SessionIdTest, HasPrefixAndHexSuffix) {
    const std::string id = bridge::core::config::generate_session_id();
    ASSERT_EQ(id.rfind("session-", 0), 0u);
    EXPECT_EQ(id.size(), std::string("session-").size() + 8);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef", 8), std::string::npos);
    EXPECT_NE(id, bridge::core::config::generate_session_id());
}

}  // namespace
