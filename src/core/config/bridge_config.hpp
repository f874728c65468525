#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace bridge::core::config {

// One stdio backend to launch.
struct ServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> working_directory;
    std::map<std::string, std::string> env;
    bool enabled = true;
    std::optional<std::uint32_t> timeout_ms;  // overrides BridgeConfig::request_timeout_ms
};

struct ClientIdentity {
    std::string name = "mcp-bridge";
    std::string version = "0.1.0";
    std::string protocol_version = "2024-11-05";
};

struct BridgeConfig {
    ClientIdentity client;
    std::uint32_t request_timeout_ms = 30000;
    std::uint32_t shutdown_grace_ms = 2000;
    std::optional<std::filesystem::path> interaction_log;
    std::string log_level = "info";
    std::vector<ServerConfig> servers;

    std::uint32_t timeout_for(const std::string& server_name) const;
};

// The four backends the bridge ships with: filesystem, git, git_analyzer, weather.
BridgeConfig default_config();

errors::Result<BridgeConfig> parse_config(const std::string& text);

errors::Result<BridgeConfig> load_config(const std::filesystem::path& path);

}  // namespace bridge::core::config
