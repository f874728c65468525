#include "core/config/bridge_config.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace bridge::core::config {

using errors::BridgeError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

BridgeError invalid(const std::string& message) {
    return BridgeError{ErrorCategory::Input, message, "config_invalid",
                       "Expected {\"servers\": [{\"name\": ..., \"command\": ...}]}"};
}

errors::Result<std::uint32_t> read_millis(const json& node, const std::string& key) {
    const auto& value = node.at(key);
    if (!value.is_number_integer()) {
        return invalid("\"" + key + "\" must be an integer number of milliseconds");
    }
    const auto millis = value.get<std::int64_t>();
    if (millis <= 0 || millis > 24LL * 60 * 60 * 1000) {
        return invalid("\"" + key + "\" out of bounds (1 ms .. 24 h)");
    }
    return static_cast<std::uint32_t>(millis);
}

errors::Result<std::string> read_string(const json& node, const std::string& key,
                                        const std::string& context) {
    const auto& value = node.at(key);
    if (!value.is_string()) {
        return invalid(context + "\"" + key + "\" must be a string");
    }
    return value.get<std::string>();
}

errors::Result<ServerConfig> parse_server(const json& node, const std::size_t index) {
    const std::string context = "servers[" + std::to_string(index) + "]: ";
    if (!node.is_object()) {
        return invalid(context + "entry must be an object");
    }

    ServerConfig server;
    for (const char* required : {"name", "command"}) {
        if (!node.contains(required)) {
            return invalid(context + "missing \"" + required + "\"");
        }
    }

    auto name = read_string(node, "name", context);
    if (errors::is_error(name)) {
        return errors::get_error(name);
    }
    server.name = errors::get_value(name);
    if (server.name.empty()) {
        return invalid(context + "\"name\" cannot be empty");
    }

    auto command = read_string(node, "command", context);
    if (errors::is_error(command)) {
        return errors::get_error(command);
    }
    server.command = errors::get_value(command);
    if (server.command.empty()) {
        return invalid(context + "\"command\" cannot be empty");
    }

    if (node.contains("args")) {
        const auto& args = node.at("args");
        if (!args.is_array()) {
            return invalid(context + "\"args\" must be an array of strings");
        }
        for (const auto& arg : args) {
            if (!arg.is_string()) {
                return invalid(context + "\"args\" must be an array of strings");
            }
            server.args.push_back(arg.get<std::string>());
        }
    }

    if (node.contains("cwd")) {
        auto cwd = read_string(node, "cwd", context);
        if (errors::is_error(cwd)) {
            return errors::get_error(cwd);
        }
        server.working_directory = std::filesystem::path(errors::get_value(cwd));
    }

    if (node.contains("env")) {
        const auto& env = node.at("env");
        if (!env.is_object()) {
            return invalid(context + "\"env\" must be an object of strings");
        }
        for (auto it = env.begin(); it != env.end(); ++it) {
            if (!it.value().is_string()) {
                return invalid(context + "\"env\" must be an object of strings");
            }
            server.env[it.key()] = it.value().get<std::string>();
        }
    }

    if (node.contains("enabled")) {
        if (!node.at("enabled").is_boolean()) {
            return invalid(context + "\"enabled\" must be a boolean");
        }
        server.enabled = node.at("enabled").get<bool>();
    }

    if (node.contains("timeout_ms")) {
        auto timeout = read_millis(node, "timeout_ms");
        if (errors::is_error(timeout)) {
            return errors::get_error(timeout);
        }
        server.timeout_ms = errors::get_value(timeout);
    }

    return server;
}

}  // namespace

std::uint32_t BridgeConfig::timeout_for(const std::string& server_name) const {
    for (const auto& server : servers) {
        if (server.name == server_name && server.timeout_ms.has_value()) {
            return server.timeout_ms.value();
        }
    }
    return request_timeout_ms;
}

BridgeConfig default_config() {
    BridgeConfig config;
    config.interaction_log = std::filesystem::path("mcp_interactions.jsonl");

    ServerConfig filesystem;
    filesystem.name = "filesystem";
    filesystem.command = "npx";
    filesystem.args = {"@modelcontextprotocol/server-filesystem", "."};
    config.servers.push_back(filesystem);

    ServerConfig git;
    git.name = "git";
    git.command = "python3";
    git.args = {"-m", "mcp_server_git", "--repository", "."};
    config.servers.push_back(git);

    ServerConfig analyzer;
    analyzer.name = "git_analyzer";
    analyzer.command = "python3";
    analyzer.args = {"git_analyzer_mcp_server/git_analyzer_server.py"};
    config.servers.push_back(analyzer);

    ServerConfig weather;
    weather.name = "weather";
    weather.command = "python3";
    weather.args = {"weather_mcp_server/app.py", "--stdio"};
    config.servers.push_back(weather);

    return config;
}

errors::Result<BridgeConfig> parse_config(const std::string& text) {
    const json root = json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        return BridgeError{ErrorCategory::Input, "Config is not valid JSON.",
                           "config_parse"};
    }
    if (!root.is_object()) {
        return invalid("top-level value must be an object");
    }

    BridgeConfig config;

    if (root.contains("client")) {
        const auto& client = root.at("client");
        if (!client.is_object()) {
            return invalid("\"client\" must be an object");
        }
        for (const char* key : {"name", "version"}) {
            if (!client.contains(key)) {
                continue;
            }
            auto value = read_string(client, key, "client: ");
            if (errors::is_error(value)) {
                return errors::get_error(value);
            }
            if (std::string(key) == "name") {
                config.client.name = errors::get_value(value);
            } else {
                config.client.version = errors::get_value(value);
            }
        }
    }

    if (root.contains("protocol_version")) {
        auto value = read_string(root, "protocol_version", "");
        if (errors::is_error(value)) {
            return errors::get_error(value);
        }
        config.client.protocol_version = errors::get_value(value);
    }

    if (root.contains("request_timeout_ms")) {
        auto value = read_millis(root, "request_timeout_ms");
        if (errors::is_error(value)) {
            return errors::get_error(value);
        }
        config.request_timeout_ms = errors::get_value(value);
    }

    if (root.contains("shutdown_grace_ms")) {
        auto value = read_millis(root, "shutdown_grace_ms");
        if (errors::is_error(value)) {
            return errors::get_error(value);
        }
        config.shutdown_grace_ms = errors::get_value(value);
    }

    if (root.contains("interaction_log")) {
        const auto& value = root.at("interaction_log");
        if (value.is_null()) {
            config.interaction_log.reset();
        } else if (value.is_string()) {
            config.interaction_log = std::filesystem::path(value.get<std::string>());
        } else {
            return invalid("\"interaction_log\" must be a path string or null");
        }
    }

    if (root.contains("log_level")) {
        auto value = read_string(root, "log_level", "");
        if (errors::is_error(value)) {
            return errors::get_error(value);
        }
        if (!logging::is_level_name(errors::get_value(value))) {
            return invalid("\"log_level\" must be one of debug, info, warn, error");
        }
        config.log_level = errors::get_value(value);
    }

    if (!root.contains("servers") || !root.at("servers").is_array()) {
        return invalid("\"servers\" must be an array");
    }

    const auto& servers = root.at("servers");
    for (std::size_t i = 0; i < servers.size(); ++i) {
        auto server = parse_server(servers.at(i), i);
        if (errors::is_error(server)) {
            return errors::get_error(server);
        }
        config.servers.push_back(errors::get_value(server));
    }

    return config;
}

errors::Result<BridgeConfig> load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return BridgeError{ErrorCategory::Input,
                           "Config file does not exist: " + path.string(),
                           "config_not_found"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return BridgeError{ErrorCategory::Input,
                           "Failed to open config file: " + path.string(),
                           "config_not_found"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto parsed = parse_config(buffer.str());
    if (!errors::is_error(parsed)) {
        BRIDGE_LOG_DEBUG("Config: loaded " +
                         std::to_string(errors::get_value(parsed).servers.size()) +
                         " server(s) from " + path.string());
    }
    return parsed;
}

}  // namespace bridge::core::config
