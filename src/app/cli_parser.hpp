#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace bridge::app::cli {

    enum class Command {
        Status,
        Tools,
        Call
    };

    struct CliRequest {
        Command command = Command::Status;
        std::string server;                          // tools, call
        std::string tool;                            // call
        nlohmann::json arguments = nlohmann::json::object();
        std::optional<std::filesystem::path> config_path;
        std::optional<std::string> log_level;
        std::optional<std::uint32_t> timeout_ms;
    };

    bridge::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
