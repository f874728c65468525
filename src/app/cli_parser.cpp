#include "cli_parser.hpp"
#include <charconv>
#include <system_error>
#include <vector>
#include "core/logging/logger.hpp"

namespace bridge::app::cli {

    using namespace bridge::core::errors;
    using nlohmann::json;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::vector<std::string> positionals;
        std::optional<std::string> args_json;
        std::optional<std::string> config;
        std::optional<std::string> log_level;
        std::optional<std::string> timeout_ms;
    };

    std::string usage() {
        return "Usage: mcp_bridge status [--config FILE] [--log-level L] [--timeout-ms N]\n"
               "       mcp_bridge tools <server> [options]\n"
               "       mcp_bridge call <server> <tool> [--args JSON] [options]";
    }

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return BridgeError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        const std::string command = argv[1];
        CliRequest req;
        if (command == "status") {
            req.command = Command::Status;
        } else if (command == "tools") {
            req.command = Command::Tools;
        } else if (command == "call") {
            req.command = Command::Call;
        } else {
            return BridgeError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--args") {
                if (i + 1 < args.size()) raw.args_json = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --args", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--log-level") {
                if (i + 1 < args.size()) raw.log_level = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --log-level", "missing_value"};
            } else if (args[i] == "--timeout-ms") {
                if (i + 1 < args.size()) raw.timeout_ms = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --timeout-ms", "missing_value"};
            } else if (args[i].rfind("--", 0) == 0) {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            } else {
                raw.positionals.push_back(args[i]);
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        const std::size_t expected = req.command == Command::Status ? 0
                                   : req.command == Command::Tools  ? 1
                                                                     : 2;
        if (raw.positionals.size() < expected) {
            return BridgeError{ErrorCategory::Input, "Missing server or tool name for '" + command + "'",
                               "missing_required_argument", usage()};
        }
        if (raw.positionals.size() > expected) {
            return BridgeError{ErrorCategory::Input, "Unexpected argument: " + raw.positionals[expected],
                               "unknown_argument", usage()};
        }
        if (expected >= 1) req.server = raw.positionals[0];
        if (expected == 2) req.tool = raw.positionals[1];

        if (raw.args_json) {
            if (req.command != Command::Call) {
                return BridgeError{ErrorCategory::Input, "--args is only valid with 'call'", "conflicting_flags"};
            }
            // Exception-free JSON parsing
            json parsed = json::parse(raw.args_json.value(), nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object()) {
                return BridgeError{ErrorCategory::Input, "--args must be a JSON object", "invalid_json",
                                   "Example: --args '{\"path\": \".\"}'"};
            }
            req.arguments = std::move(parsed);
        }

        if (raw.log_level) {
            if (!bridge::core::logging::is_level_name(raw.log_level.value())) {
                return BridgeError{ErrorCategory::Input, "Invalid log level: " + raw.log_level.value(),
                                   "invalid_log_level", "One of debug, info, warn, error."};
            }
            req.log_level = raw.log_level;
        }

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            uint32_t timeout = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return BridgeError{ErrorCategory::Input, "Invalid number for --timeout-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (timeout == 0 || timeout > 86400000) {
                return BridgeError{ErrorCategory::Input, "--timeout-ms out of bounds", "bounds_error", "Must be between 1 and 86400000."};
            }
            req.timeout_ms = timeout;
        }

        if (raw.config) {
            if (raw.config->empty()) {
                return BridgeError{ErrorCategory::Input, "Config path cannot be empty", "invalid_path"};
            }
            req.config_path = std::filesystem::path(raw.config.value());
        }

        return req;
    }

} // namespace bridge::app::cli
