#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/bridge_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/interaction_log.hpp"
#include "core/logging/logger.hpp"
#include "protocol/tool_contract.hpp"
#include "rpc/correlator.hpp"
#include "session/lifecycle_manager.hpp"
#include "session/server_registry.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitToolFailure = 1;
constexpr int kExitInputError = 2;
constexpr int kExitConfigError = 3;
constexpr int kExitNoBackend = 4;

void print_json(const nlohmann::json& value) {
    std::cout << value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = bridge::core::errors;
    using bridge::core::logging::Logger;

    // 1. Tag every log line of this process with one session id
    Logger::get().set_session_id(bridge::core::config::generate_session_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = bridge::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        BRIDGE_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            std::cerr << err.hint << std::endl;
        }
        return kExitInputError;
    }
    const auto& req = errors::get_value(parsed);

    // 3. Configuration: file when given, stock backends otherwise
    auto loaded = req.config_path.has_value()
                      ? bridge::core::config::load_config(req.config_path.value())
                      : errors::Result<bridge::core::config::BridgeConfig>(
                            bridge::core::config::default_config());
    if (errors::is_error(loaded)) {
        const auto& err = errors::get_error(loaded);
        BRIDGE_LOG_ERROR("Config error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            BRIDGE_LOG_INFO("Hint: " + err.hint);
        }
        return kExitConfigError;
    }
    auto config = errors::get_value(loaded);
    if (req.timeout_ms.has_value()) {
        config.request_timeout_ms = req.timeout_ms.value();
    }
    Logger::get().set_level(bridge::core::logging::level_from_string(
        req.log_level.value_or(config.log_level)));

    std::unique_ptr<bridge::core::logging::InteractionLog> interaction_log =
        config.interaction_log.has_value()
            ? std::make_unique<bridge::core::logging::InteractionLog>(config.interaction_log.value())
            : std::make_unique<bridge::core::logging::InteractionLog>();

    const std::chrono::milliseconds request_timeout(config.request_timeout_ms);
    bridge::session::ServerRegistry registry(bridge::rpc::Correlator(interaction_log.get()),
                                             request_timeout);
    bridge::session::LifecycleManager lifecycle(registry, config.client, request_timeout,
                                                std::chrono::milliseconds(config.shutdown_grace_ms),
                                                interaction_log.get());

    // 4. Bring the backends up; failures are reported, not fatal
    BRIDGE_LOG_INFO("mcp_bridge: starting " + std::to_string(config.servers.size()) +
                    " backend(s)");
    const auto report = lifecycle.start_all(config.servers);

    int exit_code = kExitOk;
    if (req.command == bridge::app::cli::Command::Status) {
        print_json(report.to_json());
        exit_code = report.ready_count() == 0 ? kExitNoBackend : kExitOk;
    } else if (report.ready_count() == 0) {
        BRIDGE_LOG_ERROR("No backend is ready");
        print_json(report.to_json());
        exit_code = kExitNoBackend;
    } else {
        // --timeout-ms also overrides a per-server timeout_ms from the config.
        const std::chrono::milliseconds call_timeout(
            req.timeout_ms.value_or(config.timeout_for(req.server)));
        const auto result = req.command == bridge::app::cli::Command::Tools
                                ? registry.list_tools(req.server, call_timeout)
                                : registry.invoke(req.server, req.tool, req.arguments,
                                                  call_timeout);
        print_json(result.to_json());
        if (!result.success) {
            const bool bad_input = result.error.has_value() &&
                                   (result.error->reason == "unknown_server" ||
                                    result.error->reason == "invalid_input");
            exit_code = bad_input ? kExitInputError : kExitToolFailure;
        }
    }

    // 5. Always stop every child before exiting
    lifecycle.shutdown_all();
    if (interaction_log->dropped_entries() > 0) {
        BRIDGE_LOG_WARN("Interaction log dropped " +
                        std::to_string(interaction_log->dropped_entries()) + " entries");
    }
    return exit_code;
}
