#pragma once
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace bridge::protocol {

    // How a failed invoke is described to the caller
    struct ToolError {
        std::string reason;   // remote_error, timeout, transport, busy, lifecycle, ...
        std::string code;     // finer-grained bridge code, e.g. "end_of_stream"
        std::string message;
        int rpc_code = 0;     // backend's JSON-RPC code when reason == "remote_error"
    };

    // Normalized outcome of every registry call: {success, data | error}
    struct ToolResult {
        std::string server;
        std::string tool;
        bool success = false;
        nlohmann::json data;
        std::optional<ToolError> error;
        double duration_ms = 0.0;

        nlohmann::json to_json() const {
            nlohmann::json out;
            out["success"] = success;
            if (success) {
                out["data"] = data;
                return out;
            }
            nlohmann::json err;
            if (error.has_value()) {
                err["reason"] = error->reason;
                err["code"] = error->code;
                err["message"] = error->message;
                if (error->reason == "remote_error") {
                    err["rpc_code"] = error->rpc_code;
                }
            }
            out["error"] = err;
            return out;
        }
    };

    inline std::string reason_for(const core::errors::BridgeError& error) {
        using core::errors::ErrorCategory;
        switch (error.category) {
            case ErrorCategory::Remote: return "remote_error";
            case ErrorCategory::Timeout: return "timeout";
            case ErrorCategory::Transport: return "transport";
            case ErrorCategory::Busy: return "busy";
            case ErrorCategory::Lifecycle: return "lifecycle";
            case ErrorCategory::Registry:
                return error.code == "duplicate_name" ? "duplicate_name" : "unknown_server";
            case ErrorCategory::Spawn: return "spawn";
            case ErrorCategory::Handshake: return "handshake";
            case ErrorCategory::Input: return "invalid_input";
            case ErrorCategory::Internal: return "internal";
            default: return "internal";
        }
    }

    inline ToolResult success_result(std::string server, std::string tool,
                                     nlohmann::json data, const double duration_ms) {
        ToolResult result;
        result.server = std::move(server);
        result.tool = std::move(tool);
        result.success = true;
        result.data = std::move(data);
        result.duration_ms = duration_ms;
        return result;
    }

    inline ToolResult failure_result(std::string server, std::string tool,
                                     const core::errors::BridgeError& error,
                                     const double duration_ms) {
        ToolResult result;
        result.server = std::move(server);
        result.tool = std::move(tool);
        result.success = false;
        result.error = ToolError{reason_for(error), error.code, error.message, error.rpc_code};
        result.duration_ms = duration_ms;
        return result;
    }

} // namespace bridge::protocol
