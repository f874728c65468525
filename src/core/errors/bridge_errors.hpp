#pragma once
#include <string>
#include <variant>

namespace bridge::core::errors {

    // 1. Typed error categories, one per failure family of the bridge
    enum class ErrorCategory {
        Input,      // E.g., bad CLI flag, malformed config, empty server name
        Spawn,      // E.g., backend binary missing or not executable
        Handshake,  // E.g., backend rejected "initialize"
        Transport,  // E.g., broken pipe, stream closed, unparsable line
        Remote,     // E.g., backend answered with an error payload
        Timeout,    // E.g., no matching response within the call budget
        Busy,       // E.g., another call held the handle for the whole budget
        Lifecycle,  // E.g., tool call on a handle that is not ready
        Registry,   // E.g., unknown or duplicate server name
        Internal    // E.g., pipe() or fork() failed
    };

    // The standardized error payload
    struct BridgeError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
        int rpc_code = 0;  // JSON-RPC error code, only set for Remote/Handshake
    };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

    // Operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BridgeError>(result);
    }

    template <typename T>
    const BridgeError& get_error(const Result<T>& result) {
        return std::get<BridgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Spawn: return "spawn";
            case ErrorCategory::Handshake: return "handshake";
            case ErrorCategory::Transport: return "transport";
            case ErrorCategory::Remote: return "remote";
            case ErrorCategory::Timeout: return "timeout";
            case ErrorCategory::Busy: return "busy";
            case ErrorCategory::Lifecycle: return "lifecycle";
            case ErrorCategory::Registry: return "registry";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace bridge::core::errors
