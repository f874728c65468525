#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace bridge::protocol {

    inline constexpr const char* kJsonRpcVersion = "2.0";

    namespace methods {
        inline constexpr const char* kInitialize = "initialize";
        inline constexpr const char* kInitialized = "notifications/initialized";
        inline constexpr const char* kToolsCall = "tools/call";
        inline constexpr const char* kToolsList = "tools/list";
    } // namespace methods

    // Standard JSON-RPC codes a backend may answer with
    namespace error_codes {
        inline constexpr int kParseError = -32700;
        inline constexpr int kInvalidRequest = -32600;
        inline constexpr int kMethodNotFound = -32601;
        inline constexpr int kInvalidParams = -32602;
        inline constexpr int kInternalError = -32603;
    } // namespace error_codes

    // Outgoing call; immutable once built.
    struct RpcRequest {
        std::int64_t id;
        std::string method;
        nlohmann::json params = nlohmann::json::object();

        nlohmann::json to_json() const {
            return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                                  {"id", id},
                                  {"method", method},
                                  {"params", params}};
        }
    };

    // Same as a request but without an id; the peer never answers it.
    struct RpcNotification {
        std::string method;
        nlohmann::json params = nlohmann::json::object();

        nlohmann::json to_json() const {
            return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                                  {"method", method},
                                  {"params", params}};
        }
    };

    struct RpcError {
        int code = error_codes::kInternalError;
        std::string message;
        std::optional<nlohmann::json> data;
    };

    // Exactly one of result / error is set.
    struct RpcResponse {
        std::int64_t id = 0;
        std::optional<nlohmann::json> result;
        std::optional<RpcError> error;

        bool is_error() const { return error.has_value(); }
    };

    // What a line read from a backend turned out to be.
    enum class MessageKind {
        Response,
        Notification,
        ServerRequest,  // backend-initiated call (sampling, roots, ...)
        Invalid
    };

    inline MessageKind classify(const nlohmann::json& message) {
        if (!message.is_object()) {
            return MessageKind::Invalid;
        }
        const bool has_id = message.contains("id") && !message.at("id").is_null();
        const bool has_method = message.contains("method") && message.at("method").is_string();
        if (has_method) {
            return has_id ? MessageKind::ServerRequest : MessageKind::Notification;
        }
        if (has_id && (message.contains("result") || message.contains("error"))) {
            return MessageKind::Response;
        }
        return MessageKind::Invalid;
    }

    // Extracts an integral id; backends that echo ids as strings ("7") are tolerated.
    inline std::optional<std::int64_t> message_id(const nlohmann::json& message) {
        if (!message.is_object() || !message.contains("id")) {
            return std::nullopt;
        }
        const auto& id = message.at("id");
        if (id.is_number_integer()) {
            return id.get<std::int64_t>();
        }
        if (id.is_string()) {
            const auto& text = id.get_ref<const std::string&>();
            if (text.empty() || text.size() > 18) {
                return std::nullopt;
            }
            std::int64_t value = 0;
            for (const char c : text) {
                if (c < '0' || c > '9') {
                    return std::nullopt;
                }
                value = value * 10 + (c - '0');
            }
            return value;
        }
        return std::nullopt;
    }

    // Returns nullopt when the message is not a well-formed response.
    inline std::optional<RpcResponse> parse_response(const nlohmann::json& message) {
        if (classify(message) != MessageKind::Response) {
            return std::nullopt;
        }
        const auto id = message_id(message);
        if (!id.has_value()) {
            return std::nullopt;
        }

        RpcResponse response;
        response.id = id.value();
        if (message.contains("error") && !message.at("error").is_null()) {
            const auto& err = message.at("error");
            RpcError rpc_error;
            if (err.is_object()) {
                if (err.contains("code") && err.at("code").is_number_integer()) {
                    rpc_error.code = err.at("code").get<int>();
                }
                if (err.contains("message") && err.at("message").is_string()) {
                    rpc_error.message = err.at("message").get<std::string>();
                }
                if (err.contains("data")) {
                    rpc_error.data = err.at("data");
                }
            } else if (err.is_string()) {
                rpc_error.message = err.get<std::string>();
            }
            if (rpc_error.message.empty()) {
                rpc_error.message = "json-rpc error";
            }
            response.error = rpc_error;
            return response;
        }

        response.result = message.contains("result") ? message.at("result")
                                                     : nlohmann::json::object();
        return response;
    }

} // namespace bridge::protocol
