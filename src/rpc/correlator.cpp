#include "rpc/correlator.hpp"

#include <mutex>
#include <optional>
#include "core/logging/logger.hpp"
#include "protocol/jsonrpc_contract.hpp"

namespace bridge::rpc {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::MessageKind;
using Clock = std::chrono::steady_clock;

namespace {

std::optional<BridgeError> check_state(const ServerHandle& handle, const HandleState required) {
    const HandleState state = handle.state();
    if (state == required) {
        return std::nullopt;
    }
    if (state == HandleState::Dead) {
        const auto reason = handle.failure_reason();
        return BridgeError{ErrorCategory::Lifecycle,
                           "Backend '" + handle.name() + "' is unavailable" +
                               (reason.has_value() ? ": " + reason.value() : "."),
                           "server_unavailable"};
    }
    return BridgeError{ErrorCategory::Lifecycle,
                       "Backend '" + handle.name() + "' is not ready (state: " +
                           to_string(state) + ").",
                       "not_ready"};
}

}  // namespace

Correlator::Correlator(core::logging::InteractionLog* interaction_log)
    : interaction_log_(interaction_log) {}

void Correlator::record(const std::string& server, const std::string& action,
                        const json& payload) const {
    if (interaction_log_ != nullptr) {
        interaction_log_->record(server, action, payload);
    }
}

core::errors::Result<json> Correlator::call(ServerHandle& handle, const std::string& method,
                                            const json& params,
                                            const std::chrono::milliseconds timeout) const {
    auto result = exchange(handle, method, params, timeout, HandleState::Ready);
    if (core::errors::is_error(result) &&
        core::errors::get_error(result).category == ErrorCategory::Transport) {
        const auto& err = core::errors::get_error(result);
        auto moved = handle.transition(HandleState::Dead, err.code + ": " + err.message);
        if (core::errors::is_error(moved)) {
            BRIDGE_LOG_DEBUG("Correlator: " + core::errors::get_error(moved).message);
        }
    }
    return result;
}

core::errors::Result<json> Correlator::handshake_call(
    ServerHandle& handle, const std::string& method, const json& params,
    const std::chrono::milliseconds timeout) const {
    return exchange(handle, method, params, timeout, HandleState::Initializing);
}

core::errors::Status Correlator::notify(ServerHandle& handle, const std::string& method,
                                        const json& params) const {
    const HandleState state = handle.state();
    if (state != HandleState::Initializing && state != HandleState::Ready) {
        return check_state(handle, HandleState::Ready).value();
    }
    const protocol::RpcNotification notification{method, params};
    return handle.channel().send_line(notification.to_json());
}

core::errors::Result<json> Correlator::exchange(ServerHandle& handle, const std::string& method,
                                                const json& params,
                                                const std::chrono::milliseconds timeout,
                                                const HandleState required_state) const {
    if (auto not_usable = check_state(handle, required_state)) {
        return not_usable.value();
    }

    const auto deadline = Clock::now() + timeout;
    std::unique_lock<std::timed_mutex> lock(handle.call_mutex(), std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        return BridgeError{ErrorCategory::Busy,
                           "Backend '" + handle.name() + "' stayed busy with another call for " +
                               std::to_string(timeout.count()) + " ms.",
                           "busy", "Calls on one backend are serialized; retry later."};
    }
    // The previous holder may have killed the handle.
    if (auto not_usable = check_state(handle, required_state)) {
        return not_usable.value();
    }

    const protocol::RpcRequest request{handle.next_request_id(), method, params};
    auto sent = handle.channel().send_line(request.to_json(), deadline);
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }

    while (true) {
        auto line = handle.channel().read_line(deadline);
        if (core::errors::is_error(line)) {
            const auto& err = core::errors::get_error(line);
            if (err.category != ErrorCategory::Timeout) {
                return err;
            }
            BRIDGE_LOG_WARN("Correlator: " + handle.name() + " gave no answer to '" + method +
                            "' (id " + std::to_string(request.id) + ") within " +
                            std::to_string(timeout.count()) + " ms");
            record(handle.name(), "timeout",
                   json{{"id", request.id}, {"method", method}, {"timeout_ms", timeout.count()}});
            return BridgeError{ErrorCategory::Timeout,
                               "Backend '" + handle.name() + "' did not answer '" + method +
                                   "' within " + std::to_string(timeout.count()) + " ms.",
                               "timeout", "A late answer will be discarded."};
        }

        const json& message = core::errors::get_value(line);
        switch (protocol::classify(message)) {
            case MessageKind::Response: {
                const auto id = protocol::message_id(message);
                if (!id.has_value() || id.value() != request.id) {
                    // Late answer to a call that already timed out.
                    BRIDGE_LOG_WARN("Correlator: " + handle.name() +
                                    " discarding response with id " +
                                    (id.has_value() ? std::to_string(id.value()) : "?") +
                                    " while waiting for " + std::to_string(request.id));
                    record(handle.name(), "discard", message);
                    continue;
                }
                const auto response = protocol::parse_response(message);
                if (!response.has_value()) {
                    return BridgeError{ErrorCategory::Transport,
                                       "Backend '" + handle.name() + "' sent a malformed response.",
                                       "parse_error"};
                }
                if (response->is_error()) {
                    const auto& rpc_error = response->error.value();
                    return BridgeError{ErrorCategory::Remote, rpc_error.message, "remote_error",
                                       "", rpc_error.code};
                }
                return response->result.value();
            }
            case MessageKind::Notification:
                BRIDGE_LOG_DEBUG("Correlator: " + handle.name() + " notification '" +
                                 message.at("method").get<std::string>() + "' ignored");
                continue;
            case MessageKind::ServerRequest: {
                // Backend-initiated calls are not supported; answer so the backend does not stall.
                BRIDGE_LOG_WARN("Correlator: " + handle.name() + " sent unsupported request '" +
                                message.at("method").get<std::string>() + "'");
                json reply{{"jsonrpc", protocol::kJsonRpcVersion},
                           {"id", message.at("id")},
                           {"error",
                            {{"code", protocol::error_codes::kMethodNotFound},
                             {"message", "Method not supported by client"}}}};
                auto replied = handle.channel().send_line(reply, deadline);
                if (core::errors::is_error(replied)) {
                    return core::errors::get_error(replied);
                }
                continue;
            }
            case MessageKind::Invalid:
            default:
                BRIDGE_LOG_WARN("Correlator: " + handle.name() +
                                " sent a message that is neither response nor notification");
                record(handle.name(), "discard", message);
                continue;
        }
    }
}

}  // namespace bridge::rpc
