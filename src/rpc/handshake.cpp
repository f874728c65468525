#include "rpc/handshake.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/jsonrpc_contract.hpp"

namespace bridge::rpc {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

Handshake::Handshake(core::config::ClientIdentity client, const Correlator& correlator)
    : client_(std::move(client)), correlator_(correlator) {}

json Handshake::initialize_params() const {
    json params;
    params["protocolVersion"] = client_.protocol_version;
    params["capabilities"] = json::object();
    params["clientInfo"] = {{"name", client_.name}, {"version", client_.version}};
    return params;
}

BridgeError Handshake::fail(ServerHandle& handle, BridgeError error) const {
    auto moved = handle.transition(HandleState::Failed, error.code + ": " + error.message);
    if (core::errors::is_error(moved)) {
        BRIDGE_LOG_WARN("Handshake: " + core::errors::get_error(moved).message);
    }
    return error;
}

core::errors::Status Handshake::initialize(ServerHandle& handle,
                                           const std::chrono::milliseconds timeout) const {
    auto started = handle.transition(HandleState::Initializing);
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }

    auto response = correlator_.handshake_call(handle, protocol::methods::kInitialize,
                                               initialize_params(), timeout);
    if (core::errors::is_error(response)) {
        const auto& err = core::errors::get_error(response);
        switch (err.category) {
            case ErrorCategory::Remote:
                return fail(handle, BridgeError{ErrorCategory::Handshake,
                                                "Backend '" + handle.name() +
                                                    "' rejected initialize: " + err.message,
                                                "handshake_rejected", "", err.rpc_code});
            case ErrorCategory::Timeout:
                return fail(handle, BridgeError{ErrorCategory::Handshake,
                                                "Backend '" + handle.name() +
                                                    "' did not answer initialize in time.",
                                                "handshake_timeout"});
            default:
                return fail(handle, BridgeError{ErrorCategory::Handshake,
                                                "Backend '" + handle.name() +
                                                    "' failed during initialize: " + err.message,
                                                "handshake_transport", err.hint});
        }
    }

    const json& result = core::errors::get_value(response);
    json info = json::object();
    if (result.is_object()) {
        for (const char* key : {"protocolVersion", "serverInfo", "capabilities"}) {
            if (result.contains(key)) {
                info[key] = result.at(key);
            }
        }
        if (result.contains("protocolVersion") && result.at("protocolVersion").is_string() &&
            result.at("protocolVersion").get<std::string>() != client_.protocol_version) {
            BRIDGE_LOG_WARN("Handshake: " + handle.name() + " negotiated protocol " +
                            result.at("protocolVersion").get<std::string>() + " (asked for " +
                            client_.protocol_version + ")");
        }
    }
    handle.set_server_info(info);

    auto notified = correlator_.notify(handle, protocol::methods::kInitialized, json::object());
    if (core::errors::is_error(notified)) {
        const auto& err = core::errors::get_error(notified);
        return fail(handle, BridgeError{ErrorCategory::Handshake,
                                        "Backend '" + handle.name() +
                                            "' failed during initialized notification: " +
                                            err.message,
                                        "handshake_transport"});
    }

    auto ready = handle.transition(HandleState::Ready);
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }
    return core::errors::ok();
}

}  // namespace bridge::rpc
