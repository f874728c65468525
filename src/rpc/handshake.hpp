#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "rpc/correlator.hpp"
#include "rpc/server_handle.hpp"

namespace bridge::rpc {

// Brings a freshly spawned handle to Ready: "initialize" request, then the
// "notifications/initialized" notification. Any failure leaves it Failed.
class Handshake {
public:
    Handshake(core::config::ClientIdentity client, const Correlator& correlator);

    core::errors::Status initialize(ServerHandle& handle,
                                    std::chrono::milliseconds timeout) const;

    nlohmann::json initialize_params() const;

private:
    core::errors::BridgeError fail(ServerHandle& handle, core::errors::BridgeError error) const;

    core::config::ClientIdentity client_;
    const Correlator& correlator_;
};

}  // namespace bridge::rpc
