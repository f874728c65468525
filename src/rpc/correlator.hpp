#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "core/logging/interaction_log.hpp"
#include "rpc/server_handle.hpp"

namespace bridge::rpc {

// Turns "send request, wait for the line with the same id" into a synchronous call.
//
// One outstanding request per handle: a second caller on the same handle
// blocks on the handle's call lock until the first finishes, bounded by its
// own timeout (then it fails with Busy). Calls on different handles never
// wait on each other.
class Correlator {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{30000};

    explicit Correlator(core::logging::InteractionLog* interaction_log = nullptr);

    // Requires a Ready handle. Errors: Lifecycle (not_ready, server_unavailable),
    // Busy, Timeout, Remote (remote_error) and Transport; a Transport error
    // moves the handle to Dead.
    core::errors::Result<nlohmann::json> call(ServerHandle& handle, const std::string& method,
                                              const nlohmann::json& params,
                                              std::chrono::milliseconds timeout = kDefaultTimeout) const;

    // Same exchange for a handle still in Initializing; used by the handshake.
    core::errors::Result<nlohmann::json> handshake_call(
        ServerHandle& handle, const std::string& method, const nlohmann::json& params,
        std::chrono::milliseconds timeout) const;

    // Fire-and-forget; no response is read.
    core::errors::Status notify(ServerHandle& handle, const std::string& method,
                                const nlohmann::json& params) const;

private:
    core::errors::Result<nlohmann::json> exchange(ServerHandle& handle, const std::string& method,
                                                  const nlohmann::json& params,
                                                  std::chrono::milliseconds timeout,
                                                  HandleState required_state) const;

    void record(const std::string& server, const std::string& action,
                const nlohmann::json& payload) const;

    core::logging::InteractionLog* interaction_log_;
};

}  // namespace bridge::rpc
