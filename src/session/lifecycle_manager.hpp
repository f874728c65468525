#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/interaction_log.hpp"
#include "rpc/correlator.hpp"
#include "rpc/server_handle.hpp"
#include "session/server_registry.hpp"

namespace bridge::session {

enum class BackendStatus {
    Ready,
    Failed,
    Skipped
};

std::string to_string(BackendStatus status);

struct BackendReport {
    std::string name;
    BackendStatus status = BackendStatus::Failed;
    std::optional<core::errors::BridgeError> error;
    nlohmann::json server_info = nlohmann::json::object();
};

struct StartReport {
    std::vector<BackendReport> backends;

    std::size_t ready_count() const;
    // Skipped backends do not count against this.
    bool all_ready() const;
    nlohmann::json to_json() const;
};

// Starts every configured backend and owns it until shutdown.
class LifecycleManager {
public:
    LifecycleManager(ServerRegistry& registry, core::config::ClientIdentity client,
                     std::chrono::milliseconds handshake_timeout,
                     std::chrono::milliseconds shutdown_grace,
                     core::logging::InteractionLog* interaction_log = nullptr);
    ~LifecycleManager();

    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    // One backend failing never stops the others.
    StartReport start_all(const std::vector<core::config::ServerConfig>& servers);

    // Clears the registry, then closes every handle ever opened or registered,
    // ready or not.
    void shutdown_all() noexcept;

    std::size_t open_count() const;

private:
    BackendReport start_one(const core::config::ServerConfig& server);
    void record(const std::string& server, const std::string& action,
                const nlohmann::json& payload) noexcept;

    ServerRegistry& registry_;
    core::config::ClientIdentity client_;
    std::chrono::milliseconds handshake_timeout_;
    std::chrono::milliseconds shutdown_grace_;
    core::logging::InteractionLog* interaction_log_;
    rpc::Correlator correlator_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<rpc::ServerHandle>> handles_;
};

}  // namespace bridge::session
