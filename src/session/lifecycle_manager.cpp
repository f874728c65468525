#include "session/lifecycle_manager.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <utility>
#include "core/logging/logger.hpp"
#include "rpc/handshake.hpp"
#include "transport/stdio_channel.hpp"

namespace bridge::session {

using core::config::ServerConfig;
using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

json error_to_json(const BridgeError& error) {
    json out;
    out["category"] = core::errors::to_string(error.category);
    out["code"] = error.code;
    out["message"] = error.message;
    if (!error.hint.empty()) {
        out["hint"] = error.hint;
    }
    if (error.rpc_code != 0) {
        out["rpc_code"] = error.rpc_code;
    }
    return out;
}

BackendReport failed_report(const std::string& name, BridgeError error) {
    BackendReport report;
    report.name = name;
    report.status = BackendStatus::Failed;
    report.error = std::move(error);
    return report;
}

}  // namespace

std::string to_string(const BackendStatus status) {
    switch (status) {
        case BackendStatus::Ready:
            return "ready";
        case BackendStatus::Failed:
            return "failed";
        case BackendStatus::Skipped:
            return "skipped";
        default:
            return "unknown";
    }
}

std::size_t StartReport::ready_count() const {
    std::size_t count = 0;
    for (const auto& backend : backends) {
        if (backend.status == BackendStatus::Ready) {
            ++count;
        }
    }
    return count;
}

bool StartReport::all_ready() const {
    for (const auto& backend : backends) {
        if (backend.status == BackendStatus::Failed) {
            return false;
        }
    }
    return true;
}

json StartReport::to_json() const {
    json entries = json::array();
    for (const auto& backend : backends) {
        json entry;
        entry["name"] = backend.name;
        entry["state"] = to_string(backend.status);
        if (backend.error.has_value()) {
            entry["error"] = error_to_json(backend.error.value());
        }
        if (backend.status == BackendStatus::Ready && backend.server_info.contains("serverInfo")) {
            entry["server_info"] = backend.server_info.at("serverInfo");
        }
        entries.push_back(entry);
    }
    return json{{"backends", entries},
                {"ready", ready_count()},
                {"all_ready", all_ready()}};
}

LifecycleManager::LifecycleManager(ServerRegistry& registry,
                                   core::config::ClientIdentity client,
                                   const std::chrono::milliseconds handshake_timeout,
                                   const std::chrono::milliseconds shutdown_grace,
                                   core::logging::InteractionLog* interaction_log)
    : registry_(registry),
      client_(std::move(client)),
      handshake_timeout_(handshake_timeout),
      shutdown_grace_(shutdown_grace),
      interaction_log_(interaction_log),
      correlator_(interaction_log) {}

LifecycleManager::~LifecycleManager() {
    shutdown_all();
}

void LifecycleManager::record(const std::string& server, const std::string& action,
                              const json& payload) noexcept {
    if (interaction_log_ == nullptr) {
        return;
    }
    try {
        interaction_log_->record(server, action, payload);
    } catch (const std::exception& e) {
        BRIDGE_LOG_WARN(std::string("LifecycleManager: interaction log failed: ") + e.what());
    }
}

StartReport LifecycleManager::start_all(const std::vector<ServerConfig>& servers) {
    StartReport report;
    std::set<std::string> seen;
    for (const auto& server : servers) {
        if (!server.enabled) {
            BRIDGE_LOG_INFO("LifecycleManager: " + server.name + " disabled, skipping");
            BackendReport skipped;
            skipped.name = server.name;
            skipped.status = BackendStatus::Skipped;
            report.backends.push_back(std::move(skipped));
            continue;
        }
        if (!seen.insert(server.name).second || registry_.contains(server.name)) {
            BackendReport duplicate = failed_report(
                server.name, BridgeError{ErrorCategory::Registry,
                                         "Backend '" + server.name + "' is configured twice.",
                                         "duplicate_name"});
            record(server.name, "start_failed", error_to_json(duplicate.error.value()));
            report.backends.push_back(std::move(duplicate));
            continue;
        }
        report.backends.push_back(start_one(server));
    }

    BRIDGE_LOG_INFO("LifecycleManager: " + std::to_string(report.ready_count()) + "/" +
                    std::to_string(report.backends.size()) + " backends ready");
    return report;
}

BackendReport LifecycleManager::start_one(const ServerConfig& server) {
    if (server.name.empty()) {
        return failed_report(server.name,
                             BridgeError{ErrorCategory::Input, "Backend name cannot be empty.",
                                         "invalid_registration"});
    }

    BRIDGE_LOG_INFO("LifecycleManager: starting " + server.name + " (" + server.command + ")");
    transport::ChannelOptions options;
    options.name = server.name;
    options.command = server.command;
    options.args = server.args;
    options.working_directory = server.working_directory;
    options.env = server.env;

    auto opened = transport::StdioChannel::open(options, interaction_log_);
    if (core::errors::is_error(opened)) {
        const auto& err = core::errors::get_error(opened);
        BRIDGE_LOG_ERROR("LifecycleManager: " + server.name + " failed to spawn: " + err.message);
        record(server.name, "start_failed", error_to_json(err));
        return failed_report(server.name, err);
    }

    auto handle = std::make_shared<rpc::ServerHandle>(
        server.name, std::move(std::get<std::unique_ptr<transport::StdioChannel>>(opened)));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handles_.push_back(handle);
    }

    const auto timeout = server.timeout_ms.has_value()
                             ? std::chrono::milliseconds(server.timeout_ms.value())
                             : handshake_timeout_;
    const rpc::Handshake handshake(client_, correlator_);
    const auto initialized = handshake.initialize(*handle, timeout);
    if (core::errors::is_error(initialized)) {
        const auto& err = core::errors::get_error(initialized);
        BRIDGE_LOG_ERROR("LifecycleManager: " + server.name + " handshake failed: " +
                         err.message);
        record(server.name, "start_failed", error_to_json(err));
        // Do not keep a half-started process around until shutdown.
        handle->close(shutdown_grace_);
        return failed_report(server.name, err);
    }

    auto registered = registry_.register_server(server.name, handle);
    if (core::errors::is_error(registered)) {
        const auto& err = core::errors::get_error(registered);
        record(server.name, "start_failed", error_to_json(err));
        handle->close(shutdown_grace_);
        return failed_report(server.name, err);
    }
    if (server.timeout_ms.has_value()) {
        registry_.set_timeout(server.name, timeout);
    }

    BackendReport report;
    report.name = server.name;
    report.status = BackendStatus::Ready;
    report.server_info = handle->server_info();
    record(server.name, "start", report.server_info);
    return report;
}

void LifecycleManager::shutdown_all() noexcept {
    std::vector<std::shared_ptr<rpc::ServerHandle>> handles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handles.swap(handles_);
    }
    // Drop registry entries first so no new call starts. Handles registered
    // directly on the registry are closed here too.
    for (auto& registered : registry_.unregister_all()) {
        if (std::find(handles.begin(), handles.end(), registered) == handles.end()) {
            handles.push_back(std::move(registered));
        }
    }
    if (handles.empty()) {
        return;
    }

    BRIDGE_LOG_INFO("LifecycleManager: shutting down " + std::to_string(handles.size()) +
                    " backend(s)");
    for (const auto& handle : handles) {
        handle->close(shutdown_grace_);
        const auto exit_code = handle->channel().exit_code();
        record(handle->name(), "shutdown",
               json{{"state", rpc::to_string(handle->state())},
                    {"exit_code", exit_code.has_value() ? json(exit_code.value()) : json()}});
    }
}

std::size_t LifecycleManager::open_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

}  // namespace bridge::session
