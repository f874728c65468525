#include "session/server_registry.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/jsonrpc_contract.hpp"

namespace bridge::session {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::ToolResult;

namespace {

constexpr int kMaxToolPages = 64;

double elapsed_ms(const std::chrono::steady_clock::time_point started) {
    const auto ended = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(ended - started).count();
}

}  // namespace

ServerRegistry::ServerRegistry(rpc::Correlator correlator,
                               const std::chrono::milliseconds default_timeout)
    : correlator_(std::move(correlator)), default_timeout_(default_timeout) {}

core::errors::Status ServerRegistry::register_server(
    const std::string& name, std::shared_ptr<rpc::ServerHandle> handle) {
    if (name.empty()) {
        return BridgeError{ErrorCategory::Input, "Server name cannot be empty.",
                           "invalid_registration"};
    }
    if (!handle) {
        return BridgeError{ErrorCategory::Input, "Server '" + name + "' has no handle.",
                           "invalid_registration"};
    }
    if (!handle->is_ready()) {
        return BridgeError{ErrorCategory::Input,
                           "Server '" + name + "' is not ready (state: " +
                               rpc::to_string(handle->state()) + ").",
                           "invalid_registration"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (servers_.find(name) != servers_.end()) {
        return BridgeError{ErrorCategory::Registry,
                           "Server '" + name + "' is already registered.", "duplicate_name"};
    }
    servers_.emplace(name, std::move(handle));
    BRIDGE_LOG_INFO("ServerRegistry: registered " + name);
    return core::errors::ok();
}

core::errors::Result<std::shared_ptr<rpc::ServerHandle>> ServerRegistry::find(
    const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(name);
    if (it == servers_.end()) {
        return BridgeError{ErrorCategory::Registry, "Unknown server: " + name,
                           "unknown_server"};
    }
    return it->second;
}

std::chrono::milliseconds ServerRegistry::timeout_for(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timeouts_.find(name);
    return it == timeouts_.end() ? default_timeout_ : it->second;
}

void ServerRegistry::set_timeout(const std::string& server,
                                 const std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    timeouts_[server] = timeout;
}

ToolResult ServerRegistry::invoke(const std::string& server, const std::string& tool,
                                  const json& arguments,
                                  const std::optional<std::chrono::milliseconds> timeout) const {
    const auto started = std::chrono::steady_clock::now();
    if (tool.empty()) {
        return protocol::failure_result(
            server, tool,
            BridgeError{ErrorCategory::Input, "Tool name cannot be empty.", "invalid_tool"},
            0.0);
    }
    if (!arguments.is_null() && !arguments.is_object()) {
        return protocol::failure_result(
            server, tool,
            BridgeError{ErrorCategory::Input, "Tool arguments must be a JSON object.",
                        "invalid_arguments"},
            0.0);
    }

    auto found = find(server);
    if (core::errors::is_error(found)) {
        return protocol::failure_result(server, tool, core::errors::get_error(found), 0.0);
    }
    const auto handle = core::errors::get_value(found);

    json params;
    params["name"] = tool;
    params["arguments"] = arguments.is_null() ? json::object() : arguments;

    BRIDGE_LOG_INFO("ServerRegistry: " + server + "." + tool);
    auto result = correlator_.call(*handle, protocol::methods::kToolsCall, params,
                                   timeout.value_or(timeout_for(server)));
    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        BRIDGE_LOG_WARN("ServerRegistry: " + server + "." + tool + " failed [" + err.code +
                        "]: " + err.message);
        return protocol::failure_result(server, tool, err, elapsed_ms(started));
    }
    return protocol::success_result(server, tool, core::errors::get_value(result),
                                    elapsed_ms(started));
}

ToolResult ServerRegistry::list_tools(
    const std::string& server, const std::optional<std::chrono::milliseconds> timeout) const {
    const auto started = std::chrono::steady_clock::now();
    auto found = find(server);
    if (core::errors::is_error(found)) {
        return protocol::failure_result(server, "tools/list", core::errors::get_error(found), 0.0);
    }
    const auto handle = core::errors::get_value(found);

    json tools = json::array();
    std::string cursor;
    for (int page = 0; page < kMaxToolPages; ++page) {
        json params = json::object();
        if (!cursor.empty()) {
            params["cursor"] = cursor;
        }
        auto result = correlator_.call(*handle, protocol::methods::kToolsList, params,
                                       timeout.value_or(timeout_for(server)));
        if (core::errors::is_error(result)) {
            return protocol::failure_result(server, "tools/list", core::errors::get_error(result),
                                            elapsed_ms(started));
        }

        const json& listing = core::errors::get_value(result);
        if (listing.is_object() && listing.contains("tools") && listing.at("tools").is_array()) {
            for (const auto& entry : listing.at("tools")) {
                tools.push_back(entry);
            }
        }
        if (!listing.is_object() || !listing.contains("nextCursor") ||
            !listing.at("nextCursor").is_string()) {
            break;
        }
        cursor = listing.at("nextCursor").get<std::string>();
        if (cursor.empty()) {
            break;
        }
    }

    return protocol::success_result(server, "tools/list", json{{"tools", tools}},
                                    elapsed_ms(started));
}

std::vector<std::string> ServerRegistry::server_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(servers_.size());
    for (const auto& entry : servers_) {
        names.push_back(entry.first);
    }
    return names;
}

bool ServerRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.find(name) != servers_.end();
}

std::size_t ServerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.size();
}

std::vector<std::shared_ptr<rpc::ServerHandle>> ServerRegistry::unregister_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<rpc::ServerHandle>> handles;
    handles.reserve(servers_.size());
    for (auto& entry : servers_) {
        handles.push_back(std::move(entry.second));
    }
    servers_.clear();
    return handles;
}

}  // namespace bridge::session
