#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "rpc/correlator.hpp"
#include "rpc/server_handle.hpp"

namespace bridge::session {

// Named access to every ready backend. invoke() and list_tools() never throw
// and never return a raw error: failures come back as ToolResult{success=false}.
class ServerRegistry {
public:
    explicit ServerRegistry(
        rpc::Correlator correlator = rpc::Correlator{},
        std::chrono::milliseconds default_timeout = rpc::Correlator::kDefaultTimeout);

    core::errors::Status register_server(const std::string& name,
                                         std::shared_ptr<rpc::ServerHandle> handle);

    // "tools/call" with {name: tool, arguments}.
    protocol::ToolResult invoke(
        const std::string& server, const std::string& tool,
        const nlohmann::json& arguments = nlohmann::json::object(),
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    // "tools/list", following nextCursor; data is {"tools": [...]}.
    protocol::ToolResult list_tools(
        const std::string& server,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    void set_timeout(const std::string& server, std::chrono::milliseconds timeout);

    std::vector<std::string> server_names() const;
    bool contains(const std::string& name) const;
    std::size_t size() const;

    // Removes every entry and hands the handles back to the caller.
    std::vector<std::shared_ptr<rpc::ServerHandle>> unregister_all();

private:
    core::errors::Result<std::shared_ptr<rpc::ServerHandle>> find(const std::string& name) const;
    std::chrono::milliseconds timeout_for(const std::string& name) const;

    rpc::Correlator correlator_;
    std::chrono::milliseconds default_timeout_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<rpc::ServerHandle>> servers_;
    std::map<std::string, std::chrono::milliseconds> timeouts_;
};

}  // namespace bridge::session
