#include "rpc/server_handle.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace bridge::rpc {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

std::string to_string(const HandleState state) {
    switch (state) {
        case HandleState::Spawned:
            return "spawned";
        case HandleState::Initializing:
            return "initializing";
        case HandleState::Ready:
            return "ready";
        case HandleState::Failed:
            return "failed";
        case HandleState::Dead:
            return "dead";
        default:
            return "unknown";
    }
}

ServerHandle::ServerHandle(std::string name,
                           std::unique_ptr<transport::StdioChannel> channel)
    : name_(std::move(name)), channel_(std::move(channel)) {}

bool ServerHandle::is_allowed(const HandleState from, const HandleState to) {
    switch (from) {
        case HandleState::Spawned:
            return to == HandleState::Initializing || to == HandleState::Failed;
        case HandleState::Initializing:
            return to == HandleState::Ready || to == HandleState::Failed;
        case HandleState::Ready:
            return to == HandleState::Dead;
        default:
            return false;
    }
}

HandleState ServerHandle::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<std::string> ServerHandle::failure_reason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return failure_reason_;
}

core::errors::Result<HandleState> ServerHandle::transition(
    const HandleState next, const std::optional<std::string>& reason) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!is_allowed(state_, next)) {
        return BridgeError{ErrorCategory::Lifecycle,
                           "Backend '" + name_ + "' cannot go from " + to_string(state_) +
                               " to " + to_string(next),
                           "invalid_state_transition"};
    }

    const std::string prev = to_string(state_);
    state_ = next;
    if (reason.has_value()) {
        failure_reason_ = reason;
    }
    BRIDGE_LOG_INFO("ServerHandle: " + name_ + " transition " + prev + " -> " +
                    to_string(next) + (reason.has_value() ? " (" + reason.value() + ")" : ""));
    return state_;
}

void ServerHandle::set_server_info(nlohmann::json info) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    server_info_ = std::move(info);
}

nlohmann::json ServerHandle::server_info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

void ServerHandle::close(const std::chrono::milliseconds grace) noexcept {
    if (channel_) {
        channel_->close(grace);
    }
}

}  // namespace bridge::rpc
