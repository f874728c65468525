#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "transport/stdio_channel.hpp"

namespace bridge::rpc {

// Spawned -> Initializing -> Ready | Failed; Ready -> Dead on transport failure.
enum class HandleState {
    Spawned,
    Initializing,
    Ready,
    Failed,
    Dead
};

std::string to_string(HandleState state);

// Bridge-side view of one running backend.
class ServerHandle {
public:
    ServerHandle(std::string name, std::unique_ptr<transport::StdioChannel> channel);

    ServerHandle(const ServerHandle&) = delete;
    ServerHandle& operator=(const ServerHandle&) = delete;

    const std::string& name() const { return name_; }
    HandleState state() const;
    bool is_ready() const { return state() == HandleState::Ready; }
    std::optional<std::string> failure_reason() const;

    core::errors::Result<HandleState> transition(
        HandleState next, const std::optional<std::string>& reason = std::nullopt);

    transport::StdioChannel& channel() { return *channel_; }

    // Unique for the life of the handle; starts at 1.
    std::int64_t next_request_id() { return next_id_.fetch_add(1); }

    // Held for the whole send/receive exchange of one call.
    std::timed_mutex& call_mutex() { return call_mutex_; }

    void set_server_info(nlohmann::json info);
    nlohmann::json server_info() const;

    void close(std::chrono::milliseconds grace) noexcept;

private:
    static bool is_allowed(HandleState from, HandleState to);

    std::string name_;
    std::unique_ptr<transport::StdioChannel> channel_;

    mutable std::mutex state_mutex_;
    HandleState state_ = HandleState::Spawned;
    std::optional<std::string> failure_reason_;
    nlohmann::json server_info_ = nlohmann::json::object();

    std::atomic<std::int64_t> next_id_{1};
    std::timed_mutex call_mutex_;
};

}  // namespace bridge::rpc
