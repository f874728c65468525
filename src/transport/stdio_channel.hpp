#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "core/logging/interaction_log.hpp"

namespace bridge::transport {

struct ChannelOptions {
    std::string name;
    std::string command;  // resolved through PATH when it has no '/'
    std::vector<std::string> args;
    std::optional<std::filesystem::path> working_directory;
    std::map<std::string, std::string> env;  // added to (or overriding) the parent environment
};

// One child process speaking newline-delimited JSON over its stdin/stdout.
// stderr is drained into a bounded tail buffer for diagnostics only.
class StdioChannel {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::size_t kMaxLineBytes = 8 * 1024 * 1024;
    static constexpr std::size_t kStderrTailBytes = 64 * 1024;
    static constexpr std::chrono::milliseconds kDefaultWriteTimeout{30000};

    // Fails with ErrorCategory::Spawn when the executable cannot be launched.
    static core::errors::Result<std::unique_ptr<StdioChannel>> open(
        const ChannelOptions& options,
        core::logging::InteractionLog* interaction_log = nullptr);

    ~StdioChannel();

    StdioChannel(const StdioChannel&) = delete;
    StdioChannel& operator=(const StdioChannel&) = delete;

    // Writes one JSON document followed by '\n'. The whole frame is written
    // under the channel's write lock, so concurrent senders never interleave.
    core::errors::Status send_line(const nlohmann::json& message);
    core::errors::Status send_line(const nlohmann::json& message,
                                   Clock::time_point deadline);

    // Blocks until one complete line is available or the deadline passes.
    // Errors: end_of_stream, parse_error, line_too_long (Transport), timeout (Timeout).
    core::errors::Result<nlohmann::json> read_line(Clock::time_point deadline);

    // Closes stdin, sends SIGTERM to the process group, waits up to `grace`,
    // then SIGKILLs and reaps. Safe to call repeatedly.
    void close(std::chrono::milliseconds grace) noexcept;

    bool is_alive();
    bool is_closed() const;
    pid_t pid() const { return pid_; }
    const std::string& name() const { return name_; }
    std::optional<int> exit_code() const;
    std::string stderr_tail() const;

private:
    StdioChannel(std::string name, pid_t pid, int stdin_fd, int stdout_fd,
                 int stderr_fd, core::logging::InteractionLog* interaction_log);

    void drain_stderr();
    bool reap(bool block);
    bool leader_exited();
    void signal_group(int signal_number);
    void terminate_process(std::chrono::milliseconds grace);
    core::errors::BridgeError end_of_stream_error();
    void mirror(const std::string& action, const nlohmann::json& payload);

    std::string name_;
    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    core::logging::InteractionLog* interaction_log_;

    std::mutex write_mutex_;
    std::mutex read_mutex_;
    std::string read_buffer_;
    bool stdout_eof_ = false;

    mutable std::mutex stderr_mutex_;
    std::string stderr_buffer_;

    mutable std::mutex process_mutex_;
    bool reaped_ = false;
    int wait_status_ = 0;

    std::mutex close_mutex_;
    std::atomic<bool> closed_{false};
};

}  // namespace bridge::transport
