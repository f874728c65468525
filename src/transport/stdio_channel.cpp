#include "transport/stdio_channel.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

extern char** environ;

namespace bridge::transport {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(::close(fd));
        fd = -1;
    }
}

void close_pair(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// A backend that dies mid-write must not take the bridge down with it.
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

// Poll slices are capped so a far deadline never turns into one huge wait.
int poll_slice_ms(const StdioChannel::Clock::time_point deadline) {
    const auto now = StdioChannel::Clock::now();
    if (now >= deadline) {
        return 0;
    }
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    return static_cast<int>(std::min<long long>(ms + 1, 1000));
}

std::vector<std::string> build_environment(
    const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string text(*entry);
        const std::string key = text.substr(0, text.find('='));
        if (overrides.find(key) != overrides.end()) {
            continue;
        }
        env.push_back(text);
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> to_pointer_array(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& value : strings) {
        pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

std::string describe_command(const ChannelOptions& options) {
    std::string text = options.command;
    for (const auto& arg : options.args) {
        text += " " + arg;
    }
    return text;
}

std::string last_line(const std::string& text) {
    const auto end = text.find_last_not_of("\r\n \t");
    if (end == std::string::npos) {
        return "";
    }
    const auto start = text.rfind('\n', end);
    return text.substr(start == std::string::npos ? 0 : start + 1,
                       end - (start == std::string::npos ? 0 : start + 1) + 1);
}

std::string truncate(const std::string& text, const std::size_t max_length = 240) {
    if (text.size() <= max_length) {
        return text;
    }
    return text.substr(0, max_length) + "...";
}

void write_errno_and_exit(const int status_fd, const int exit_code) {
    const int err = errno;
    static_cast<void>(::write(status_fd, &err, sizeof(err)));
    _exit(exit_code);
}

}  // namespace

core::errors::Result<std::unique_ptr<StdioChannel>> StdioChannel::open(
    const ChannelOptions& options, core::logging::InteractionLog* interaction_log) {
    if (options.command.empty()) {
        return BridgeError{ErrorCategory::Input,
                           "Backend '" + options.name + "' has an empty command.",
                           "invalid_command"};
    }
    ignore_sigpipe_once();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0) {
        const int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        return BridgeError{ErrorCategory::Internal,
                           "Failed to create process pipes: " + std::string(std::strerror(err)),
                           "pipe_creation_failed"};
    }

    // Everything the child needs is prepared before fork(); between fork()
    // and exec only async-signal-safe calls are made.
    std::vector<std::string> argv_strings;
    argv_strings.push_back(options.command);
    argv_strings.insert(argv_strings.end(), options.args.begin(), options.args.end());
    std::vector<char*> argv = to_pointer_array(argv_strings);
    std::vector<std::string> env_strings = build_environment(options.env);
    std::vector<char*> envp = to_pointer_array(env_strings);
    const std::string cwd =
        options.working_directory.has_value() ? options.working_directory->string() : "";

    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        return BridgeError{ErrorCategory::Internal,
                           "Failed to fork process: " + std::string(std::strerror(err)),
                           "fork_failed"};
    }

    if (pid == 0) {
        // Own process group, so shutdown also reaches helpers the backend spawns (npx -> node).
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(std::signal(SIGPIPE, SIG_DFL));
        if (dup2(in_pipe[0], STDIN_FILENO) < 0 || dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
            dup2(err_pipe[1], STDERR_FILENO) < 0) {
            write_errno_and_exit(status_pipe[1], 126);
        }
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            write_errno_and_exit(status_pipe[1], 126);
        }
        execvpe(argv[0], argv.data(), envp.data());
        write_errno_and_exit(status_pipe[1], 127);
    }

    static_cast<void>(setpgid(pid, pid));
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe is close-on-exec: EOF means exec succeeded, an errno means it did not.
    int child_errno = 0;
    ssize_t status_bytes = 0;
    do {
        status_bytes = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (status_bytes < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (status_bytes > 0) {
        int wait_status = 0;
        while (waitpid(pid, &wait_status, 0) < 0 && errno == EINTR) {
        }
        close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        std::string hint = "Check that '" + options.command + "' is installed and on PATH.";
        if (!cwd.empty()) {
            hint += " Working directory: " + cwd;
        }
        BRIDGE_LOG_ERROR("StdioChannel[" + options.name + "]: failed to launch '" +
                         describe_command(options) + "': " + std::strerror(child_errno));
        return BridgeError{ErrorCategory::Spawn,
                           "Failed to launch '" + options.command +
                               "': " + std::strerror(child_errno),
                           "process_spawn_failed", hint};
    }

    set_nonblocking(in_pipe[1]);
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    BRIDGE_LOG_INFO("StdioChannel[" + options.name + "]: spawned pid " +
                    std::to_string(pid) + ": " + describe_command(options));
    return std::unique_ptr<StdioChannel>(new StdioChannel(
        options.name, pid, in_pipe[1], out_pipe[0], err_pipe[0], interaction_log));
}

StdioChannel::StdioChannel(std::string name, const pid_t pid, const int stdin_fd,
                           const int stdout_fd, const int stderr_fd,
                           core::logging::InteractionLog* interaction_log)
    : name_(std::move(name)),
      pid_(pid),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd),
      interaction_log_(interaction_log) {}

StdioChannel::~StdioChannel() {
    close(std::chrono::milliseconds(1000));
}

void StdioChannel::mirror(const std::string& action, const json& payload) {
    if (interaction_log_ != nullptr) {
        interaction_log_->record(name_, action, payload);
    }
}

core::errors::Status StdioChannel::send_line(const json& message) {
    return send_line(message, Clock::now() + kDefaultWriteTimeout);
}

core::errors::Status StdioChannel::send_line(const json& message,
                                             const Clock::time_point deadline) {
    std::string frame = message.dump(-1, ' ', false, json::error_handler_t::replace);
    frame.push_back('\n');
    drain_stderr();

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0) {
        return BridgeError{ErrorCategory::Transport,
                           "Backend '" + name_ + "' channel is closed.", "write_failed"};
    }

    mirror("send", message);
    if (core::logging::Logger::get().enabled(core::logging::LogLevel::DEBUG)) {
        BRIDGE_LOG_DEBUG(name_ + " <- " + truncate(frame.substr(0, frame.size() - 1), 2000));
    }

    std::size_t written = 0;
    while (written < frame.size()) {
        const ssize_t n = ::write(stdin_fd_, frame.data() + written, frame.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            const int wait_ms = poll_slice_ms(deadline);
            if (wait_ms == 0) {
                return BridgeError{ErrorCategory::Transport,
                                   "Backend '" + name_ + "' stopped reading its input.",
                                   "write_stalled"};
            }
            pollfd out_fd{stdin_fd_, POLLOUT, 0};
            static_cast<void>(poll(&out_fd, 1, wait_ms));
            continue;
        }
        const int err = n < 0 ? errno : EIO;
        return BridgeError{ErrorCategory::Transport,
                           "Write to backend '" + name_ + "' failed: " + std::strerror(err),
                           "write_failed"};
    }
    return core::errors::ok();
}

core::errors::Result<json> StdioChannel::read_line(const Clock::time_point deadline) {
    std::lock_guard<std::mutex> lock(read_mutex_);
    while (true) {
        const auto newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.find_first_not_of(" \t") == std::string::npos) {
                continue;
            }

            json message = json::parse(line, nullptr, false);
            if (message.is_discarded()) {
                mirror("receive", json{{"raw", line}, {"parse_error", true}});
                BRIDGE_LOG_WARN("StdioChannel[" + name_ + "]: unparsable line: " +
                                truncate(line));
                return BridgeError{ErrorCategory::Transport,
                                   "Backend '" + name_ + "' sent a line that is not valid JSON.",
                                   "parse_error", "line: " + truncate(line)};
            }
            mirror("receive", message);
            if (core::logging::Logger::get().enabled(core::logging::LogLevel::DEBUG)) {
                BRIDGE_LOG_DEBUG(name_ + " -> " + truncate(line, 2000));
            }
            return message;
        }

        if (read_buffer_.size() > kMaxLineBytes) {
            read_buffer_.clear();
            return BridgeError{ErrorCategory::Transport,
                               "Backend '" + name_ + "' sent a line longer than " +
                                   std::to_string(kMaxLineBytes) + " bytes.",
                               "line_too_long"};
        }
        if (stdout_eof_ || stdout_fd_ < 0) {
            return end_of_stream_error();
        }

        const int wait_ms = poll_slice_ms(deadline);
        if (wait_ms == 0) {
            return BridgeError{ErrorCategory::Timeout,
                               "No message from backend '" + name_ + "' before the deadline.",
                               "timeout"};
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        fds[nfds].fd = stdout_fd_;
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        ++nfds;
        {
            std::lock_guard<std::mutex> stderr_lock(stderr_mutex_);
            if (stderr_fd_ >= 0) {
                fds[nfds].fd = stderr_fd_;
                fds[nfds].events = POLLIN;
                fds[nfds].revents = 0;
                ++nfds;
            }
        }

        const int ready = poll(fds, nfds, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            return BridgeError{ErrorCategory::Transport,
                               "poll() on backend '" + name_ + "' failed: " + std::strerror(err),
                               "poll_failed"};
        }
        if (nfds > 1 && fds[1].revents != 0) {
            drain_stderr();
        }
        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
            continue;
        }

        char buffer[4096];
        while (read_buffer_.size() <= kMaxLineBytes) {
            const ssize_t n = ::read(stdout_fd_, buffer, sizeof(buffer));
            if (n > 0) {
                read_buffer_.append(buffer, static_cast<std::size_t>(n));
                continue;
            }
            if (n == 0) {
                stdout_eof_ = true;
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                stdout_eof_ = true;
            }
            break;
        }
    }
}

void StdioChannel::drain_stderr() {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    if (stderr_fd_ < 0) {
        return;
    }

    std::string chunk;
    char buffer[4096];
    while (true) {
        const ssize_t n = ::read(stderr_fd_, buffer, sizeof(buffer));
        if (n > 0) {
            chunk.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            close_fd(stderr_fd_);
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        break;
    }

    if (chunk.empty()) {
        return;
    }
    if (core::logging::Logger::get().enabled(core::logging::LogLevel::DEBUG)) {
        BRIDGE_LOG_DEBUG(name_ + " [stderr] " + truncate(last_line(chunk), 2000));
    }
    stderr_buffer_ += chunk;
    if (stderr_buffer_.size() > kStderrTailBytes) {
        stderr_buffer_.erase(0, stderr_buffer_.size() - kStderrTailBytes);
    }
}

std::string StdioChannel::stderr_tail() const {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return stderr_buffer_;
}

bool StdioChannel::reap(const bool block) {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (reaped_) {
        return true;
    }

    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (waited < 0 && errno == EINTR);

    if (waited == pid_) {
        reaped_ = true;
        wait_status_ = status;
        return true;
    }
    if (waited < 0 && errno == ECHILD) {
        reaped_ = true;
        return true;
    }
    return false;
}

bool StdioChannel::is_alive() {
    return !reap(false);
}

bool StdioChannel::is_closed() const {
    return closed_.load();
}

std::optional<int> StdioChannel::exit_code() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (!reaped_) {
        return std::nullopt;
    }
    if (WIFEXITED(wait_status_)) {
        return WEXITSTATUS(wait_status_);
    }
    if (WIFSIGNALED(wait_status_)) {
        return 128 + WTERMSIG(wait_status_);
    }
    return -1;
}

BridgeError StdioChannel::end_of_stream_error() {
    drain_stderr();
    std::string message = "Backend '" + name_ + "' closed its output stream";
    if (!is_alive()) {
        const auto code = exit_code();
        if (code.has_value()) {
            message += " (exit code " + std::to_string(code.value()) + ")";
        }
    }
    message += ".";
    const std::string stderr_line = last_line(stderr_tail());
    return BridgeError{ErrorCategory::Transport, message, "end_of_stream",
                       stderr_line.empty() ? "" : "stderr: " + truncate(stderr_line)};
}

// Exit check that leaves the leader as a zombie, so its pid keeps naming the group.
bool StdioChannel::leader_exited() {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (reaped_) {
        return true;
    }

    siginfo_t info{};
    int rc = 0;
    do {
        rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        return errno == ECHILD;
    }
    return info.si_pid == pid_;
}

// Only signals while the leader is unreaped; after that the pid may belong to someone else.
void StdioChannel::signal_group(const int signal_number) {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (reaped_) {
        return;
    }
    static_cast<void>(::kill(-pid_, signal_number));
    static_cast<void>(::kill(pid_, signal_number));
}

void StdioChannel::terminate_process(const std::chrono::milliseconds grace) {
    if (!leader_exited()) {
        signal_group(SIGTERM);

        const auto deadline = Clock::now() + grace;
        bool exited = false;
        while (Clock::now() < deadline) {
            if (leader_exited()) {
                exited = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (!exited) {
            BRIDGE_LOG_WARN("StdioChannel[" + name_ + "]: pid " + std::to_string(pid_) +
                            " ignored SIGTERM for " + std::to_string(grace.count()) +
                            " ms, sending SIGKILL");
        }
    }
    // Also takes down helpers left behind in the backend's process group.
    signal_group(SIGKILL);
    reap(true);
}

void StdioChannel::close(const std::chrono::milliseconds grace) noexcept {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        close_fd(stdin_fd_);
    }

    terminate_process(grace);

    {
        std::lock_guard<std::mutex> read_lock(read_mutex_);
        drain_stderr();
        close_fd(stdout_fd_);
        std::lock_guard<std::mutex> stderr_lock(stderr_mutex_);
        close_fd(stderr_fd_);
    }

    closed_.store(true);
    const auto code = exit_code();
    BRIDGE_LOG_INFO("StdioChannel[" + name_ + "]: closed pid " + std::to_string(pid_) +
                    (code.has_value() ? " (exit code " + std::to_string(code.value()) + ")"
                                      : ""));
}

}  // namespace bridge::transport
