#include "core/logging/interaction_log.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace bridge::core::logging {

using errors::BridgeError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

std::string iso_timestamp(const std::int64_t unix_ms) {
    const std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3)
        << std::setfill('0') << (unix_ms % 1000) << "Z";
    return out.str();
}

}  // namespace

InteractionLog::InteractionLog(std::filesystem::path log_path)
    : log_path_(std::move(log_path)) {}

errors::Status InteractionLog::append_entry(const std::string& entry_json) {
    const auto& log_path = log_path_.value();
    const auto parent = log_path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return BridgeError{ErrorCategory::Internal,
                               "Unable to create interaction log directory: " +
                                   parent.string(),
                               "interaction_log_dir_failed"};
        }
    }

    std::ofstream out(log_path, std::ios::app);
    if (!out.is_open()) {
        return BridgeError{ErrorCategory::Internal,
                           "Unable to open interaction log: " + log_path.string(),
                           "interaction_log_open_failed"};
    }

    out << entry_json << "\n";
    out.flush();
    if (!out.good()) {
        return BridgeError{ErrorCategory::Internal,
                           "Unable to write interaction log: " + log_path.string(),
                           "interaction_log_write_failed"};
    }
    return errors::ok();
}

void InteractionLog::record(const std::string& server, const std::string& action,
                            const json& payload) {
    if (!log_path_.has_value()) {
        return;
    }

    const auto ts = now_unix_ms();
    json entry;
    entry["ts_unix_ms"] = ts;
    entry["timestamp"] = iso_timestamp(ts);
    entry["server"] = server;
    entry["action"] = action;
    entry["payload"] = payload;
    // Replace invalid UTF-8 coming from a backend instead of throwing.
    const std::string line = entry.dump(-1, ' ', false, json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    const auto status = append_entry(line);
    if (errors::is_error(status)) {
        dropped_.fetch_add(1);
        if (!warned_) {
            warned_ = true;
            BRIDGE_LOG_WARN("InteractionLog: " + errors::get_error(status).message +
                            " (further failures are counted silently)");
        }
    }
}

}  // namespace bridge::core::logging
