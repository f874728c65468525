#pragma once

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace bridge::core::logging {

// Append-only JSON Lines audit trail of every message exchanged with the backends.
// Observer only: record() never reports failure to its caller.
class InteractionLog {
public:
    // Disabled log; record() is a no-op.
    InteractionLog() = default;
    explicit InteractionLog(std::filesystem::path log_path);

    InteractionLog(const InteractionLog&) = delete;
    InteractionLog& operator=(const InteractionLog&) = delete;

    void record(const std::string& server, const std::string& action,
                const nlohmann::json& payload);

    bool enabled() const { return log_path_.has_value(); }
    const std::optional<std::filesystem::path>& path() const { return log_path_; }
    std::size_t dropped_entries() const { return dropped_.load(); }

private:
    errors::Status append_entry(const std::string& entry_json);

    std::optional<std::filesystem::path> log_path_;
    std::mutex mutex_;
    std::atomic<std::size_t> dropped_{0};
    bool warned_ = false;
};

}  // namespace bridge::core::logging
