#pragma once
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace bridge::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Case-insensitive; unknown names fall back to INFO.
    inline LogLevel level_from_string(std::string name) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](const unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        if (name == "debug") return LogLevel::DEBUG;
        if (name == "warn" || name == "warning") return LogLevel::WARN;
        if (name == "error") return LogLevel::ERROR;
        return LogLevel::INFO;
    }

    inline bool is_level_name(const std::string& name) {
        return name == "debug" || name == "info" || name == "warn" ||
               name == "warning" || name == "error";
    }

    // Process-wide logger. Writes to stderr so stdout stays free for command output.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << timestamp() << " [" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string timestamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    now.time_since_epoch()) % 1000;
            std::tm utc{};
            gmtime_r(&seconds, &utc);
            std::ostringstream out;
            out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "."
                << std::setw(3) << std::setfill('0') << millis.count() << "Z";
            return out.str();
        }

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define BRIDGE_LOG_DEBUG(msg) bridge::core::logging::Logger::get().log(bridge::core::logging::LogLevel::DEBUG, msg)
    #define BRIDGE_LOG_INFO(msg)  bridge::core::logging::Logger::get().log(bridge::core::logging::LogLevel::INFO, msg)
    #define BRIDGE_LOG_WARN(msg)  bridge::core::logging::Logger::get().log(bridge::core::logging::LogLevel::WARN, msg)
    #define BRIDGE_LOG_ERROR(msg) bridge::core::logging::Logger::get().log(bridge::core::logging::LogLevel::ERROR, msg)

} // namespace bridge::core::logging
