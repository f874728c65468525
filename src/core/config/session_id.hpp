#pragma once
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace bridge::core::config {

    // Tags every log line of one bridge process: "session-" + 8 hex digits.
    inline std::string generate_session_id() {
        std::random_device rd;
        std::uniform_int_distribution<std::uint32_t> dis;

        std::ostringstream out;
        out << "session-" << std::hex << std::setw(8) << std::setfill('0') << dis(rd);
        return out.str();
    }

} // namespace bridge::core::config
