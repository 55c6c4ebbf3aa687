#pragma once
#include <chrono>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>

namespace ralph::core::config {

    // Identifier for one invocation of the loop: "<prefix>-" followed by 8 hex digits.
    // Used as the log prefix and stamped on every audit event.
    inline std::string generate_run_id(const std::string& prefix = "loop") {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::int64_t now_unix_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

} // namespace ralph::core::config
