#pragma once
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace usbide::core::config {

    // "sess-<unix seconds, 8 hex>-<random, 4 hex>", ordered by start time
    inline std::string generate_session_id(
        const std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) {
        const auto seconds =
            std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<std::uint32_t> dis(0, 0xFFFF);

        std::ostringstream ss;
        ss << "sess-" << std::hex << std::setfill('0') << std::setw(8)
           << static_cast<std::uint32_t>(seconds) << '-' << std::setw(4) << dis(gen);
        return ss.str();
    }

} // namespace usbide::core::config
