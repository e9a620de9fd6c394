#pragma once
#include <chrono>
#include <cstddef>
#include <ctime>
#include <string>

namespace flowlaunch::core::config {

    // Generates a timestamped run tag, e.g. "RUN_2024-03-01_14-05-09"
    inline std::string generate_run_tag() {
        const std::time_t now =
            std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);

        char buffer[32];
        const std::size_t written =
            std::strftime(buffer, sizeof(buffer), "RUN_%Y-%m-%d_%H-%M-%S", &local);
        return std::string(buffer, written);
    }

} // namespace flowlaunch::core::config
