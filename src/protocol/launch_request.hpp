#pragma once
#include <string>
#include <filesystem>
#include <optional>
#include <vector>

namespace flowlaunch::protocol {

    // Validated command-line input required to launch a flow
    struct LaunchRequest {
        std::string pdk = "sky130A";
        std::optional<std::string> scl;
        std::optional<std::string> flow_name;
        std::optional<std::filesystem::path> pdk_root;

        // Mutually exclusive; enforced by the CLI validator
        std::optional<std::string> run_tag;
        bool resume_last = false;

        std::optional<std::string> from_step;
        std::optional<std::string> to_step;
        std::optional<std::filesystem::path> initial_state_path;

        // Raw KEY=VALUE strings in command-line order
        std::vector<std::string> config_overrides;
        std::filesystem::path config_file;
    };

} // namespace flowlaunch::protocol
