#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "config/config.hpp"
#include "core/errors/launch_errors.hpp"

namespace flowlaunch::config {

struct ConfigRequest {
    std::filesystem::path config_file;
    std::string pdk;
    std::optional<std::string> scl;
    std::optional<std::filesystem::path> pdk_root;
    std::vector<std::string> overrides;
};

// Loads a configuration file and merges command-line overrides into it.
// Failures use ErrorCategory::Config and carry every collected error in
// `details` and every warning in `warnings`.
class ConfigBuilder {
public:
    virtual ~ConfigBuilder() = default;

    virtual core::errors::Result<ResolvedConfig> load(
        const ConfigRequest& request) const = 0;
};

}  // namespace flowlaunch::config
