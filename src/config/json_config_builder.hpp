#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "config/config_builder.hpp"

namespace flowlaunch::config {

class JsonConfigBuilder : public ConfigBuilder {
public:
    core::errors::Result<ResolvedConfig> load(
        const ConfigRequest& request) const override;

    // Default standard cell library for a PDK, if one is known.
    static std::optional<std::string> default_scl(const std::string& pdk);

    // --pdk-root, else $PDK_ROOT, else $HOME/.volare
    static std::filesystem::path resolve_pdk_root(
        const std::optional<std::filesystem::path>& pdk_root);
};

}  // namespace flowlaunch::config
