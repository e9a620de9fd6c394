#include "config/json_config_builder.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace flowlaunch::config {

using core::errors::ErrorCategory;
using core::errors::LaunchError;
using nlohmann::json;

namespace {

constexpr const char* kDirPrefix = "dir::";

struct Issue {
    std::string code;
    std::string message;
};

LaunchError make_config_error(const std::filesystem::path& config_file,
                              const std::vector<Issue>& issues,
                              std::vector<std::string> warnings) {
    LaunchError error{ErrorCategory::Config,
                      "Errors have occurred while loading the configuration file '" +
                          config_file.string() + "'",
                      issues.size() == 1 ? issues.front().code : "invalid_config",
                      "Please check your configuration."};
    for (const auto& issue : issues) {
        error.details.push_back(issue.message);
    }
    error.warnings = std::move(warnings);
    return error;
}

bool is_identifier(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    const auto first = static_cast<unsigned char>(key.front());
    if (std::isalpha(first) == 0 && key.front() != '_') {
        return false;
    }
    for (const char c : key) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
            return false;
        }
    }
    return true;
}

void parse_meta(const json& meta, ConfigMeta& out, std::vector<Issue>& errors) {
    if (!meta.is_object()) {
        errors.push_back({"invalid_meta", "'meta' must be an object."});
        return;
    }

    auto flow_it = meta.find("flow");
    if (flow_it != meta.end() && !flow_it->is_null()) {
        if (flow_it->is_string()) {
            out.flow = flow_it->get<std::string>();
        } else if (flow_it->is_array()) {
            std::vector<std::string> step_ids;
            bool valid = true;
            for (const auto& element : *flow_it) {
                if (!element.is_string()) {
                    valid = false;
                    break;
                }
                step_ids.push_back(element.get<std::string>());
            }
            if (valid) {
                out.flow = std::move(step_ids);
            } else {
                errors.push_back({"invalid_meta_flow",
                                  "'meta.flow' must contain only step id strings."});
            }
        } else {
            errors.push_back({"invalid_meta_flow",
                              "'meta.flow' must be a flow name or a list of step ids."});
        }
    }

    auto version_it = meta.find("version");
    if (version_it != meta.end()) {
        if (version_it->is_number_integer()) {
            // Non-negative literals are stored unsigned.
            const bool in_range =
                version_it->is_number_unsigned()
                    ? version_it->get<std::uint64_t>() <=
                          static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                    : version_it->get<std::int64_t>() >= std::numeric_limits<int>::min();
            if (in_range) {
                out.version = static_cast<int>(version_it->get<std::int64_t>());
            } else {
                errors.push_back({"invalid_meta_version", "'meta.version' is out of range."});
            }
        } else {
            errors.push_back({"invalid_meta_version", "'meta.version' must be an integer."});
        }
    }
}

void apply_overrides(const std::vector<std::string>& overrides, json& values,
                     std::vector<Issue>& errors, std::vector<std::string>& warnings) {
    for (const auto& raw : overrides) {
        const auto eq = raw.find('=');
        if (eq == std::string::npos) {
            errors.push_back({"invalid_override_key",
                              "Invalid override '" + raw + "': expected KEY=VALUE."});
            continue;
        }

        const std::string key = raw.substr(0, eq);
        const std::string value_text = raw.substr(eq + 1);
        if (!is_identifier(key)) {
            errors.push_back({"invalid_override_key",
                              "Invalid override '" + raw + "': '" + key +
                                  "' is not a valid configuration key."});
            continue;
        }

        json value = json::parse(value_text, nullptr, false);
        if (value.is_discarded()) {
            errors.push_back({"invalid_override_value",
                              "Invalid value for override " + key + ": '" +
                                  value_text + "' is not a valid JSON value."});
            continue;
        }

        if (key == "meta") {
            errors.push_back({"invalid_override_key",
                              "Invalid override '" + raw + "': 'meta' cannot be overridden."});
            continue;
        }
        if (!values.contains(key)) {
            warnings.push_back("Override key '" + key +
                               "' is not present in the configuration file.");
        }
        values[key] = std::move(value);
    }
}

void resolve_dir_references(json& value, const std::filesystem::path& design_root) {
    if (value.is_string()) {
        const std::string& text = value.get_ref<const std::string&>();
        if (text.rfind(kDirPrefix, 0) == 0) {
            value = (design_root / text.substr(std::char_traits<char>::length(kDirPrefix)))
                        .lexically_normal()
                        .string();
        }
        return;
    }
    if (value.is_array() || value.is_object()) {
        for (auto& element : value) {
            resolve_dir_references(element, design_root);
        }
    }
}

}  // namespace

std::optional<std::string> JsonConfigBuilder::default_scl(const std::string& pdk) {
    if (pdk == "sky130A" || pdk == "sky130B") {
        return std::string("sky130_fd_sc_hd");
    }
    if (pdk == "gf180mcuC" || pdk == "gf180mcuD") {
        return std::string("gf180mcu_fd_sc_mcu7t5v0");
    }
    return std::nullopt;
}

std::filesystem::path JsonConfigBuilder::resolve_pdk_root(
    const std::optional<std::filesystem::path>& pdk_root) {
    if (pdk_root.has_value()) {
        return pdk_root.value();
    }
    if (const char* env_root = std::getenv("PDK_ROOT")) {
        if (*env_root != '\0') {
            return std::filesystem::path(env_root);
        }
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".volare";
    }
    return std::filesystem::path(".volare");
}

core::errors::Result<ResolvedConfig> JsonConfigBuilder::load(
    const ConfigRequest& request) const {
    const auto& config_file = request.config_file;
    std::vector<Issue> errors;
    std::vector<std::string> warnings;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_file, ec) || ec) {
        return make_config_error(
            config_file, {{"config_not_found", "Configuration file not found: " + config_file.string()}},
            warnings);
    }

    std::ifstream in(config_file);
    if (!in.is_open()) {
        return make_config_error(
            config_file, {{"config_unreadable", "Unable to open configuration file: " + config_file.string()}},
            warnings);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    json values;
    try {
        values = json::parse(buffer.str());
    } catch (const json::exception& e) {
        return make_config_error(
            config_file, {{"config_parse_failed", "Invalid JSON in configuration file: " + std::string(e.what())}},
            warnings);
    }
    if (!values.is_object()) {
        return make_config_error(
            config_file, {{"config_not_object", "The configuration file must contain a JSON object."}},
            warnings);
    }

    const std::filesystem::path design_root =
        std::filesystem::absolute(config_file, ec).parent_path().lexically_normal();
    if (ec) {
        return make_config_error(
            config_file, {{"invalid_design_root", "Unable to resolve the design directory of " + config_file.string()}},
            warnings);
    }

    ConfigMeta meta;
    auto meta_it = values.find("meta");
    if (meta_it != values.end()) {
        parse_meta(*meta_it, meta, errors);
        values.erase(meta_it);
    }

    apply_overrides(request.overrides, values, errors, warnings);

    const json* design_name = values.contains("DESIGN_NAME") ? &values["DESIGN_NAME"] : nullptr;
    if (design_name == nullptr || !design_name->is_string() ||
        design_name->get_ref<const std::string&>().empty()) {
        errors.push_back({"missing_design_name", "DESIGN_NAME must be set to a non-empty string."});
    }

    resolve_dir_references(values, design_root);

    std::optional<std::string> scl = request.scl;
    if (!scl.has_value()) {
        scl = default_scl(request.pdk);
    }
    if (!scl.has_value()) {
        errors.push_back({"missing_scl", "No standard cell library was specified and no default is known for PDK '" +
                                             request.pdk + "'."});
    }

    const std::filesystem::path pdk_root = resolve_pdk_root(request.pdk_root);
    if (!std::filesystem::is_directory(pdk_root / request.pdk, ec) || ec) {
        warnings.push_back("PDK '" + request.pdk + "' was not found under '" + pdk_root.string() + "'.");
    }

    if (!errors.empty()) {
        return make_config_error(config_file, errors, std::move(warnings));
    }

    values["PDK"] = request.pdk;
    values["STD_CELL_LIBRARY"] = scl.value();
    values["PDK_ROOT"] = pdk_root.string();

    LOG_DEBUG("Loaded configuration for design '" + values["DESIGN_NAME"].get<std::string>() +
              "' from " + config_file.string());

    ResolvedConfig resolved;
    resolved.config = Config(std::move(values), std::move(meta));
    resolved.design_root = design_root;
    resolved.warnings = std::move(warnings);
    return resolved;
}

}  // namespace flowlaunch::config
