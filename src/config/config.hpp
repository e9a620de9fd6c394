#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace flowlaunch::config {

// Either a registered flow name or an ordered list of step ids.
using FlowDeclaration = std::variant<std::string, std::vector<std::string>>;

struct ConfigMeta {
    std::optional<FlowDeclaration> flow;
    int version = 1;
};

// Merged configuration values. Immutable once built.
class Config {
public:
    Config() = default;
    Config(nlohmann::json values, ConfigMeta meta)
        : values_(std::move(values)), meta_(std::move(meta)) {}

    const nlohmann::json& values() const { return values_; }
    const ConfigMeta& meta() const { return meta_; }

    // nullptr when the key is absent
    const nlohmann::json* find(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return nullptr;
        }
        return &(*it);
    }

    std::optional<std::string> get_string(const std::string& key) const {
        const nlohmann::json* value = find(key);
        if (value == nullptr || !value->is_string()) {
            return std::nullopt;
        }
        return value->get<std::string>();
    }

private:
    nlohmann::json values_ = nlohmann::json::object();
    ConfigMeta meta_;
};

struct ResolvedConfig {
    Config config;
    std::filesystem::path design_root;
    std::vector<std::string> warnings;
};

}  // namespace flowlaunch::config
