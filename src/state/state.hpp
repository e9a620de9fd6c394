#pragma once

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/launch_errors.hpp"

namespace flowlaunch::state {

// Snapshot of a flow's outputs: design-format id -> path (or null), plus
// metrics. Serialized as one JSON object whose "metrics" key holds the
// metrics and whose other keys hold the paths.
class State {
public:
    static constexpr const char* kMetricsKey = "metrics";

    State() = default;

    static core::errors::Result<State> loads(const std::string& text);
    std::string dumps() const;

    // "metrics" is reserved and cannot be used as a path id.
    bool set_path(const std::string& id, std::optional<std::string> path);
    std::optional<std::string> path(const std::string& id) const;
    const std::map<std::string, std::optional<std::string>>& paths() const { return paths_; }

    void set_metric(const std::string& name, nlohmann::json value);
    const nlohmann::json& metrics() const { return metrics_; }

    bool operator==(const State& other) const;
    bool operator!=(const State& other) const { return !(*this == other); }

private:
    std::map<std::string, std::optional<std::string>> paths_;
    nlohmann::json metrics_ = nlohmann::json::object();
};

}  // namespace flowlaunch::state
