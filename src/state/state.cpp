#include "state/state.hpp"

#include <utility>

namespace flowlaunch::state {

using core::errors::ErrorCategory;
using core::errors::LaunchError;
using nlohmann::json;

core::errors::Result<State> State::loads(const std::string& text) {
    json parsed;
    try {
        parsed = json::parse(text);
    } catch (const json::exception& e) {
        return LaunchError{ErrorCategory::State,
                           std::string("State is not valid JSON: ") + e.what(),
                           "state_parse_failed"};
    }

    if (!parsed.is_object()) {
        return LaunchError{ErrorCategory::State,
                           "State must be a JSON object.",
                           "state_parse_failed"};
    }

    State state;
    for (auto it = parsed.begin(); it != parsed.end(); ++it) {
        if (it.key() == kMetricsKey) {
            if (!it.value().is_object()) {
                return LaunchError{ErrorCategory::State,
                                   "State 'metrics' must be a JSON object.",
                                   "state_parse_failed"};
            }
            state.metrics_ = it.value();
            continue;
        }

        if (it.value().is_null()) {
            state.paths_[it.key()] = std::nullopt;
        } else if (it.value().is_string()) {
            state.paths_[it.key()] = it.value().get<std::string>();
        } else {
            return LaunchError{ErrorCategory::State,
                               "State entry '" + it.key() +
                                   "' must be a path string or null.",
                               "state_parse_failed"};
        }
    }
    return state;
}

std::string State::dumps() const {
    json out = json::object();
    for (const auto& [id, path] : paths_) {
        if (path.has_value()) {
            out[id] = path.value();
        } else {
            out[id] = nullptr;
        }
    }
    out[kMetricsKey] = metrics_;
    return out.dump(2);
}

bool State::set_path(const std::string& id, std::optional<std::string> path) {
    if (id == kMetricsKey) {
        return false;
    }
    paths_[id] = std::move(path);
    return true;
}

std::optional<std::string> State::path(const std::string& id) const {
    auto it = paths_.find(id);
    if (it == paths_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void State::set_metric(const std::string& name, json value) {
    metrics_[name] = std::move(value);
}

bool State::operator==(const State& other) const {
    return paths_ == other.paths_ && metrics_ == other.metrics_;
}

}  // namespace flowlaunch::state
