#include "session/state_loader.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace flowlaunch::session {

using core::errors::ErrorCategory;
using core::errors::LaunchError;

core::errors::Result<std::optional<state::State>> load_initial_state(
    const std::optional<std::filesystem::path>& path) {
    if (!path.has_value()) {
        return std::optional<state::State>();
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path.value(), ec) || ec) {
        return LaunchError{ErrorCategory::State,
                           "Initial state file not found: " + path->string(),
                           "initial_state_missing"};
    }

    std::ifstream in(path.value());
    if (!in.is_open()) {
        return LaunchError{ErrorCategory::State,
                           "Unable to open initial state file: " + path->string(),
                           "initial_state_unreadable"};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return LaunchError{ErrorCategory::State,
                           "Unable to read initial state file: " + path->string(),
                           "initial_state_unreadable"};
    }

    auto loaded = state::State::loads(buffer.str());
    if (core::errors::is_error(loaded)) {
        auto error = core::errors::get_error(loaded);
        error.message = "Failed to load initial state '" + path->string() + "': " + error.message;
        return error;
    }

    LOG_INFO("Using initial state from " + path->string());
    return std::optional<state::State>(core::errors::take_value(std::move(loaded)));
}

}  // namespace flowlaunch::session
