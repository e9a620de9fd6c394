#pragma once

#include <filesystem>
#include <optional>
#include "core/errors/launch_errors.hpp"
#include "state/state.hpp"

namespace flowlaunch::session {

// Loads the state passed with --with-initial-state. No path means no seed
// state; nothing is searched for implicitly.
core::errors::Result<std::optional<state::State>> load_initial_state(
    const std::optional<std::filesystem::path>& path);

}  // namespace flowlaunch::session
