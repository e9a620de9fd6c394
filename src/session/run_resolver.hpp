#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/launch_errors.hpp"

namespace flowlaunch::session {

// Picks the run tag handed to the flow:
//   run_tag given  -> returned unchanged (the engine validates it)
//   resume_last    -> the subdirectory of <design_root>/runs with the newest
//                     last-write time; no_runs_found if there is none
//   neither        -> std::nullopt, the engine assigns a tag
//
// The scan is a snapshot taken without locking <design_root>/runs.
core::errors::Result<std::optional<std::string>> resolve_run_tag(
    const std::filesystem::path& design_root,
    const std::optional<std::string>& run_tag, bool resume_last);

}  // namespace flowlaunch::session
