#pragma once

#include <string>
#include "core/errors/launch_errors.hpp"

namespace flowlaunch::session {

enum class LaunchStage {
    Idle,
    ConfigResolved,
    FlowResolved,
    StateLoaded,
    RunResolved,
    Dispatched,
    Succeeded,
    FailedExpected,
    FailedUnexpected
};

// Single-pass launch progression. Stages only move forward, and nothing
// leaves a terminal stage.
class StageTracker {
public:
    core::errors::Result<LaunchStage> advance(LaunchStage next);

    LaunchStage current() const { return stage_; }

    static bool is_terminal(LaunchStage stage);
    static std::string to_string(LaunchStage stage);

private:
    LaunchStage stage_ = LaunchStage::Idle;
};

}  // namespace flowlaunch::session
