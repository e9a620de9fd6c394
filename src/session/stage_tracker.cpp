#include "session/stage_tracker.hpp"
#include "core/logging/logger.hpp"

namespace flowlaunch::session {

using core::errors::ErrorCategory;
using core::errors::LaunchError;

bool StageTracker::is_terminal(const LaunchStage stage) {
    return stage == LaunchStage::Succeeded || stage == LaunchStage::FailedExpected ||
           stage == LaunchStage::FailedUnexpected;
}

std::string StageTracker::to_string(const LaunchStage stage) {
    switch (stage) {
        case LaunchStage::Idle:
            return "idle";
        case LaunchStage::ConfigResolved:
            return "config_resolved";
        case LaunchStage::FlowResolved:
            return "flow_resolved";
        case LaunchStage::StateLoaded:
            return "state_loaded";
        case LaunchStage::RunResolved:
            return "run_resolved";
        case LaunchStage::Dispatched:
            return "dispatched";
        case LaunchStage::Succeeded:
            return "succeeded";
        case LaunchStage::FailedExpected:
            return "failed_expected";
        case LaunchStage::FailedUnexpected:
            return "failed_unexpected";
        default:
            return "unknown";
    }
}

core::errors::Result<LaunchStage> StageTracker::advance(const LaunchStage next) {
    if (is_terminal(stage_)) {
        return LaunchError{ErrorCategory::Internal,
                           "Launch is already terminal: " + to_string(stage_),
                           "invalid_stage_transition"};
    }
    if (static_cast<int>(next) <= static_cast<int>(stage_)) {
        return LaunchError{ErrorCategory::Internal,
                           "Cannot move from " + to_string(stage_) + " back to " +
                               to_string(next),
                           "invalid_stage_transition"};
    }

    LOG_DEBUG("Launch stage " + to_string(stage_) + " -> " + to_string(next));
    stage_ = next;
    return stage_;
}

}  // namespace flowlaunch::session
