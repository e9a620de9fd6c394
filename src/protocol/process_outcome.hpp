#pragma once

#include <string>

namespace flowlaunch::protocol {

enum class ProcessOutcome {
    Succeeded,
    FailedExpected,
    FailedUnexpected
};

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitFlowFailed = 2;

inline int exit_code(const ProcessOutcome outcome) {
    switch (outcome) {
        case ProcessOutcome::Succeeded:
            return kExitSuccess;
        case ProcessOutcome::FailedExpected:
            return kExitFlowFailed;
        case ProcessOutcome::FailedUnexpected:
            return kExitFailure;
        default:
            return kExitFailure;
    }
}

inline std::string to_string(const ProcessOutcome outcome) {
    switch (outcome) {
        case ProcessOutcome::Succeeded:
            return "succeeded";
        case ProcessOutcome::FailedExpected:
            return "failed_expected";
        case ProcessOutcome::FailedUnexpected:
            return "failed_unexpected";
        default:
            return "unknown";
    }
}

}  // namespace flowlaunch::protocol
