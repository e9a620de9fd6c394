#pragma once
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace flowlaunch::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., conflicting or malformed command-line flags
        Config,     // E.g., configuration file failed to load or merge
        Flow,       // E.g., unknown flow name
        State,      // E.g., initial state file missing or malformed
        Run,        // E.g., --last-run with no previous runs
        Execution,  // A step reported an anticipated pipeline failure
        Internal    // Unexpected engine error
    };

    // The standardized error payload
    struct LaunchError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
            std::vector<std::string> details;   // Every individual error when several were collected
            std::vector<std::string> warnings;  // Non-fatal, shown alongside the error
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a LaunchError.
    template <typename T>
    using Result = std::variant<T, LaunchError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<LaunchError>(result);
    }

    template <typename T>
    const LaunchError& get_error(const Result<T>& result) {
        return std::get<LaunchError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Config:    return "config";
            case ErrorCategory::Flow:      return "flow";
            case ErrorCategory::State:     return "state";
            case ErrorCategory::Run:       return "run";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace flowlaunch::core::errors
