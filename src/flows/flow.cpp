#include "flows/flow.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace flowlaunch::flows {

using core::errors::ErrorCategory;
using core::errors::LaunchError;

Flow::Flow(config::Config config, std::filesystem::path design_root)
    : config_(std::move(config)), design_root_(std::move(design_root)) {}

core::errors::Result<state::State> Flow::start(const StartOptions& options) {
    if ((options.frm.has_value() || options.to.has_value()) && !supports_step_range()) {
        return LaunchError{ErrorCategory::Internal,
                           "Flow '" + name() + "' does not support --from or --to.",
                           "step_range_unsupported"};
    }

    LOG_INFO("Starting flow '" + name() + "'" +
             (options.tag.has_value() ? " with tag " + options.tag.value() : ""));
    return run(options);
}

}  // namespace flowlaunch::flows
