#pragma once

#include "config/config_builder.hpp"
#include "flows/flow_registry.hpp"
#include "protocol/launch_request.hpp"
#include "steps/step.hpp"

namespace flowlaunch::app {

// External collaborators used by one launch.
struct LaunchEnvironment {
    const config::ConfigBuilder& config_builder;
    const flows::FlowRegistry& flow_registry;
    const steps::StepRegistry& step_registry;
};

// Resolves config, flow, seed state and run tag, then dispatches. Returns
// the process exit code.
int launch(const protocol::LaunchRequest& request, const LaunchEnvironment& environment);

// Parses argv first; conflicting flags end the process before any file is read.
int run_cli(int argc, char* argv[], const LaunchEnvironment& environment);

}  // namespace flowlaunch::app
