#include "app/launcher.hpp"
#include "config/json_config_builder.hpp"
#include "core/errors/launch_errors.hpp"
#include "core/logging/logger.hpp"
#include "flows/flow_registry.hpp"
#include "protocol/process_outcome.hpp"
#include "steps/builtin_steps.hpp"

int main(int argc, char* argv[]) {
    // 1. Built-in steps and flows
    auto steps = flowlaunch::steps::builtin_steps();
    if (flowlaunch::core::errors::is_error(steps)) {
        const auto& err = flowlaunch::core::errors::get_error(steps);
        LOG_ERROR("Failed to register steps [" + err.code + "]: " + err.message);
        return flowlaunch::protocol::kExitFailure;
    }
    const auto& step_registry = flowlaunch::core::errors::get_value(steps);

    auto flows = flowlaunch::flows::builtin_flows(step_registry);
    if (flowlaunch::core::errors::is_error(flows)) {
        const auto& err = flowlaunch::core::errors::get_error(flows);
        LOG_ERROR("Failed to register flows [" + err.code + "]: " + err.message);
        return flowlaunch::protocol::kExitFailure;
    }

    // 2. Launch
    flowlaunch::config::JsonConfigBuilder config_builder;
    const flowlaunch::app::LaunchEnvironment environment{
        config_builder, flowlaunch::core::errors::get_value(flows), step_registry};
    return flowlaunch::app::run_cli(argc, argv, environment);
}
