#include "app/launcher.hpp"

#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "core/errors/launch_errors.hpp"
#include "core/logging/logger.hpp"
#include "flows/flow_resolver.hpp"
#include "protocol/process_outcome.hpp"
#include "runtime/dispatcher.hpp"
#include "session/run_resolver.hpp"
#include "session/stage_tracker.hpp"
#include "session/state_loader.hpp"

namespace flowlaunch::app {

using core::errors::LaunchError;
using protocol::ProcessOutcome;
using session::LaunchStage;
using session::StageTracker;

namespace {

void report(const std::string& label, const LaunchError& err) {
    LOG_ERROR(label + " [" + err.code + "]: " + err.message);
    const bool details_repeat_message = err.details.size() == 1 && err.details.front() == err.message;
    if (!details_repeat_message) {
        for (const auto& detail : err.details) {
            LOG_ERROR("  " + detail);
        }
    }
    if (!err.warnings.empty()) {
        LOG_INFO("The following warnings have also been generated:");
        for (const auto& warning : err.warnings) {
            LOG_WARN("  " + warning);
        }
    }
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

bool advance(StageTracker& tracker, const LaunchStage next) {
    auto moved = tracker.advance(next);
    if (core::errors::is_error(moved)) {
        report("Internal error", core::errors::get_error(moved));
        return false;
    }
    return true;
}

LaunchStage terminal_stage(const ProcessOutcome outcome) {
    switch (outcome) {
        case ProcessOutcome::Succeeded:
            return LaunchStage::Succeeded;
        case ProcessOutcome::FailedExpected:
            return LaunchStage::FailedExpected;
        case ProcessOutcome::FailedUnexpected:
        default:
            return LaunchStage::FailedUnexpected;
    }
}

}  // namespace

int launch(const protocol::LaunchRequest& request, const LaunchEnvironment& environment) {
    StageTracker tracker;

    // 1. Configuration
    config::ConfigRequest config_request;
    config_request.config_file = request.config_file;
    config_request.pdk = request.pdk;
    config_request.scl = request.scl;
    config_request.pdk_root = request.pdk_root;
    config_request.overrides = request.config_overrides;

    auto loaded = environment.config_builder.load(config_request);
    if (core::errors::is_error(loaded)) {
        report("Configuration error", core::errors::get_error(loaded));
        LOG_INFO("flowlaunch will now quit. Please check your configuration.");
        return protocol::kExitFailure;
    }
    const auto& resolved = core::errors::get_value(loaded);
    for (const auto& warning : resolved.warnings) {
        LOG_WARN(warning);
    }
    if (!advance(tracker, LaunchStage::ConfigResolved)) {
        return protocol::kExitFailure;
    }

    // 2. Flow
    auto descriptor = flows::resolve_flow(request.flow_name, resolved.config.meta().flow,
                                          environment.flow_registry);
    if (core::errors::is_error(descriptor)) {
        report("Flow error", core::errors::get_error(descriptor));
        return protocol::kExitFailure;
    }
    if (!advance(tracker, LaunchStage::FlowResolved)) {
        return protocol::kExitFailure;
    }

    // 3. Seed state
    auto seed = session::load_initial_state(request.initial_state_path);
    if (core::errors::is_error(seed)) {
        report("Initial state error", core::errors::get_error(seed));
        return protocol::kExitFailure;
    }
    if (!advance(tracker, LaunchStage::StateLoaded)) {
        return protocol::kExitFailure;
    }

    // 4. Run tag
    auto run_tag = session::resolve_run_tag(resolved.design_root, request.run_tag,
                                            request.resume_last);
    if (core::errors::is_error(run_tag)) {
        report("Run error", core::errors::get_error(run_tag));
        return protocol::kExitFailure;
    }
    const auto& tag = core::errors::get_value(run_tag);
    if (tag.has_value()) {
        core::logging::Logger::get().set_run_tag(tag.value());
    }
    if (!advance(tracker, LaunchStage::RunResolved)) {
        return protocol::kExitFailure;
    }

    // 5. Dispatch
    if (!advance(tracker, LaunchStage::Dispatched)) {
        return protocol::kExitFailure;
    }
    runtime::DispatchRequest dispatch_request;
    dispatch_request.run_tag = tag;
    dispatch_request.from_step = request.from_step;
    dispatch_request.to_step = request.to_step;
    dispatch_request.seed_state = core::errors::get_value(seed);

    runtime::Dispatcher dispatcher(environment.step_registry);
    const ProcessOutcome outcome = dispatcher.dispatch(
        core::errors::get_value(descriptor), resolved, dispatch_request);
    if (!advance(tracker, terminal_stage(outcome))) {
        return protocol::kExitFailure;
    }
    return protocol::exit_code(outcome);
}

int run_cli(int argc, char* argv[], const LaunchEnvironment& environment) {
    if (cli::wants_help(argc, argv)) {
        std::cout << cli::usage(argc > 0 ? argv[0] : "flowlaunch");
        std::string flows;
        for (const auto& name : environment.flow_registry.names()) {
            flows += flows.empty() ? name : ", " + name;
        }
        std::cout << "\nBuilt-in flows: " << flows << "\n";
        return protocol::kExitSuccess;
    }

    auto parsed = cli::parse_and_validate(argc, argv);
    if (core::errors::is_error(parsed)) {
        report("Input error", core::errors::get_error(parsed));
        return protocol::kExitFailure;
    }
    return launch(core::errors::get_value(parsed), environment);
}

}  // namespace flowlaunch::app
