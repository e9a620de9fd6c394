#include "runtime/dispatcher.hpp"

#include <memory>
#include "core/logging/logger.hpp"
#include "flows/sequential_flow.hpp"

namespace flowlaunch::runtime {

using core::errors::ErrorCategory;
using core::errors::LaunchError;
using protocol::ProcessOutcome;

namespace {

constexpr const char* kAdHocFlowName = "SequentialFlow";

}  // namespace

Dispatcher::Dispatcher(const steps::StepRegistry& steps) : steps_(steps) {}

core::errors::Result<flows::FlowFactory> Dispatcher::instantiate(
    const flows::FlowDescriptor& descriptor) const {
    if (const auto* registered = std::get_if<flows::RegisteredFlow>(&descriptor)) {
        if (!registered->factory) {
            return LaunchError{ErrorCategory::Internal,
                               "Flow '" + registered->name + "' has no factory.",
                               "invalid_flow_factory"};
        }
        return registered->factory;
    }

    const auto& ad_hoc = std::get<flows::AdHocFlow>(descriptor);
    return flows::SequentialFlow::make_factory(kAdHocFlowName, ad_hoc.step_ids, steps_);
}

ProcessOutcome Dispatcher::dispatch(const flows::FlowDescriptor& descriptor,
                                    const config::ResolvedConfig& resolved,
                                    const DispatchRequest& request) const {
    auto factory = instantiate(descriptor);
    if (core::errors::is_error(factory)) {
        const auto& err = core::errors::get_error(factory);
        LOG_ERROR("The flow could not be created [" + err.code + "]: " + err.message);
        return ProcessOutcome::FailedUnexpected;
    }

    std::unique_ptr<flows::Flow> flow =
        core::errors::get_value(factory)(resolved.config, resolved.design_root);
    if (!flow) {
        LOG_ERROR("The flow could not be created: the factory returned nothing.");
        return ProcessOutcome::FailedUnexpected;
    }

    flows::StartOptions options;
    options.tag = request.run_tag;
    options.frm = request.from_step;
    options.to = request.to_step;
    options.with_initial_state = request.seed_state;

    auto started = flow->start(options);
    if (core::errors::is_error(started)) {
        const auto& err = core::errors::get_error(started);
        if (err.category == ErrorCategory::Execution) {
            LOG_ERROR("The following error was encountered while running the flow: " +
                      err.message);
            LOG_ERROR("flowlaunch will now quit.");
            return ProcessOutcome::FailedExpected;
        }
        LOG_ERROR("The flow has encountered an unexpected error [" + err.code + "]: " +
                  err.message);
        LOG_ERROR("flowlaunch will now quit.");
        return ProcessOutcome::FailedUnexpected;
    }

    LOG_INFO("Flow '" + flow->name() + "' completed successfully.");
    return ProcessOutcome::Succeeded;
}

}  // namespace flowlaunch::runtime
