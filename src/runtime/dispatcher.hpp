#pragma once

#include <optional>
#include <string>
#include "config/config.hpp"
#include "core/errors/launch_errors.hpp"
#include "flows/flow.hpp"
#include "flows/flow_resolver.hpp"
#include "protocol/process_outcome.hpp"
#include "state/state.hpp"
#include "steps/step.hpp"

namespace flowlaunch::runtime {

struct DispatchRequest {
    std::optional<std::string> run_tag;
    std::optional<std::string> from_step;
    std::optional<std::string> to_step;
    std::optional<state::State> seed_state;
};

class Dispatcher {
public:
    // Ad-hoc flows resolve their step ids against `steps`, which must outlive
    // the dispatcher.
    explicit Dispatcher(const steps::StepRegistry& steps);

    core::errors::Result<flows::FlowFactory> instantiate(
        const flows::FlowDescriptor& descriptor) const;

    protocol::ProcessOutcome dispatch(const flows::FlowDescriptor& descriptor,
                                      const config::ResolvedConfig& resolved,
                                      const DispatchRequest& request) const;

private:
    const steps::StepRegistry& steps_;
};

}  // namespace flowlaunch::runtime
