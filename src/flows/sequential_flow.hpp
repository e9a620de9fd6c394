#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "flows/flow.hpp"
#include "steps/step.hpp"

namespace flowlaunch::flows {

// Runs its steps in order under <design_root>/runs/<tag>/. Supports
// --from/--to and resumes from the latest state_out.json of an existing run
// directory when no initial state is given.
class SequentialFlow : public Flow {
public:
    SequentialFlow(std::string name, std::vector<std::unique_ptr<steps::Step>> steps,
                   config::Config config, std::filesystem::path design_root);

    std::string name() const override { return name_; }
    bool supports_step_range() const override { return true; }

    std::vector<std::string> step_ids() const;

    // Resolves every step id against the registry up front. The returned
    // factory builds a fresh SequentialFlow on each call.
    static core::errors::Result<FlowFactory> make_factory(
        std::string name, const std::vector<std::string>& step_ids,
        const steps::StepRegistry& registry);

protected:
    core::errors::Result<state::State> run(const StartOptions& options) override;

private:
    std::optional<std::size_t> index_of(const std::string& step_id) const;

    std::string name_;
    std::vector<std::unique_ptr<steps::Step>> steps_;
};

}  // namespace flowlaunch::flows
