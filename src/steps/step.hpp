#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "config/config.hpp"
#include "core/errors/launch_errors.hpp"
#include "state/state.hpp"

namespace flowlaunch::steps {

struct StepContext {
    const config::Config& config;
    std::filesystem::path design_root;
    std::filesystem::path step_dir;  // Created before the step runs
};

class Step {
public:
    virtual ~Step() = default;

    virtual std::string id() const = 0;

    // Returns the output state. ErrorCategory::Execution marks an
    // anticipated failure of the design under test.
    virtual core::errors::Result<state::State> run(
        const StepContext& context, const state::State& input) const = 0;
};

using StepFactory = std::function<std::unique_ptr<Step>()>;

// Exact, case-sensitive map from step id to factory.
class StepRegistry {
public:
    core::errors::Result<std::string> register_step(const std::string& id,
                                                    StepFactory factory);

    const StepFactory* find(const std::string& id) const;
    std::vector<std::string> ids() const;

private:
    std::map<std::string, StepFactory> factories_;
};

}  // namespace flowlaunch::steps
