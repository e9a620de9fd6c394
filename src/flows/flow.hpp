#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "config/config.hpp"
#include "core/errors/launch_errors.hpp"
#include "state/state.hpp"

namespace flowlaunch::flows {

struct StartOptions {
    std::optional<std::string> tag;   // Absent requests a fresh run
    std::optional<std::string> frm;
    std::optional<std::string> to;
    std::optional<state::State> with_initial_state;
};

// A runnable pipeline bound to one configuration and design directory.
//
// start() errors:
//   ErrorCategory::Execution - an anticipated failure reported by a step
//   anything else            - an unexpected engine error
class Flow {
public:
    Flow(config::Config config, std::filesystem::path design_root);
    virtual ~Flow() = default;

    Flow(const Flow&) = delete;
    Flow& operator=(const Flow&) = delete;

    virtual std::string name() const = 0;

    // Whether --from/--to can narrow the executed steps.
    virtual bool supports_step_range() const { return false; }

    core::errors::Result<state::State> start(const StartOptions& options);

    const config::Config& config() const { return config_; }
    const std::filesystem::path& design_root() const { return design_root_; }

protected:
    virtual core::errors::Result<state::State> run(const StartOptions& options) = 0;

private:
    config::Config config_;
    std::filesystem::path design_root_;
};

using FlowFactory = std::function<std::unique_ptr<Flow>(
    const config::Config& config, const std::filesystem::path& design_root)>;

}  // namespace flowlaunch::flows
