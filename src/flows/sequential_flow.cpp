#include "flows/sequential_flow.hpp"

#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/run_tag.hpp"
#include "core/logging/logger.hpp"
#include "session/run_artifacts.hpp"

namespace flowlaunch::flows {

using core::errors::ErrorCategory;
using core::errors::LaunchError;
using nlohmann::json;
using session::RunArtifacts;
using state::State;

SequentialFlow::SequentialFlow(std::string name,
                               std::vector<std::unique_ptr<steps::Step>> steps,
                               config::Config config,
                               std::filesystem::path design_root)
    : Flow(std::move(config), std::move(design_root)),
      name_(std::move(name)),
      steps_(std::move(steps)) {}

std::vector<std::string> SequentialFlow::step_ids() const {
    std::vector<std::string> ids;
    ids.reserve(steps_.size());
    for (const auto& step : steps_) {
        ids.push_back(step->id());
    }
    return ids;
}

std::optional<std::size_t> SequentialFlow::index_of(const std::string& step_id) const {
    for (std::size_t i = 0; i < steps_.size(); ++i) {
        if (steps_[i]->id() == step_id) {
            return i;
        }
    }
    return std::nullopt;
}

core::errors::Result<FlowFactory> SequentialFlow::make_factory(
    std::string name, const std::vector<std::string>& step_ids,
    const steps::StepRegistry& registry) {
    std::vector<steps::StepFactory> factories;
    factories.reserve(step_ids.size());
    for (const auto& id : step_ids) {
        const steps::StepFactory* factory = registry.find(id);
        if (factory == nullptr) {
            std::string known;
            for (const auto& known_id : registry.ids()) {
                known += known.empty() ? known_id : ", " + known_id;
            }
            return LaunchError{ErrorCategory::Flow,
                               "Unknown step '" + id + "' in flow '" + name + "'.",
                               "unknown_step",
                               "Available steps: " + known};
        }
        factories.push_back(*factory);
    }

    FlowFactory flow_factory =
        [name = std::move(name), factories = std::move(factories)](
            const config::Config& config,
            const std::filesystem::path& design_root) -> std::unique_ptr<Flow> {
        std::vector<std::unique_ptr<steps::Step>> steps;
        steps.reserve(factories.size());
        for (const auto& factory : factories) {
            steps.push_back(factory());
        }
        return std::make_unique<SequentialFlow>(name, std::move(steps), config, design_root);
    };
    return flow_factory;
}

core::errors::Result<State> SequentialFlow::run(const StartOptions& options) {
    if (steps_.empty()) {
        return LaunchError{ErrorCategory::Internal,
                           "Flow '" + name_ + "' has no steps.",
                           "empty_flow"};
    }

    std::size_t first = 0;
    std::size_t last = steps_.size() - 1;
    if (options.frm.has_value()) {
        const auto index = index_of(options.frm.value());
        if (!index.has_value()) {
            return LaunchError{ErrorCategory::Internal,
                               "Failed to process start step '" + options.frm.value() +
                                   "': no such step in flow '" + name_ + "'.",
                               "unknown_start_step"};
        }
        first = index.value();
    }
    if (options.to.has_value()) {
        const auto index = index_of(options.to.value());
        if (!index.has_value()) {
            return LaunchError{ErrorCategory::Internal,
                               "Failed to process end step '" + options.to.value() +
                                   "': no such step in flow '" + name_ + "'.",
                               "unknown_end_step"};
        }
        last = index.value();
    }
    if (first > last) {
        return LaunchError{ErrorCategory::Internal,
                           "Start step '" + steps_[first]->id() +
                               "' comes after end step '" + steps_[last]->id() + "'.",
                           "invalid_step_range"};
    }

    const std::string tag = options.tag.value_or(core::config::generate_run_tag());
    // The tag names exactly one directory below runs/.
    if (tag.empty() || tag == "." || tag == ".." ||
        tag.find_first_of("/\\") != std::string::npos) {
        return LaunchError{ErrorCategory::Internal,
                           "Invalid run tag '" + tag + "': it must name a single directory.",
                           "invalid_run_tag"};
    }
    RunArtifacts artifacts(design_root() / "runs" / tag);
    auto prepared = artifacts.prepare();
    if (core::errors::is_error(prepared)) {
        return core::errors::get_error(prepared);
    }

    State current;
    if (options.with_initial_state.has_value()) {
        current = options.with_initial_state.value();
    } else {
        auto latest = artifacts.latest_state();
        if (core::errors::is_error(latest)) {
            return core::errors::get_error(latest);
        }
        const auto& previous = core::errors::get_value(latest);
        if (previous.has_value()) {
            LOG_INFO("Using the latest state of run '" + tag + "' as the initial state.");
            current = previous.value();
        }
    }

    json start_payload;
    start_payload["flow"] = name_;
    start_payload["tag"] = tag;
    start_payload["from"] = steps_[first]->id();
    start_payload["to"] = steps_[last]->id();
    auto started = artifacts.write_event("flow_start", start_payload);
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }

    for (std::size_t i = first; i <= last; ++i) {
        const auto& step = steps_[i];
        auto created = artifacts.create_step_dir(step->id());
        if (core::errors::is_error(created)) {
            return core::errors::get_error(created);
        }
        const auto& step_dir = core::errors::get_value(created);

        LOG_INFO("Running step '" + step->id() + "' (" + std::to_string(i + 1) + "/" +
                 std::to_string(steps_.size()) + ")");
        steps::StepContext context{config(), design_root(), step_dir};
        auto outcome = step->run(context, current);
        if (core::errors::is_error(outcome)) {
            const auto& error = core::errors::get_error(outcome);
            json failed_payload;
            failed_payload["step"] = step->id();
            failed_payload["category"] = core::errors::to_string(error.category);
            failed_payload["message"] = error.message;
            auto logged = artifacts.write_event("step_failed", failed_payload);
            if (core::errors::is_error(logged)) {
                LOG_WARN("Failed to record step failure: " +
                         core::errors::get_error(logged).message);
            }
            return error;
        }
        current = core::errors::take_value(std::move(outcome));

        auto saved = artifacts.write_state(step_dir, current);
        if (core::errors::is_error(saved)) {
            return core::errors::get_error(saved);
        }

        json done_payload;
        done_payload["step"] = step->id();
        done_payload["dir"] = step_dir.filename().string();
        auto logged = artifacts.write_event("step_done", done_payload);
        if (core::errors::is_error(logged)) {
            return core::errors::get_error(logged);
        }
    }

    json done_payload;
    done_payload["flow"] = name_;
    auto finished = artifacts.write_event("flow_done", done_payload);
    if (core::errors::is_error(finished)) {
        return core::errors::get_error(finished);
    }
    return current;
}

}  // namespace flowlaunch::flows
