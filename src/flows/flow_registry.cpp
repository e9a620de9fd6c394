#include "flows/flow_registry.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include "flows/sequential_flow.hpp"
#include "steps/builtin_steps.hpp"

namespace flowlaunch::flows {

using core::errors::ErrorCategory;
using core::errors::LaunchError;

std::string FlowRegistry::normalize(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return name;
}

core::errors::Result<std::string> FlowRegistry::register_flow(std::string name,
                                                              FlowFactory factory) {
    if (name.empty()) {
        return LaunchError{ErrorCategory::Internal, "Flow name cannot be empty.",
                           "invalid_flow_name"};
    }
    if (!factory) {
        return LaunchError{ErrorCategory::Internal,
                           "Flow '" + name + "' has no factory.",
                           "invalid_flow_factory"};
    }

    std::string key = normalize(name);
    if (entries_.find(key) != entries_.end()) {
        return LaunchError{ErrorCategory::Internal,
                           "Duplicate flow registration: " + name,
                           "duplicate_flow"};
    }
    entries_.emplace(key, FlowEntry{std::move(name), std::move(factory)});
    return key;
}

const FlowEntry* FlowRegistry::find(const std::string& name) const {
    auto it = entries_.find(normalize(name));
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> FlowRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.second.name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

core::errors::Result<FlowRegistry> builtin_flows(const steps::StepRegistry& steps) {
    const std::pair<const char*, std::vector<std::string>> definitions[] = {
        {kClassicFlow,
         {steps::kResolveConfigStep, steps::kVerilogFilesStep, steps::kReportMetricsStep}},
        {kChecksFlow, {steps::kVerilogFilesStep}},
    };

    FlowRegistry registry;
    for (const auto& [name, step_ids] : definitions) {
        auto factory = SequentialFlow::make_factory(name, step_ids, steps);
        if (core::errors::is_error(factory)) {
            return core::errors::get_error(factory);
        }
        auto registered = registry.register_flow(name, core::errors::get_value(factory));
        if (core::errors::is_error(registered)) {
            return core::errors::get_error(registered);
        }
    }
    return registry;
}

}  // namespace flowlaunch::flows
