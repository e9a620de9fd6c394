#pragma once

#include <map>
#include <string>
#include <vector>
#include "core/errors/launch_errors.hpp"
#include "flows/flow.hpp"
#include "steps/step.hpp"

namespace flowlaunch::flows {

struct FlowEntry {
    std::string name;  // Canonical spelling
    FlowFactory factory;
};

// Startup-time map from lower-cased flow name to factory.
class FlowRegistry {
public:
    core::errors::Result<std::string> register_flow(std::string name, FlowFactory factory);

    // Case-insensitive; nullptr when unknown.
    const FlowEntry* find(const std::string& name) const;

    // Canonical names, sorted.
    std::vector<std::string> names() const;

    static std::string normalize(std::string name);

private:
    std::map<std::string, FlowEntry> entries_;
};

inline constexpr const char* kClassicFlow = "Classic";
inline constexpr const char* kChecksFlow = "Checks";

core::errors::Result<FlowRegistry> builtin_flows(const steps::StepRegistry& steps);

}  // namespace flowlaunch::flows
