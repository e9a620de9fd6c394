#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "config/config.hpp"
#include "core/errors/launch_errors.hpp"
#include "flows/flow_registry.hpp"

namespace flowlaunch::flows {

struct RegisteredFlow {
    std::string name;
    FlowFactory factory;
};

// Built at dispatch time from exactly these step ids, in order.
struct AdHocFlow {
    std::vector<std::string> step_ids;
};

using FlowDescriptor = std::variant<RegisteredFlow, AdHocFlow>;

// The explicit name wins over the configuration's meta.flow. A step list is
// never looked up in the registry; a name is looked up case-insensitively.
core::errors::Result<FlowDescriptor> resolve_flow(
    const std::optional<std::string>& explicit_name,
    const std::optional<config::FlowDeclaration>& declared,
    const FlowRegistry& registry);

}  // namespace flowlaunch::flows
