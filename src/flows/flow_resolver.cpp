#include "flows/flow_resolver.hpp"

#include "core/logging/logger.hpp"

namespace flowlaunch::flows {

using core::errors::ErrorCategory;
using core::errors::LaunchError;

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        out += out.empty() ? item : ", " + item;
    }
    return out;
}

}  // namespace

core::errors::Result<FlowDescriptor> resolve_flow(
    const std::optional<std::string>& explicit_name,
    const std::optional<config::FlowDeclaration>& declared,
    const FlowRegistry& registry) {
    std::string source = "specified with --flow";
    config::FlowDeclaration description;
    if (explicit_name.has_value()) {
        description = explicit_name.value();
    } else if (declared.has_value()) {
        description = declared.value();
        source = "specified in configuration's 'meta' object";
    } else {
        return LaunchError{ErrorCategory::Flow,
                           "No flow was specified with --flow or in the configuration's 'meta' object.",
                           "missing_flow",
                           "Available flows: " + join(registry.names())};
    }

    if (const auto* step_ids = std::get_if<std::vector<std::string>>(&description)) {
        LOG_DEBUG("Using an ad-hoc sequential flow of " + std::to_string(step_ids->size()) +
                  " step(s).");
        return FlowDescriptor{AdHocFlow{*step_ids}};
    }

    const auto& name = std::get<std::string>(description);
    const FlowEntry* entry = registry.find(name);
    if (entry == nullptr) {
        return LaunchError{ErrorCategory::Flow,
                           "Unknown flow '" + name + "' " + source + ".",
                           "unknown_flow",
                           "Available flows: " + join(registry.names())};
    }
    return FlowDescriptor{RegisteredFlow{entry->name, entry->factory}};
}

}  // namespace flowlaunch::flows
