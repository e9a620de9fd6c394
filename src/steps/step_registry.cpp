#include "steps/step.hpp"

#include <utility>

namespace flowlaunch::steps {

using core::errors::ErrorCategory;
using core::errors::LaunchError;

core::errors::Result<std::string> StepRegistry::register_step(
    const std::string& id, StepFactory factory) {
    if (id.empty()) {
        return LaunchError{ErrorCategory::Internal, "Step id cannot be empty.",
                           "invalid_step_id"};
    }
    if (!factory) {
        return LaunchError{ErrorCategory::Internal,
                           "Step '" + id + "' has no factory.",
                           "invalid_step_factory"};
    }
    if (factories_.find(id) != factories_.end()) {
        return LaunchError{ErrorCategory::Internal,
                           "Duplicate step registration: " + id,
                           "duplicate_step"};
    }
    factories_.emplace(id, std::move(factory));
    return id;
}

const StepFactory* StepRegistry::find(const std::string& id) const {
    auto it = factories_.find(id);
    if (it == factories_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> StepRegistry::ids() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& entry : factories_) {
        out.push_back(entry.first);
    }
    return out;
}

}  // namespace flowlaunch::steps
