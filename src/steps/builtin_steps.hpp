#pragma once

#include "core/errors/launch_errors.hpp"
#include "steps/step.hpp"

namespace flowlaunch::steps {

inline constexpr const char* kResolveConfigStep = "Misc.ResolveConfig";
inline constexpr const char* kVerilogFilesStep = "Checker.VerilogFiles";
inline constexpr const char* kReportMetricsStep = "Misc.ReportMetrics";

// Registry holding every step shipped with flowlaunch.
core::errors::Result<StepRegistry> builtin_steps();

}  // namespace flowlaunch::steps
