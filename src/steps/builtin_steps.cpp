#include "steps/builtin_steps.hpp"

#include <fstream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace flowlaunch::steps {

using core::errors::ErrorCategory;
using core::errors::LaunchError;
using nlohmann::json;
using state::State;

namespace {

core::errors::Result<std::filesystem::path> write_json_file(
    const std::filesystem::path& path, const json& payload) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return LaunchError{ErrorCategory::Internal,
                           "Unable to open output file: " + path.string(),
                           "step_output_open_failed"};
    }
    out << payload.dump(2) << "\n";
    if (!out.good()) {
        return LaunchError{ErrorCategory::Internal,
                           "Unable to write output file: " + path.string(),
                           "step_output_write_failed"};
    }
    return path;
}

LaunchError reserved_key_error(const std::string& key) {
    return LaunchError{ErrorCategory::Internal,
                       "State key '" + key + "' is reserved.",
                       "reserved_state_key"};
}

class ResolveConfigStep : public Step {
public:
    std::string id() const override { return kResolveConfigStep; }

    core::errors::Result<State> run(const StepContext& context,
                                    const State& input) const override {
        json payload = context.config.values();
        json meta = json::object();
        meta["version"] = context.config.meta().version;
        if (context.config.meta().flow.has_value()) {
            const auto& flow = context.config.meta().flow.value();
            if (const auto* name = std::get_if<std::string>(&flow)) {
                meta["flow"] = *name;
            } else {
                meta["flow"] = std::get<std::vector<std::string>>(flow);
            }
        }
        payload["meta"] = meta;

        auto written = write_json_file(context.step_dir / "resolved.json", payload);
        if (core::errors::is_error(written)) {
            return core::errors::get_error(written);
        }

        State output = input;
        if (!output.set_path("resolved_config", core::errors::get_value(written).string())) {
            return reserved_key_error("resolved_config");
        }
        return output;
    }
};

class VerilogFilesStep : public Step {
public:
    std::string id() const override { return kVerilogFilesStep; }

    core::errors::Result<State> run(const StepContext& context,
                                    const State& input) const override {
        const json* files = context.config.find("VERILOG_FILES");
        if (files == nullptr || files->is_null()) {
            return LaunchError{ErrorCategory::Execution,
                               "VERILOG_FILES is not set.",
                               "missing_verilog_files"};
        }

        std::vector<std::string> paths;
        if (files->is_string()) {
            paths.push_back(files->get<std::string>());
        } else if (files->is_array()) {
            for (const auto& element : *files) {
                if (!element.is_string()) {
                    return LaunchError{ErrorCategory::Execution,
                                       "VERILOG_FILES must contain only paths.",
                                       "invalid_verilog_files"};
                }
                paths.push_back(element.get<std::string>());
            }
        } else {
            return LaunchError{ErrorCategory::Execution,
                               "VERILOG_FILES must be a path or a list of paths.",
                               "invalid_verilog_files"};
        }

        if (paths.empty()) {
            return LaunchError{ErrorCategory::Execution,
                               "VERILOG_FILES is empty.",
                               "missing_verilog_files"};
        }

        std::string missing;
        for (const auto& entry : paths) {
            std::filesystem::path candidate(entry);
            if (candidate.is_relative()) {
                candidate = context.design_root / candidate;
            }
            std::error_code ec;
            if (!std::filesystem::is_regular_file(candidate, ec) || ec) {
                missing += missing.empty() ? entry : ", " + entry;
            }
        }
        if (!missing.empty()) {
            return LaunchError{ErrorCategory::Execution,
                               "The following Verilog files do not exist: " + missing,
                               "verilog_files_not_found"};
        }

        LOG_DEBUG(std::to_string(paths.size()) + " Verilog file(s) found.");
        State output = input;
        output.set_metric("design__verilog_file__count", paths.size());
        return output;
    }
};

class ReportMetricsStep : public Step {
public:
    std::string id() const override { return kReportMetricsStep; }

    core::errors::Result<State> run(const StepContext& context,
                                    const State& input) const override {
        auto written = write_json_file(context.step_dir / "metrics.json", input.metrics());
        if (core::errors::is_error(written)) {
            return core::errors::get_error(written);
        }

        State output = input;
        if (!output.set_path("metrics_report", core::errors::get_value(written).string())) {
            return reserved_key_error("metrics_report");
        }
        return output;
    }
};

template <typename StepType>
StepFactory factory_for() {
    return []() -> std::unique_ptr<Step> { return std::make_unique<StepType>(); };
}

}  // namespace

core::errors::Result<StepRegistry> builtin_steps() {
    StepRegistry registry;
    const std::pair<const char*, StepFactory> entries[] = {
        {kResolveConfigStep, factory_for<ResolveConfigStep>()},
        {kVerilogFilesStep, factory_for<VerilogFilesStep>()},
        {kReportMetricsStep, factory_for<ReportMetricsStep>()},
    };
    for (const auto& [id, factory] : entries) {
        auto registered = registry.register_step(id, factory);
        if (core::errors::is_error(registered)) {
            return core::errors::get_error(registered);
        }
    }
    return registry;
}

}  // namespace flowlaunch::steps
