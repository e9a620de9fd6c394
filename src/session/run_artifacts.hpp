#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/launch_errors.hpp"
#include "state/state.hpp"

namespace flowlaunch::session {

// Owns the on-disk layout of one run directory:
//   <run_dir>/flow.jsonl          append-only event log
//   <run_dir>/NN-<step-slug>/     one directory per executed step
//   <run_dir>/NN-<step-slug>/state_out.json
class RunArtifacts {
public:
    static constexpr const char* kStateFileName = "state_out.json";

    explicit RunArtifacts(std::filesystem::path run_dir,
                          std::filesystem::path event_log_name = "flow.jsonl");

    const std::filesystem::path& run_dir() const { return run_dir_; }

    core::errors::Result<std::filesystem::path> prepare() const;

    // Numbering continues after the step directories already present.
    core::errors::Result<std::filesystem::path> create_step_dir(
        const std::string& step_id) const;

    core::errors::Result<std::filesystem::path> write_state(
        const std::filesystem::path& step_dir, const state::State& state) const;

    // state_out.json of the highest-numbered step directory that has one.
    core::errors::Result<std::optional<state::State>> latest_state() const;

    core::errors::Result<std::filesystem::path> write_event(
        const std::string& event, const nlohmann::json& payload) const;

    static std::string step_dir_name(std::size_t ordinal, const std::string& step_id);

private:
    struct StepDir {
        std::size_t ordinal = 0;
        std::filesystem::path path;
    };

    core::errors::Result<std::vector<StepDir>> list_step_dirs() const;

    std::filesystem::path run_dir_;
    std::filesystem::path event_log_name_;
};

}  // namespace flowlaunch::session
