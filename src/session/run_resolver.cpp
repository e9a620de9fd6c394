#include "session/run_resolver.hpp"

#include <system_error>
#include "core/logging/logger.hpp"

namespace flowlaunch::session {

using core::errors::ErrorCategory;
using core::errors::LaunchError;

core::errors::Result<std::optional<std::string>> resolve_run_tag(
    const std::filesystem::path& design_root,
    const std::optional<std::string>& run_tag, const bool resume_last) {
    if (run_tag.has_value()) {
        return run_tag;
    }
    if (!resume_last) {
        return std::optional<std::string>();
    }

    const auto runs_dir = design_root / "runs";
    const LaunchError no_runs{ErrorCategory::Run,
                              "--last-run specified, but no runs found.",
                              "no_runs_found",
                              "Expected at least one run directory under " + runs_dir.string()};

    std::error_code ec;
    std::filesystem::directory_iterator it(runs_dir, ec);
    if (ec) {
        return no_runs;
    }

    std::optional<std::filesystem::path> latest_run;
    std::filesystem::file_time_type latest_time{};
    for (const std::filesystem::directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        // Entries may disappear while another process works on runs/.
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec) || entry_ec) {
            continue;
        }
        const auto modified = std::filesystem::last_write_time(it->path(), entry_ec);
        if (entry_ec) {
            continue;
        }
        if (!latest_run.has_value() || modified > latest_time) {
            latest_time = modified;
            latest_run = it->path();
        }
    }
    if (ec) {
        LOG_WARN("Scan of " + runs_dir.string() + " stopped early: " + ec.message());
    }

    if (!latest_run.has_value()) {
        return no_runs;
    }

    const std::string tag = latest_run->filename().string();
    LOG_INFO("Resuming the last run: " + tag);
    return std::optional<std::string>(tag);
}

}  // namespace flowlaunch::session
