#include "session/run_artifacts.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace flowlaunch::session {

using core::errors::ErrorCategory;
using core::errors::LaunchError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

// "12-misc-resolveconfig" -> 12
std::optional<std::size_t> parse_ordinal(const std::string& name) {
    const auto dash = name.find('-');
    if (dash == std::string::npos || dash == 0) {
        return std::nullopt;
    }
    std::size_t ordinal = 0;
    const char* begin = name.data();
    const char* end = name.data() + dash;
    auto [ptr, ec] = std::from_chars(begin, end, ordinal);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return ordinal;
}

}  // namespace

RunArtifacts::RunArtifacts(std::filesystem::path run_dir,
                           std::filesystem::path event_log_name)
    : run_dir_(std::move(run_dir)), event_log_name_(std::move(event_log_name)) {}

std::string RunArtifacts::step_dir_name(const std::size_t ordinal,
                                        const std::string& step_id) {
    std::string slug;
    slug.reserve(step_id.size());
    for (const char c : step_id) {
        if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
            slug.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        } else {
            slug.push_back('-');
        }
    }

    std::ostringstream name;
    if (ordinal < 10) {
        name << '0';
    }
    name << ordinal << '-' << slug;
    return name.str();
}

core::errors::Result<std::filesystem::path> RunArtifacts::prepare() const {
    if (run_dir_.empty()) {
        return LaunchError{ErrorCategory::Internal, "Run directory cannot be empty.",
                           "invalid_run_dir"};
    }

    std::error_code ec;
    std::filesystem::create_directories(run_dir_, ec);
    if (ec) {
        return LaunchError{ErrorCategory::Internal,
                           "Unable to create run directory: " + run_dir_.string(),
                           "run_dir_create_failed"};
    }
    if (!std::filesystem::is_directory(run_dir_, ec) || ec) {
        return LaunchError{ErrorCategory::Internal,
                           "Run directory is not a directory: " + run_dir_.string(),
                           "run_dir_create_failed"};
    }
    return run_dir_;
}

core::errors::Result<std::vector<RunArtifacts::StepDir>> RunArtifacts::list_step_dirs() const {
    std::vector<StepDir> dirs;
    std::error_code ec;
    std::filesystem::directory_iterator it(run_dir_, ec);
    if (ec) {
        return LaunchError{ErrorCategory::Internal,
                           "Unable to list run directory: " + run_dir_.string(),
                           "run_dir_list_failed"};
    }
    for (const std::filesystem::directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec) || entry_ec) {
            continue;
        }
        const auto ordinal = parse_ordinal(it->path().filename().string());
        if (!ordinal.has_value()) {
            continue;
        }
        dirs.push_back(StepDir{ordinal.value(), it->path()});
    }
    if (ec) {
        return LaunchError{ErrorCategory::Internal,
                           "Unable to list run directory: " + run_dir_.string(),
                           "run_dir_list_failed"};
    }
    std::sort(dirs.begin(), dirs.end(), [](const StepDir& a, const StepDir& b) {
        return a.ordinal < b.ordinal;
    });
    return dirs;
}

core::errors::Result<std::filesystem::path> RunArtifacts::create_step_dir(
    const std::string& step_id) const {
    auto listed = list_step_dirs();
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }
    const auto& dirs = core::errors::get_value(listed);
    const std::size_t next = dirs.empty() ? 1 : dirs.back().ordinal + 1;

    const auto step_dir = run_dir_ / step_dir_name(next, step_id);
    std::error_code ec;
    std::filesystem::create_directories(step_dir, ec);
    if (ec) {
        return LaunchError{ErrorCategory::Internal,
                           "Unable to create step directory: " + step_dir.string(),
                           "step_dir_create_failed"};
    }
    return step_dir;
}

core::errors::Result<std::filesystem::path> RunArtifacts::write_state(
    const std::filesystem::path& step_dir, const state::State& state) const {
    const auto state_path = step_dir / kStateFileName;
    std::ofstream out(state_path, std::ios::trunc);
    if (!out.is_open()) {
        return LaunchError{ErrorCategory::Internal,
                           "Unable to open state file: " + state_path.string(),
                           "state_open_failed"};
    }

    out << state.dumps() << "\n";
    if (!out.good()) {
        return LaunchError{ErrorCategory::Internal,
                           "Unable to write state file: " + state_path.string(),
                           "state_write_failed"};
    }
    return state_path;
}

core::errors::Result<std::optional<state::State>> RunArtifacts::latest_state() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(run_dir_, ec) || ec) {
        return std::optional<state::State>();
    }

    auto listed = list_step_dirs();
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }
    const auto& dirs = core::errors::get_value(listed);
    for (auto it = dirs.rbegin(); it != dirs.rend(); ++it) {
        const auto state_path = it->path / kStateFileName;
        if (!std::filesystem::is_regular_file(state_path, ec) || ec) {
            continue;
        }

        std::ifstream in(state_path);
        if (!in.is_open()) {
            return LaunchError{ErrorCategory::Internal,
                               "Unable to open state file: " + state_path.string(),
                               "state_open_failed"};
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        auto loaded = state::State::loads(buffer.str());
        if (core::errors::is_error(loaded)) {
            auto error = core::errors::get_error(loaded);
            error.category = ErrorCategory::Internal;
            error.message = "Failed to load " + state_path.string() + ": " + error.message;
            return error;
        }
        return std::optional<state::State>(core::errors::take_value(std::move(loaded)));
    }
    return std::optional<state::State>();
}

core::errors::Result<std::filesystem::path> RunArtifacts::write_event(
    const std::string& event, const json& payload) const {
    json record;
    record["ts_unix_ms"] = now_unix_ms();
    record["event"] = event;
    record["run_dir"] = run_dir_.filename().string();
    record["payload"] = payload;

    const auto log_path = run_dir_ / event_log_name_;
    std::ofstream out(log_path, std::ios::app);
    if (!out.is_open()) {
        return LaunchError{ErrorCategory::Internal,
                           "Unable to open event log: " + log_path.string(),
                           "event_log_open_failed"};
    }

    out << record.dump() << "\n";
    if (!out.good()) {
        return LaunchError{ErrorCategory::Internal,
                           "Unable to write event: " + log_path.string(),
                           "event_log_write_failed"};
    }
    return log_path;
}

}  // namespace flowlaunch::session
