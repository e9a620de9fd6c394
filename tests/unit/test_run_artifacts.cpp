#include <filesystem>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>
#include <gtest/gtest.h>
#include "core/errors/launch_errors.hpp"
#include "session/run_artifacts.hpp"
#include "state/state.hpp"
#include "unit/test_support.hpp"

namespace {

using flowlaunch::core::errors::get_error;
using flowlaunch::core::errors::get_value;
using flowlaunch::core::errors::is_error;
using flowlaunch::session::RunArtifacts;
using flowlaunch::state::State;
using flowlaunch::test_support::TempWorkspace;
using nlohmann::json;

TEST(RunArtifactsTest, NamesStepDirectories) {
    EXPECT_EQ(RunArtifacts::step_dir_name(1, "Misc.ResolveConfig"), "01-misc-resolveconfig");
    EXPECT_EQ(RunArtifacts::step_dir_name(12, "Checker.VerilogFiles"),
              "12-checker-verilogfiles");
}

TEST(RunArtifactsTest, NumbersStepDirectoriesAfterExistingOnes) {
    TempWorkspace workspace;
    RunArtifacts artifacts(workspace.root() / "runs" / "RUN_A");
    ASSERT_FALSE(is_error(artifacts.prepare()));

    auto first = artifacts.create_step_dir("Misc.ResolveConfig");
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first).filename(), "01-misc-resolveconfig");

    // Unnumbered entries do not affect the sequence.
    std::filesystem::create_directories(artifacts.run_dir() / "tmp");
    auto second = artifacts.create_step_dir("Checker.VerilogFiles");
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second).filename(), "02-checker-verilogfiles");
}

TEST(RunArtifactsTest, LatestStateComesFromHighestStep) {
    TempWorkspace workspace;
    RunArtifacts artifacts(workspace.root() / "RUN_A");
    ASSERT_FALSE(is_error(artifacts.prepare()));

    State early;
    early.set_metric("step", 1);
    State late;
    late.set_metric("step", 2);

    auto first = artifacts.create_step_dir("A");
    auto second = artifacts.create_step_dir("B");
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));
    ASSERT_FALSE(is_error(artifacts.write_state(get_value(first), early)));
    ASSERT_FALSE(is_error(artifacts.write_state(get_value(second), late)));
    // A later step that never finished has no state file.
    ASSERT_FALSE(is_error(artifacts.create_step_dir("C")));

    auto latest = artifacts.latest_state();
    ASSERT_FALSE(is_error(latest));
    ASSERT_TRUE(get_value(latest).has_value());
    EXPECT_EQ(get_value(latest).value(), late);
}

TEST(RunArtifactsTest, MissingRunDirHasNoState) {
    TempWorkspace workspace;
    RunArtifacts artifacts(workspace.root() / "never_created");
    auto latest = artifacts.latest_state();
    ASSERT_FALSE(is_error(latest));
    EXPECT_FALSE(get_value(latest).has_value());
}

TEST(RunArtifactsTest, CorruptStateIsReported) {
    TempWorkspace workspace;
    workspace.write_file("RUN_A/01-a/state_out.json", "{oops");
    RunArtifacts artifacts(workspace.root() / "RUN_A");

    auto latest = artifacts.latest_state();
    ASSERT_TRUE(is_error(latest));
    EXPECT_EQ(get_error(latest).code, "state_parse_failed");
}

TEST(RunArtifactsTest, OverflowingMetricInStateIsReported) {
    TempWorkspace workspace;
    workspace.write_file("RUN_A/01-a/state_out.json", R"({"metrics": {"power": 1e999}})");
    RunArtifacts artifacts(workspace.root() / "RUN_A");

    auto latest = artifacts.latest_state();
    ASSERT_TRUE(is_error(latest));
    EXPECT_EQ(get_error(latest).code, "state_parse_failed");
}

TEST(RunArtifactsTest, AppendsEventsAsJsonLines) {
    TempWorkspace workspace;
    RunArtifacts artifacts(workspace.root() / "RUN_A");
    ASSERT_FALSE(is_error(artifacts.prepare()));

    ASSERT_FALSE(is_error(artifacts.write_event("flow_start", json{{"flow", "Classic"}})));
    auto written = artifacts.write_event("flow_done", json::object());
    ASSERT_FALSE(is_error(written));

    std::ifstream in(get_value(written));
    std::string line;
    ASSERT_TRUE(static_cast<bool>(std::getline(in, line)));
    const auto record = json::parse(line);
    EXPECT_EQ(record["event"], "flow_start");
    EXPECT_EQ(record["run_dir"], "RUN_A");
    EXPECT_EQ(record["payload"]["flow"], "Classic");
    EXPECT_TRUE(record.contains("ts_unix_ms"));
    ASSERT_TRUE(static_cast<bool>(std::getline(in, line)));
    EXPECT_EQ(json::parse(line)["event"], "flow_done");
}

TEST(RunArtifactsTest, PrepareRejectsEmptyDirectory) {
    RunArtifacts artifacts{std::filesystem::path()};
    auto prepared = artifacts.prepare();
    ASSERT_TRUE(is_error(prepared));
    EXPECT_EQ(get_error(prepared).code, "invalid_run_dir");
}

}  // namespace
