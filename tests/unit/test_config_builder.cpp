#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include "config/json_config_builder.hpp"
#include "core/errors/launch_errors.hpp"
#include "unit/test_support.hpp"

namespace {

using flowlaunch::config::ConfigRequest;
using flowlaunch::config::JsonConfigBuilder;
using flowlaunch::core::errors::ErrorCategory;
using flowlaunch::core::errors::get_error;
using flowlaunch::core::errors::get_value;
using flowlaunch::core::errors::is_error;
using flowlaunch::test_support::TempWorkspace;

class ConfigBuilderTest : public ::testing::Test {
protected:
    ConfigRequest make_request(const std::filesystem::path& config_file,
                               std::vector<std::string> overrides = {}) const {
        ConfigRequest request;
        request.config_file = config_file;
        request.pdk = "sky130A";
        request.pdk_root = workspace_.root() / "pdks";
        request.overrides = std::move(overrides);
        return request;
    }

    std::filesystem::path write_config(const std::string& content) const {
        return workspace_.write_file("design/config.json", content);
    }

    TempWorkspace workspace_;
    JsonConfigBuilder builder_;
};

TEST_F(ConfigBuilderTest, LoadsConfigAndInfersDesignRoot) {
    const auto config_file = write_config(R"({
        "DESIGN_NAME": "spm",
        "VERILOG_FILES": ["dir::src/spm.v", "/abs/other.v"],
        "meta": {"version": 2, "flow": "Classic"}
    })");

    auto result = builder_.load(make_request(config_file));
    ASSERT_FALSE(is_error(result));
    const auto& resolved = get_value(result);

    const auto expected_root =
        std::filesystem::absolute(workspace_.root() / "design").lexically_normal();
    EXPECT_EQ(resolved.design_root, expected_root);
    EXPECT_EQ(resolved.config.get_string("DESIGN_NAME").value(), "spm");
    EXPECT_FALSE(resolved.config.values().contains("meta"));
    EXPECT_EQ(resolved.config.meta().version, 2);
    ASSERT_TRUE(resolved.config.meta().flow.has_value());
    EXPECT_EQ(std::get<std::string>(resolved.config.meta().flow.value()), "Classic");

    const auto* files = resolved.config.find("VERILOG_FILES");
    ASSERT_NE(files, nullptr);
    EXPECT_EQ((*files)[0].get<std::string>(), (expected_root / "src/spm.v").string());
    EXPECT_EQ((*files)[1].get<std::string>(), "/abs/other.v");

    EXPECT_EQ(resolved.config.get_string("PDK").value(), "sky130A");
    EXPECT_EQ(resolved.config.get_string("STD_CELL_LIBRARY").value(), "sky130_fd_sc_hd");
    EXPECT_EQ(resolved.config.get_string("PDK_ROOT").value(),
              (workspace_.root() / "pdks").string());
}

TEST_F(ConfigBuilderTest, ReadsStepListFromMeta) {
    const auto config_file = write_config(
        R"({"DESIGN_NAME": "spm", "meta": {"flow": ["Misc.ResolveConfig", "Checker.VerilogFiles"]}})");

    auto result = builder_.load(make_request(config_file));
    ASSERT_FALSE(is_error(result));
    const auto& flow = get_value(result).config.meta().flow;
    ASSERT_TRUE(flow.has_value());
    const auto& steps = std::get<std::vector<std::string>>(flow.value());
    ASSERT_EQ(steps.size(), 2u);
    EXPECT_EQ(steps[0], "Misc.ResolveConfig");
    EXPECT_EQ(steps[1], "Checker.VerilogFiles");
}

TEST_F(ConfigBuilderTest, AppliesOverridesAsJsonValues) {
    const auto config_file = write_config(R"({"DESIGN_NAME": "spm", "CLOCK_PERIOD": 10})");

    auto result = builder_.load(make_request(
        config_file, {"CLOCK_PERIOD=25", "CLOCK_PORT=\"clk\"", "EXTRA={\"a\": [1, true]}"}));
    ASSERT_FALSE(is_error(result));
    const auto& resolved = get_value(result);
    EXPECT_EQ(resolved.config.find("CLOCK_PERIOD")->get<int>(), 25);
    EXPECT_EQ(resolved.config.get_string("CLOCK_PORT").value(), "clk");
    EXPECT_TRUE((*resolved.config.find("EXTRA"))["a"][1].get<bool>());

    bool warned_clock_port = false;
    for (const auto& warning : resolved.warnings) {
        if (warning.find("CLOCK_PORT") != std::string::npos) {
            warned_clock_port = true;
        }
    }
    EXPECT_TRUE(warned_clock_port);
}

TEST_F(ConfigBuilderTest, RejectsOverrideValueThatIsNotJson) {
    const auto config_file = write_config(R"({"DESIGN_NAME": "spm"})");

    auto result = builder_.load(make_request(config_file, {"FOO=notjson"}));
    ASSERT_TRUE(is_error(result));
    const auto& err = get_error(result);
    EXPECT_EQ(err.category, ErrorCategory::Config);
    EXPECT_EQ(err.code, "invalid_override_value");
    ASSERT_EQ(err.details.size(), 1u);
    EXPECT_NE(err.details[0].find("notjson"), std::string::npos);
}

TEST_F(ConfigBuilderTest, RejectsMalformedOverrideKey) {
    const auto config_file = write_config(R"({"DESIGN_NAME": "spm"})");

    auto missing_key = builder_.load(make_request(config_file, {"=1"}));
    ASSERT_TRUE(is_error(missing_key));
    EXPECT_EQ(get_error(missing_key).code, "invalid_override_key");

    auto missing_equals = builder_.load(make_request(config_file, {"FOO"}));
    ASSERT_TRUE(is_error(missing_equals));
    EXPECT_EQ(get_error(missing_equals).code, "invalid_override_key");
}

TEST_F(ConfigBuilderTest, CollectsEveryErrorAndWarning) {
    const auto config_file = write_config(R"({"VERILOG_FILES": []})");

    auto result = builder_.load(make_request(config_file, {"FOO=notjson", "NEW_KEY=1"}));
    ASSERT_TRUE(is_error(result));
    const auto& err = get_error(result);
    EXPECT_EQ(err.code, "invalid_config");
    EXPECT_EQ(err.details.size(), 2u);
    // NEW_KEY is absent from the file; the PDK is absent from the PDK root.
    EXPECT_EQ(err.warnings.size(), 2u);
}

TEST_F(ConfigBuilderTest, FailsWhenFileMissing) {
    auto result = builder_.load(make_request(workspace_.root() / "missing.json"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_not_found");
}

TEST_F(ConfigBuilderTest, FailsOnInvalidJson) {
    const auto config_file = write_config("{\"DESIGN_NAME\": ");

    auto result = builder_.load(make_request(config_file));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_parse_failed");
}

TEST_F(ConfigBuilderTest, ReportsOverflowingNumberAsParseFailure) {
    const auto config_file = write_config(R"({"DESIGN_NAME": "spm", "X": 1e999})");

    auto result = builder_.load(make_request(config_file));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Config);
    EXPECT_EQ(get_error(result).code, "config_parse_failed");
}

TEST_F(ConfigBuilderTest, RejectsMetaVersionOutsideIntRange) {
    const auto too_big = write_config(
        R"({"DESIGN_NAME": "spm", "meta": {"version": 4294967298}})");
    auto big_result = builder_.load(make_request(too_big));
    ASSERT_TRUE(is_error(big_result));
    EXPECT_EQ(get_error(big_result).code, "invalid_meta_version");

    const auto too_small = write_config(
        R"({"DESIGN_NAME": "spm", "meta": {"version": -4294967298}})");
    auto small_result = builder_.load(make_request(too_small));
    ASSERT_TRUE(is_error(small_result));
    EXPECT_EQ(get_error(small_result).code, "invalid_meta_version");
}

TEST_F(ConfigBuilderTest, FailsOnInvalidMetaFlow) {
    const auto config_file = write_config(R"({"DESIGN_NAME": "spm", "meta": {"flow": 3}})");

    auto result = builder_.load(make_request(config_file));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_meta_flow");
}

TEST_F(ConfigBuilderTest, RequiresSclForUnknownPdk) {
    const auto config_file = write_config(R"({"DESIGN_NAME": "spm"})");

    auto request = make_request(config_file);
    request.pdk = "mystery_pdk";
    auto without_scl = builder_.load(request);
    ASSERT_TRUE(is_error(without_scl));
    EXPECT_EQ(get_error(without_scl).code, "missing_scl");

    request.scl = "mystery_scl";
    auto with_scl = builder_.load(request);
    ASSERT_FALSE(is_error(with_scl));
    EXPECT_EQ(get_value(with_scl).config.get_string("STD_CELL_LIBRARY").value(), "mystery_scl");
}

TEST_F(ConfigBuilderTest, KnowsDefaultLibraries) {
    EXPECT_EQ(JsonConfigBuilder::default_scl("sky130B").value(), "sky130_fd_sc_hd");
    EXPECT_EQ(JsonConfigBuilder::default_scl("gf180mcuD").value(), "gf180mcu_fd_sc_mcu7t5v0");
    EXPECT_FALSE(JsonConfigBuilder::default_scl("unknown").has_value());
    EXPECT_EQ(JsonConfigBuilder::resolve_pdk_root(std::filesystem::path("/opt/pdks")),
              std::filesystem::path("/opt/pdks"));
}

}  // namespace
