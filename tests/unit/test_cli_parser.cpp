#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/launch_errors.hpp"
#include "unit/test_support.hpp"

namespace {

using flowlaunch::app::cli::parse_and_validate;
using flowlaunch::app::cli::usage;
using flowlaunch::app::cli::wants_help;
using flowlaunch::core::errors::ErrorCategory;
using flowlaunch::core::errors::get_error;
using flowlaunch::core::errors::get_value;
using flowlaunch::core::errors::is_error;
using flowlaunch::protocol::LaunchRequest;
using flowlaunch::test_support::Argv;

flowlaunch::core::errors::Result<LaunchRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    Argv args(tokens);
    return parse_and_validate(args.argc(), args.argv());
}

TEST(CliParserTest, FailsWhenConfigFileMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_config_file");
}

TEST(CliParserTest, FailsWhenRunTagAndLastRunBothProvided) {
    auto result = parse_tokens({"--run-tag", "RUN_1", "--last-run", "config.json"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
    EXPECT_NE(get_error(result).message.find("mutually exclusive"), std::string::npos);
}

TEST(CliParserTest, CollectsEveryViolation) {
    auto result = parse_tokens({"--last-run", "--run-tag=RUN_1"});
    ASSERT_TRUE(is_error(result));
    const auto& err = get_error(result);
    EXPECT_EQ(err.code, "conflicting_flags");
    ASSERT_EQ(err.details.size(), 2u);
    EXPECT_NE(err.details[1].find("CONFIG_FILE"), std::string::npos);
}

TEST(CliParserTest, FailsOnEmptyRunTag) {
    auto inline_empty = parse_tokens({"--run-tag=", "config.json"});
    ASSERT_TRUE(is_error(inline_empty));
    EXPECT_EQ(get_error(inline_empty).code, "empty_value");
    EXPECT_NE(get_error(inline_empty).message.find("--run-tag"), std::string::npos);

    auto separate_empty = parse_tokens({"--run-tag", "", "config.json"});
    ASSERT_TRUE(is_error(separate_empty));
    EXPECT_EQ(get_error(separate_empty).code, "empty_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"--verbose", "config.json"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_tokens({"config.json", "--flow"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenFlagGivenInlineValue) {
    auto result = parse_tokens({"--last-run=yes", "config.json"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unexpected_value");
}

TEST(CliParserTest, FailsOnExtraPositional) {
    auto result = parse_tokens({"a.json", "b.json"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unexpected_argument");
}

TEST(CliParserTest, AppliesDefaults) {
    auto result = parse_tokens({"designs/spm/config.json"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.pdk, "sky130A");
    EXPECT_FALSE(req.scl.has_value());
    EXPECT_FALSE(req.flow_name.has_value());
    EXPECT_FALSE(req.run_tag.has_value());
    EXPECT_FALSE(req.resume_last);
    EXPECT_TRUE(req.config_overrides.empty());
    EXPECT_EQ(req.config_file, std::filesystem::path("designs/spm/config.json"));
}

TEST(CliParserTest, ParsesEveryOption) {
    auto result = parse_tokens({"-p", "gf180mcuC", "-s", "my_scl", "-f", "classic",
                                "--pdk-root", "/pdks", "--run-tag", "RUN_A",
                                "-F", "Checker.VerilogFiles", "-T", "Misc.ReportMetrics",
                                "-I", "state_in.json", "-c", "A=1",
                                "--override-config", "B=\"x\"", "--override-config=C=[1,2]",
                                "config.json"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.pdk, "gf180mcuC");
    EXPECT_EQ(req.scl.value(), "my_scl");
    EXPECT_EQ(req.flow_name.value(), "classic");
    EXPECT_EQ(req.pdk_root.value(), std::filesystem::path("/pdks"));
    EXPECT_EQ(req.run_tag.value(), "RUN_A");
    EXPECT_EQ(req.from_step.value(), "Checker.VerilogFiles");
    EXPECT_EQ(req.to_step.value(), "Misc.ReportMetrics");
    EXPECT_EQ(req.initial_state_path.value(), std::filesystem::path("state_in.json"));
    ASSERT_EQ(req.config_overrides.size(), 3u);
    EXPECT_EQ(req.config_overrides[0], "A=1");
    EXPECT_EQ(req.config_overrides[1], "B=\"x\"");
    EXPECT_EQ(req.config_overrides[2], "C=[1,2]");
}

TEST(CliParserTest, ParsesLastRun) {
    auto result = parse_tokens({"config.json", "--last-run"});
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).resume_last);
}

TEST(CliParserTest, TreatsArgumentsAfterDoubleDashAsPositional) {
    auto result = parse_tokens({"--", "-weird.json"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).config_file, std::filesystem::path("-weird.json"));
}

TEST(CliParserTest, DetectsHelp) {
    Argv with_help({"config.json", "-h"});
    EXPECT_TRUE(wants_help(with_help.argc(), with_help.argv()));

    Argv without_help({"config.json"});
    EXPECT_FALSE(wants_help(without_help.argc(), without_help.argv()));

    EXPECT_NE(usage("flowlaunch").find("--with-initial-state"), std::string::npos);
}

}  // namespace
