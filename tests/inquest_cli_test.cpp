#include <inquest/inquest_cli.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

#include "test_support/temporary_project.h"

namespace inquest {
namespace {

using ::testing::HasSubstr;

TEST(ParseAnalyzeArgumentsTest, ParsesFlagsAndValues) {
  const std::vector<std::string> args = {"--root",
                                         "/project/root",
                                         "--config",
                                         "inquest.yml",
                                         "--out",
                                         "out-dir",
                                         "--state-dir",
                                         "state",
                                         "--mode",
                                         "parallel",
                                         "--workers",
                                         "3",
                                         "--batch-size",
                                         "7",
                                         "--timeout-ms",
                                         "250",
                                         "--global-timeout-ms",
                                         "900",
                                         "--incremental",
                                         "--no-metrics",
                                         "--history-max",
                                         "5",
                                         "--techniques",
                                         "todo-comments,long-functions",
                                         "--flag",
                                         "strict",
                                         "--flag",
                                         "legacy=false",
                                         "--format",
                                         "markdown,json",
                                         "--ignored-paths",
                                         "generated,third_party",
                                         "--log-level",
                                         "debug"};

  const auto options = ParseAnalyzeArguments(args);

  ASSERT_TRUE(options.root);
  EXPECT_EQ(options.root->generic_string(), "/project/root");
  ASSERT_TRUE(options.config_file);
  EXPECT_EQ(options.config_file->generic_string(), "inquest.yml");
  EXPECT_EQ(options.output_directory->generic_string(), "out-dir");
  EXPECT_EQ(options.state_directory->generic_string(), "state");
  EXPECT_EQ(options.mode, std::optional<ExecutionMode>(ExecutionMode::kParallel));
  EXPECT_EQ(options.workers, std::optional<unsigned>(3));
  EXPECT_EQ(options.batch_size, std::optional<std::size_t>(7));
  EXPECT_EQ(options.timeout_ms, std::optional<unsigned>(250));
  EXPECT_EQ(options.global_timeout_ms, std::optional<unsigned>(900));
  EXPECT_EQ(options.incremental, std::optional<bool>(true));
  EXPECT_EQ(options.metrics, std::optional<bool>(false));
  EXPECT_EQ(options.history_max, std::optional<std::size_t>(5));
  EXPECT_EQ(options.techniques, (std::vector<std::string>{"todo-comments",
                                                          "long-functions"}));
  EXPECT_EQ(options.flags,
            (std::map<std::string, bool>{{"legacy", false}, {"strict", true}}));
  EXPECT_EQ(options.formats, (std::vector<std::string>{"markdown", "json"}));
  ASSERT_EQ(options.ignored_paths.size(), 2u);
  EXPECT_EQ(options.ignored_paths[1].generic_string(), "third_party");
  EXPECT_EQ(options.log_level, std::optional<LogLevel>(LogLevel::kDebug));
}

TEST(ParseAnalyzeArgumentsTest, RejectsUnknownAndMalformedArguments) {
  EXPECT_THROW(ParseAnalyzeArguments({"--bogus"}), std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({"--root"}), std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({"--workers", "-2"}),
               std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({"--format", "html"}),
               std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({"--mode", "turbo"}),
               std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({"--flag", "strict=maybe"}),
               std::invalid_argument);
}

TEST(ParseAnalyzeArgumentsTest, HelpStopsParsing) {
  const auto options = ParseAnalyzeArguments({"--help", "--bogus"});
  EXPECT_TRUE(options.show_help);
}

TEST(ParseConfigFileTest, ReadsKeysAndAliases) {
  test::TemporaryProject project;
  const auto config = project.AddFile("inquest.yaml",
                                      "root: /srv/code\n"
                                      "output-directory: reports\n"
                                      "mode: fast\n"
                                      "worker_count: 2\n"
                                      "timeout_ms: 100\n"
                                      "incremental: yes\n"
                                      "techniques: [todo-comments]\n"
                                      "format: json\n"
                                      "flags:\n"
                                      "  strict: true\n"
                                      "  legacy: off\n"
                                      "ignored_paths:\n"
                                      "  - vendor\n");

  const auto options = ParseConfigFile(config);
  EXPECT_EQ(options.root->generic_string(), "/srv/code");
  EXPECT_EQ(options.output_directory->generic_string(), "reports");
  EXPECT_EQ(options.mode, std::optional<ExecutionMode>(ExecutionMode::kParallel));
  EXPECT_EQ(options.workers, std::optional<unsigned>(2));
  EXPECT_EQ(options.timeout_ms, std::optional<unsigned>(100));
  EXPECT_EQ(options.incremental, std::optional<bool>(true));
  EXPECT_EQ(options.techniques, (std::vector<std::string>{"todo-comments"}));
  EXPECT_EQ(options.formats, (std::vector<std::string>{"json"}));
  EXPECT_TRUE(options.flags.at("strict"));
  EXPECT_FALSE(options.flags.at("legacy"));
  ASSERT_EQ(options.ignored_paths.size(), 1u);
}

TEST(ParseConfigFileTest, UnknownKeyListsSupportedKeys) {
  test::TemporaryProject project;
  const auto config = project.AddFile("inquest.yml", "colour: blue\n");
  try {
    ParseConfigFile(config);
    FAIL() << "expected unknown key to throw";
  } catch (const std::invalid_argument &ex) {
    EXPECT_THAT(ex.what(), HasSubstr("Unknown config key: colour"));
    EXPECT_THAT(ex.what(), HasSubstr("timeout_ms"));
  }
}

TEST(ParseConfigFileTest, RejectsMissingFileAndOtherFormats) {
  test::TemporaryProject project;
  EXPECT_THROW(ParseConfigFile(project.root() / "absent.yml"),
               std::runtime_error);
  const auto json = project.AddFile("inquest.json", "{}");
  EXPECT_THROW(ParseConfigFile(json), std::invalid_argument);
  const auto list = project.AddFile("list.yml", "- root\n");
  EXPECT_THROW(ParseConfigFile(list), std::invalid_argument);
}

TEST(MergeOptionsTest, CommandLineWinsOverConfig) {
  AnalyzeOptions config;
  config.root = "/from/config";
  config.timeout_ms = 100;
  config.techniques = {"todo-comments"};
  config.flags = {{"strict", true}, {"legacy", true}};

  AnalyzeOptions cli;
  cli.timeout_ms = 500;
  cli.flags = {{"legacy", false}};

  const auto merged = MergeOptions(config, cli);
  EXPECT_EQ(merged.root->generic_string(), "/from/config");
  EXPECT_EQ(merged.timeout_ms, std::optional<unsigned>(500));
  EXPECT_EQ(merged.techniques, (std::vector<std::string>{"todo-comments"}));
  EXPECT_TRUE(merged.flags.at("strict"));
  EXPECT_FALSE(merged.flags.at("legacy"));
}

TEST(ResolveAnalyzeOptionsTest, RequiresRoot) {
  EXPECT_THROW(ResolveAnalyzeOptions(AnalyzeOptions{}), std::invalid_argument);
}

TEST(BuildExecutionOptionsTest, AppliesDefaultsAndStatePaths) {
  AnalyzeOptions options;
  options.root = "/project";
  const auto execution = BuildExecutionOptions(options, "/project");

  EXPECT_EQ(execution.mode, ExecutionMode::kSequential);
  EXPECT_EQ(execution.timeout_ms, kDefaultTimeoutMs);
  EXPECT_FALSE(execution.incremental_enabled);
  EXPECT_TRUE(execution.metrics_enabled);
  EXPECT_EQ(execution.batch_size, kDefaultBatchSize);
  EXPECT_EQ(execution.incremental_state_path.generic_string(),
            "/project/.inquest/incremental-state.yml");
  EXPECT_EQ(execution.metrics_history_path.generic_string(),
            "/project/.inquest/metrics-history.yml");
}

TEST(BuildExecutionOptionsTest, HonoursOverridesAndRejectsZeroBatch) {
  AnalyzeOptions options;
  options.state_directory = "cache";
  options.mode = ExecutionMode::kParallel;
  options.workers = 6;
  options.incremental = true;
  options.flags = {{"strict", true}};
  const auto execution = BuildExecutionOptions(options, "/project");
  EXPECT_EQ(execution.worker_count, std::optional<unsigned>(6));
  EXPECT_TRUE(execution.incremental_enabled);
  EXPECT_EQ(execution.incremental_state_path.generic_string(),
            "/project/cache/incremental-state.yml");
  EXPECT_TRUE(execution.ambient_flags.at("strict"));

  options.batch_size = 0;
  EXPECT_THROW(BuildExecutionOptions(options, "/project"),
               std::invalid_argument);
}

TEST(ParseStateCommandArgumentsTest, AcceptsLastOnlyWhenAllowed) {
  const auto metrics =
      ParseStateCommandArguments({"--root", "/p", "--last", "3"}, true);
  EXPECT_EQ(metrics.last, 3u);
  EXPECT_EQ(metrics.root->generic_string(), "/p");
  EXPECT_THROW(ParseStateCommandArguments({"--last", "3"}, false),
               std::invalid_argument);
}

TEST(ResolveStateDirectoryTest, KeepsAbsolutePaths) {
  EXPECT_EQ(ResolveStateDirectory(std::filesystem::path("/state"), "/project")
                .generic_string(),
            "/state");
  EXPECT_EQ(ResolveStateDirectory(std::nullopt, "/project").generic_string(),
            "/project/.inquest");
}

} // namespace
} // namespace inquest
