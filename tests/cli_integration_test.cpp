#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/wait.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace inquest {
namespace {

using ::testing::HasSubstr;

std::string LoadFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  return std::string((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
}

std::filesystem::path ExecutableUnderTest() {
  return std::filesystem::path(INQUEST_CLI_PATH);
}

int ExitCode(const std::string &command) {
  return WEXITSTATUS(std::system(command.c_str()));
}

std::string Quiet(const std::string &command,
                  const std::filesystem::path &output) {
  return command + " > " + output.string() + " 2>&1";
}

TEST(CliIntegrationTest, WritesReportsAndExitsCleanForInfoFindings) {
  test::TemporaryProject project;
  project.AddFile("src/a.ts", "const a = 1;\n// TODO: drop this\n");
  project.AddFile("src/b.cpp", "int B() { return 2; }\n");

  const auto output_directory = project.root() / "artifacts";
  const auto log = project.root() / "cli.log";
  const std::string command =
      ExecutableUnderTest().string() + " analyze --root " +
      project.root().string() + " --format markdown,json --out " +
      output_directory.string();

  ASSERT_EQ(ExitCode(Quiet(command, log)), 0) << LoadFile(log);

  const auto markdown = LoadFile(output_directory / "inquest_report.md");
  const auto json = LoadFile(output_directory / "inquest_report.json");
  EXPECT_THAT(markdown, HasSubstr("# Analysis Report"));
  EXPECT_THAT(markdown, HasSubstr("todo-pending"));
  EXPECT_THAT(json, HasSubstr("\"files_analyzed\": 2"));
  EXPECT_THAT(LoadFile(log), HasSubstr("Analyzed 2 files"));
  EXPECT_TRUE(std::filesystem::exists(project.root() / ".inquest" /
                                      "metrics-history.yml"));
}

TEST(CliIntegrationTest, IncrementalRunPersistsStateAndCleanRemovesIt) {
  test::TemporaryProject project;
  project.AddFile("a.ts", "// TODO\n");
  const auto log = project.root() / "cli.log";
  const auto cli = ExecutableUnderTest().string();
  const auto analyze = cli + " analyze --incremental --root " +
                       project.root().string() + " --out " +
                       (project.root() / "out").string();

  ASSERT_EQ(ExitCode(Quiet(analyze, log)), 0) << LoadFile(log);
  ASSERT_EQ(ExitCode(Quiet(analyze, log)), 0) << LoadFile(log);
  const auto state = project.root() / ".inquest" / "incremental-state.yml";
  EXPECT_THAT(LoadFile(state), HasSubstr("a.ts"));

  const auto metrics = cli + " metrics --root " + project.root().string();
  ASSERT_EQ(ExitCode(Quiet(metrics, log)), 0);
  EXPECT_THAT(LoadFile(log), HasSubstr("| Timestamp |"));

  const auto clean = cli + " cache clean --root " + project.root().string();
  ASSERT_EQ(ExitCode(Quiet(clean, log)), 0);
  EXPECT_FALSE(std::filesystem::exists(project.root() / ".inquest"));
}

TEST(CliIntegrationTest, ListsTechniques) {
  test::TemporaryProject project;
  const auto log = project.root() / "cli.log";
  ASSERT_EQ(ExitCode(Quiet(ExecutableUnderTest().string() + " techniques", log)),
            0);
  const auto output = LoadFile(log);
  EXPECT_THAT(output, HasSubstr("todo-comments"));
  EXPECT_THAT(output, HasSubstr("long-functions"));
  EXPECT_THAT(output, HasSubstr("duplicate-files"));
}

TEST(CliIntegrationTest, UsageErrorsExitWithOne) {
  test::TemporaryProject project;
  const auto log = project.root() / "cli.log";
  const auto cli = ExecutableUnderTest().string();
  EXPECT_EQ(ExitCode(Quiet(cli + " analyze --bogus", log)), 1);
  EXPECT_THAT(LoadFile(log), HasSubstr("Unknown argument: --bogus"));
  EXPECT_EQ(ExitCode(Quiet(cli + " analyze --root " +
                               project.root().string() +
                               " --techniques nonexistent",
                           log)),
            1);
  EXPECT_EQ(ExitCode(Quiet(cli + " frobnicate", log)), 1);
}

} // namespace
} // namespace inquest
