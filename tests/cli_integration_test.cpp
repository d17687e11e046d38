#include <espresso/cli_exit_codes.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/wait.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_site.h"

namespace espresso {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

std::string LoadFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  return std::string((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
}

std::filesystem::path ExecutableUnderTest() {
  return std::filesystem::path(ESPRESSO_CLI_PATH);
}

int RunCli(const std::string &arguments,
           const std::filesystem::path &log_path) {
  const auto command = "\"" + ExecutableUnderTest().string() + "\" " +
                       arguments + " > \"" + log_path.string() + "\" 2>&1";
  return WEXITSTATUS(std::system(command.c_str()));
}

void WriteSampleSite(const test::TemporarySite &site) {
  site.AddFile("site.yml", "title: Espresso\n"
                           "footer:\n"
                           "  text: Made with coffee\n");
  site.AddArticle("blog/coffee/roasting-basics.md", "Roasting basics",
                  "2023-03-01");
  site.AddArticle("blog/coffee/brewing.md", "Brewing", "2023-01-01",
                  "related: [blog/coffee/roasting-basics]\n");
  site.AddArticle("blog/coffee/draft.md", "Draft", "2023-06-01",
                  "hide: true\n");
}

TEST(CliIntegrationTest, BuildsSampleSiteAndWritesReports) {
  test::TemporarySite site;
  WriteSampleSite(site);
  const auto out = site.root() / "out";
  const auto log = site.root() / "cli.log";

  const auto exit_code =
      RunCli("build --root \"" + site.root().string() + "\" --out \"" +
                 out.string() + "\" --format markdown,json",
             log);

  ASSERT_EQ(exit_code, kExitSuccess) << LoadFile(log);
  const auto markdown = LoadFile(out / "site_model.md");
  EXPECT_THAT(markdown, HasSubstr("| Site | Espresso |"));
  EXPECT_THAT(markdown, HasSubstr("blog/coffee/roasting-basics<br>"
                                  "blog/coffee/brewing"));
  EXPECT_THAT(markdown, Not(HasSubstr("blog/coffee/draft<br>")));
  EXPECT_THAT(markdown, HasSubstr("- Blog -> blog"));
  EXPECT_THAT(markdown, HasSubstr("Made with coffee"));
  const auto json = LoadFile(out / "site_model.json");
  EXPECT_THAT(json, HasSubstr("\"related\": [\"blog/coffee/roasting-basics\"]"));
}

TEST(CliIntegrationTest, DefaultsToTargetDirectoryAndBuildCommand) {
  test::TemporarySite site;
  WriteSampleSite(site);
  const auto log = site.root() / "cli.log";

  const auto exit_code =
      RunCli("--root \"" + site.root().string() + "\"", log);

  ASSERT_EQ(exit_code, kExitSuccess) << LoadFile(log);
  EXPECT_TRUE(std::filesystem::exists(site.root() / "target" / "site_model.md"));
  EXPECT_FALSE(
      std::filesystem::exists(site.root() / "target" / "site_model.json"));
}

TEST(CliIntegrationTest, UnresolvedLinksYieldWarningExitCode) {
  test::TemporarySite site;
  WriteSampleSite(site);
  site.AddArticle("blog/tea/green.md", "Green", "2023-02-01",
                  "related: [blog/tea/missing]\n");
  const auto log = site.root() / "cli.log";

  const auto exit_code =
      RunCli("build --root \"" + site.root().string() + "\"", log);

  EXPECT_EQ(exit_code, kExitWarnings);
  EXPECT_THAT(LoadFile(log), HasSubstr("build.related.unresolved"));
  EXPECT_THAT(LoadFile(site.root() / "target" / "site_model.md"),
              HasSubstr("related.article_not_found"));
}

TEST(CliIntegrationTest, StrictRelatedFailsBuild) {
  test::TemporarySite site;
  WriteSampleSite(site);
  site.AddArticle("blog/tea/green.md", "Green", "2023-02-01",
                  "related: [nowhere/x]\n");
  const auto log = site.root() / "cli.log";

  const auto exit_code = RunCli(
      "build --root \"" + site.root().string() + "\" --strict-related", log);

  EXPECT_EQ(exit_code, kExitFailure);
  EXPECT_THAT(LoadFile(log), HasSubstr("Error:"));
}

TEST(CliIntegrationTest, MissingRootIsAnError) {
  test::TemporarySite site;
  const auto log = site.root() / "cli.log";

  EXPECT_EQ(RunCli("build", log), kExitFailure);
  EXPECT_THAT(LoadFile(log), HasSubstr("--root is required"));
  EXPECT_EQ(RunCli("publish", log), kExitFailure);
  EXPECT_THAT(LoadFile(log), HasSubstr("Unknown command: publish"));
}

TEST(CliIntegrationTest, PrintsHelp) {
  test::TemporarySite site;
  const auto log = site.root() / "cli.log";

  EXPECT_EQ(RunCli("build --help", log), kExitSuccess);
  EXPECT_THAT(LoadFile(log), HasSubstr("--strict-related"));
}

} // namespace
} // namespace espresso
