#include <espresso/filesystem_content_source.h>

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_site.h"

namespace espresso {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

class FilesystemContentSourceTest : public ::testing::Test {
protected:
  BuildConfig MakeConfig() const {
    BuildConfig config;
    config.root_path = site_.root().string();
    return config;
  }

  std::vector<std::string> RelativePaths(const std::vector<ContentFile> &files) {
    std::vector<std::string> paths;
    const auto root = ContentRoot(MakeConfig());
    for (const auto &file : files) {
      paths.push_back(
          std::filesystem::path(file.path).lexically_relative(root).generic_string());
    }
    return paths;
  }

  test::TemporarySite site_;
};

TEST_F(FilesystemContentSourceTest, CollectsMarkdownFilesInSortedOrder) {
  site_.AddFile("content/blog/tea/green.md", "green");
  site_.AddFile("content/about.md", "about");
  site_.AddFile("content/blog/coffee/beans.md", "beans");
  site_.AddFile("content/blog/notes.txt", "ignored");
  site_.AddFile("site.yml", "title: x\n");

  FilesystemContentSource source;
  const auto files = source.Acquire(MakeConfig());

  EXPECT_THAT(RelativePaths(files),
              ElementsAre("about.md", "blog/coffee/beans.md", "blog/tea/green.md"));
  EXPECT_EQ(files.front().source, "about");
}

TEST_F(FilesystemContentSourceTest, SkipsHiddenFilesAndDirectories) {
  site_.AddFile("content/.drafts/secret.md", "secret");
  site_.AddFile("content/blog/.wip.md", "wip");
  site_.AddFile("content/blog/post.md", "post");

  FilesystemContentSource source;
  const auto files = source.Acquire(MakeConfig());

  EXPECT_THAT(RelativePaths(files), ElementsAre("blog/post.md"));
}

TEST_F(FilesystemContentSourceTest, HonorsConfiguredExtensions) {
  site_.AddFile("content/a.md", "a");
  site_.AddFile("content/b.markdown", "b");
  auto config = MakeConfig();
  config.extensions = {".markdown"};

  FilesystemContentSource source;
  const auto files = source.Acquire(config);

  EXPECT_THAT(RelativePaths(files), ElementsAre("b.markdown"));
}

TEST_F(FilesystemContentSourceTest, MissingContentDirectoryIsAnError) {
  FilesystemContentSource source;

  try {
    source.Acquire(MakeConfig());
    FAIL() << "Expected runtime_error";
  } catch (const std::runtime_error &error) {
    EXPECT_THAT(error.what(), HasSubstr("Content directory not found"));
  }
}

TEST_F(FilesystemContentSourceTest, LogsCollectedCount) {
  site_.AddFile("content/a.md", "a");
  std::stringstream log;
  FilesystemContentSource source(MakeLogger({LogLevel::kInfo}, log));

  source.Acquire(MakeConfig());

  EXPECT_THAT(log.str(), HasSubstr("source.collected"));
  EXPECT_THAT(log.str(), HasSubstr("\"count\": \"1\""));
}

TEST(ContentRootTest, JoinsRootAndContentDirectory) {
  BuildConfig config;
  config.root_path = "site/";
  config.content_dir = "pages";

  EXPECT_EQ(ContentRoot(config).generic_string(), "site/pages");

  config.root_path.clear();
  EXPECT_THROW(ContentRoot(config), std::invalid_argument);
}

} // namespace
} // namespace espresso
