#include <espresso/content_path.h>
#include <espresso/errors.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace espresso {
namespace {

TEST(ContentPathTest, StripsContentRootAndExtension) {
  const auto location =
      ComputeContentLocation("site/content/blog/coffee/post.md", "site/content");

  EXPECT_EQ(location.route_path, "blog/coffee");
  EXPECT_EQ(location.article_id, "post");
}

TEST(ContentPathTest, FileDirectlyBelowRootHasEmptyRoute) {
  const auto location =
      ComputeContentLocation("site/content/about.md", "site/content/");

  EXPECT_EQ(location.route_path, "");
  EXPECT_EQ(location.article_id, "about");
}

TEST(ContentPathTest, CurrentDirectoryRootKeepsRelativePath) {
  const auto location = ComputeContentLocation("./blog/index.md", ".");

  EXPECT_EQ(location.route_path, "blog");
  EXPECT_EQ(location.article_id, "index");
}

TEST(ContentPathTest, NormalizesRedundantSegments) {
  const auto location = ComputeContentLocation(
      "site/content/blog/./drafts/../post.md", "site/./content");

  EXPECT_EQ(location.route_path, "blog");
  EXPECT_EQ(location.article_id, "post");
}

TEST(ContentPathTest, RejectsFilesOutsideRoot) {
  EXPECT_THROW(ComputeContentLocation("other/blog/post.md", "site/content"),
               MalformedPathError);
  EXPECT_THROW(ComputeContentLocation("site/contents/post.md", "site/content"),
               MalformedPathError);
  EXPECT_THROW(ComputeContentLocation("site/content", "site/content"),
               MalformedPathError);
  EXPECT_THROW(ComputeContentLocation("../post.md", "."), MalformedPathError);
}

TEST(ContentPathTest, RejectsPathsWithoutFileName) {
  EXPECT_THROW(ComputeContentLocation("", "site/content"), MalformedPathError);
  EXPECT_THROW(ComputeContentLocation("site/content/blog/", "site/content"),
               MalformedPathError);
}

TEST(ContentPathTest, ParsesRelatedLinkOnLastSlash) {
  const auto link = ParseRelatedLink("blog/coffee/roasting-basics");

  ASSERT_TRUE(link.has_value());
  EXPECT_EQ(link->route_path, "blog/coffee");
  EXPECT_EQ(link->article_id, "roasting-basics");
}

TEST(ContentPathTest, RelatedLinkWithoutSlashTargetsRoot) {
  const auto link = ParseRelatedLink("/about");

  ASSERT_TRUE(link.has_value());
  EXPECT_EQ(link->route_path, "");
  EXPECT_EQ(link->article_id, "about");
  EXPECT_EQ(FormatRelatedLink(*link), "about");
}

TEST(ContentPathTest, RejectsEmptyRelatedLinks) {
  EXPECT_FALSE(ParseRelatedLink("").has_value());
  EXPECT_FALSE(ParseRelatedLink("/").has_value());
  EXPECT_FALSE(ParseRelatedLink("blog/").has_value());
}

TEST(ContentPathTest, FormatsRelatedLink) {
  EXPECT_EQ(FormatRelatedLink(RelatedLink{"blog/tea", "green"}),
            "blog/tea/green");
}

} // namespace
} // namespace espresso
