#include <espresso/route_walker.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace espresso {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

RouteTree MakeTree() {
  RouteTree tree;
  for (const auto *path :
       {"blog/coffee", "blog/tea/green", "about", "blog", "docs/api"}) {
    auto article = std::make_shared<Article>();
    article->id = "post";
    tree.Insert(Page{path, article});
  }
  return tree;
}

std::vector<std::string> CollectPaths(const RouteTree &tree, int depth) {
  std::vector<std::string> paths;
  WalkRoutes(tree.root(), depth,
             [&](const Route &route) { paths.push_back(route.path()); });
  return paths;
}

TEST(RouteWalkerTest, DepthOneVisitsTopLevelRoutesOnly) {
  const auto tree = MakeTree();

  EXPECT_THAT(CollectPaths(tree, 1), ElementsAre("about", "blog", "docs"));
}

TEST(RouteWalkerTest, DepthTwoStopsBelowSecondLevel) {
  const auto tree = MakeTree();

  EXPECT_THAT(CollectPaths(tree, 2),
              ElementsAre("about", "blog", "blog/coffee", "blog/tea", "docs",
                          "docs/api"));
}

TEST(RouteWalkerTest, UnboundedDepthVisitsEveryRoutePreOrder) {
  const auto tree = MakeTree();

  EXPECT_THAT(CollectPaths(tree, kUnboundedDepth),
              ElementsAre("about", "blog", "blog/coffee", "blog/tea",
                          "blog/tea/green", "docs", "docs/api"));
}

TEST(RouteWalkerTest, DepthZeroVisitsNothing) {
  const auto tree = MakeTree();

  EXPECT_THAT(CollectPaths(tree, 0), IsEmpty());
}

TEST(RouteWalkerTest, RejectsNegativeDepthOtherThanUnbounded) {
  const auto tree = MakeTree();

  EXPECT_THROW(CollectPaths(tree, -2), std::invalid_argument);
}

TEST(RouteWalkerTest, WalkStartsBelowGivenRoute) {
  auto tree = MakeTree();
  std::vector<std::string> paths;
  WalkRoutes(tree.Lookup("blog"), kUnboundedDepth,
             [&](Route &route) { paths.push_back(route.path()); });

  EXPECT_THAT(paths, ElementsAre("blog/coffee", "blog/tea", "blog/tea/green"));
}

TEST(RouteWalkerTest, ForEachRouteIncludesRoot) {
  auto tree = MakeTree();
  std::vector<std::string> paths;
  ForEachRoute(tree, [&](Route &route) { paths.push_back(route.path()); });

  ASSERT_EQ(paths.size(), 8U);
  EXPECT_EQ(paths.front(), "");
  EXPECT_EQ(paths.back(), "docs/api");
}

} // namespace
} // namespace espresso
