#pragma once

#include <espresso/models.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace espresso {

// A node of the site's path hierarchy. For content stored at
// `content/blog/coffee/post.md` the tree holds
//
//   root
//    └─ "blog"            path "blog"
//        └─ "coffee"      path "blog/coffee", pages: [post]
//
// Pages are heap-allocated so that pointers handed to derived views stay
// valid while routes grow.
class Route {
public:
  Route() = default;
  Route(std::string key, std::string path);

  Route(const Route &) = delete;
  Route &operator=(const Route &) = delete;

  const std::string &key() const { return key_; }
  const std::string &path() const { return path_; }
  bool IsRoot() const { return path_.empty() && key_.empty(); }

  const std::vector<std::unique_ptr<Page>> &pages() const { return pages_; }
  const std::map<std::string, std::unique_ptr<Route>> &children() const {
    return children_;
  }

  Route *Child(const std::string &key);
  const Route *Child(const std::string &key) const;
  Route &ChildOrCreate(const std::string &key);

  const Page &AppendPage(Page page);
  const Page *FindPage(const std::string &article_id) const;

  IndexPage *index_page() { return index_page_.get(); }
  const IndexPage *index_page() const { return index_page_.get(); }
  void SetIndexPage(IndexPage index_page);

  ListPage *list_page() { return list_page_.get(); }
  const ListPage *list_page() const { return list_page_.get(); }
  void SetListPage(ListPage list_page);

private:
  std::string key_;
  std::string path_;
  std::vector<std::unique_ptr<Page>> pages_;
  std::map<std::string, std::unique_ptr<Route>> children_;
  std::unique_ptr<IndexPage> index_page_;
  std::unique_ptr<ListPage> list_page_;
};

class RouteTree {
public:
  RouteTree();

  Route &root() { return *root_; }
  const Route &root() const { return *root_; }

  // Creates missing routes along page.path and appends the page to the
  // last one. An empty path registers the page at the root.
  const Page &Insert(Page page);
  void InsertIndex(IndexPage index_page);

  Route &Lookup(const std::string &path);
  const Route &Lookup(const std::string &path) const;
  const Route *Find(const std::string &path) const;

  std::size_t PageCount() const;

private:
  Route &Descend(const std::string &path);

  std::unique_ptr<Route> root_;
};

std::vector<std::string> SplitRoutePath(const std::string &path);

} // namespace espresso
