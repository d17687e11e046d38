#include <espresso/route_tree.h>

#include <espresso/errors.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace espresso {
namespace {

std::string JoinPath(const std::string &parent, const std::string &key) {
  if (parent.empty()) {
    return key;
  }
  return parent + "/" + key;
}

std::vector<std::string> SplitSegments(const std::string &path) {
  std::vector<std::string> segments;
  if (path.empty()) {
    return segments;
  }
  std::string current;
  for (const auto character : path) {
    if (character == '/') {
      segments.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  segments.push_back(std::move(current));
  return segments;
}

std::size_t CountPages(const Route &route) {
  auto count = route.pages().size();
  for (const auto &[key, child] : route.children()) {
    count += CountPages(*child);
  }
  return count;
}

} // namespace

std::vector<std::string> SplitRoutePath(const std::string &path) {
  auto segments = SplitSegments(path);
  const auto empty = std::find_if(segments.begin(), segments.end(),
                                  [](const auto &s) { return s.empty(); });
  if (empty != segments.end()) {
    throw MalformedPathError("Route path contains an empty segment: '" +
                             path + "'");
  }
  return segments;
}

Route::Route(std::string key, std::string path)
    : key_(std::move(key)), path_(std::move(path)) {}

Route *Route::Child(const std::string &key) {
  const auto found = children_.find(key);
  return found == children_.end() ? nullptr : found->second.get();
}

const Route *Route::Child(const std::string &key) const {
  const auto found = children_.find(key);
  return found == children_.end() ? nullptr : found->second.get();
}

Route &Route::ChildOrCreate(const std::string &key) {
  const auto expected_path = JoinPath(path_, key);
  auto &slot = children_[key];
  if (!slot) {
    slot = std::make_unique<Route>(key, expected_path);
    return *slot;
  }
  if (slot->path() != expected_path) {
    throw std::logic_error("Route '" + key + "' under '" + path_ +
                           "' carries mismatched path '" + slot->path() +
                           "'");
  }
  return *slot;
}

const Page &Route::AppendPage(Page page) {
  pages_.push_back(std::make_unique<Page>(std::move(page)));
  return *pages_.back();
}

const Page *Route::FindPage(const std::string &article_id) const {
  const auto found =
      std::find_if(pages_.begin(), pages_.end(), [&](const auto &page) {
        return page->article && page->article->id == article_id;
      });
  return found == pages_.end() ? nullptr : found->get();
}

void Route::SetIndexPage(IndexPage index_page) {
  if (index_page_) {
    throw MalformedPathError("Route '" + path_ +
                             "' already has an index page");
  }
  index_page_ = std::make_unique<IndexPage>(std::move(index_page));
}

void Route::SetListPage(ListPage list_page) {
  list_page_ = std::make_unique<ListPage>(std::move(list_page));
}

RouteTree::RouteTree() : root_(std::make_unique<Route>()) {}

Route &RouteTree::Descend(const std::string &path) {
  // Split first so a malformed path leaves the tree untouched.
  const auto segments = SplitRoutePath(path);
  Route *node = root_.get();
  for (const auto &segment : segments) {
    node = &node->ChildOrCreate(segment);
  }
  return *node;
}

const Page &RouteTree::Insert(Page page) {
  auto &route = Descend(page.path);
  return route.AppendPage(std::move(page));
}

void RouteTree::InsertIndex(IndexPage index_page) {
  auto &route = Descend(index_page.page.path);
  route.SetIndexPage(std::move(index_page));
}

Route &RouteTree::Lookup(const std::string &path) {
  const auto &self = *this;
  return const_cast<Route &>(self.Lookup(path));
}

const Route &RouteTree::Lookup(const std::string &path) const {
  const auto *route = Find(path);
  if (route == nullptr) {
    throw RouteNotFoundError(path);
  }
  return *route;
}

const Route *RouteTree::Find(const std::string &path) const {
  // Empty segments never match a child key, so no validation is needed.
  const Route *node = root_.get();
  for (const auto &segment : SplitSegments(path)) {
    node = node->Child(segment);
    if (node == nullptr) {
      return nullptr;
    }
  }
  return node;
}

std::size_t RouteTree::PageCount() const { return CountPages(*root_); }

} // namespace espresso
