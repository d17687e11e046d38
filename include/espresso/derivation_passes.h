#pragma once

#include <espresso/models.h>
#include <espresso/route_tree.h>

#include <string>
#include <vector>

namespace espresso {

bool IsVisible(const Page &page);

// Gives every route without an index page a list page holding its visible
// pages, newest first when sort_pages is set. Ties keep registration order.
void BuildListPages(RouteTree &tree, bool sort_pages);

std::vector<const Page *> CollectVisiblePages(const RouteTree &tree);

// Index pages aggregate the visible pages of the whole site, not only of
// their own subtree.
void AddArticlePagesToIndexPages(RouteTree &tree);

enum class ResolutionStatus {
  kFound,
  kRouteNotFound,
  kArticleNotFound,
  kArticleHidden
};

struct RelatedResolution {
  ResolutionStatus status = ResolutionStatus::kRouteNotFound;
  const Page *page = nullptr;

  bool found() const { return status == ResolutionStatus::kFound; }
};

RelatedResolution ResolveRelatedLink(const RouteTree &tree,
                                     const RelatedLink &link);

// Appends resolved pages to each article's related_pages. Links that do not
// resolve are returned as warnings and contribute no back-reference.
std::vector<BuildWarning> BuildRelated(RouteTree &tree);

Nav BuildNav(const RouteTree &tree, const SiteSettings &settings);
Footer BuildFooter(const SiteSettings &settings);

std::string TitleCase(const std::string &value);

// Throws std::logic_error unless every route carries exactly one of an
// index page or a list page.
void VerifyDerivedViews(const RouteTree &tree);

} // namespace espresso
