#include <espresso/derivation_passes.h>

#include <espresso/content_path.h>
#include <espresso/route_walker.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace espresso {
namespace {

std::string DescribeRoute(const std::string &path) {
  return path.empty() ? std::string("/") : path;
}

BuildWarning MakeResolutionWarning(const Page &owner, const RelatedLink &link,
                                   ResolutionStatus status) {
  const auto owner_name = FormatRelatedLink({owner.path, owner.article->id});
  const auto target = FormatRelatedLink(link);

  BuildWarning warning;
  warning.subject = owner_name;
  switch (status) {
  case ResolutionStatus::kRouteNotFound:
    warning.code = "related.route_not_found";
    warning.message = "Related link '" + target + "' names unknown route '" +
                      DescribeRoute(link.route_path) + "'";
    break;
  case ResolutionStatus::kArticleNotFound:
    warning.code = "related.article_not_found";
    warning.message = "Related link '" + target + "' names unknown article '" +
                      link.article_id + "'";
    break;
  case ResolutionStatus::kArticleHidden:
    warning.code = "related.article_hidden";
    warning.message = "Related link '" + target + "' points to a hidden article";
    break;
  case ResolutionStatus::kFound:
    break;
  }
  return warning;
}

void ResolvePageLinks(const RouteTree &tree, const Page &page,
                      std::vector<BuildWarning> &warnings) {
  if (!page.article) {
    return;
  }
  for (const auto &link : page.article->related_links) {
    const auto resolution = ResolveRelatedLink(tree, link);
    if (resolution.found()) {
      page.article->related_pages.push_back(resolution.page);
      continue;
    }
    warnings.push_back(MakeResolutionWarning(page, link, resolution.status));
  }
}

} // namespace

bool IsVisible(const Page &page) {
  return page.article != nullptr && !page.article->hide;
}

void BuildListPages(RouteTree &tree, bool sort_pages) {
  ForEachRoute(tree, [sort_pages](Route &route) {
    // Routes with a user-provided index page never get a list page.
    if (route.index_page() != nullptr) {
      return;
    }

    ListPage list_page;
    list_page.path = route.path();
    for (const auto &page : route.pages()) {
      if (IsVisible(*page)) {
        list_page.pages.push_back(page.get());
      }
    }

    if (sort_pages) {
      std::stable_sort(list_page.pages.begin(), list_page.pages.end(),
                       [](const Page *left, const Page *right) {
                         return left->article->date > right->article->date;
                       });
    }
    route.SetListPage(std::move(list_page));
  });
}

std::vector<const Page *> CollectVisiblePages(const RouteTree &tree) {
  std::vector<const Page *> pages;
  ForEachRoute(tree, [&pages](const Route &route) {
    for (const auto &page : route.pages()) {
      if (IsVisible(*page)) {
        pages.push_back(page.get());
      }
    }
  });
  return pages;
}

void AddArticlePagesToIndexPages(RouteTree &tree) {
  const auto visible = CollectVisiblePages(tree);
  ForEachRoute(tree, [&visible](Route &route) {
    auto *index_page = route.index_page();
    if (index_page == nullptr) {
      return;
    }
    index_page->pages.insert(index_page->pages.end(), visible.begin(),
                             visible.end());
  });
}

RelatedResolution ResolveRelatedLink(const RouteTree &tree,
                                     const RelatedLink &link) {
  RelatedResolution resolution;
  const auto *route = tree.Find(link.route_path);
  if (route == nullptr) {
    resolution.status = ResolutionStatus::kRouteNotFound;
    return resolution;
  }

  const auto *page = route->FindPage(link.article_id);
  if (page == nullptr) {
    resolution.status = ResolutionStatus::kArticleNotFound;
    return resolution;
  }
  if (!IsVisible(*page)) {
    resolution.status = ResolutionStatus::kArticleHidden;
    return resolution;
  }

  resolution.status = ResolutionStatus::kFound;
  resolution.page = page;
  return resolution;
}

std::vector<BuildWarning> BuildRelated(RouteTree &tree) {
  std::vector<BuildWarning> warnings;
  ForEachRoute(tree, [&](Route &route) {
    for (const auto &page : route.pages()) {
      ResolvePageLinks(tree, *page, warnings);
    }
    if (const auto *index_page = route.index_page()) {
      ResolvePageLinks(tree, index_page->page, warnings);
    }
  });
  return warnings;
}

Nav BuildNav(const RouteTree &tree, const SiteSettings &settings) {
  Nav nav;
  nav.brand = settings.title;
  nav.items = settings.nav.items;

  if (!settings.nav.override) {
    WalkRoutes(tree.root(), 1, [&nav](const Route &route) {
      nav.items.push_back(NavItem{TitleCase(route.key()), route.key()});
    });
  }
  return nav;
}

Footer BuildFooter(const SiteSettings &settings) {
  Footer footer;
  footer.text = settings.footer.text;
  footer.items = settings.footer.items;
  return footer;
}

std::string TitleCase(const std::string &value) {
  std::string result;
  result.reserve(value.size());
  bool word_start = true;
  for (const auto character : value) {
    const auto ch = static_cast<unsigned char>(character);
    if (std::isalnum(ch) == 0 && character != '_') {
      word_start = true;
      result.push_back(character);
      continue;
    }
    result.push_back(word_start ? static_cast<char>(std::toupper(ch))
                                : character);
    word_start = false;
  }
  return result;
}

void VerifyDerivedViews(const RouteTree &tree) {
  ForEachRoute(tree, [](const Route &route) {
    const bool has_index = route.index_page() != nullptr;
    const bool has_list = route.list_page() != nullptr;
    if (has_index == has_list) {
      throw std::logic_error("Route '" + DescribeRoute(route.path()) +
                             "' must carry exactly one of an index page "
                             "or a list page");
    }
  });
}

} // namespace espresso
