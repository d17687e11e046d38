#include <espresso/site_summary_reporter.h>

#include <espresso/content_path.h>
#include <espresso/derivation_passes.h>
#include <espresso/front_matter_parser.h>
#include <espresso/route_walker.h>
#include <espresso/site.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace espresso {
namespace {

struct RouteSummary {
  std::string path;
  std::size_t pages = 0;
  std::size_t visible = 0;
  std::string view;
  std::vector<std::string> entries;
};

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""},
      {'\\', "\\\\"},
      {'\n', "\\n"},
      {'\r', "\\r"},
      {'\t', "\\t"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

template <typename Collection, typename Formatter>
std::string Join(const Collection &items, const std::string &delimiter,
                 Formatter formatter) {
  std::ostringstream output;
  bool first = true;
  std::for_each(items.begin(), items.end(), [&](const auto &item) {
    if (!first) {
      output << delimiter;
    }
    output << formatter(item);
    first = false;
  });
  return output.str();
}

std::string JoinJsonArray(const std::vector<std::string> &values) {
  return Join(values, ",", [](const std::string &value) {
    return "\"" + EscapeJsonString(value) + "\"";
  });
}

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "markdown";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string DisplayPath(const std::string &path) {
  return path.empty() ? std::string("/") : path;
}

std::string PageName(const Page &page) {
  return FormatRelatedLink({page.path, page.article->id});
}

std::vector<RouteSummary> SummarizeRoutes(const Site &site) {
  std::vector<RouteSummary> summaries;
  ForEachRoute(site.routes, [&summaries](const Route &route) {
    RouteSummary summary;
    summary.path = DisplayPath(route.path());
    summary.pages = route.pages().size();
    summary.visible = static_cast<std::size_t>(
        std::count_if(route.pages().begin(), route.pages().end(),
                       [](const auto &page) { return IsVisible(*page); }));

    std::vector<const Page *> view_pages;
    if (const auto *index_page = route.index_page()) {
      summary.view = "index";
      view_pages = index_page->pages;
    } else if (const auto *list_page = route.list_page()) {
      summary.view = "list";
      view_pages = list_page->pages;
    } else {
      summary.view = "none";
    }
    for (const auto *page : view_pages) {
      summary.entries.push_back(PageName(*page));
    }
    summaries.push_back(std::move(summary));
  });
  return summaries;
}

std::string BuildHeaderMarkdown(const Site &site, const BuildConfig &config,
                                const std::string &timestamp) {
  std::ostringstream section;
  section << "## Build Header\n\n";
  section << "| Field | Value |\n";
  section << "| --- | --- |\n";
  section << "| Generated On | " << timestamp << " |\n";
  section << "| Site | " << (site.nav.brand.empty() ? "-" : site.nav.brand)
          << " |\n";
  section << "| Source | " << config.root_path << " |\n";
  section << "| Pages | " << site.routes.PageCount() << " |\n\n";
  return section.str();
}

std::string BuildRoutesMarkdown(const std::vector<RouteSummary> &routes) {
  std::ostringstream section;
  section << "## Routes\n\n";
  section << "| Route | Pages | Visible | View | Entries |\n";
  section << "| --- | --- | --- | --- | --- |\n";
  for (const auto &route : routes) {
    const auto entries =
        route.entries.empty()
            ? std::string("-")
            : Join(route.entries, "<br>",
                   [](const std::string &value) { return value; });
    section << "| " << route.path << " | " << route.pages << " | "
            << route.visible << " | " << route.view << " | " << entries
            << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildRelatedMarkdown(const Site &site) {
  std::ostringstream section;
  section << "## Related Articles\n\n";
  bool any = false;
  ForEachRoute(site.routes, [&](const Route &route) {
    for (const auto &page : route.pages()) {
      if (page->article->related_pages.empty()) {
        continue;
      }
      any = true;
      section << "- " << PageName(*page) << ": "
              << Join(page->article->related_pages, ", ",
                      [](const Page *related) { return PageName(*related); })
              << "\n";
    }
  });
  if (!any) {
    section << "- None\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildNavigationMarkdown(const Site &site) {
  std::ostringstream section;
  section << "## Navigation\n\n";
  if (site.nav.items.empty()) {
    section << "- None\n\n";
    return section.str();
  }
  for (const auto &item : site.nav.items) {
    section << "- " << item.label << " -> " << item.target << "\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildFooterMarkdown(const Site &site) {
  std::ostringstream section;
  section << "## Footer\n\n";
  if (!site.footer.text.empty()) {
    section << site.footer.text << "\n\n";
  }
  for (const auto &item : site.footer.items) {
    section << "- " << item.label << " -> " << item.target << "\n";
  }
  if (site.footer.text.empty() && site.footer.items.empty()) {
    section << "- None\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildWarningsMarkdown(const std::vector<BuildWarning> &warnings) {
  std::ostringstream section;
  section << "## Warnings\n\n";
  if (warnings.empty()) {
    section << "- None\n";
    return section.str();
  }
  for (const auto &warning : warnings) {
    section << "- `" << warning.code << "` " << warning.subject << ": "
            << warning.message << "\n";
  }
  return section.str();
}

std::string BuildHeaderJson(const Site &site, const BuildConfig &config,
                            const std::string &timestamp) {
  std::ostringstream json;
  json << "\"build_header\": {";
  json << "\"generated_on\": \"" << EscapeJsonString(timestamp) << "\",";
  json << "\"site\": \"" << EscapeJsonString(site.nav.brand) << "\",";
  json << "\"source\": \"" << EscapeJsonString(config.root_path) << "\",";
  json << "\"pages\": " << site.routes.PageCount() << "}";
  return json.str();
}

std::string BuildRoutesJson(const std::vector<RouteSummary> &routes) {
  std::ostringstream json;
  json << "\"routes\": [";
  for (std::size_t i = 0; i < routes.size(); ++i) {
    const auto &route = routes[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"path\": \"" << EscapeJsonString(route.path) << "\",";
    json << "\"pages\": " << route.pages << ",";
    json << "\"visible\": " << route.visible << ",";
    json << "\"view\": \"" << route.view << "\",";
    json << "\"entries\": [" << JoinJsonArray(route.entries) << "]}";
  }
  json << "]";
  return json.str();
}

std::string BuildArticlesJson(const Site &site) {
  std::ostringstream json;
  json << "\"articles\": [";
  bool first = true;
  ForEachRoute(site.routes, [&](const Route &route) {
    for (const auto &page : route.pages()) {
      const auto &article = *page->article;
      std::vector<std::string> related;
      for (const auto *related_page : article.related_pages) {
        related.push_back(PageName(*related_page));
      }
      if (!first) {
        json << ",";
      }
      first = false;
      json << "{\"id\": \"" << EscapeJsonString(PageName(*page)) << "\",";
      json << "\"title\": \"" << EscapeJsonString(article.title) << "\",";
      json << "\"date\": \"" << FormatDate(article.date) << "\",";
      json << "\"hidden\": " << (article.hide ? "true" : "false") << ",";
      json << "\"related\": [" << JoinJsonArray(related) << "]}";
    }
  });
  json << "]";
  return json.str();
}

std::string BuildNavigationJson(const Site &site) {
  std::ostringstream json;
  json << "\"navigation\": {\"brand\": \"" << EscapeJsonString(site.nav.brand)
       << "\", \"items\": [";
  json << Join(site.nav.items, ",", [](const NavItem &item) {
    return "{\"label\": \"" + EscapeJsonString(item.label) +
           "\", \"target\": \"" + EscapeJsonString(item.target) + "\"}";
  });
  json << "]}";
  return json.str();
}

std::string BuildFooterJson(const Site &site) {
  std::ostringstream json;
  json << "\"footer\": {\"text\": \"" << EscapeJsonString(site.footer.text)
       << "\", \"items\": [";
  json << Join(site.footer.items, ",", [](const FooterItem &item) {
    return "{\"label\": \"" + EscapeJsonString(item.label) +
           "\", \"target\": \"" + EscapeJsonString(item.target) + "\"}";
  });
  json << "]}";
  return json.str();
}

std::string BuildWarningsJson(const std::vector<BuildWarning> &warnings) {
  std::ostringstream json;
  json << "\"warnings\": [";
  json << Join(warnings, ",", [](const BuildWarning &warning) {
    return "{\"code\": \"" + EscapeJsonString(warning.code) +
           "\", \"subject\": \"" + EscapeJsonString(warning.subject) +
           "\", \"message\": \"" + EscapeJsonString(warning.message) + "\"}";
  });
  json << "]";
  return json.str();
}

} // namespace

Report SiteSummaryReporter::Render(const Site &site,
                                   const std::vector<BuildWarning> &warnings,
                                   const BuildConfig &config) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm tm;
#ifdef _WIN32
  gmtime_s(&tm, &now_time);
#else
  gmtime_r(&now_time, &tm);
#endif
  std::ostringstream timestamp_stream;
  timestamp_stream << std::put_time(&tm, "%FT%TZ");
  const auto timestamp = timestamp_stream.str();

  const auto routes = SummarizeRoutes(site);

  Report report;
  if (ShouldRenderFormat(config.formats, "markdown")) {
    std::ostringstream output;
    output << "# Site Model Summary\n\n";
    output << BuildHeaderMarkdown(site, config, timestamp);
    output << BuildRoutesMarkdown(routes);
    output << BuildRelatedMarkdown(site);
    output << BuildNavigationMarkdown(site);
    output << BuildFooterMarkdown(site);
    output << BuildWarningsMarkdown(warnings);
    report.markdown = output.str();
  }

  if (ShouldRenderFormat(config.formats, "json")) {
    std::ostringstream output;
    output << "{";
    output << BuildHeaderJson(site, config, timestamp) << ",";
    output << BuildRoutesJson(routes) << ",";
    output << BuildArticlesJson(site) << ",";
    output << BuildNavigationJson(site) << ",";
    output << BuildFooterJson(site) << ",";
    output << BuildWarningsJson(warnings);
    output << "}";
    report.json = output.str();
  }

  return report;
}

} // namespace espresso
