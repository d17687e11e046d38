#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace espresso {

using Timestamp = std::chrono::system_clock::time_point;

struct Page;

struct RelatedLink {
  std::string route_path;
  std::string article_id;
};

struct Article {
  std::string id;
  std::string title;
  std::string description;
  std::string content;
  Timestamp date{};
  bool hide = false;
  std::vector<std::string> related;
  std::vector<RelatedLink> related_links;
  // Filled by the related-article pass; points into the owning route tree.
  std::vector<const Page *> related_pages;
};

struct Page {
  std::string path;
  std::shared_ptr<Article> article;
};

struct ListPage {
  std::string path;
  std::vector<const Page *> pages;
};

struct IndexPage {
  Page page;
  std::vector<const Page *> pages;
};

struct NavItem {
  std::string label;
  std::string target;
};

struct Nav {
  std::string brand;
  std::vector<NavItem> items;
};

struct FooterItem {
  std::string label;
  std::string target;
};

struct Footer {
  std::string text;
  std::vector<FooterItem> items;
};

struct SiteSettings {
  std::string title;
  struct NavSettings {
    bool override = false;
    std::vector<NavItem> items;
  } nav;
  struct FooterSettings {
    std::string text;
    std::vector<FooterItem> items;
  } footer;
};

struct FinalizeOptions {
  bool sort_list_pages = true;
  bool strict_related = false;
};

struct BuildConfig {
  std::string root_path;
  std::string content_dir = "content";
  std::vector<std::string> extensions = {".md"};
  std::vector<std::string> formats = {"markdown"};
  std::size_t workers = 0;
  FinalizeOptions finalize;
  SiteSettings settings;
};

struct ContentFile {
  std::string path;
  std::string source;
};

struct BuildWarning {
  std::string code;
  std::string subject;
  std::string message;
};

struct RenderContext {
  std::filesystem::path target_dir;
  std::string base_url;
};

struct Report {
  std::string markdown;
  std::string json;
};

} // namespace espresso
