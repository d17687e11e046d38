#pragma once

#include <espresso/interfaces.h>
#include <espresso/logging.h>
#include <espresso/site.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace espresso {

struct BuildContext {
  std::string content_root;
  std::shared_ptr<ArticleParser> parser;
  std::shared_ptr<Logger> logger;
  SiteSettings settings;
};

struct BuildResult {
  Site site;
  std::vector<BuildWarning> warnings;
};

// Owns the site model while content is registered. Ingest, Register and
// RegisterIndex may be called from several threads at once; Finalize must
// only run after all of them returned.
class SiteBuilder {
public:
  explicit SiteBuilder(BuildContext context);

  SiteBuilder(const SiteBuilder &) = delete;
  SiteBuilder &operator=(const SiteBuilder &) = delete;

  Page Ingest(const std::string &raw_path, const std::string &source);
  Page Ingest(const std::string &raw_path, Article article);

  // Parses and registers files on `worker_count` threads (0 picks the
  // hardware concurrency). The first failure is rethrown once every worker
  // has stopped.
  void IngestAll(const std::vector<ContentFile> &files,
                 std::size_t worker_count);

  void Register(Page page);
  void RegisterIndex(IndexPage index_page);

  BuildResult Finalize(const FinalizeOptions &options);

  std::size_t PageCount() const;
  std::vector<BuildWarning> Warnings() const;

private:
  void AddWarning(BuildWarning warning);
  void RequireOpen() const;

  BuildContext context_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::unique_ptr<Site> site_;
  std::vector<BuildWarning> warnings_;
  bool finalized_ = false;
};

} // namespace espresso
