#include <espresso/site_builder.h>

#include <espresso/content_path.h>
#include <espresso/derivation_passes.h>
#include <espresso/errors.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace espresso {
namespace {

constexpr const char kIndexArticleId[] = "index";

std::size_t ResolveWorkerCount(std::size_t requested, std::size_t jobs) {
  auto workers = requested;
  if (workers == 0) {
    workers = std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
  }
  return std::min(workers, jobs);
}

// Joins every started worker on scope exit, including when starting a
// later worker throws.
class JoiningThreads {
public:
  JoiningThreads() = default;
  JoiningThreads(const JoiningThreads &) = delete;
  JoiningThreads &operator=(const JoiningThreads &) = delete;
  ~JoiningThreads() { JoinAll(); }

  template <typename Function> void Start(Function &&function) {
    threads_.emplace_back(std::forward<Function>(function));
  }

  void Reserve(std::size_t count) { threads_.reserve(count); }

  void JoinAll() {
    for (auto &thread : threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  }

private:
  std::vector<std::thread> threads_;
};

} // namespace

SiteBuilder::SiteBuilder(BuildContext context)
    : context_(std::move(context)),
      logger_(EnsureLogger(context_.logger)),
      site_(std::make_unique<Site>()) {}

Page SiteBuilder::Ingest(const std::string &raw_path,
                         const std::string &source) {
  if (!context_.parser) {
    throw std::logic_error("SiteBuilder has no article parser configured");
  }

  Article article;
  try {
    article = context_.parser->Parse(source);
  } catch (const ParseError &error) {
    throw ParseError(raw_path + ": " + error.what());
  }
  return Ingest(raw_path, std::move(article));
}

Page SiteBuilder::Ingest(const std::string &raw_path, Article article) {
  const auto location = ComputeContentLocation(raw_path, context_.content_root);
  article.id = location.article_id;

  std::vector<BuildWarning> malformed;
  article.related_links.clear();
  for (const auto &link : article.related) {
    auto parsed = ParseRelatedLink(link);
    if (!parsed) {
      malformed.push_back({"related.malformed",
                           FormatRelatedLink({location.route_path, article.id}),
                           "Related link '" + link + "' is malformed"});
      continue;
    }
    article.related_links.push_back(std::move(*parsed));
  }

  Page page{location.route_path, std::make_shared<Article>(std::move(article))};

  // A user-provided `index` file becomes the route's index page.
  if (page.article->id == kIndexArticleId) {
    RegisterIndex(IndexPage{page, {}});
  } else {
    Register(page);
  }
  for (auto &warning : malformed) {
    AddWarning(std::move(warning));
  }

  logger_->Log(LogLevel::kDebug, "build.page.registered",
               {{"file", raw_path},
                {"route", location.route_path},
                {"id", page.article->id}});
  return page;
}

void SiteBuilder::IngestAll(const std::vector<ContentFile> &files,
                            std::size_t worker_count) {
  if (files.empty()) {
    return;
  }

  const auto start = std::chrono::steady_clock::now();
  const auto workers = ResolveWorkerCount(worker_count, files.size());

  std::atomic<std::size_t> next_file{0};
  std::atomic<bool> failed{false};
  std::mutex error_mutex;
  std::exception_ptr first_error;

  JoiningThreads threads;
  threads.Reserve(workers);
  const auto run_worker = [&]() {
    while (!failed.load()) {
      const auto index = next_file.fetch_add(1);
      if (index >= files.size()) {
        break;
      }
      try {
        Ingest(files[index].path, files[index].source);
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
        failed.store(true);
      }
    }
  };
  try {
    for (std::size_t i = 0; i < workers; ++i) {
      threads.Start(run_worker);
    }
  } catch (const std::system_error &) {
    // Running workers stop taking files; the guard joins them.
    failed.store(true);
    throw;
  }
  threads.JoinAll();

  if (first_error) {
    logger_->Log(LogLevel::kError, "build.ingest.failed",
                 {{"files", std::to_string(files.size())}});
    std::rethrow_exception(first_error);
  }

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count();
  logger_->Log(LogLevel::kInfo, "build.ingest.complete",
               {{"files", std::to_string(files.size())},
                {"workers", std::to_string(workers)},
                {"duration_ms", std::to_string(duration_ms)}});
}

void SiteBuilder::Register(Page page) {
  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();
  site_->routes.Insert(std::move(page));
}

void SiteBuilder::RegisterIndex(IndexPage index_page) {
  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();
  site_->routes.InsertIndex(std::move(index_page));
}

BuildResult SiteBuilder::Finalize(const FinalizeOptions &options) {
  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();
  finalized_ = true;

  auto &routes = site_->routes;
  BuildListPages(routes, options.sort_list_pages);
  logger_->Log(LogLevel::kDebug, "build.pass.complete",
               {{"pass", "list_pages"},
                {"sorted", options.sort_list_pages ? "true" : "false"}});

  AddArticlePagesToIndexPages(routes);
  logger_->Log(LogLevel::kDebug, "build.pass.complete",
               {{"pass", "index_pages"}});

  auto unresolved = BuildRelated(routes);
  for (const auto &warning : unresolved) {
    logger_->Log(LogLevel::kWarn, "build.related.unresolved",
                 {{"article", warning.subject},
                  {"code", warning.code},
                  {"detail", warning.message}});
  }
  if (options.strict_related && !unresolved.empty()) {
    throw UnresolvedLinkError(unresolved.front().subject + ": " +
                              unresolved.front().message);
  }
  warnings_.insert(warnings_.end(), unresolved.begin(), unresolved.end());
  logger_->Log(LogLevel::kDebug, "build.pass.complete",
               {{"pass", "related"},
                {"unresolved", std::to_string(unresolved.size())}});

  site_->nav = BuildNav(routes, context_.settings);
  site_->footer = BuildFooter(context_.settings);
  VerifyDerivedViews(routes);

  logger_->Log(LogLevel::kInfo, "build.finalized",
               {{"pages", std::to_string(routes.PageCount())},
                {"warnings", std::to_string(warnings_.size())}});

  BuildResult result{std::move(*site_), warnings_};
  site_.reset();
  return result;
}

std::size_t SiteBuilder::PageCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();
  return site_->routes.PageCount();
}

std::vector<BuildWarning> SiteBuilder::Warnings() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return warnings_;
}

void SiteBuilder::AddWarning(BuildWarning warning) {
  logger_->Log(LogLevel::kWarn, "build.warning",
               {{"code", warning.code},
                {"subject", warning.subject},
                {"detail", warning.message}});
  std::lock_guard<std::mutex> lock(mutex_);
  warnings_.push_back(std::move(warning));
}

void SiteBuilder::RequireOpen() const {
  if (finalized_) {
    throw std::logic_error("SiteBuilder has already been finalized");
  }
}

} // namespace espresso
