#include <espresso/default_site_pipeline.h>

#include <espresso/filesystem_content_source.h>
#include <espresso/plugin_dispatch.h>

#include <chrono>
#include <utility>

namespace espresso {

DefaultSitePipeline::DefaultSitePipeline(PipelineComponents components)
    : content_source_(std::move(components.content_source)),
      parser_(std::move(components.parser)),
      reporter_(std::move(components.reporter)),
      plugins_(std::move(components.plugins)),
      logger_(EnsureLogger(std::move(components.logger))),
      render_(std::move(components.render)) {}

PipelineResult DefaultSitePipeline::Run(const BuildConfig &config) {
  const auto content_root = ContentRoot(config);
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"root", config.root_path},
                {"content", content_root.generic_string()}});

  const auto pipeline_start = std::chrono::steady_clock::now();
  const auto files = content_source_->Acquire(config);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "source"},
                {"file_count", std::to_string(files.size())}});

  SiteBuilder builder(BuildContext{content_root.generic_string(), parser_,
                                   logger_, config.settings});
  builder.IngestAll(files, config.workers);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "ingest"},
                {"pages", std::to_string(builder.PageCount())}});

  auto build = builder.Finalize(config.finalize);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "derive"},
                {"warnings", std::to_string(build.warnings.size())}});

  const auto published = PublishSite(build.site, plugins_, render_);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "publish"},
                {"plugins", std::to_string(plugins_.size())},
                {"pages", std::to_string(published)}});

  auto report = reporter_->Render(build.site, build.warnings, config);

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - pipeline_start)
          .count();
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"warnings", std::to_string(build.warnings.size())}});

  return PipelineResult{std::move(build), std::move(report), published};
}

} // namespace espresso
