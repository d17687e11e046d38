#include <espresso/site_pipeline_builder.h>

#include <espresso/default_site_pipeline.h>
#include <espresso/filesystem_content_source.h>
#include <espresso/front_matter_parser.h>
#include <espresso/site_summary_reporter.h>

#include <stdexcept>
#include <utility>

namespace espresso {

SitePipelineBuilder &SitePipelineBuilder::WithContentSource(
    std::unique_ptr<ContentSource> content_source) {
  components_.content_source = std::move(content_source);
  return *this;
}

SitePipelineBuilder &
SitePipelineBuilder::WithParser(std::shared_ptr<ArticleParser> parser) {
  components_.parser = std::move(parser);
  return *this;
}

SitePipelineBuilder &
SitePipelineBuilder::WithReporter(std::unique_ptr<Reporter> reporter) {
  components_.reporter = std::move(reporter);
  return *this;
}

SitePipelineBuilder &
SitePipelineBuilder::WithPlugin(std::shared_ptr<OutputPlugin> plugin) {
  if (!plugin) {
    throw std::invalid_argument("Output plugin cannot be null");
  }
  components_.plugins.push_back(std::move(plugin));
  return *this;
}

SitePipelineBuilder &
SitePipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

SitePipelineBuilder &
SitePipelineBuilder::WithRenderContext(RenderContext render) {
  components_.render = std::move(render);
  return *this;
}

DefaultSitePipeline SitePipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  if (!components_.content_source) {
    components_.content_source =
        std::make_unique<FilesystemContentSource>(components_.logger);
  }
  if (!components_.parser) {
    components_.parser = std::make_shared<FrontMatterParser>();
  }
  if (!components_.reporter) {
    components_.reporter = std::make_unique<SiteSummaryReporter>();
  }
  return DefaultSitePipeline(std::move(components_));
}

} // namespace espresso
