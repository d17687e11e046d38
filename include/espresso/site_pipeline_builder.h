#pragma once

#include <espresso/interfaces.h>
#include <espresso/logging.h>
#include <espresso/site_builder.h>

#include <memory>
#include <vector>

namespace espresso {

class DefaultSitePipeline;

struct PipelineResult {
  BuildResult build;
  Report report;
  std::size_t published_pages = 0;
};

struct PipelineComponents {
  std::unique_ptr<ContentSource> content_source;
  std::shared_ptr<ArticleParser> parser;
  std::unique_ptr<Reporter> reporter;
  std::vector<std::shared_ptr<OutputPlugin>> plugins;
  std::shared_ptr<Logger> logger;
  RenderContext render;
};

class SitePipelineBuilder {
public:
  SitePipelineBuilder &
  WithContentSource(std::unique_ptr<ContentSource> content_source);
  SitePipelineBuilder &WithParser(std::shared_ptr<ArticleParser> parser);
  SitePipelineBuilder &WithReporter(std::unique_ptr<Reporter> reporter);
  SitePipelineBuilder &WithPlugin(std::shared_ptr<OutputPlugin> plugin);
  SitePipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  SitePipelineBuilder &WithRenderContext(RenderContext render);

  DefaultSitePipeline Build();

private:
  PipelineComponents components_;
};

} // namespace espresso
