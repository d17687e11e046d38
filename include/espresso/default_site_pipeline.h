#pragma once

#include <espresso/site_pipeline_builder.h>

#include <memory>
#include <vector>

namespace espresso {

class DefaultSitePipeline : public SitePipeline {
public:
  explicit DefaultSitePipeline(PipelineComponents components);

  PipelineResult Run(const BuildConfig &config) override;

private:
  std::unique_ptr<ContentSource> content_source_;
  std::shared_ptr<ArticleParser> parser_;
  std::unique_ptr<Reporter> reporter_;
  std::vector<std::shared_ptr<OutputPlugin>> plugins_;
  std::shared_ptr<Logger> logger_;
  RenderContext render_;
};

} // namespace espresso
