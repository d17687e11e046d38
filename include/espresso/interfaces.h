#pragma once

#include <espresso/models.h>

#include <string>
#include <vector>

namespace espresso {

struct Site;
struct PipelineResult;

class ContentSource {
public:
  virtual ~ContentSource() = default;
  virtual std::vector<ContentFile> Acquire(const BuildConfig &config) = 0;
};

class ArticleParser {
public:
  virtual ~ArticleParser() = default;
  virtual Article Parse(const std::string &source) = 0;
};

class OutputPlugin {
public:
  virtual ~OutputPlugin() = default;
  virtual void ProcessArticlePage(const RenderContext &context,
                                  const Page &page) = 0;
  virtual void Finalize(const RenderContext &context) = 0;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual Report Render(const Site &site,
                        const std::vector<BuildWarning> &warnings,
                        const BuildConfig &config) = 0;
};

class SitePipeline {
public:
  virtual ~SitePipeline() = default;
  virtual PipelineResult Run(const BuildConfig &config) = 0;
};

} // namespace espresso
