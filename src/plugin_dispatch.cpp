#include <espresso/plugin_dispatch.h>

#include <espresso/derivation_passes.h>

#include <stdexcept>

namespace espresso {

std::size_t PublishSite(const Site &site,
                        const std::vector<std::shared_ptr<OutputPlugin>> &plugins,
                        const RenderContext &context) {
  for (const auto &plugin : plugins) {
    if (!plugin) {
      throw std::invalid_argument("Output plugin cannot be null");
    }
  }

  const auto pages = CollectVisiblePages(site.routes);
  for (const auto &plugin : plugins) {
    for (const auto *page : pages) {
      plugin->ProcessArticlePage(context, *page);
    }
    plugin->Finalize(context);
  }
  return pages.size();
}

} // namespace espresso
