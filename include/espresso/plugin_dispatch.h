#pragma once

#include <espresso/interfaces.h>
#include <espresso/site.h>

#include <memory>
#include <vector>

namespace espresso {

// Hands every visible article page to each plugin, then finalizes each
// plugin once. Returns the number of pages delivered per plugin.
std::size_t PublishSite(const Site &site,
                        const std::vector<std::shared_ptr<OutputPlugin>> &plugins,
                        const RenderContext &context);

} // namespace espresso
