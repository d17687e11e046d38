#pragma once

#include <espresso/models.h>

#include <optional>
#include <string>

namespace espresso {

struct ContentLocation {
  std::string route_path;
  std::string article_id;
};

// `site/content/blog/coffee/post.md` below content root `site/content`
// yields route path `blog/coffee` and article id `post`. Throws
// MalformedPathError when raw_path does not lie below content_root.
ContentLocation ComputeContentLocation(const std::string &raw_path,
                                       const std::string &content_root);

// Splits `coffee/roasting-basics` (or `/coffee/roasting-basics`) on the
// last slash. Returns std::nullopt for an empty link or an empty id.
std::optional<RelatedLink> ParseRelatedLink(const std::string &link);

std::string FormatRelatedLink(const RelatedLink &link);

} // namespace espresso
