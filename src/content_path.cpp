#include <espresso/content_path.h>

#include <espresso/errors.h>

#include <algorithm>
#include <filesystem>

namespace espresso {
namespace {

std::filesystem::path Normalize(const std::string &value) {
  auto normalized = std::filesystem::path(value).lexically_normal();
  // `content/` keeps an empty filename after normalization; drop it.
  if (!normalized.empty() && !normalized.has_filename()) {
    normalized = normalized.parent_path();
  }
  return normalized;
}

bool IsCurrentDirectory(const std::filesystem::path &path) {
  return path.empty() || path == ".";
}

std::filesystem::path RelativeToRoot(const std::filesystem::path &file,
                                     const std::filesystem::path &root,
                                     const std::string &raw_path) {
  if (IsCurrentDirectory(root)) {
    if (file.is_absolute() || *file.begin() == "..") {
      throw MalformedPathError("Content file '" + raw_path +
                               "' is not relative to the content root");
    }
    return file;
  }

  const auto root_length = std::distance(root.begin(), root.end());
  const auto file_length = std::distance(file.begin(), file.end());
  if (file_length <= root_length ||
      !std::equal(root.begin(), root.end(), file.begin())) {
    throw MalformedPathError("Content file '" + raw_path +
                             "' is not located below content root '" +
                             root.generic_string() + "'");
  }

  std::filesystem::path relative;
  auto it = file.begin();
  std::advance(it, root_length);
  for (; it != file.end(); ++it) {
    relative /= *it;
  }
  return relative;
}

} // namespace

ContentLocation ComputeContentLocation(const std::string &raw_path,
                                       const std::string &content_root) {
  if (raw_path.empty() || raw_path.back() == '/') {
    throw MalformedPathError("Content file path '" + raw_path +
                             "' does not name a file");
  }

  const auto file = Normalize(raw_path);
  const auto root = Normalize(content_root);
  const auto relative = RelativeToRoot(file, root, raw_path);

  ContentLocation location;
  location.article_id = relative.stem().string();
  if (location.article_id.empty() || location.article_id == "." ||
      location.article_id == "..") {
    throw MalformedPathError("Content file '" + raw_path +
                             "' has no usable file name");
  }
  location.route_path = relative.parent_path().generic_string();
  return location;
}

std::optional<RelatedLink> ParseRelatedLink(const std::string &link) {
  auto value = link;
  if (!value.empty() && value.front() == '/') {
    value.erase(value.begin());
  }
  if (value.empty()) {
    return std::nullopt;
  }

  RelatedLink parsed;
  const auto separator = value.rfind('/');
  if (separator == std::string::npos) {
    parsed.article_id = value;
  } else {
    parsed.route_path = value.substr(0, separator);
    parsed.article_id = value.substr(separator + 1);
  }
  if (parsed.article_id.empty()) {
    return std::nullopt;
  }
  return parsed;
}

std::string FormatRelatedLink(const RelatedLink &link) {
  if (link.route_path.empty()) {
    return link.article_id;
  }
  return link.route_path + "/" + link.article_id;
}

} // namespace espresso
