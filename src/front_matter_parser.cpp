#include <espresso/front_matter_parser.h>

#include <espresso/errors.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace espresso {
namespace {

constexpr const char kDelimiter[] = "---";

struct SplitSource {
  std::optional<std::string> header;
  std::string body;
};

std::string StripLineEnding(std::string line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

SplitSource SplitFrontMatter(const std::string &source) {
  SplitSource split;
  std::istringstream stream(source);
  std::string line;
  if (!std::getline(stream, line) || StripLineEnding(line) != kDelimiter) {
    split.body = source;
    return split;
  }

  std::string header;
  while (std::getline(stream, line)) {
    const auto trimmed = StripLineEnding(line);
    if (trimmed == kDelimiter || trimmed == "...") {
      split.header = header;
      const auto consumed = stream.tellg();
      split.body = consumed < 0 ? std::string{}
                                : source.substr(static_cast<std::size_t>(consumed));
      return split;
    }
    header += line;
    header += '\n';
  }
  throw ParseError("Front matter block is not terminated by '---'");
}

std::string ExtractString(const YAML::Node &node, const std::string &key) {
  if (node.IsNull()) {
    return {};
  }
  if (!node.IsScalar()) {
    throw ParseError("Front matter key '" + key + "' must be a string");
  }
  return node.as<std::string>();
}

std::vector<std::string> ExtractStringList(const YAML::Node &node,
                                           const std::string &key) {
  std::vector<std::string> values;
  if (node.IsNull()) {
    return values;
  }
  if (node.IsScalar()) {
    values.push_back(node.as<std::string>());
    return values;
  }
  if (!node.IsSequence()) {
    throw ParseError("Front matter key '" + key +
                     "' must be a string or list of strings");
  }
  for (const auto &child : node) {
    values.push_back(ExtractString(child, key));
  }
  return values;
}

void ApplyHeader(const YAML::Node &header, Article &article) {
  if (header.IsNull()) {
    return;
  }
  if (!header.IsMap()) {
    throw ParseError("Front matter must be a mapping");
  }

  for (const auto &entry : header) {
    const auto key = entry.first.as<std::string>();
    const auto &value = entry.second;
    if (key == "title") {
      article.title = ExtractString(value, key);
    } else if (key == "description") {
      article.description = ExtractString(value, key);
    } else if (key == "date") {
      if (!value.IsNull()) {
        article.date = ParseDate(ExtractString(value, key));
      }
    } else if (key == "hide") {
      article.hide = value.as<bool>();
    } else if (key == "related") {
      article.related = ExtractStringList(value, key);
    }
  }
}

bool IsCalendarDate(const std::tm &tm) {
  const std::chrono::year_month_day date{
      std::chrono::year{tm.tm_year + 1900},
      std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
      std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};
  return date.ok();
}

std::time_t ToUtcTime(std::tm &tm) {
#ifdef _WIN32
  return _mkgmtime(&tm);
#else
  return timegm(&tm);
#endif
}

} // namespace

Article FrontMatterParser::Parse(const std::string &source) {
  const auto split = SplitFrontMatter(source);

  Article article;
  article.content = split.body;
  if (!split.header) {
    return article;
  }

  try {
    ApplyHeader(YAML::Load(*split.header), article);
  } catch (const YAML::Exception &error) {
    throw ParseError(std::string("Invalid front matter: ") + error.what());
  }
  return article;
}

Timestamp ParseDate(const std::string &value) {
  static const char *const kFormats[] = {"%Y-%m-%dT%H:%M:%S",
                                         "%Y-%m-%d %H:%M:%S", "%Y-%m-%d"};
  for (const auto *format : kFormats) {
    std::tm tm{};
    std::istringstream stream(value);
    stream >> std::get_time(&tm, format);
    if (stream.fail()) {
      continue;
    }
    stream >> std::ws;
    if (!stream.eof()) {
      continue;
    }
    if (!IsCalendarDate(tm)) {
      throw ParseError("Invalid date '" + value + "': no such calendar day");
    }
    return std::chrono::system_clock::from_time_t(ToUtcTime(tm));
  }
  throw ParseError("Invalid date '" + value +
                   "', expected YYYY-MM-DD or YYYY-MM-DDTHH:MM:SS");
}

std::string FormatDate(Timestamp timestamp) {
  const auto time = std::chrono::system_clock::to_time_t(timestamp);
  std::tm tm;
#ifdef _WIN32
  gmtime_s(&tm, &time);
#else
  gmtime_r(&time, &tm);
#endif
  std::ostringstream stream;
  stream << std::put_time(&tm, "%Y-%m-%d");
  return stream.str();
}

} // namespace espresso
