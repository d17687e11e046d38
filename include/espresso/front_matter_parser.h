#pragma once

#include <espresso/interfaces.h>

#include <string>

namespace espresso {

// Reads article metadata from a leading YAML block:
//
//   ---
//   title: Roasting basics
//   date: 2023-03-01
//   hide: false
//   related: [coffee/brewing]
//   ---
//   body...
//
// The body is kept verbatim in Article::content.
class FrontMatterParser : public ArticleParser {
public:
  Article Parse(const std::string &source) override;
};

Timestamp ParseDate(const std::string &value);
std::string FormatDate(Timestamp timestamp);

} // namespace espresso
