#include <espresso/errors.h>
#include <espresso/front_matter_parser.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace espresso {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

TEST(FrontMatterParserTest, ReadsHeaderAndKeepsBody) {
  FrontMatterParser parser;

  const auto article = parser.Parse("---\n"
                                    "title: Roasting basics\n"
                                    "description: Light to dark\n"
                                    "date: 2023-03-01\n"
                                    "hide: false\n"
                                    "related:\n"
                                    "  - coffee/brewing\n"
                                    "  - /tea/green\n"
                                    "---\n"
                                    "# Roasting\n\nBody text.\n");

  EXPECT_EQ(article.title, "Roasting basics");
  EXPECT_EQ(article.description, "Light to dark");
  EXPECT_EQ(FormatDate(article.date), "2023-03-01");
  EXPECT_FALSE(article.hide);
  EXPECT_THAT(article.related, ElementsAre("coffee/brewing", "/tea/green"));
  EXPECT_EQ(article.content, "# Roasting\n\nBody text.\n");
  EXPECT_TRUE(article.id.empty());
}

TEST(FrontMatterParserTest, AcceptsSingleRelatedLinkAndHiddenFlag) {
  FrontMatterParser parser;

  const auto article =
      parser.Parse("---\nhide: true\nrelated: coffee/brewing\n---\n");

  EXPECT_TRUE(article.hide);
  EXPECT_THAT(article.related, ElementsAre("coffee/brewing"));
  EXPECT_TRUE(article.content.empty());
}

TEST(FrontMatterParserTest, SourceWithoutHeaderIsAllBody) {
  FrontMatterParser parser;

  const auto article = parser.Parse("Just text\n---\n");

  EXPECT_TRUE(article.title.empty());
  EXPECT_EQ(article.content, "Just text\n---\n");
  EXPECT_THAT(article.related, IsEmpty());
}

TEST(FrontMatterParserTest, IgnoresUnknownKeys) {
  FrontMatterParser parser;

  const auto article = parser.Parse("---\ntitle: T\nlayout: post\n...\nbody");

  EXPECT_EQ(article.title, "T");
  EXPECT_EQ(article.content, "body");
}

TEST(FrontMatterParserTest, RejectsUnterminatedHeader) {
  FrontMatterParser parser;

  EXPECT_THROW(parser.Parse("---\ntitle: T\n"), ParseError);
}

TEST(FrontMatterParserTest, WrapsYamlErrors) {
  FrontMatterParser parser;

  try {
    parser.Parse("---\ntitle: [unclosed\n---\n");
    FAIL() << "Expected ParseError";
  } catch (const ParseError &error) {
    EXPECT_THAT(error.what(), HasSubstr("Invalid front matter"));
  }
  EXPECT_THROW(parser.Parse("---\nhide: maybe\n---\n"), ParseError);
  EXPECT_THROW(parser.Parse("---\n- a\n- b\n---\n"), ParseError);
}

TEST(FrontMatterParserTest, ParsesSupportedDateFormats) {
  EXPECT_EQ(FormatDate(ParseDate("2023-03-01")), "2023-03-01");
  EXPECT_EQ(FormatDate(ParseDate("2023-03-01T23:59:00")), "2023-03-01");
  EXPECT_LT(ParseDate("2023-03-01 08:00:00"), ParseDate("2023-03-01T09:00:00"));
  EXPECT_THROW(ParseDate("March 1st"), ParseError);
  EXPECT_THROW(ParseDate("2023-03-01 trailing"), ParseError);
}

TEST(FrontMatterParserTest, RejectsDaysOutsideTheMonth) {
  EXPECT_THROW(ParseDate("2023-02-30"), ParseError);
  EXPECT_THROW(ParseDate("2023-04-31T10:00:00"), ParseError);
  EXPECT_THROW(ParseDate("2023-13-01"), ParseError);
  EXPECT_EQ(FormatDate(ParseDate("2024-02-29")), "2024-02-29");

  FrontMatterParser parser;
  EXPECT_THROW(parser.Parse("---\ndate: 2023-02-30\n---\n"), ParseError);
}

TEST(FrontMatterParserTest, EmptyValuesReadAsUnset) {
  FrontMatterParser parser;

  const auto article =
      parser.Parse("---\ntitle: T\ndescription:\ndate:\nrelated:\n---\n");

  EXPECT_EQ(article.title, "T");
  EXPECT_TRUE(article.description.empty());
  EXPECT_EQ(article.date, Timestamp{});
  EXPECT_THAT(article.related, IsEmpty());
}

} // namespace
} // namespace espresso
