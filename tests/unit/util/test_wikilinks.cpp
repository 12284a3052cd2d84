#include <gtest/gtest.h>

#include "bflow/util/wikilinks.hpp"

using namespace bflow::util;

class WikilinksTest : public ::testing::Test {};

TEST_F(WikilinksTest, FindsLinksWithPositions) {
  auto matches = findWikilinkMatches("See [[Alpha]] and [[Beta|b]].");
  ASSERT_EQ(matches.size(), 2u);
  EXPECT_EQ(matches[0].index, 4u);
  EXPECT_EQ(matches[0].match_text, "[[Alpha]]");
  EXPECT_EQ(matches[0].inner, "Alpha");
  EXPECT_EQ(matches[1].inner, "Beta|b");
}

TEST_F(WikilinksTest, SkipsEmbeds) {
  auto matches = findWikilinkMatches("![[image.png]] then [[Note]]");
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].inner, "Note");
}

TEST_F(WikilinksTest, NoLinks) {
  EXPECT_TRUE(findWikilinkMatches("- [x] plain task").empty());
  EXPECT_TRUE(findWikilinkMatches("[[]]").empty());
}

TEST_F(WikilinksTest, ParseParts) {
  auto full = parseWikilinkText("Note#Section|Alias");
  EXPECT_EQ(full.link_path, "Note");
  ASSERT_TRUE(full.section.has_value());
  EXPECT_EQ(*full.section, "Section");
  ASSERT_TRUE(full.alias.has_value());
  EXPECT_EQ(*full.alias, "Alias");

  auto plain = parseWikilinkText("Note");
  EXPECT_EQ(plain.link_path, "Note");
  EXPECT_FALSE(plain.section.has_value());
  EXPECT_FALSE(plain.alias.has_value());

  // '#' after the pipe belongs to the alias
  auto hashed_alias = parseWikilinkText("Note|Issue #4");
  EXPECT_EQ(hashed_alias.link_path, "Note");
  EXPECT_FALSE(hashed_alias.section.has_value());
  EXPECT_EQ(*hashed_alias.alias, "Issue #4");
}

TEST_F(WikilinksTest, DisplayText) {
  EXPECT_EQ(stripWikilinksToDisplayText("Call [[Bob Smith|Bob]] today"), "Call Bob today");
  EXPECT_EQ(stripWikilinksToDisplayText("Read [[Book#Chapter 2]]"), "Read Chapter 2");
  EXPECT_EQ(stripWikilinksToDisplayText("Meet [[ Alice ]]"), "Meet Alice");
  EXPECT_EQ(stripWikilinksToDisplayText("[[A]][[B|b]]"), "Ab");
  EXPECT_EQ(stripWikilinksToDisplayText("no links"), "no links");
}

TEST_F(WikilinksTest, EmptyAliasOrSectionFallsBack) {
  EXPECT_EQ(stripWikilinksToDisplayText("[[Note|]]"), "Note");
  EXPECT_EQ(stripWikilinksToDisplayText("[[Note#]]"), "Note");
  EXPECT_EQ(stripWikilinksToDisplayText("[[Note#  |]]"), "Note");
}
