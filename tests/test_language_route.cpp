#include <gtest/gtest.h>

#include "language_route.h"

TEST(LanguageRouteTest, ExactMatchSideA) {
  Direction d = DecideDirection("zh", "en", "zh");
  EXPECT_EQ(d.side, Side::A);
  EXPECT_EQ(d.source_lang, "zh");
  EXPECT_EQ(d.target_lang, "en");
}

TEST(LanguageRouteTest, ExactMatchSideB) {
  Direction d = DecideDirection("zh", "en", "en");
  EXPECT_EQ(d.side, Side::B);
  EXPECT_EQ(d.source_lang, "en");
  EXPECT_EQ(d.target_lang, "zh");
}

TEST(LanguageRouteTest, RegionTagMatchesByPrefix) {
  Direction d = DecideDirection("zh", "en", "en-US");
  EXPECT_EQ(d.side, Side::B);
  EXPECT_EQ(d.source_lang, "en");
  EXPECT_EQ(d.target_lang, "zh");
}

TEST(LanguageRouteTest, UnknownLanguageFallsBackToSideA) {
  Direction d = DecideDirection("zh", "en", "fr");
  EXPECT_EQ(d.side, Side::A);
  EXPECT_EQ(d.source_lang, "fr");
  EXPECT_EQ(d.target_lang, "en");
}

TEST(LanguageRouteTest, ExactMatchBeatsPrefixOfOtherSide) {
  // "en-GB" 精确匹配 B，虽然也是 A 的前缀扩展
  Direction d = DecideDirection("en", "en-GB", "en-GB");
  EXPECT_EQ(d.side, Side::B);
  EXPECT_EQ(d.source_lang, "en-GB");
  EXPECT_EQ(d.target_lang, "en");
}

TEST(LanguageRouteTest, PrefixPrefersSideA) {
  Direction d = DecideDirection("en", "en-GB", "en-AU");
  EXPECT_EQ(d.side, Side::A);
  EXPECT_EQ(d.source_lang, "en");
}

TEST(LanguageRouteTest, EmptyDetectionIsSideA) {
  Direction d = DecideDirection("ja", "ko", "");
  EXPECT_EQ(d.side, Side::A);
  EXPECT_EQ(d.source_lang, "ja");
  EXPECT_EQ(d.target_lang, "ko");
}

TEST(LanguageRouteTest, EmptyConfiguredTagNeverMatchesByPrefix) {
  Direction d = DecideDirection("", "en", "de");
  EXPECT_EQ(d.side, Side::A);
  EXPECT_EQ(d.source_lang, "de");
  EXPECT_EQ(d.target_lang, "en");
}

TEST(LanguageRouteTest, SideNames) {
  EXPECT_STREQ(GetSideName(Side::A), "left");
  EXPECT_STREQ(GetSideName(Side::B), "right");
  EXPECT_STREQ(GetSideName(Side::Undetermined), "auto");

  Side s = Side::Undetermined;
  EXPECT_TRUE(ParseSideName("right", s));
  EXPECT_EQ(s, Side::B);
  EXPECT_TRUE(ParseSideName("a", s));
  EXPECT_EQ(s, Side::A);
  EXPECT_FALSE(ParseSideName("middle", s));
}
