/*
TaleVox — Speech tag matching tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include <gtest/gtest.h>

#include <string>

#include "text/attribution.h"

using namespace talevox;

namespace {

std::vector<Attribution> find(const std::string& s) {
  return findAttributions(s, 0, s.size());
}

} // namespace

TEST(Attribution, NameBeforeVerb) {
  const std::string s = "Then John said it.";
  const auto a = find(s);
  ASSERT_EQ(a.size(), 1u);
  EXPECT_EQ(a[0].name, "John");
  EXPECT_FALSE(a[0].pronoun);
  EXPECT_EQ(s.substr(a[0].begin, a[0].end - a[0].begin), "John said");
}

TEST(Attribution, CollapsesWhitespaceRuns) {
  for (const std::string s : {"John said", "John  said", "John\n\t said", "John\xC2\xA0said"}) {
    const auto a = find(s);
    ASSERT_EQ(a.size(), 1u) << s;
    EXPECT_EQ(a[0].name, "John") << s;
    // Offsets map back to the original text, extra whitespace included.
    EXPECT_EQ(a[0].begin, 0u);
    EXPECT_EQ(a[0].end, s.size());
  }
}

TEST(Attribution, ContractionEndsTheName) {
  const auto a = find("She'd said so.");
  ASSERT_EQ(a.size(), 1u);
  EXPECT_EQ(a[0].name, "She");
  EXPECT_TRUE(a[0].pronoun);

  const auto b = find("Tom\xE2\x80\x99ll say no.");
  ASSERT_EQ(b.size(), 1u);
  EXPECT_EQ(b[0].name, "Tom");
  EXPECT_FALSE(b[0].pronoun);
}

TEST(Attribution, VerbBeforeName) {
  const auto a = find("\"Run,\" shouted Mary Jane.");
  ASSERT_EQ(a.size(), 1u);
  EXPECT_EQ(a[0].name, "Mary Jane");
}

TEST(Attribution, TwoWordNameBeforeVerb) {
  const auto a = find("Captain Smith replied calmly.");
  ASSERT_EQ(a.size(), 1u);
  EXPECT_EQ(a[0].name, "Captain Smith");
}

TEST(Attribution, AuxiliaryBetweenNameAndVerb) {
  const auto a = find("Alice had whispered it.");
  ASSERT_EQ(a.size(), 1u);
  EXPECT_EQ(a[0].name, "Alice");
}

TEST(Attribution, IgnoresSentenceStartersAndLowercase) {
  EXPECT_TRUE(find("The said thing.").empty());
  EXPECT_TRUE(find("the man said nothing").empty());
  EXPECT_TRUE(find("Suddenly said.").empty());
}

TEST(Attribution, CanonicalKey) {
  EXPECT_EQ(canonicalKey("  Mary \t Jane "), "mary jane");
  EXPECT_EQ(canonicalKey("NARRATOR"), "narrator");
  EXPECT_TRUE(isSpeechVerb("Whispered"));
  EXPECT_TRUE(isPronoun("They"));
  EXPECT_FALSE(isPronoun("Alice"));
}

TEST(Attribution, CanonicalKeyFoldsAccentedCapitals) {
  EXPECT_EQ(canonicalKey("\xC3\x89LISE"), canonicalKey("\xC3\x89lise"));
  EXPECT_EQ(canonicalKey("\xC3\x89LISE"), "\xC3\xA9lise");
  EXPECT_EQ(canonicalKey("\xC5\x81UKASZ"), "\xC5\x82ukasz");
  EXPECT_EQ(canonicalKey("\xC5\xBD" "ELKO"), "\xC5\xBE" "elko");
  EXPECT_EQ(canonicalKey("\xC3\x98YVIND"), "\xC3\xB8yvind");
  // The multiplication sign has no lowercase form.
  EXPECT_EQ(canonicalKey("A\xC3\x97" "B"), "a\xC3\x97" "b");
}
