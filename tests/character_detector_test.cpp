/*
TaleVox — CharacterDetector tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "detect/character_detector.h"
#include "test_support.h"
#include "text/text_segmenter.h"

using namespace talevox;
using talevox::testing::FakeLlm;

namespace {

const char* kChapter = "Alice said, \"Hello there.\" Bob whispered, \"Is anyone home?\"";

std::vector<Segment> segmentsOf(const std::string& text) {
  TextSegmenter seg(text);
  return seg.segmentAll();
}

std::size_t countKey(const CharacterSet& set, const std::string& key) {
  std::size_t n = 0;
  for (const Character& c : set.characters) {
    if (c.canonicalKey == key) ++n;
  }
  return n;
}

DetectorOptions fastOptions() {
  DetectorOptions opt;
  opt.llmTimeout = std::chrono::milliseconds(200);
  return opt;
}

} // namespace

TEST(CharacterDetector, HeuristicOnly) {
  CharacterDetector detector(nullptr, fastOptions());
  const CharacterSet set = detector.detect(kChapter, segmentsOf(kChapter));

  ASSERT_EQ(set.size(), 3u);
  EXPECT_EQ(set.characters[0].canonicalKey, "narrator");
  EXPECT_EQ(set.characters[0].displayName, "Narrator");
  EXPECT_TRUE(set.contains("alice"));
  EXPECT_TRUE(set.contains("bob"));
  EXPECT_EQ(set.find("alice")->displayName, "Alice");
  EXPECT_FALSE(set.usedLlm);
}

TEST(CharacterDetector, MergesLlmRosterIntoOneNarrator) {
  auto llm = std::make_shared<FakeLlm>(
    R"({"characters": {"NARRATOR": {}, "alice": {"gender": "female"}, "Old  Tom": {"gender": "male"}, "she": {}}})");
  CharacterDetector detector(llm, fastOptions());
  const CharacterSet set = detector.detect(kChapter, segmentsOf(kChapter));

  EXPECT_TRUE(set.usedLlm);
  EXPECT_EQ(countKey(set, "narrator"), 1u);
  EXPECT_EQ(countKey(set, "alice"), 1u);
  // Heuristic display name wins; the LLM supplies the gender.
  EXPECT_EQ(set.find("alice")->displayName, "Alice");
  EXPECT_EQ(set.find("alice")->gender, Gender::Female);
  ASSERT_TRUE(set.contains("old tom"));
  EXPECT_EQ(set.find("old tom")->displayName, "Old Tom");
  EXPECT_FALSE(set.contains("she"));
  EXPECT_EQ(set.characters[0].canonicalKey, "narrator");
}

TEST(CharacterDetector, SlowLlmTimesOutAndFallsBack) {
  auto llm = std::make_shared<FakeLlm>(R"({"characters": {"Zed": {}}})", std::chrono::milliseconds(2000));
  CharacterDetector detector(llm, fastOptions());

  const auto start = std::chrono::steady_clock::now();
  const CharacterSet set = detector.detect(kChapter, segmentsOf(kChapter));
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
  EXPECT_FALSE(set.usedLlm);
  EXPECT_FALSE(set.contains("zed"));
  EXPECT_TRUE(set.contains("alice"));
  EXPECT_TRUE(set.contains("bob"));
}

TEST(CharacterDetector, QueryLlmReportsTimeout) {
  auto llm = std::make_shared<FakeLlm>("[]", std::chrono::milliseconds(1000));
  CharacterDetector detector(llm, fastOptions());
  std::vector<LlmCharacter> roster;
  Error err;
  EXPECT_FALSE(detector.queryLlm(kChapter, roster, err));
  EXPECT_EQ(err.code, ErrorCode::DetectionTimeout);
}

TEST(CharacterDetector, MalformedReplyFallsBack) {
  auto llm = std::make_shared<FakeLlm>("no json here at all");
  CharacterDetector detector(llm, fastOptions());

  std::vector<LlmCharacter> roster;
  Error err;
  EXPECT_FALSE(detector.queryLlm(kChapter, roster, err));
  EXPECT_EQ(err.code, ErrorCode::InvalidInput);

  const CharacterSet set = detector.detect(kChapter, segmentsOf(kChapter));
  EXPECT_FALSE(set.usedLlm);
  EXPECT_EQ(set.size(), 3u);
}

TEST(CharacterDetector, TransportErrorFallsBack) {
  auto llm = std::make_shared<FakeLlm>("", std::chrono::milliseconds(0), false);
  CharacterDetector detector(llm, fastOptions());
  const CharacterSet set = detector.detect(kChapter, segmentsOf(kChapter));
  EXPECT_FALSE(set.usedLlm);
  EXPECT_EQ(set.size(), 3u);
}

TEST(CharacterDetector, DisabledLlmIsNeverCalled) {
  auto llm = std::make_shared<FakeLlm>("[]");
  DetectorOptions opt = fastOptions();
  opt.useLlm = false;
  CharacterDetector detector(llm, opt);
  detector.detect(kChapter, segmentsOf(kChapter));
  EXPECT_EQ(llm->calls.load(), 0);
}

TEST(CharacterDetector, ExcerptIsBounded) {
  auto llm = std::make_shared<FakeLlm>("[]");
  DetectorOptions opt = fastOptions();
  opt.excerptChars = 300;
  CharacterDetector detector(llm, opt);
  const std::string text = std::string(5000, 'x');
  detector.detect(text, {});
  EXPECT_EQ(llm->lastPrompt().find(std::string(301, 'x')), std::string::npos);
  EXPECT_NE(llm->lastPrompt().find(std::string(300, 'x')), std::string::npos);
}

TEST(CharacterDetector, CachesPerChapterUntilTextChanges) {
  auto llm = std::make_shared<FakeLlm>(R"(["Alice"])");
  CharacterDetector detector(llm, fastOptions());
  const std::vector<Segment> segs = segmentsOf(kChapter);

  bool hit = true;
  detector.detectCached("book/1", kChapter, segs, &hit);
  EXPECT_FALSE(hit);
  detector.detectCached("book/1", kChapter, segs, &hit);
  EXPECT_TRUE(hit);
  EXPECT_EQ(llm->calls.load(), 1);

  const std::string edited = std::string(kChapter) + " The end.";
  detector.detectCached("book/1", edited, segmentsOf(edited), &hit);
  EXPECT_FALSE(hit);

  detector.forget("book/1");
  detector.detectCached("book/1", edited, segmentsOf(edited), &hit);
  EXPECT_FALSE(hit);
  EXPECT_EQ(llm->calls.load(), 3);
}
