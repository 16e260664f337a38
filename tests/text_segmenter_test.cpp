/*
TaleVox — TextSegmenter tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include <gtest/gtest.h>

#include <string>

#include "text/text_segmenter.h"

using namespace talevox;

namespace {

bool onlyWhitespace(const std::string& text, std::size_t begin, std::size_t end) {
  for (std::size_t i = begin; i < end; ++i) {
    const char c = text[i];
    if (c != ' ' && c != '\n' && c != '\t' && c != '\r') return false;
  }
  return true;
}

// Segments cover the text in increasing offset order with whitespace gaps only.
void expectCoverage(const std::string& text, const std::vector<Segment>& segs) {
  std::size_t pos = 0;
  for (std::size_t i = 0; i < segs.size(); ++i) {
    EXPECT_EQ(segs[i].index, i);
    EXPECT_LT(segs[i].begin, segs[i].end);
    EXPECT_GE(segs[i].begin, pos) << "segment " << i << " overlaps the previous one";
    EXPECT_TRUE(onlyWhitespace(text, pos, segs[i].begin)) << "gap before segment " << i;
    pos = segs[i].end;
  }
  EXPECT_TRUE(onlyWhitespace(text, pos, text.size()));
}

} // namespace

TEST(TextSegmenter, TwoSpeakersWithLeadingTags) {
  const std::string text = "Alice said, \"Hello there.\" Bob whispered, \"Is anyone home?\"";
  TextSegmenter seg(text);
  const std::vector<Segment> s = seg.segmentAll();

  ASSERT_EQ(s.size(), 4u);
  EXPECT_EQ(s[0].kind, SegmentKind::Narration);
  EXPECT_EQ(s[0].text, "Alice said,");
  EXPECT_EQ(s[1].kind, SegmentKind::Dialogue);
  EXPECT_EQ(s[1].text, "Hello there.");
  EXPECT_EQ(s[1].attributedName, "Alice");
  EXPECT_EQ(s[2].kind, SegmentKind::Narration);
  EXPECT_EQ(s[2].text, "Bob whispered,");
  EXPECT_EQ(s[3].kind, SegmentKind::Dialogue);
  EXPECT_EQ(s[3].text, "Is anyone home?");
  EXPECT_EQ(s[3].attributedName, "Bob");
  EXPECT_EQ(text.substr(s[3].begin, s[3].end - s[3].begin), "\"Is anyone home?\"");
  expectCoverage(text, s);
}

TEST(TextSegmenter, TrailingTagAndInterruptedLine) {
  const std::string text = "\"Wait,\" Bob said, \"come back.\" \"No,\" replied Carol.";
  TextSegmenter seg(text);
  const std::vector<Segment> s = seg.segmentAll();

  ASSERT_EQ(s.size(), 5u);
  EXPECT_EQ(s[0].attributedName, "Bob");
  EXPECT_EQ(s[1].text, "Bob said,");
  EXPECT_EQ(s[2].text, "come back.");
  EXPECT_EQ(s[2].attributedName, "Bob");
  EXPECT_EQ(s[3].text, "No,");
  EXPECT_EQ(s[3].attributedName, "Carol");
  EXPECT_EQ(s[4].kind, SegmentKind::Narration);
  expectCoverage(text, s);
}

TEST(TextSegmenter, WhitespaceAndContractionTags) {
  const std::string text =
    "John  said, \"First.\"\n\n"
    "He paused. He'd said, \"Second.\"";
  TextSegmenter seg(text);
  const std::vector<Segment> s = seg.segmentAll();

  std::vector<const Segment*> dialogue;
  for (const Segment& x : s) {
    if (x.kind == SegmentKind::Dialogue) dialogue.push_back(&x);
  }
  ASSERT_EQ(dialogue.size(), 2u);
  EXPECT_EQ(dialogue[0]->attributedName, "John");
  // The pronoun resolves to the last named speaker.
  EXPECT_EQ(dialogue[1]->attributedName, "John");
  expectCoverage(text, s);
}

TEST(TextSegmenter, UnattributedQuoteIsNarration) {
  const std::string text = "The sign read \"Closed\". Nobody moved.";
  TextSegmenter seg(text);
  const std::vector<Segment> s = seg.segmentAll();
  for (const Segment& x : s) {
    EXPECT_EQ(x.kind, SegmentKind::Narration);
    EXPECT_TRUE(x.attributedName.empty());
  }
  expectCoverage(text, s);
}

TEST(TextSegmenter, PronounWithoutEarlierSpeakerIsNarration) {
  const std::string text = "He said, \"Hi.\"";
  TextSegmenter seg(text);
  const std::vector<Segment> s = seg.segmentAll();
  ASSERT_EQ(s.size(), 2u);
  EXPECT_EQ(s[1].kind, SegmentKind::Narration);
  EXPECT_EQ(s[1].text, "Hi.");
}

TEST(TextSegmenter, LooseTagWithinTwoSentences) {
  const std::string near = "Dana asked a question. She waited. \"Really?\"";
  TextSegmenter a(near);
  const std::vector<Segment> s = a.segmentAll();
  ASSERT_EQ(s.size(), 2u);
  EXPECT_EQ(s[1].kind, SegmentKind::Dialogue);
  EXPECT_EQ(s[1].attributedName, "Dana");

  const std::string far = "Dana asked a question. She waited. It rained. \"Really?\"";
  TextSegmenter b(far);
  const std::vector<Segment> t = b.segmentAll();
  ASSERT_EQ(t.size(), 2u);
  EXPECT_EQ(t[1].kind, SegmentKind::Narration);
}

TEST(TextSegmenter, TypographicQuotes) {
  const std::string text = "\xE2\x80\x9CHello,\xE2\x80\x9D said Eve.";
  TextSegmenter seg(text);
  const std::vector<Segment> s = seg.segmentAll();
  ASSERT_GE(s.size(), 1u);
  EXPECT_EQ(s[0].kind, SegmentKind::Dialogue);
  EXPECT_EQ(s[0].text, "Hello,");
  EXPECT_EQ(s[0].attributedName, "Eve");
  expectCoverage(text, s);
}

TEST(TextSegmenter, UnterminatedQuoteStaysNarration) {
  const std::string text = "Ann said, \"This never ends";
  TextSegmenter seg(text);
  const std::vector<Segment> s = seg.segmentAll();
  ASSERT_EQ(s.size(), 1u);
  EXPECT_EQ(s[0].kind, SegmentKind::Narration);
  expectCoverage(text, s);
}

TEST(TextSegmenter, LongNarrationIsChunked) {
  std::string text;
  for (int i = 0; i < 40; ++i) text += "This is a fairly ordinary sentence. ";
  SegmenterOptions opt;
  opt.maxChunkChars = 200;
  TextSegmenter seg(text, opt);
  const std::vector<Segment> s = seg.segmentAll();
  EXPECT_GT(s.size(), 1u);
  for (const Segment& x : s) EXPECT_LE(x.end - x.begin, 200u);
  expectCoverage(text, s);
}

TEST(TextSegmenter, LazyAndRestartable) {
  const std::string text = "Alice said, \"One.\" Then silence.";
  TextSegmenter seg(text);
  Segment first;
  ASSERT_TRUE(seg.next(first));
  EXPECT_EQ(first.index, 0u);

  const std::vector<Segment> all = seg.segmentAll();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].text, first.text);

  Segment extra;
  EXPECT_FALSE(seg.next(extra));
  seg.restart();
  ASSERT_TRUE(seg.next(extra));
  EXPECT_EQ(extra.text, first.text);
}

TEST(TextSegmenter, EmptyAndBlankText) {
  TextSegmenter empty("");
  EXPECT_TRUE(empty.segmentAll().empty());
  TextSegmenter blank(" \n\t ");
  EXPECT_TRUE(blank.segmentAll().empty());
}
