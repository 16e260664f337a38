/*
TaleVox — Chapter text to narration/dialogue segments.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_TEXT_TEXT_SEGMENTER_H
#define TALEVOX_TEXT_TEXT_SEGMENTER_H

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

#include "../core/segment.h"
#include "attribution.h"

namespace talevox {

struct SegmenterOptions {
  // Longest text handed to one render. 0 = unlimited.
  std::size_t maxChunkChars = 5000;
  // How far (in sentences) a loose speech tag may sit from its quote.
  std::size_t attributionSentences = 2;
};

// Splits chapter text into ordered segments.
//
// Quoted spans ("...", “...”, „...“) with a resolvable speech tag become
// dialogue; everything else, including unattributed quotes and the tags
// themselves, is narration. Segments come out in source order and cover the
// text with gaps of whitespace only.
//
// The sequence is lazy: each next() call scans only as far as it must.
// restart() rewinds to the first segment.
class TextSegmenter {
public:
  explicit TextSegmenter(std::string text, SegmenterOptions options = SegmenterOptions());

  // False when the chapter is exhausted.
  bool next(Segment& out);
  void restart();

  // Convenience: restart and drain.
  std::vector<Segment> segmentAll();

  const std::string& text() const { return text_; }

private:
  struct QuoteSpan {
    std::size_t begin = 0;      // Opening mark.
    std::size_t end = 0;        // Past the closing mark.
    std::size_t innerBegin = 0;
    std::size_t innerEnd = 0;
  };

  bool findQuote(std::size_t from, QuoteSpan& out) const;
  void fillPending();
  // Best speech tag for `q`; leadBegin is where the narration before it starts.
  bool attribute(const QuoteSpan& q, std::size_t leadBegin, const QuoteSpan* nextQuote, Attribution& out) const;
  bool onlySeparators(std::size_t begin, std::size_t end) const;
  bool endsWithComma(const QuoteSpan& q) const;
  void emitNarration(std::size_t begin, std::size_t end);
  void emitDialogue(const QuoteSpan& q, const std::string& speaker);

  std::string text_;
  SegmenterOptions options_;

  std::size_t pos_ = 0;
  std::size_t nextIndex_ = 0;
  std::string lastSpeaker_;
  std::deque<Segment> pending_;
};

} // namespace talevox

#endif // TALEVOX_TEXT_TEXT_SEGMENTER_H
