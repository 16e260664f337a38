/*
TaleVox — Chapter text to narration/dialogue segments.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "text_segmenter.h"

#include <utility>

#include "../util/utf8.h"
#include "chunking.h"

namespace talevox {

namespace {

bool closesQuote(char32_t opener, char32_t cp) {
  switch (opener) {
    case U'"':
      return cp == U'"' || cp == 0x201D;
    case 0x201C:
      return cp == 0x201D || cp == U'"';
    case 0x201E: // „ closes with “ or ”
      return cp == 0x201C || cp == 0x201D || cp == U'"';
    default:
      return false;
  }
}

} // namespace

TextSegmenter::TextSegmenter(std::string text, SegmenterOptions options)
    : text_(std::move(text)), options_(options) {}

void TextSegmenter::restart() {
  pos_ = 0;
  nextIndex_ = 0;
  lastSpeaker_.clear();
  pending_.clear();
}

bool TextSegmenter::next(Segment& out) {
  while (pending_.empty() && pos_ < text_.size()) {
    fillPending();
  }
  if (pending_.empty()) return false;

  out = std::move(pending_.front());
  pending_.pop_front();
  out.index = nextIndex_++;
  return true;
}

std::vector<Segment> TextSegmenter::segmentAll() {
  restart();
  std::vector<Segment> out;
  Segment seg;
  while (next(seg)) out.push_back(std::move(seg));
  return out;
}

bool TextSegmenter::findQuote(std::size_t from, QuoteSpan& out) const {
  std::size_t pos = from;
  while (pos < text_.size()) {
    std::size_t len = 0;
    const char32_t cp = decodeAt(text_, pos, len);
    if (!isOpeningQuote(cp)) {
      pos += len;
      continue;
    }

    const std::size_t innerBegin = pos + len;
    std::size_t p = innerBegin;
    bool closed = false;
    std::size_t closeLen = 0;
    while (p < text_.size()) {
      const char32_t c = decodeAt(text_, p, closeLen);
      if (closesQuote(cp, c)) {
        closed = true;
        break;
      }
      p += closeLen;
    }
    // An unterminated quote runs to the end; the rest stays narration.
    if (!closed) return false;

    if (cleanSpeechText(std::string_view(text_).substr(innerBegin, p - innerBegin)).empty()) {
      pos = p + closeLen;
      continue;
    }

    out.begin = pos;
    out.innerBegin = innerBegin;
    out.innerEnd = p;
    out.end = p + closeLen;
    return true;
  }
  return false;
}

bool TextSegmenter::onlySeparators(std::size_t begin, std::size_t end) const {
  std::size_t pos = begin;
  while (pos < end) {
    std::size_t len = 0;
    const char32_t cp = decodeAt(text_, pos, len);
    const bool sep = isSpaceChar(cp) || cp == U',' || cp == U':' || cp == U'-' || cp == 0x2013 || cp == 0x2014;
    if (!sep) return false;
    pos += len;
  }
  return true;
}

bool TextSegmenter::endsWithComma(const QuoteSpan& q) const {
  std::size_t e = q.innerEnd;
  while (e > q.innerBegin && (text_[e - 1] == ' ' || text_[e - 1] == '\t' || text_[e - 1] == '\n' || text_[e - 1] == '\r')) --e;
  if (e == q.innerBegin) return false;
  if (text_[e - 1] == ',') return true;
  // An em dash marks an interrupted line too.
  return e - q.innerBegin >= 3 && text_.compare(e - 3, 3, "\xE2\x80\x94") == 0;
}

bool TextSegmenter::attribute(const QuoteSpan& q, std::size_t leadBegin, const QuoteSpan* nextQuote, Attribution& out) const {
  const std::size_t trailEnd = nextQuote ? nextQuote->begin : text_.size();
  const std::vector<Attribution> before = findAttributions(text_, leadBegin, q.begin);
  const std::vector<Attribution> after = findAttributions(text_, q.end, trailEnd);

  auto leadsNextQuote = [&](const Attribution& a) {
    return nextQuote && onlySeparators(a.end, nextQuote->begin);
  };

  // 1. A tag directly before the quote: `Alice said, "..."`.
  if (!before.empty() && onlySeparators(before.back().end, q.begin)) {
    out = before.back();
    return true;
  }

  // 2. A tag directly after it: `"...," Bob said.` When that tag also opens
  //    the next quote it belongs there, unless this quote was cut off
  //    mid-sentence (`"Wait," Bob said, "come back."`).
  if (!after.empty() && onlySeparators(q.end, after.front().begin)) {
    if (!leadsNextQuote(after.front()) || endsWithComma(q)) {
      out = after.front();
      return true;
    }
  }

  const std::size_t reach = options_.attributionSentences;
  if (reach == 0) return false;

  // 3. Nearest tag within the last few sentences before the quote.
  if (!before.empty()) {
    const std::vector<TextSpan> sentences = splitSentences(text_, leadBegin, q.begin);
    const std::size_t from = sentences.size() > reach ? sentences[sentences.size() - reach].begin : leadBegin;
    for (auto it = before.rbegin(); it != before.rend(); ++it) {
      if (it->begin < from) break;
      out = *it;
      return true;
    }
  }

  // 4. Nearest tag within the next few sentences, skipping one that opens the
  //    next quote.
  if (!after.empty()) {
    const std::vector<TextSpan> sentences = splitSentences(text_, q.end, trailEnd);
    const std::size_t until = sentences.size() > reach ? sentences[reach - 1].end : trailEnd;
    for (const Attribution& a : after) {
      if (a.end > until) break;
      if (leadsNextQuote(a)) continue;
      out = a;
      return true;
    }
  }
  return false;
}

void TextSegmenter::emitNarration(std::size_t begin, std::size_t end) {
  for (const TextSpan& span : chunkSpans(text_, begin, end, options_.maxChunkChars)) {
    Segment seg;
    seg.text = cleanSpeechText(std::string_view(text_).substr(span.begin, span.size()));
    if (seg.text.empty()) continue;
    seg.begin = span.begin;
    seg.end = span.end;
    seg.kind = SegmentKind::Narration;
    pending_.push_back(std::move(seg));
  }
}

void TextSegmenter::emitDialogue(const QuoteSpan& q, const std::string& speaker) {
  const std::vector<TextSpan> spans = chunkSpans(text_, q.innerBegin, q.innerEnd, options_.maxChunkChars);
  for (std::size_t i = 0; i < spans.size(); ++i) {
    Segment seg;
    seg.text = cleanSpeechText(std::string_view(text_).substr(spans[i].begin, spans[i].size()));
    if (seg.text.empty()) continue;
    // The marks belong to the first and last piece.
    seg.begin = i == 0 ? q.begin : spans[i].begin;
    seg.end = i + 1 == spans.size() ? q.end : spans[i].end;
    seg.kind = speaker.empty() ? SegmentKind::Narration : SegmentKind::Dialogue;
    seg.attributedName = speaker;
    pending_.push_back(std::move(seg));
  }
}

void TextSegmenter::fillPending() {
  QuoteSpan q;
  if (!findQuote(pos_, q)) {
    emitNarration(pos_, text_.size());
    pos_ = text_.size();
    return;
  }

  QuoteSpan following;
  const bool hasFollowing = findQuote(q.end, following);

  emitNarration(pos_, q.begin);

  std::string speaker;
  Attribution a;
  if (attribute(q, pos_, hasFollowing ? &following : nullptr, a)) {
    if (a.pronoun) {
      speaker = lastSpeaker_;
    } else {
      speaker = a.name;
      lastSpeaker_ = a.name;
    }
  }
  emitDialogue(q, speaker);
  pos_ = q.end;
}

} // namespace talevox
