/*
TaleVox — Sentence-aware text chunking.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "chunking.h"

#include "../util/utf8.h"

namespace talevox {

namespace {

bool isClosingTrail(char32_t cp) {
  return cp == U'"' || cp == U'\'' || cp == U')' || cp == U']' || cp == U'}' || cp == 0x201D || cp == 0x2019;
}

bool isContinuationByte(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

// Largest cut <= limit that does not split a UTF-8 sequence (and is > from).
std::size_t codePointBoundary(std::string_view text, std::size_t from, std::size_t limit) {
  std::size_t cut = limit;
  while (cut > from && cut < text.size() && isContinuationByte(static_cast<unsigned char>(text[cut]))) --cut;
  if (cut == from) {
    // A single code point longer than the limit; take it whole.
    std::size_t len = 0;
    decodeAt(text, from, len);
    cut = from + (len ? len : 1);
  }
  return cut;
}

void splitLongSentence(std::string_view text, const TextSpan& sentence, std::size_t maxChars, std::vector<TextSpan>& out) {
  std::size_t start = sentence.begin;
  while (sentence.end - start > maxChars) {
    const std::size_t limit = start + maxChars;

    // Try to cut just after a space before maxChars.
    std::size_t best = std::string_view::npos;
    for (std::size_t i = limit; i > start; --i) {
      const char c = text[i - 1];
      if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
        best = i;
        break;
      }
    }
    if (best == std::string_view::npos || best <= start) {
      // No spaces; hard cut.
      best = codePointBoundary(text, start, limit);
    }

    out.push_back(TextSpan{start, best, false});
    start = best;
  }
  if (start < sentence.end) out.push_back(TextSpan{start, sentence.end, sentence.endsSentence});
}

} // namespace

std::vector<TextSpan> splitSentences(std::string_view text, std::size_t begin, std::size_t end) {
  std::vector<TextSpan> out;
  if (end > text.size()) end = text.size();
  if (begin >= end) return out;

  std::size_t start = begin;
  std::size_t pos = begin;
  while (pos < end) {
    std::size_t len = 0;
    const char32_t cp = decodeAt(text, pos, len);
    pos += len;

    // Treat new lines as hard-ish boundaries.
    if (cp == U'\n') {
      out.push_back(TextSpan{start, pos, true});
      start = pos;
      continue;
    }

    if (isSentenceEnd(cp)) {
      // Runs like "?!" or "..." end one sentence, not several.
      while (pos < end) {
        std::size_t nlen = 0;
        const char32_t n = decodeAt(text, pos, nlen);
        if (isSentenceEnd(n) || isClosingTrail(n)) {
          pos += nlen;
          continue;
        }
        break;
      }
      // Trailing whitespace stays with the sentence it follows.
      while (pos < end) {
        std::size_t nlen = 0;
        const char32_t n = decodeAt(text, pos, nlen);
        if (!isSpaceChar(n) || n == U'\n') break;
        pos += nlen;
      }
      out.push_back(TextSpan{start, pos, true});
      start = pos;
    }
  }
  if (start < end) out.push_back(TextSpan{start, end, true});
  return out;
}

std::vector<TextSpan> chunkSpans(std::string_view text, std::size_t begin, std::size_t end, std::size_t maxChars) {
  std::vector<TextSpan> chunks;
  if (end > text.size()) end = text.size();
  if (begin >= end) return chunks;
  if (maxChars == 0) {
    chunks.push_back(TextSpan{begin, end, true});
    return chunks;
  }

  // First, ensure no single sentence is bigger than the limit.
  std::vector<TextSpan> parts;
  for (const TextSpan& s : splitSentences(text, begin, end)) {
    if (s.size() <= maxChars) {
      parts.push_back(s);
    } else {
      splitLongSentence(text, s, maxChars, parts);
    }
  }

  // Then pack parts up to maxChars. Parts are contiguous, so packing only
  // moves the end of the current chunk.
  TextSpan current{};
  bool open = false;
  for (const TextSpan& part : parts) {
    if (!open) {
      current = part;
      open = true;
    } else if (part.end - current.begin <= maxChars) {
      current.end = part.end;
      current.endsSentence = part.endsSentence;
    } else {
      chunks.push_back(current);
      current = part;
    }
  }
  if (open) chunks.push_back(current);
  return chunks;
}

} // namespace talevox
