/*
TaleVox — UTF-8 scanning helpers.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "utf8.h"

#include <cstdint>

namespace talevox {

char32_t decodeAt(std::string_view s, std::size_t pos, std::size_t& outLen) {
  outLen = 1;
  if (pos >= s.size()) {
    outLen = 0;
    return 0;
  }

  const unsigned char* p = reinterpret_cast<const unsigned char*>(s.data()) + pos;
  const std::size_t avail = s.size() - pos;
  const unsigned char c0 = p[0];

  if (c0 < 0x80) return c0;

  std::size_t need = 0;
  std::uint32_t cp = 0;
  std::uint32_t minCp = 0;
  if ((c0 >> 5) == 0x6) {
    // 110xxxxx 10xxxxxx
    need = 2;
    cp = c0 & 0x1F;
    minCp = 0x80;
  } else if ((c0 >> 4) == 0xE) {
    // 1110xxxx 10xxxxxx 10xxxxxx
    need = 3;
    cp = c0 & 0x0F;
    minCp = 0x800;
  } else if ((c0 >> 3) == 0x1E) {
    // 11110xxx 10xxxxxx 10xxxxxx 10xxxxxx
    need = 4;
    cp = c0 & 0x07;
    minCp = 0x10000;
  } else {
    return kReplacementChar;
  }

  if (avail < need) return kReplacementChar;
  for (std::size_t i = 1; i < need; ++i) {
    if ((p[i] & 0xC0) != 0x80) return kReplacementChar;
    cp = (cp << 6) | (p[i] & 0x3F);
  }
  // Overlong forms, surrogate halves and out-of-range values are not scalar values.
  if (cp < minCp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return kReplacementChar;

  outLen = need;
  return static_cast<char32_t>(cp);
}

void appendUtf8(std::string& out, char32_t ch) {
  const std::uint32_t cp = static_cast<std::uint32_t>(ch);
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool isSpaceChar(char32_t cp) {
  switch (cp) {
    case U' ':
    case U'\t':
    case U'\n':
    case U'\r':
    case U'\v':
    case U'\f':
    case 0x00A0:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

bool isOpeningQuote(char32_t cp) {
  return cp == U'"' || cp == 0x201C || cp == 0x201E;
}

bool isClosingQuote(char32_t cp) {
  return cp == U'"' || cp == 0x201D;
}

bool isApostrophe(char32_t cp) {
  return cp == U'\'' || cp == 0x2019;
}

bool isSentenceEnd(char32_t cp) {
  switch (cp) {
    case U'.':
    case U'!':
    case U'?':
    case 0x2026: // …
    case 0x3002: // 。
    case 0xFF01: // ！
    case 0xFF1F: // ？
      return true;
    default:
      return false;
  }
}

std::string asciiLower(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c >= 'A' && c <= 'Z') {
      out.push_back(static_cast<char>(c - 'A' + 'a'));
    } else {
      out.push_back(c);
    }
  }
  return out;
}

static char32_t lowerLatin(char32_t cp) {
  if (cp >= 'A' && cp <= 'Z') return cp + 0x20;
  if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;
  if (cp == 0x178) return 0xFF;
  // Extended-A alternates upper/lower, but the parity flips at U+0139..U+0148
  // and U+0179..U+017E. U+0130, U+0131, U+0138 and U+0149 have no pair.
  if ((cp >= 0x100 && cp <= 0x12F) || (cp >= 0x132 && cp <= 0x137) || (cp >= 0x14A && cp <= 0x177)) {
    return (cp % 2 == 0) ? cp + 1 : cp;
  }
  if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
    return (cp % 2 == 1) ? cp + 1 : cp;
  }
  return cp;
}

std::string foldCase(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  std::size_t pos = 0;
  while (pos < s.size()) {
    std::size_t len = 0;
    const char32_t cp = decodeAt(s, pos, len);
    if (cp < 0x80 || cp == kReplacementChar) {
      const char c = s[pos];
      out.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c);
      pos += 1;
      continue;
    }
    appendUtf8(out, lowerLatin(cp));
    pos += len;
  }
  return out;
}

std::string cleanSpeechText(std::string_view s) {
  std::string out;
  out.reserve(s.size());

  bool inSpace = true; // trim leading
  std::size_t pos = 0;
  while (pos < s.size()) {
    std::size_t len = 0;
    const char32_t cp = decodeAt(s, pos, len);
    if (cp == 0 || cp == kReplacementChar) {
      pos += len;
      continue;
    }
    if (isSpaceChar(cp)) {
      if (!inSpace) {
        out.push_back(' ');
        inSpace = true;
      }
      pos += len;
      continue;
    }
    out.append(s.substr(pos, len));
    inSpace = false;
    pos += len;
  }

  while (!out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

} // namespace talevox
