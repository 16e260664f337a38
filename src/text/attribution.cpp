/*
TaleVox — Speech tag matching ("Alice said", "asked Bob").
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "attribution.h"

#include <unordered_set>

#include "../util/utf8.h"

namespace talevox {

namespace {

const std::unordered_set<std::string>& speechVerbs() {
  static const std::unordered_set<std::string> verbs = {
    "said", "says", "say",
    "asked", "asks", "ask",
    "replied", "replies", "reply",
    "whispered", "whispers", "whisper",
    "shouted", "shouts", "shout",
    "yelled", "yells",
    "cried", "cries",
    "called", "calls",
    "answered", "answers",
    "muttered", "mutters",
    "murmured", "murmurs",
    "exclaimed", "exclaims",
    "added", "adds",
    "continued", "continues",
    "snapped", "snaps",
    "told", "tells",
    "insisted", "insists",
    "demanded", "demands",
    "laughed", "sighed", "growled", "hissed", "screamed", "breathed",
    "admitted", "agreed", "explained", "warned", "remarked", "declared",
    "responded", "stammered", "mumbled", "pleaded", "suggested",
    "repeated", "retorted", "protested", "interrupted", "wondered",
  };
  return verbs;
}

// Words that may stand between the name and the verb.
const std::unordered_set<std::string>& auxiliaries() {
  static const std::unordered_set<std::string> words = {
    "had", "has", "would", "will", "then", "just", "finally", "quietly", "softly",
  };
  return words;
}

const std::unordered_set<std::string>& pronouns() {
  static const std::unordered_set<std::string> words = {
    "he", "she", "they", "i", "we", "you",
  };
  return words;
}

// Capitalized words that start sentences far more often than they name anyone.
const std::unordered_set<std::string>& stopwords() {
  static const std::unordered_set<std::string> words = {
    "the", "a", "an", "and", "but", "or", "so", "then", "when", "while", "after",
    "before", "as", "at", "in", "on", "of", "for", "with", "to", "from", "by",
    "if", "once", "now", "later", "still", "yet", "meanwhile", "suddenly",
    "finally", "yesterday", "today", "tomorrow", "this", "that", "these",
    "those", "there", "here", "it", "oh", "well", "yes", "no", "someone",
    "somebody", "everyone", "nobody", "his", "her", "their", "my", "our",
    "your", "its", "what", "who", "why", "how", "where",
  };
  return words;
}

// Contraction suffixes that end a name without breaking the tag.
bool isNameContraction(const std::string& lowerSuffix) {
  return lowerSuffix == "d" || lowerSuffix == "s" || lowerSuffix == "ll";
}

bool isWordChar(char32_t cp) {
  if (cp < 0x80) {
    return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z') || (cp >= U'0' && cp <= U'9');
  }
  if (cp == kReplacementChar || isSpaceChar(cp) || isOpeningQuote(cp) || isClosingQuote(cp) || isApostrophe(cp)) {
    return false;
  }
  if (cp >= 0x2000 && cp <= 0x206F) return false; // General punctuation.
  if (cp >= 0x3000 && cp <= 0x303F) return false; // CJK punctuation.
  if (cp >= 0xFF00 && cp <= 0xFF20) return false; // Full-width punctuation.
  if (cp == 0x00AB || cp == 0x00BB || cp == 0x00A1 || cp == 0x00BF) return false;
  return true;
}

bool isUpperInitial(char32_t cp) {
  if (cp >= U'A' && cp <= U'Z') return true;
  // Latin-1 capitals, minus the multiplication sign.
  return cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7;
}

struct Token {
  std::string base;   // Word up to an inner apostrophe.
  std::string suffix; // After the apostrophe, lowercased ("d" in "She'd").
  std::size_t normBegin = 0;
  std::size_t normEnd = 0;
  bool capitalized = false;
};

// Whitespace-collapsed copy of a window with a map back to source offsets.
struct NormalizedWindow {
  std::string text;
  std::vector<std::size_t> sourceOffset; // One per byte of `text`.
};

NormalizedWindow normalize(std::string_view source, std::size_t begin, std::size_t end) {
  NormalizedWindow w;
  w.text.reserve(end - begin);
  w.sourceOffset.reserve(end - begin);

  bool inSpace = false;
  std::size_t pos = begin;
  while (pos < end) {
    std::size_t len = 0;
    const char32_t cp = decodeAt(source, pos, len);
    if (isSpaceChar(cp)) {
      if (!inSpace) {
        w.text.push_back(' ');
        w.sourceOffset.push_back(pos);
        inSpace = true;
      }
    } else {
      for (std::size_t k = 0; k < len && pos + k < end; ++k) {
        w.text.push_back(source[pos + k]);
        w.sourceOffset.push_back(pos + k);
      }
      inSpace = false;
    }
    pos += len;
  }
  return w;
}

std::vector<Token> tokenize(const std::string& norm) {
  std::vector<Token> tokens;
  std::size_t pos = 0;
  while (pos < norm.size()) {
    std::size_t len = 0;
    char32_t cp = decodeAt(norm, pos, len);
    if (!isWordChar(cp)) {
      pos += len;
      continue;
    }

    Token t;
    t.normBegin = pos;
    t.capitalized = isUpperInitial(cp);
    bool inSuffix = false;
    while (pos < norm.size()) {
      cp = decodeAt(norm, pos, len);
      if (isWordChar(cp)) {
        if (inSuffix) {
          t.suffix.append(asciiLower(norm.substr(pos, len)));
        } else {
          t.base.append(norm, pos, len);
        }
        pos += len;
        continue;
      }
      if (isApostrophe(cp) && !inSuffix) {
        // Only an apostrophe with letters on both sides stays in the word.
        std::size_t nlen = 0;
        const char32_t next = decodeAt(norm, pos + len, nlen);
        if (pos + len < norm.size() && isWordChar(next)) {
          inSuffix = true;
          pos += len;
          continue;
        }
      }
      break;
    }
    t.normEnd = pos;
    tokens.push_back(std::move(t));
  }
  return tokens;
}

// Nothing but one space between the two tokens.
bool tight(const std::string& norm, const Token& a, const Token& b) {
  return b.normBegin == a.normEnd + 1 && norm[a.normEnd] == ' ';
}

bool isNameWord(const Token& t) {
  return t.capitalized && stopwords().count(asciiLower(t.base)) == 0 && !isSpeechVerb(asciiLower(t.base));
}

} // namespace

bool isSpeechVerb(std::string_view word) {
  return speechVerbs().count(asciiLower(word)) != 0;
}

bool isPronoun(std::string_view word) {
  return pronouns().count(asciiLower(word)) != 0;
}

std::string canonicalKey(std::string_view name) {
  return foldCase(cleanSpeechText(name));
}

std::vector<Attribution> findAttributions(std::string_view source, std::size_t begin, std::size_t end) {
  std::vector<Attribution> out;
  if (end > source.size()) end = source.size();
  if (begin >= end) return out;

  const NormalizedWindow w = normalize(source, begin, end);
  const std::vector<Token> tokens = tokenize(w.text);

  auto sourceBegin = [&](const Token& t) { return w.sourceOffset[t.normBegin]; };
  auto sourceEnd = [&](const Token& t) { return w.sourceOffset[t.normEnd - 1] + 1; };

  for (std::size_t v = 0; v < tokens.size(); ++v) {
    const Token& verb = tokens[v];
    if (!verb.suffix.empty() || !isSpeechVerb(verb.base)) continue;

    // "<name> [aux] <verb>"
    if (v > 0) {
      std::size_t n = v - 1;
      bool linked = tight(w.text, tokens[n], verb);
      if (linked && tokens[n].suffix.empty() && auxiliaries().count(asciiLower(tokens[n].base)) != 0 && n > 0) {
        linked = tight(w.text, tokens[n - 1], tokens[n]);
        --n;
      }
      const Token& name = tokens[n];
      const bool suffixOk = name.suffix.empty() || isNameContraction(name.suffix);
      if (linked && suffixOk) {
        if (isPronoun(name.base)) {
          out.push_back(Attribution{name.base, true, sourceBegin(name), sourceEnd(verb)});
          continue;
        }
        if (isNameWord(name)) {
          std::size_t first = n;
          if (n > 0 && tokens[n - 1].suffix.empty() && isNameWord(tokens[n - 1]) && tight(w.text, tokens[n - 1], name)) {
            first = n - 1;
          }
          std::string full = tokens[first].base;
          if (first != n) full += " " + name.base;
          out.push_back(Attribution{full, false, sourceBegin(tokens[first]), sourceEnd(verb)});
          continue;
        }
      }
    }

    // "<verb> <name>"
    if (v + 1 < tokens.size() && tight(w.text, verb, tokens[v + 1])) {
      const Token& name = tokens[v + 1];
      if (!name.suffix.empty() && !isNameContraction(name.suffix)) continue;
      if (isPronoun(name.base)) {
        out.push_back(Attribution{name.base, true, sourceBegin(verb), sourceEnd(name)});
        continue;
      }
      if (isNameWord(name)) {
        std::size_t last = v + 1;
        if (name.suffix.empty() && v + 2 < tokens.size() && isNameWord(tokens[v + 2]) &&
            tokens[v + 2].suffix.empty() && tight(w.text, name, tokens[v + 2])) {
          last = v + 2;
        }
        std::string full = name.base;
        if (last != v + 1) full += " " + tokens[last].base;
        out.push_back(Attribution{full, false, sourceBegin(verb), sourceEnd(tokens[last])});
      }
    }
  }
  return out;
}

} // namespace talevox
