/*
TaleVox — Speaking-character detection (LLM hint + heuristic tier).
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_DETECT_CHARACTER_DETECTOR_H
#define TALEVOX_DETECT_CHARACTER_DETECTOR_H

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../core/character.h"
#include "../core/error.h"
#include "../core/segment.h"
#include "llm_client.h"

namespace talevox {

// Detected roster for one chapter. The narrator is always the first entry
// and appears exactly once.
struct CharacterSet {
  std::vector<Character> characters;
  // The LLM tier answered and its roster was merged in.
  bool usedLlm = false;

  const Character* find(const std::string& canonicalKey) const;
  bool contains(const std::string& canonicalKey) const { return find(canonicalKey) != nullptr; }
  std::size_t size() const { return characters.size(); }

  // Insert or merge by canonical key. The first display name wins; a known
  // gender replaces an unknown one. Returns the stored entry.
  Character& add(const std::string& name, Gender gender);
};

struct DetectorOptions {
  bool useLlm = true;
  std::chrono::milliseconds llmTimeout{15000};
  // Bytes of chapter text sent to the model.
  std::size_t excerptChars = 8000;
};

class CharacterDetector {
public:
  // `llm` may be null: the heuristic tier then runs alone.
  CharacterDetector(std::shared_ptr<LlmClient> llm, DetectorOptions options);

  // Roster for `text`. Never fails: LLM timeouts and bad replies fall back to
  // the heuristic tier, which reads the segments' attributed names.
  CharacterSet detect(const std::string& text, const std::vector<Segment>& segments);

  // As detect(), but reuses the previous result for `chapterKey` while its
  // text is unchanged.
  CharacterSet detectCached(
    const std::string& chapterKey,
    const std::string& text,
    const std::vector<Segment>& segments,
    bool* outCacheHit = nullptr
  );

  void forget(const std::string& chapterKey);

  // The LLM tier alone, bounded by the watchdog. DetectionTimeout when the
  // call outlives llmTimeout; InvalidInput for transport errors and replies
  // with no roster.
  bool queryLlm(const std::string& text, std::vector<LlmCharacter>& out, Error& outError);

private:
  struct CacheEntry {
    std::size_t textHash = 0;
    std::size_t textSize = 0;
    CharacterSet characters;
  };

  std::shared_ptr<LlmClient> llm_;
  DetectorOptions options_;

  std::mutex cacheMutex_;
  std::map<std::string, CacheEntry> cache_;
};

} // namespace talevox

#endif // TALEVOX_DETECT_CHARACTER_DETECTOR_H
