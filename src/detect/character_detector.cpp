/*
TaleVox — Speaking-character detection (LLM hint + heuristic tier).
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "character_detector.h"

#include <exception>
#include <functional>
#include <future>
#include <thread>
#include <utility>

#include "../text/attribution.h"
#include "../util/debug_log.h"
#include "../util/utf8.h"

namespace talevox {

namespace {

struct LlmOutcome {
  bool ok = false;
  std::string reply;
  std::string error;
};

// First `maxBytes` of text without splitting a UTF-8 sequence.
std::string excerptOf(const std::string& text, std::size_t maxBytes) {
  if (text.size() <= maxBytes) return text;
  std::size_t cut = maxBytes;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
  return text.substr(0, cut);
}

} // namespace

const Character* CharacterSet::find(const std::string& canonicalKey) const {
  for (const Character& c : characters) {
    if (c.canonicalKey == canonicalKey) return &c;
  }
  return nullptr;
}

Character& CharacterSet::add(const std::string& name, Gender gender) {
  const std::string key = canonicalKey(name);
  for (Character& c : characters) {
    if (c.canonicalKey == key) {
      if (c.gender == Gender::Unknown) c.gender = gender;
      return c;
    }
  }
  Character c;
  c.canonicalKey = key;
  c.displayName = key == kNarratorKey ? std::string("Narrator") : cleanSpeechText(name);
  c.gender = gender;
  characters.push_back(std::move(c));
  return characters.back();
}

CharacterDetector::CharacterDetector(std::shared_ptr<LlmClient> llm, DetectorOptions options)
    : llm_(std::move(llm)), options_(options) {}

bool CharacterDetector::queryLlm(const std::string& text, std::vector<LlmCharacter>& out, Error& outError) {
  out.clear();
  if (!llm_) return outError.set(ErrorCode::InvalidInput, "No LLM client configured");

  const std::string prompt = buildCharacterPrompt(excerptOf(text, options_.excerptChars));

  // The call runs on its own thread so the watchdog below can give up on it.
  // A timed-out call finishes in the background against its own transport
  // timeout; its result is dropped.
  std::shared_ptr<LlmClient> client = llm_;
  auto task = std::make_shared<std::packaged_task<LlmOutcome()>>([client, prompt]() {
    LlmOutcome o;
    try {
      o.ok = client->generate(prompt, o.reply, o.error);
    } catch (const std::exception& e) {
      o.ok = false;
      o.error = std::string("LLM client threw: ") + e.what();
    }
    return o;
  });
  std::future<LlmOutcome> result = task->get_future();
  std::thread([task]() { (*task)(); }).detach();

  if (result.wait_for(options_.llmTimeout) != std::future_status::ready) {
    return outError.set(
      ErrorCode::DetectionTimeout,
      "LLM did not answer within " + std::to_string(options_.llmTimeout.count()) + " ms"
    );
  }

  LlmOutcome o = result.get();
  if (!o.ok) return outError.set(ErrorCode::InvalidInput, o.error);

  std::string parseError;
  if (!parseCharacterReply(o.reply, out, parseError)) {
    return outError.set(ErrorCode::InvalidInput, parseError);
  }
  return true;
}

CharacterSet CharacterDetector::detect(const std::string& text, const std::vector<Segment>& segments) {
  CharacterSet set;
  set.add(kNarratorKey, Gender::Unknown);

  // Heuristic tier: every attributed speaker. This is also what segment-level
  // speaker resolution uses, so it always runs.
  for (const Segment& seg : segments) {
    if (seg.kind != SegmentKind::Dialogue || seg.attributedName.empty()) continue;
    set.add(seg.attributedName, Gender::Unknown);
  }

  if (options_.useLlm && llm_) {
    std::vector<LlmCharacter> roster;
    Error err;
    if (queryLlm(text, roster, err)) {
      for (const LlmCharacter& c : roster) {
        const std::string key = canonicalKey(c.name);
        if (key.empty() || isPronoun(key)) continue;
        set.add(c.name, c.gender);
      }
      set.usedLlm = true;
    } else {
      DEBUG_WARN("Character detection falling back to heuristics: %s", err.describe().c_str());
    }
  }

  DEBUG_LOG("Detected %zu characters (llm=%d)", set.size(), set.usedLlm ? 1 : 0);
  return set;
}

CharacterSet CharacterDetector::detectCached(
  const std::string& chapterKey,
  const std::string& text,
  const std::vector<Segment>& segments,
  bool* outCacheHit
) {
  const std::size_t hash = std::hash<std::string>{}(text);
  {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    auto it = cache_.find(chapterKey);
    if (it != cache_.end() && it->second.textHash == hash && it->second.textSize == text.size()) {
      if (outCacheHit) *outCacheHit = true;
      DEBUG_LOG("Character cache hit for %s", chapterKey.c_str());
      return it->second.characters;
    }
  }
  if (outCacheHit) *outCacheHit = false;

  CharacterSet set = detect(text, segments);

  std::lock_guard<std::mutex> lock(cacheMutex_);
  CacheEntry& entry = cache_[chapterKey];
  entry.textHash = hash;
  entry.textSize = text.size();
  entry.characters = set;
  return set;
}

void CharacterDetector::forget(const std::string& chapterKey) {
  std::lock_guard<std::mutex> lock(cacheMutex_);
  cache_.erase(chapterKey);
}

} // namespace talevox
