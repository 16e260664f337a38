/*
TaleVox — Stable character to voice assignment.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "voice_assigner.h"

#include <algorithm>
#include <mutex>
#include <utility>
#include <vector>

#include "../text/attribution.h"
#include "../util/debug_log.h"
#include "../util/utf8.h"

namespace talevox {

VoiceAssigner::VoiceAssigner(const VoiceCatalog& catalog, std::string narratorVoice)
    : catalog_(catalog), narratorVoice_(std::move(narratorVoice)) {}

bool VoiceAssigner::narratorInfo(const VoiceInfo*& out, Error& outError) const {
  if (catalog_.empty()) {
    return outError.set(ErrorCode::ConfigurationError, "Backend '" + catalog_.backend() + "' has no voices");
  }
  const std::string& id = narratorVoice_.empty() ? catalog_.defaultNarratorVoice() : narratorVoice_;
  out = catalog_.resolve(id);
  if (!out) {
    return outError.set(
      ErrorCode::ConfigurationError,
      "Narrator voice '" + id + "' is not available for backend '" + catalog_.backend() + "'"
    );
  }
  return true;
}

VoiceProfile VoiceAssigner::profileForBinding(const VoiceBinding& b, const VoiceInfo& narrator) const {
  // Bindings made under another backend resolve through the legacy map.
  if (const VoiceInfo* v = catalog_.resolve(b.voice.voiceId)) return catalog_.profileFor(*v);
  DEBUG_WARN("Voice '%s' of '%s' unknown to %s; using the narrator voice",
             b.voice.voiceId.c_str(), b.canonicalKey.c_str(), catalog_.backend().c_str());
  return catalog_.profileFor(narrator);
}

// Stored ids may come from another backend; compare what they resolve to here.
bool VoiceAssigner::voiceTaken(const BookVoiceTable& table, const VoiceInfo& v) const {
  for (const auto& kv : table.bindings()) {
    const VoiceInfo* bound = catalog_.resolve(kv.second.voice.voiceId);
    if (bound && bound->voiceId == v.voiceId) return true;
  }
  return false;
}

const VoiceInfo& VoiceAssigner::pickVoice(const BookVoiceTable& table, const VoiceInfo& narrator, Gender gender) const {
  const VoiceInfo* firstFree = nullptr;
  for (const VoiceInfo& v : catalog_.voices()) {
    if (v.voiceId == narrator.voiceId || voiceTaken(table, v)) continue;
    if (gender != Gender::Unknown && v.gender == gender) return v;
    if (!firstFree) firstFree = &v;
  }
  if (firstFree) return *firstFree;

  // Pool exhausted: reuse non-narrator voices round-robin.
  std::vector<const VoiceInfo*> reusable;
  for (const VoiceInfo& v : catalog_.voices()) {
    if (v.voiceId != narrator.voiceId) reusable.push_back(&v);
  }
  if (reusable.empty()) return narrator;

  std::size_t characters = 0;
  for (const auto& kv : table.bindings()) {
    if (kv.first != kNarratorKey) ++characters;
  }
  return *reusable[characters % reusable.size()];
}

bool VoiceAssigner::assign(BookVoices& book, const CharacterSet& characters, VoiceMap& outMap, Error& outError) {
  outMap.clear();

  const VoiceInfo* narrator = nullptr;
  if (!narratorInfo(narrator, outError)) return false;

  std::lock_guard<std::mutex> lock(book.mutex_);
  BookVoiceTable& table = book.table_;

  if (!table.narrator()) {
    VoiceBinding b;
    b.canonicalKey = kNarratorKey;
    b.displayName = "Narrator";
    b.voice = catalog_.profileFor(*narrator);
    table.bind(std::move(b));
  }
  // The narrator's current voice, which may come from a stored table.
  const VoiceInfo* narratorVoice = catalog_.resolve(table.narrator()->voice.voiceId);
  if (!narratorVoice) narratorVoice = narrator;

  std::vector<const Character*> fresh;
  for (const Character& c : characters.characters) {
    if (c.canonicalKey.empty() || table.find(c.canonicalKey)) continue;
    fresh.push_back(&c);
  }
  std::sort(fresh.begin(), fresh.end(), [](const Character* a, const Character* b) {
    return a->canonicalKey < b->canonicalKey;
  });

  for (const Character* c : fresh) {
    const VoiceInfo& v = pickVoice(table, *narratorVoice, c->gender);
    VoiceBinding b;
    b.canonicalKey = c->canonicalKey;
    b.displayName = c->displayName.empty() ? c->canonicalKey : c->displayName;
    b.gender = c->gender;
    b.voice = catalog_.profileFor(v);
    DEBUG_LOG("Book %s: %s -> %s", book.bookId_.c_str(), b.canonicalKey.c_str(), b.voice.voiceId.c_str());
    table.bind(std::move(b));
  }

  outMap[kNarratorKey] = profileForBinding(*table.narrator(), *narratorVoice);
  for (const Character& c : characters.characters) {
    if (const VoiceBinding* b = table.find(c.canonicalKey)) {
      outMap[c.canonicalKey] = profileForBinding(*b, *narratorVoice);
    }
  }
  return true;
}

bool VoiceAssigner::overrideVoice(BookVoices& book, const std::string& name, const std::string& voiceId, Error& outError) {
  const std::string key = canonicalKey(name);
  if (key.empty()) return outError.set(ErrorCode::InvalidInput, "Empty character name");

  const VoiceInfo* v = catalog_.find(voiceId);
  if (!v) {
    return outError.set(
      ErrorCode::InvalidInput,
      "Voice '" + voiceId + "' is not available for backend '" + catalog_.backend() + "'"
    );
  }

  std::lock_guard<std::mutex> lock(book.mutex_);
  BookVoiceTable& table = book.table_;
  VoiceBinding b;
  if (const VoiceBinding* existing = table.find(key)) {
    b = *existing;
  } else {
    b.canonicalKey = key;
    b.displayName = key == kNarratorKey ? std::string("Narrator") : cleanSpeechText(name);
  }
  b.voice = catalog_.profileFor(*v);
  table.bind(std::move(b));
  DEBUG_LOG("Book %s: %s overridden -> %s", book.bookId_.c_str(), key.c_str(), voiceId.c_str());
  return true;
}

void VoiceAssigner::adopt(BookVoices& book, BookVoiceTable table) {
  std::lock_guard<std::mutex> lock(book.mutex_);
  if (book.loaded_) return;
  // Keep anything bound before the load finished; stored bindings win.
  for (const auto& kv : book.table_.bindings()) {
    if (!table.find(kv.first)) table.bind(kv.second);
  }
  book.table_ = std::move(table);
  book.loaded_ = true;
}

void VoiceAssigner::reset(BookVoices& book) {
  std::lock_guard<std::mutex> lock(book.mutex_);
  book.table_.reset();
  DEBUG_LOG("Book %s: voice table reset", book.bookId_.c_str());
}

bool VoiceAssigner::persist(BookVoices& book, const VoiceTableStore& store, BookVoiceTable& outSnapshot, Error& outError) {
  std::lock_guard<std::mutex> lock(book.mutex_);
  if (!store.save(book.bookId_, book.table_, outError)) return false;
  outSnapshot = book.table_;
  return true;
}

} // namespace talevox
