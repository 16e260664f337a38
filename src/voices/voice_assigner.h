/*
TaleVox — Stable character to voice assignment.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_VOICES_VOICE_ASSIGNER_H
#define TALEVOX_VOICES_VOICE_ASSIGNER_H

#include <map>
#include <string>

#include "../core/character.h"
#include "../core/error.h"
#include "../detect/character_detector.h"
#include "voice_catalog.h"
#include "voice_table.h"
#include "voice_table_store.h"

namespace talevox {

// canonical key -> voice the active backend should use.
using VoiceMap = std::map<std::string, VoiceProfile>;

// The only writer of a book's voice table. Every call takes the book's lock
// for its whole duration, so two chapters of one book cannot bind two
// different voices to the same new character.
class VoiceAssigner {
public:
  // narratorVoice: fixed narrator voice id; empty = the catalog default.
  explicit VoiceAssigner(const VoiceCatalog& catalog, std::string narratorVoice = std::string());

  const VoiceCatalog& catalog() const { return catalog_; }

  // Bind a voice to every character of `characters` (and the narrator) that
  // has none yet; existing bindings are never changed. outMap receives a
  // profile for each of those characters, translated to the active backend.
  //
  // New characters are taken in key order. Each gets the first pool voice
  // not used by the narrator or any other character of the book, preferring
  // the character's gender when known. When the pool runs out, non-narrator
  // voices are reused round-robin.
  bool assign(BookVoices& book, const CharacterSet& characters, VoiceMap& outMap, Error& outError);

  // Rebind one character to a voice from the active pool.
  bool overrideVoice(BookVoices& book, const std::string& name, const std::string& voiceId, Error& outError);

  // Install a stored table once per book (load-at-start). Later calls are
  // ignored so an in-memory table is never clobbered by a stale file.
  void adopt(BookVoices& book, BookVoiceTable table);

  // Forget every binding of the book.
  void reset(BookVoices& book);

  // Save the book's table under its lock, so a save never overwrites a newer
  // one. `outSnapshot` is the table that was written.
  bool persist(BookVoices& book, const VoiceTableStore& store, BookVoiceTable& outSnapshot, Error& outError);

private:
  bool narratorInfo(const VoiceInfo*& out, Error& outError) const;
  VoiceProfile profileForBinding(const VoiceBinding& b, const VoiceInfo& narrator) const;
  bool voiceTaken(const BookVoiceTable& table, const VoiceInfo& v) const;
  const VoiceInfo& pickVoice(const BookVoiceTable& table, const VoiceInfo& narrator, Gender gender) const;

  const VoiceCatalog& catalog_;
  std::string narratorVoice_;
};

} // namespace talevox

#endif // TALEVOX_VOICES_VOICE_ASSIGNER_H
