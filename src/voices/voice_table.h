/*
TaleVox — Book-scoped character to voice table.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_VOICES_VOICE_TABLE_H
#define TALEVOX_VOICES_VOICE_TABLE_H

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "../core/character.h"

namespace talevox {

struct VoiceBinding {
  std::string canonicalKey;
  std::string displayName;
  Gender gender = Gender::Unknown;
  VoiceProfile voice;
};

// Character -> voice bindings of one book, keyed by canonical key.
// Plain value; BookVoices owns the shared copy.
class BookVoiceTable {
public:
  const VoiceBinding* find(const std::string& canonicalKey) const;
  const VoiceBinding* narrator() const { return find(kNarratorKey); }

  // Insert or replace the binding for b.canonicalKey.
  void bind(VoiceBinding b);
  void reset() { bindings_.clear(); }

  // Some binding other than `exceptKey` already uses voiceId.
  bool empty() const { return bindings_.empty(); }
  std::size_t size() const { return bindings_.size(); }
  const std::map<std::string, VoiceBinding>& bindings() const { return bindings_; }

  bool operator==(const BookVoiceTable& other) const;
  bool operator!=(const BookVoiceTable& other) const { return !(*this == other); }

private:
  std::map<std::string, VoiceBinding> bindings_;
};

class VoiceAssigner;

// Shared state of one book: its voice table and the lock guarding it.
// Concurrent chapter runs of the same book share one BookVoices; only
// VoiceAssigner changes the table.
class BookVoices {
public:
  explicit BookVoices(std::string bookId) : bookId_(std::move(bookId)) {}

  BookVoices(const BookVoices&) = delete;
  BookVoices& operator=(const BookVoices&) = delete;

  const std::string& bookId() const { return bookId_; }

  // Copy of the current table.
  BookVoiceTable snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_;
  }

  // A stored table was adopted (see VoiceAssigner::adopt).
  bool loaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_;
  }

private:
  friend class VoiceAssigner;

  std::string bookId_;
  mutable std::mutex mutex_;
  BookVoiceTable table_;
  bool loaded_ = false;
};

} // namespace talevox

#endif // TALEVOX_VOICES_VOICE_TABLE_H
