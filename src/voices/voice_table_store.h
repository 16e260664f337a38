/*
TaleVox — Voice table persistence.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_VOICES_VOICE_TABLE_STORE_H
#define TALEVOX_VOICES_VOICE_TABLE_STORE_H

#include <string>
#include <utility>

#include "../core/error.h"
#include "voice_table.h"

namespace talevox {

// Reads and writes "<booksDir>/<bookId>/voices.yaml":
//
//   book: my-book
//   characters:
//     - key: alice
//       name: Alice
//       gender: female
//       voice: af_bella
//       backend: kokoro
//       engine_voice: af_bella
//       language: en-us
class VoiceTableStore {
public:
  explicit VoiceTableStore(std::string booksDir) : booksDir_(std::move(booksDir)) {}

  std::string pathFor(const std::string& bookId) const;

  // A missing file is an empty table, not an error.
  bool load(const std::string& bookId, BookVoiceTable& outTable, Error& outError) const;

  // Written to a temporary file first and renamed over the old one.
  bool save(const std::string& bookId, const BookVoiceTable& table, Error& outError) const;

private:
  std::string booksDir_;
};

// The YAML document alone, for callers that store it elsewhere.
std::string serializeVoiceTable(const std::string& bookId, const BookVoiceTable& table);
bool parseVoiceTable(const std::string& yamlText, const std::string& sourceName, BookVoiceTable& outTable, Error& outError);

} // namespace talevox

#endif // TALEVOX_VOICES_VOICE_TABLE_STORE_H
