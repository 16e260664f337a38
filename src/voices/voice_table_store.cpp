/*
TaleVox — Voice table persistence.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "voice_table_store.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include "../text/attribution.h"
#include "../util/debug_log.h"
#include "../util/scratch_file.h"
#include "../util/yaml_min.h"

namespace fs = std::filesystem;

namespace talevox {

namespace {

bool validBookId(const std::string& id) {
  if (id.empty() || id == "." || id == "..") return false;
  return id.find('/') == std::string::npos && id.find('\\') == std::string::npos;
}

std::string field(const yaml_min::Node& item, const char* key) {
  const yaml_min::Node* n = item.get(key);
  return n ? n->asString() : std::string();
}

} // namespace

std::string serializeVoiceTable(const std::string& bookId, const BookVoiceTable& table) {
  std::ostringstream oss;
  oss << "# TaleVox voice table. Edit with care; keys are canonical names.\n";
  oss << "book: " << yaml_min::quoteIfNeeded(bookId) << "\n";
  if (table.empty()) {
    oss << "characters: []\n";
    return oss.str();
  }
  oss << "characters:\n";
  for (const auto& kv : table.bindings()) {
    const VoiceBinding& b = kv.second;
    oss << "  - key: " << yaml_min::quoteIfNeeded(b.canonicalKey) << "\n";
    oss << "    name: " << yaml_min::quoteIfNeeded(b.displayName) << "\n";
    oss << "    gender: " << genderName(b.gender) << "\n";
    oss << "    voice: " << yaml_min::quoteIfNeeded(b.voice.voiceId) << "\n";
    oss << "    backend: " << yaml_min::quoteIfNeeded(b.voice.backend) << "\n";
    oss << "    engine_voice: " << yaml_min::quoteIfNeeded(b.voice.backendVoiceName) << "\n";
    oss << "    language: " << yaml_min::quoteIfNeeded(b.voice.language) << "\n";
  }
  return oss.str();
}

bool parseVoiceTable(const std::string& yamlText, const std::string& sourceName, BookVoiceTable& outTable, Error& outError) {
  yaml_min::Node root;
  std::string parseError;
  if (!yaml_min::loadString(yamlText, root, parseError, sourceName)) {
    return outError.set(ErrorCode::InvalidInput, parseError);
  }

  BookVoiceTable table;
  const yaml_min::Node* chars = root.get("characters");
  if (chars && !chars->isNull()) {
    if (!chars->isSeq()) {
      return outError.set(ErrorCode::InvalidInput, sourceName + ": 'characters' must be a list");
    }
    for (const yaml_min::Node& item : chars->seq) {
      if (!item.isMap()) {
        return outError.set(ErrorCode::InvalidInput, sourceName + ":" + std::to_string(item.line) + ": expected a character entry");
      }
      VoiceBinding b;
      // Keys are re-normalized so hand edits cannot split one character in two.
      b.canonicalKey = canonicalKey(field(item, "key"));
      b.displayName = field(item, "name");
      b.gender = parseGender(field(item, "gender"));
      b.voice.voiceId = field(item, "voice");
      b.voice.backend = field(item, "backend");
      b.voice.backendVoiceName = field(item, "engine_voice");
      b.voice.language = field(item, "language");
      if (b.canonicalKey.empty() || b.voice.voiceId.empty()) {
        return outError.set(
          ErrorCode::InvalidInput,
          sourceName + ":" + std::to_string(item.line) + ": character entry needs 'key' and 'voice'"
        );
      }
      if (b.displayName.empty()) b.displayName = b.canonicalKey;
      if (b.voice.backendVoiceName.empty()) b.voice.backendVoiceName = b.voice.voiceId;
      if (table.find(b.canonicalKey)) {
        DEBUG_WARN("%s:%d: duplicate character '%s' ignored", sourceName.c_str(), item.line, b.canonicalKey.c_str());
        continue;
      }
      table.bind(std::move(b));
    }
  }

  outTable = std::move(table);
  return true;
}

std::string VoiceTableStore::pathFor(const std::string& bookId) const {
  return (fs::path(booksDir_) / bookId / "voices.yaml").string();
}

bool VoiceTableStore::load(const std::string& bookId, BookVoiceTable& outTable, Error& outError) const {
  if (!validBookId(bookId)) return outError.set(ErrorCode::InvalidInput, "Invalid book id: '" + bookId + "'");

  const std::string path = pathFor(bookId);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    outTable = BookVoiceTable();
    return true;
  }

  std::ifstream f(path, std::ios::binary);
  if (!f) return outError.set(ErrorCode::InvalidInput, "Could not open voice table: " + path);
  const std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (!parseVoiceTable(text, path, outTable, outError)) return false;

  DEBUG_LOG("Loaded %zu voice bindings for book %s", outTable.size(), bookId.c_str());
  return true;
}

bool VoiceTableStore::save(const std::string& bookId, const BookVoiceTable& table, Error& outError) const {
  if (!validBookId(bookId)) return outError.set(ErrorCode::InvalidInput, "Invalid book id: '" + bookId + "'");

  const fs::path path = pathFor(bookId);
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    return outError.set(ErrorCode::ConfigurationError, "Could not create " + path.parent_path().string() + ": " + ec.message());
  }

  // Unique per call: saves of one book may run concurrently.
  std::string err;
  ScratchFile tmp;
  if (!tmp.create(path.parent_path().string(), "voices.yaml.", ".tmp", err) ||
      !tmp.write(serializeVoiceTable(bookId, table), err)) {
    return outError.set(ErrorCode::ConfigurationError, err);
  }

  fs::rename(tmp.path(), path, ec);
  if (ec) {
    return outError.set(ErrorCode::ConfigurationError, "Could not replace " + path.string() + ": " + ec.message());
  }
  tmp.release();
  return true;
}

} // namespace talevox
