/*
TaleVox — Runtime settings.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "settings.h"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>

#include "../util/debug_log.h"
#include "../util/utf8.h"
#include "../util/yaml_min.h"

namespace talevox {

namespace {

const std::set<std::string>& knownKeys() {
  static const std::set<std::string> keys = {
    "storage_dir",
    "tts.backend", "tts.speed", "tts.sample_rate", "tts.timeout_seconds", "tts.max_chunk_chars",
    "kokoro.executable", "kokoro.model", "kokoro.voices",
    "say.executable", "espeak.executable",
    "llm.enabled", "llm.url", "llm.model", "llm.timeout_seconds", "llm.excerpt_chars",
    "pipeline.fanout", "pipeline.workers", "pipeline.pause_ms",
    "voices.narrator",
    "logging.enabled", "logging.path", "logging.stderr",
  };
  return keys;
}

void reportUnknownKeys(const yaml_min::Node& node, const std::string& prefix, const std::string& sourceName) {
  if (!node.isMap()) return;
  for (const auto& kv : node.map) {
    const std::string key = prefix.empty() ? kv.first : prefix + "." + kv.first;
    if (kv.second.isMap()) {
      reportUnknownKeys(kv.second, key, sourceName);
    } else if (knownKeys().count(key) == 0) {
      DEBUG_WARN("%s:%d: unknown setting '%s' ignored", sourceName.c_str(), kv.second.line, key.c_str());
    }
  }
}

// Reads typed values out of the parsed document, remembering the first error.
class SettingsReader {
public:
  SettingsReader(const yaml_min::Node& root, const std::string& sourceName, Error& outError)
      : root_(root), source_(sourceName), error_(outError) {}

  void readString(const char* key, std::string& out) {
    const yaml_min::Node* n = root_.find(key);
    if (!n || n->isNull()) return;
    if (!n->isScalar()) {
      fail(*n, key, "expected a string");
      return;
    }
    out = n->scalar;
  }

  void readBool(const char* key, bool& out) {
    const yaml_min::Node* n = root_.find(key);
    if (!n || n->isNull()) return;
    if (!n->asBool(out)) fail(*n, key, "expected true/false");
  }

  void readInt(const char* key, long long minValue, long long maxValue, int& out) {
    long long v = 0;
    if (readIntValue(key, minValue, maxValue, v)) out = static_cast<int>(v);
  }

  void readSize(const char* key, long long minValue, long long maxValue, std::size_t& out) {
    long long v = 0;
    if (readIntValue(key, minValue, maxValue, v)) out = static_cast<std::size_t>(v);
  }

  void readDouble(const char* key, double minValue, double maxValue, double& out) {
    const yaml_min::Node* n = root_.find(key);
    if (!n || n->isNull()) return;
    double v = 0.0;
    if (!n->asNumber(v)) {
      fail(*n, key, "expected a number");
      return;
    }
    if (v < minValue || v > maxValue) {
      std::ostringstream oss;
      oss << "must be between " << minValue << " and " << maxValue;
      fail(*n, key, oss.str());
      return;
    }
    out = v;
  }

  bool ok() const { return !failed_; }

private:
  bool readIntValue(const char* key, long long minValue, long long maxValue, long long& out) {
    const yaml_min::Node* n = root_.find(key);
    if (!n || n->isNull()) return false;
    long long v = 0;
    if (!n->asInt(v)) {
      fail(*n, key, "expected an integer");
      return false;
    }
    if (v < minValue || v > maxValue) {
      std::ostringstream oss;
      oss << "must be between " << minValue << " and " << maxValue;
      fail(*n, key, oss.str());
      return false;
    }
    out = v;
    return true;
  }

  void fail(const yaml_min::Node& n, const char* key, const std::string& why) {
    if (failed_) return;
    failed_ = true;
    std::ostringstream oss;
    oss << source_ << ":" << n.line << ": " << key << ": " << why;
    error_.set(ErrorCode::ConfigurationError, oss.str());
  }

  const yaml_min::Node& root_;
  const std::string& source_;
  Error& error_;
  bool failed_ = false;
};

bool isKnownBackend(const std::string& name) {
  return name == "kokoro" || name == "say" || name == "espeak";
}

std::string joinPath(const std::string& dir, const std::string& leaf) {
  if (dir.empty()) return leaf;
  if (dir.back() == '/') return dir + leaf;
  return dir + "/" + leaf;
}

} // namespace

std::string Settings::kokoroModelPath() const {
  return kokoro.model.empty() ? joinPath(storageDir, "kokoro-v1.0.onnx") : kokoro.model;
}

std::string Settings::kokoroVoicesPath() const {
  return kokoro.voices.empty() ? joinPath(storageDir, "voices-v1.0.bin") : kokoro.voices;
}

std::string Settings::booksDir() const {
  return joinPath(storageDir, "books");
}

bool loadSettingsString(const std::string& yamlText, Settings& settings, Error& outError, const std::string& sourceName) {
  outError.clear();

  yaml_min::Node root;
  std::string parseError;
  if (!yaml_min::loadString(yamlText, root, parseError, sourceName)) {
    return outError.set(ErrorCode::ConfigurationError, parseError);
  }
  if (root.isNull()) return true;
  if (!root.isMap()) {
    return outError.set(ErrorCode::ConfigurationError, sourceName + ": top level must be a map");
  }
  reportUnknownKeys(root, "", sourceName);

  // Work on a copy so a bad value leaves the caller's settings untouched.
  Settings s = settings;
  SettingsReader r(root, sourceName, outError);
  r.readString("storage_dir", s.storageDir);
  r.readString("tts.backend", s.tts.backend);
  r.readDouble("tts.speed", 0.25, 4.0, s.tts.speed);
  r.readInt("tts.sample_rate", 8000, 192000, s.tts.sampleRate);
  r.readInt("tts.timeout_seconds", 1, 3600, s.tts.timeoutSeconds);
  r.readSize("tts.max_chunk_chars", 64, 1000000, s.tts.maxChunkChars);
  r.readString("kokoro.executable", s.kokoro.executable);
  r.readString("kokoro.model", s.kokoro.model);
  r.readString("kokoro.voices", s.kokoro.voices);
  r.readString("say.executable", s.sayExecutable);
  r.readString("espeak.executable", s.espeakExecutable);
  r.readBool("llm.enabled", s.llm.enabled);
  r.readString("llm.url", s.llm.url);
  r.readString("llm.model", s.llm.model);
  r.readInt("llm.timeout_seconds", 1, 120, s.llm.timeoutSeconds);
  r.readSize("llm.excerpt_chars", 256, 1000000, s.llm.excerptChars);
  r.readInt("pipeline.fanout", 1, 64, s.pipeline.fanout);
  r.readInt("pipeline.workers", 0, 256, s.pipeline.workers);
  r.readInt("pipeline.pause_ms", 0, 10000, s.pipeline.pauseMs);
  r.readString("voices.narrator", s.narratorVoice);
  r.readBool("logging.enabled", s.logging.enabled);
  r.readString("logging.path", s.logging.path);
  r.readBool("logging.stderr", s.logging.mirrorToStderr);
  if (!r.ok()) return false;

  s.tts.backend = asciiLower(s.tts.backend);
  if (!isKnownBackend(s.tts.backend)) {
    const yaml_min::Node* n = root.find("tts.backend");
    std::ostringstream oss;
    oss << sourceName << ":" << (n ? n->line : 0) << ": tts.backend: unknown backend '" << s.tts.backend
        << "' (expected kokoro, say or espeak)";
    return outError.set(ErrorCode::ConfigurationError, oss.str());
  }

  settings = std::move(s);
  return true;
}

bool loadSettingsFile(const std::string& path, Settings& settings, Error& outError) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return outError.set(ErrorCode::ConfigurationError, "Could not open settings file: " + path);
  }
  const std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  return loadSettingsString(text, settings, outError, path);
}

bool applyEnvironment(Settings& settings, Error& outError, const EnvLookup& lookup) {
  outError.clear();
  auto get = [&](const char* name) -> const char* {
    const char* v = lookup ? lookup(name) : std::getenv(name);
    return (v && *v) ? v : nullptr;
  };

  Settings s = settings;
  if (const char* v = get("STORAGE_DIR")) s.storageDir = v;
  if (const char* v = get("TTS_BACKEND")) {
    s.tts.backend = asciiLower(v);
    if (!isKnownBackend(s.tts.backend)) {
      return outError.set(ErrorCode::ConfigurationError, "TTS_BACKEND: unknown backend '" + s.tts.backend + "'");
    }
  }
  if (const char* v = get("OLLAMA_URL")) s.llm.url = v;
  if (const char* v = get("LLM_MODEL")) s.llm.model = v;

  // Numeric overrides go through the YAML scalar parser so they use the same
  // locale-independent rules as the settings file.
  auto number = [&](const char* name, double& out) -> bool {
    const char* v = get(name);
    if (!v) return true;
    yaml_min::Node n;
    n.type = yaml_min::Node::Type::Scalar;
    n.scalar = v;
    if (!n.asNumber(out)) {
      return outError.set(ErrorCode::ConfigurationError, std::string(name) + ": expected a number, got '" + v + "'");
    }
    return true;
  };

  double rate = s.tts.sampleRate;
  double speed = s.tts.speed;
  double chunk = static_cast<double>(s.tts.maxChunkChars);
  if (!number("AUDIO_SAMPLE_RATE", rate) || !number("AUDIO_SPEED", speed) || !number("MAX_CHUNK_SIZE", chunk)) {
    return false;
  }
  if (rate < 8000 || rate > 192000) {
    return outError.set(ErrorCode::ConfigurationError, "AUDIO_SAMPLE_RATE: out of range");
  }
  if (speed < 0.25 || speed > 4.0) {
    return outError.set(ErrorCode::ConfigurationError, "AUDIO_SPEED: out of range");
  }
  if (chunk < 64) {
    return outError.set(ErrorCode::ConfigurationError, "MAX_CHUNK_SIZE: out of range");
  }
  s.tts.sampleRate = static_cast<int>(rate);
  s.tts.speed = speed;
  s.tts.maxChunkChars = static_cast<std::size_t>(chunk);

  settings = std::move(s);
  return true;
}

void applyLoggingSettings(const LoggingSettings& logging) {
  if (!logging.path.empty()) DebugLog::SetPath(logging.path);
  DebugLog::SetMirrorToStderr(logging.mirrorToStderr);
  DebugLog::SetEnabled(logging.enabled);
}

} // namespace talevox
