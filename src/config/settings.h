/*
TaleVox — Runtime settings.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_CONFIG_SETTINGS_H
#define TALEVOX_CONFIG_SETTINGS_H

#include <cstddef>
#include <functional>
#include <string>

#include "../core/error.h"

namespace talevox {

struct TtsSettings {
  // kokoro | say | espeak
  std::string backend = "kokoro";
  double speed = 1.0;
  int sampleRate = 24000;
  int timeoutSeconds = 120;
  std::size_t maxChunkChars = 5000;
};

struct KokoroSettings {
  std::string executable = "kokoro-tts";
  // Empty = "<storage_dir>/kokoro-v1.0.onnx" / "<storage_dir>/voices-v1.0.bin".
  std::string model;
  std::string voices;
};

struct LlmSettings {
  bool enabled = true;
  std::string url = "http://localhost:11434";
  std::string model = "minimax-m2.5:cloud";
  int timeoutSeconds = 15;
  std::size_t excerptChars = 8000;
};

struct PipelineSettings {
  int fanout = 4;
  // 0 = hardware concurrency.
  int workers = 0;
  int pauseMs = 300;
};

struct LoggingSettings {
  bool enabled = false;
  std::string path;
  bool mirrorToStderr = false;
};

struct Settings {
  std::string storageDir = "./storage";
  TtsSettings tts;
  KokoroSettings kokoro;
  std::string sayExecutable = "say";
  std::string espeakExecutable = "espeak-ng";
  LlmSettings llm;
  PipelineSettings pipeline;
  // Fixed narrator voice id; empty = first voice of the backend pool.
  std::string narratorVoice;
  LoggingSettings logging;

  std::string kokoroModelPath() const;
  std::string kokoroVoicesPath() const;
  std::string booksDir() const;
};

// Overlay a YAML settings document on `settings`. Keys not present keep their
// current values. Unknown keys are ignored (logged), wrongly typed or out of
// range values are a ConfigurationError naming the source line.
bool loadSettingsString(
  const std::string& yamlText,
  Settings& settings,
  Error& outError,
  const std::string& sourceName = "<settings>"
);
bool loadSettingsFile(const std::string& path, Settings& settings, Error& outError);

// Returns the value of an environment variable or nullptr.
using EnvLookup = std::function<const char*(const char*)>;

// STORAGE_DIR, TTS_BACKEND, OLLAMA_URL, LLM_MODEL, AUDIO_SAMPLE_RATE,
// AUDIO_SPEED, MAX_CHUNK_SIZE. An empty lookup reads the process environment.
bool applyEnvironment(Settings& settings, Error& outError, const EnvLookup& lookup = EnvLookup());

// Push logging.* into DebugLog.
void applyLoggingSettings(const LoggingSettings& logging);

} // namespace talevox

#endif // TALEVOX_CONFIG_SETTINGS_H
