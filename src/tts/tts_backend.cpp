/*
TaleVox — Text-to-speech backend interface.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "tts_backend.h"

#include <utility>

#include "../config/settings.h"
#include "espeak_backend.h"
#include "kokoro_backend.h"
#include "mac_speech_backend.h"

namespace talevox {

const char* backendKindName(BackendKind kind) {
  switch (kind) {
    case BackendKind::Kokoro: return "kokoro";
    case BackendKind::MacSpeech: return "say";
    case BackendKind::Espeak: return "espeak";
  }
  return "kokoro";
}

bool parseBackendKind(const std::string& name, BackendKind& out) {
  if (name == "kokoro") {
    out = BackendKind::Kokoro;
  } else if (name == "say" || name == "macos" || name == "mac") {
    out = BackendKind::MacSpeech;
  } else if (name == "espeak" || name == "espeak-ng") {
    out = BackendKind::Espeak;
  } else {
    return false;
  }
  return true;
}

std::unique_ptr<TtsBackend> createBackend(const Settings& settings, Error& outError) {
  BackendKind kind;
  if (!parseBackendKind(settings.tts.backend, kind)) {
    outError.set(ErrorCode::ConfigurationError, "Unknown TTS backend '" + settings.tts.backend + "'");
    return nullptr;
  }

  ProcessBackendOptions process;
  process.timeoutMs = settings.tts.timeoutSeconds * 1000;

  switch (kind) {
    case BackendKind::Kokoro: {
      KokoroOptions o;
      o.executable = settings.kokoro.executable;
      o.modelPath = settings.kokoroModelPath();
      o.voicesPath = settings.kokoroVoicesPath();
      o.speed = settings.tts.speed;
      return std::make_unique<KokoroBackend>(std::move(o), std::move(process));
    }
    case BackendKind::MacSpeech: {
      MacSpeechOptions o;
      o.executable = settings.sayExecutable;
      o.speed = settings.tts.speed;
      o.sampleRate = settings.tts.sampleRate;
      return std::make_unique<MacSpeechBackend>(std::move(o), std::move(process));
    }
    case BackendKind::Espeak: {
      EspeakOptions o;
      o.executable = settings.espeakExecutable;
      o.speed = settings.tts.speed;
      return std::make_unique<EspeakBackend>(std::move(o), std::move(process));
    }
  }
  outError.set(ErrorCode::ConfigurationError, "Unknown TTS backend '" + settings.tts.backend + "'");
  return nullptr;
}

} // namespace talevox
