/*
TaleVox — Text-to-speech backend interface.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_TTS_TTS_BACKEND_H
#define TALEVOX_TTS_TTS_BACKEND_H

#include <memory>
#include <string>

#include "../core/audio_clip.h"
#include "../core/character.h"
#include "../core/error.h"
#include "../voices/voice_catalog.h"

namespace talevox {

struct Settings;

// Closed set of engines. A new engine is a new kind plus a TtsBackend
// subclass wired into createBackend().
enum class BackendKind {
  Kokoro,
  MacSpeech,
  Espeak,
};

// "kokoro", "say", "espeak".
const char* backendKindName(BackendKind kind);
bool parseBackendKind(const std::string& name, BackendKind& out);

// Renders one piece of text in one voice.
class TtsBackend {
public:
  virtual ~TtsBackend() = default;

  virtual BackendKind kind() const = 0;
  virtual const VoiceCatalog& catalog() const = 0;

  // Executables and model assets present. ConfigurationError otherwise.
  virtual bool checkAvailable(Error& outError) const = 0;

  // Render non-empty text. Failures (engine error, missing assets, timeout,
  // unreadable output, empty output) are SynthesisError; never an empty clip.
  // Safe to call from several threads at once.
  virtual bool render(const std::string& text, const VoiceProfile& voice, AudioClip& out, Error& outError) = 0;
};

// Backend selected by settings.tts.backend. Does not check availability.
std::unique_ptr<TtsBackend> createBackend(const Settings& settings, Error& outError);

} // namespace talevox

#endif // TALEVOX_TTS_TTS_BACKEND_H
