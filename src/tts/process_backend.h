/*
TaleVox — Backends that run an external engine per render.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_TTS_PROCESS_BACKEND_H
#define TALEVOX_TTS_PROCESS_BACKEND_H

#include <string>
#include <utility>
#include <vector>

#include "tts_backend.h"

namespace talevox {

struct ProcessBackendOptions {
  // A hung engine is killed after this long.
  int timeoutMs = 120000;
  // Where the per-render .txt / .wav files go. Empty = $TMPDIR.
  std::string scratchDir;
};

// Common render flow for engines driven as "engine <in.txt> ... <out.wav>":
// stage the text in its own .txt scratch file, give the engine a separate
// .wav scratch path, run it under the timeout, decode the WAV. Both scratch
// files are removed on every exit path.
class ProcessBackend : public TtsBackend {
public:
  bool render(const std::string& text, const VoiceProfile& voice, AudioClip& out, Error& outError) final;

protected:
  explicit ProcessBackend(ProcessBackendOptions options) : options_(std::move(options)) {}

  virtual std::vector<std::string> buildCommand(
    const std::string& textPath,
    const std::string& wavPath,
    const VoiceInfo& voice
  ) const = 0;

  // "kokoro", "say" ... for messages and scratch file names.
  const char* engineName() const { return backendKindName(kind()); }

  const ProcessBackendOptions& options() const { return options_; }

  // ConfigurationError unless `executable` resolves on PATH.
  bool requireExecutable(const std::string& executable, Error& outError) const;

private:
  ProcessBackendOptions options_;
};

} // namespace talevox

#endif // TALEVOX_TTS_PROCESS_BACKEND_H
