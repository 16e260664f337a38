/*
TaleVox — eSpeak NG system speech backend.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_TTS_ESPEAK_BACKEND_H
#define TALEVOX_TTS_ESPEAK_BACKEND_H

#include <string>

#include "process_backend.h"

namespace talevox {

struct EspeakOptions {
  std::string executable = "espeak-ng";
  double speed = 1.0;
};

// Runs `espeak-ng -v VOICE -s WPM -f in.txt -w out.wav`. 1.0 speed is
// 175 words per minute, eSpeak's default.
class EspeakBackend final : public ProcessBackend {
public:
  EspeakBackend(EspeakOptions options, ProcessBackendOptions processOptions);

  BackendKind kind() const override { return BackendKind::Espeak; }
  const VoiceCatalog& catalog() const override { return espeakVoiceCatalog(); }
  bool checkAvailable(Error& outError) const override;

protected:
  std::vector<std::string> buildCommand(
    const std::string& textPath,
    const std::string& wavPath,
    const VoiceInfo& voice
  ) const override;

private:
  EspeakOptions espeak_;
};

} // namespace talevox

#endif // TALEVOX_TTS_ESPEAK_BACKEND_H
