/*
TaleVox — macOS system speech backend.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_TTS_MAC_SPEECH_BACKEND_H
#define TALEVOX_TTS_MAC_SPEECH_BACKEND_H

#include <string>

#include "process_backend.h"

namespace talevox {

struct MacSpeechOptions {
  std::string executable = "say";
  double speed = 1.0;
  int sampleRate = 24000;
};

// Runs `say -v NAME -r WPM -f in.txt -o out.wav --file-format=WAVE
// --data-format=LEI16@RATE`. 1.0 speed is 180 words per minute.
class MacSpeechBackend final : public ProcessBackend {
public:
  MacSpeechBackend(MacSpeechOptions options, ProcessBackendOptions processOptions);

  BackendKind kind() const override { return BackendKind::MacSpeech; }
  const VoiceCatalog& catalog() const override { return sayVoiceCatalog(); }
  bool checkAvailable(Error& outError) const override;

protected:
  std::vector<std::string> buildCommand(
    const std::string& textPath,
    const std::string& wavPath,
    const VoiceInfo& voice
  ) const override;

private:
  MacSpeechOptions say_;
};

} // namespace talevox

#endif // TALEVOX_TTS_MAC_SPEECH_BACKEND_H
