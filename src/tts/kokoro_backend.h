/*
TaleVox — Kokoro neural TTS backend.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_TTS_KOKORO_BACKEND_H
#define TALEVOX_TTS_KOKORO_BACKEND_H

#include <string>

#include "process_backend.h"

namespace talevox {

struct KokoroOptions {
  std::string executable = "kokoro-tts";
  std::string modelPath;   // kokoro-v1.0.onnx
  std::string voicesPath;  // voices-v1.0.bin
  double speed = 1.0;
};

// Runs the kokoro-tts CLI:
//   kokoro-tts <in.txt> <out.wav> --voice V --speed S --lang L --model M --voices F
// The CLI picks its reader and writer from the file extensions. Output is
// 24 kHz mono 16-bit.
class KokoroBackend final : public ProcessBackend {
public:
  KokoroBackend(KokoroOptions options, ProcessBackendOptions processOptions);

  BackendKind kind() const override { return BackendKind::Kokoro; }
  const VoiceCatalog& catalog() const override { return kokoroVoiceCatalog(); }
  bool checkAvailable(Error& outError) const override;

protected:
  std::vector<std::string> buildCommand(
    const std::string& textPath,
    const std::string& wavPath,
    const VoiceInfo& voice
  ) const override;

private:
  KokoroOptions kokoro_;
};

} // namespace talevox

#endif // TALEVOX_TTS_KOKORO_BACKEND_H
