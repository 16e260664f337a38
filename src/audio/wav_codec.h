/*
TaleVox — WAV encoding and decoding.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_AUDIO_WAV_CODEC_H
#define TALEVOX_AUDIO_WAV_CODEC_H

#include <cstdint>
#include <string>
#include <vector>

#include "../core/audio_clip.h"

namespace talevox {

// Canonical 44-byte-header PCM WAV for a clip.
std::vector<std::uint8_t> encodeWav(const AudioClip& clip);

bool writeWavFile(const std::string& path, const AudioClip& clip, std::string& outError);

// Parse a RIFF/WAVE stream into a clip.
//
// Walks the chunk list and ignores anything that is not "fmt " or "data"
// (LIST, FLLR padding, fact, ...). Accepts integer PCM (8/16/24/32-bit),
// WAVE_FORMAT_EXTENSIBLE wrapping integer PCM, and 32-bit IEEE float, which
// is converted to 16-bit. A data chunk whose declared size runs past the end
// of the stream, or that is not a whole number of frames, is an error.
bool decodeWav(const std::vector<std::uint8_t>& bytes, AudioClip& out, std::string& outError);

bool readWavFile(const std::string& path, AudioClip& out, std::string& outError);

} // namespace talevox

#endif // TALEVOX_AUDIO_WAV_CODEC_H
