/*
TaleVox — In-memory PCM clip and chapter audio.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_CORE_AUDIO_CLIP_H
#define TALEVOX_CORE_AUDIO_CLIP_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace talevox {

// Interleaved little-endian integer PCM with its format declared alongside.
//
// 8-bit samples are unsigned (WAV convention); 16/24/32-bit are signed.
struct AudioClip {
  std::vector<std::uint8_t> pcm;
  int sampleRate = 0;
  int channelCount = 0;
  int bitDepth = 0;

  int bytesPerSample() const { return bitDepth / 8; }
  int blockAlign() const { return channelCount * bytesPerSample(); }

  // Number of frames (one sample per channel), assuming a well-formed clip.
  std::size_t frameCount() const;
  double durationSeconds() const;

  // True when the declared header fields are usable and the payload length is
  // a whole number of frames. On failure `outWhy` says which field is wrong.
  bool isConsistent(std::string& outWhy) const;
};

// Final merged artifact for one chapter; replaced wholesale on regeneration.
struct ChapterAudio {
  std::string chapterKey;
  AudioClip clip;
  std::size_t segmentCount = 0;

  // Complete RIFF/WAVE byte stream of `clip`.
  std::vector<std::uint8_t> toWav() const;
};

} // namespace talevox

#endif // TALEVOX_CORE_AUDIO_CLIP_H
