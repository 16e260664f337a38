/*
TaleVox — Merges per-segment clips into one chapter track.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_AUDIO_AUDIO_CONCATENATOR_H
#define TALEVOX_AUDIO_AUDIO_CONCATENATOR_H

#include <vector>

#include "../core/audio_clip.h"
#include "../core/error.h"

namespace talevox {

// Convert a well-formed clip to another channel count / bit depth.
// Mono -> stereo duplicates the channel, stereo -> mono averages.
// Returns false (with outError) if the source clip is inconsistent.
bool convertClipFormat(const AudioClip& in, int channelCount, int bitDepth, AudioClip& out, std::string& outError);

class AudioConcatenator {
public:
  explicit AudioConcatenator(int pauseMs = 300) : pauseMs_(pauseMs < 0 ? 0 : pauseMs) {}

  // Merge `clips` in the given order into `out.clip`.
  //
  // Every clip must be internally consistent, non-empty and share the first
  // clip's sample rate; otherwise FormatError is returned with the offending
  // position in segmentIndex. Mixed channel counts / bit depths are
  // normalized to the widest format present before merging.
  bool concatenate(const std::vector<AudioClip>& clips, ChapterAudio& out, Error& outError) const;

  int pauseMs() const { return pauseMs_; }

private:
  int pauseMs_;
};

} // namespace talevox

#endif // TALEVOX_AUDIO_AUDIO_CONCATENATOR_H
