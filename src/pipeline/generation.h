/*
TaleVox — Chapter generation requests, states and results.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_PIPELINE_GENERATION_H
#define TALEVOX_PIPELINE_GENERATION_H

#include <atomic>
#include <cstddef>
#include <future>
#include <string>
#include <vector>

#include "../core/audio_clip.h"
#include "../core/error.h"
#include "../core/segment.h"
#include "../detect/character_detector.h"
#include "../voices/voice_table.h"

namespace talevox {

// Pending -> Segmenting -> Detecting -> Assigning -> Synthesizing(i of N)
//         -> Concatenating -> Ready, or Failed(reason) from any state.
enum class PipelineState {
  Pending,
  Segmenting,
  Detecting,
  Assigning,
  Synthesizing,
  Concatenating,
  Ready,
  Failed,
};

const char* pipelineStateName(PipelineState state);

struct ChapterRequest {
  std::string bookId;
  std::string chapterId;
  // Plain UTF-8 chapter text.
  std::string text;

  // Identity used for de-duplication and the detection cache. Unique only
  // for requests that pass validate().
  std::string key() const { return bookId + "/" + chapterId; }

  // Both ids non-empty, not "." or "..", and free of '/' and '\\'.
  bool validate(Error& outError) const;
};

// Everything a finished run hands back. Either Ready with complete audio, or
// Failed with a reason; never partial audio.
struct GenerationResult {
  std::string chapterKey;
  PipelineState state = PipelineState::Pending;
  Error error;

  ChapterAudio audio;
  // Segments with speakerKey resolved.
  std::vector<Segment> segments;
  CharacterSet characters;
  bool detectionCached = false;
  // Book table after this run's assignments.
  BookVoiceTable voices;

  bool ok() const { return state == PipelineState::Ready; }
};

struct CancelToken {
  std::atomic<bool> cancelled{false};

  void cancel() { cancelled.store(true); }
  bool isCancelled() const { return cancelled.load(); }
};

// What submit() hands to each requester. Duplicate requests for a chapter in
// flight get the same future (joined == true).
struct GenerationHandle {
  std::string chapterKey;
  std::shared_future<GenerationResult> result;
  bool joined = false;

  const GenerationResult& wait() const { return result.get(); }
};

} // namespace talevox

#endif // TALEVOX_PIPELINE_GENERATION_H
