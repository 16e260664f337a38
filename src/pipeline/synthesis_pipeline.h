/*
TaleVox — Per-chapter synthesis orchestration.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_PIPELINE_SYNTHESIS_PIPELINE_H
#define TALEVOX_PIPELINE_SYNTHESIS_PIPELINE_H

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../audio/audio_concatenator.h"
#include "../detect/character_detector.h"
#include "../text/text_segmenter.h"
#include "../tts/tts_backend.h"
#include "../voices/voice_assigner.h"
#include "../voices/voice_table_store.h"
#include "generation.h"
#include "generation_registry.h"
#include "worker_pool.h"

namespace talevox {

struct Settings;

struct PipelineOptions {
  // Segments rendered at once within one chapter.
  std::size_t fanout = 4;
  // Chapter runs at once. 0 = hardware concurrency.
  std::size_t workers = 0;
  // Silence between segments.
  int pauseMs = 300;
  SegmenterOptions segmenter;
  // Fixed narrator voice id; empty = backend default.
  std::string narratorVoice;
  // Voice tables are loaded from / saved to "<booksDir>/<book>/voices.yaml".
  // Empty = in memory only.
  std::string booksDir;
};

// (chapter key, state, segments done, segment total). Called from worker
// threads; must not block for long.
using ProgressObserver = std::function<void(const std::string&, PipelineState, std::size_t, std::size_t)>;

// Turns chapter text into chapter audio.
//
// Each request runs on the worker pool through
// segment -> detect -> assign -> synthesize -> concatenate. A second request
// for a chapter already in flight joins the first one's result. Segment
// renders fan out up to `fanout` at once; a failed render is retried once and
// then fails the whole chapter.
class SynthesisPipeline {
public:
  SynthesisPipeline(
    std::shared_ptr<TtsBackend> backend,
    std::shared_ptr<CharacterDetector> detector,
    PipelineOptions options
  );
  ~SynthesisPipeline();

  SynthesisPipeline(const SynthesisPipeline&) = delete;
  SynthesisPipeline& operator=(const SynthesisPipeline&) = delete;

  // Start (or join) a generation. Returns at once.
  GenerationHandle submit(const ChapterRequest& request);

  // submit() and wait.
  GenerationResult generate(const ChapterRequest& request);

  // Mark the in-flight run for `chapterKey` cancelled. Renders already
  // handed to the engine finish, their audio is dropped and the run ends
  // Failed(Cancelled). False when nothing is in flight for the key.
  bool cancel(const std::string& chapterKey);

  void setObserver(ProgressObserver observer);

  // Shared state of a book, created on first use.
  std::shared_ptr<BookVoices> book(const std::string& bookId);

  VoiceAssigner& assigner() { return assigner_; }
  TtsBackend& backend() { return *backend_; }
  const GenerationRegistry& registry() const { return registry_; }

private:
  GenerationResult run(const ChapterRequest& request, CancelToken& cancel);
  void notify(const std::string& key, PipelineState state, std::size_t done, std::size_t total);
  void recordFailure(GenerationResult& result, const Error& error);
  GenerationResult fail(GenerationResult& result, const Error& error);

  bool loadVoices(BookVoices& book, Error& outError);
  bool synthesizeAll(
    const std::string& key,
    const std::vector<Segment>& segments,
    const VoiceMap& voices,
    CancelToken& cancel,
    std::vector<AudioClip>& outClips,
    Error& outError
  );
  bool renderWithRetry(const Segment& seg, const VoiceProfile& voice, AudioClip& out, Error& outError);

  std::shared_ptr<TtsBackend> backend_;
  std::shared_ptr<CharacterDetector> detector_;
  PipelineOptions options_;
  VoiceAssigner assigner_;
  AudioConcatenator concatenator_;
  std::unique_ptr<VoiceTableStore> store_;
  GenerationRegistry registry_;

  std::mutex booksMutex_;
  std::map<std::string, std::shared_ptr<BookVoices>> books_;

  std::mutex observerMutex_;
  ProgressObserver observer_;

  // Last: its destructor drains queued runs while everything above is alive.
  WorkerPool pool_;
};

// Pipeline wired from settings: backend, optional Ollama client, options.
std::unique_ptr<SynthesisPipeline> createPipeline(const Settings& settings, bool useLlm, Error& outError);

} // namespace talevox

#endif // TALEVOX_PIPELINE_SYNTHESIS_PIPELINE_H
