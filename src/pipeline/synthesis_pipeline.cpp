/*
TaleVox — Per-chapter synthesis orchestration.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "synthesis_pipeline.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <thread>
#include <utility>

#include "../config/settings.h"
#include "../text/attribution.h"
#include "../util/debug_log.h"

namespace talevox {

SynthesisPipeline::SynthesisPipeline(
  std::shared_ptr<TtsBackend> backend,
  std::shared_ptr<CharacterDetector> detector,
  PipelineOptions options
)
    : backend_(std::move(backend)),
      detector_(std::move(detector)),
      options_(std::move(options)),
      assigner_(backend_->catalog(), options_.narratorVoice),
      concatenator_(options_.pauseMs),
      store_(options_.booksDir.empty() ? nullptr : std::make_unique<VoiceTableStore>(options_.booksDir)),
      pool_(options_.workers) {
  if (options_.fanout == 0) options_.fanout = 1;
}

SynthesisPipeline::~SynthesisPipeline() = default;

void SynthesisPipeline::setObserver(ProgressObserver observer) {
  std::lock_guard<std::mutex> lock(observerMutex_);
  observer_ = std::move(observer);
}

void SynthesisPipeline::notify(const std::string& key, PipelineState state, std::size_t done, std::size_t total) {
  ProgressObserver observer;
  {
    std::lock_guard<std::mutex> lock(observerMutex_);
    observer = observer_;
  }
  if (observer) observer(key, state, done, total);
}

std::shared_ptr<BookVoices> SynthesisPipeline::book(const std::string& bookId) {
  std::lock_guard<std::mutex> lock(booksMutex_);
  std::shared_ptr<BookVoices>& slot = books_[bookId];
  if (!slot) slot = std::make_shared<BookVoices>(bookId);
  return slot;
}

GenerationHandle SynthesisPipeline::submit(const ChapterRequest& request) {
  Error invalid;
  if (!request.validate(invalid)) {
    GenerationResult result;
    result.chapterKey = request.key();
    recordFailure(result, invalid);
    std::promise<GenerationResult> done;
    done.set_value(std::move(result));

    GenerationHandle handle;
    handle.chapterKey = request.key();
    handle.result = done.get_future().share();
    return handle;
  }

  GenerationRegistry::Ticket ticket = registry_.acquire(request.key());

  GenerationHandle handle;
  handle.chapterKey = ticket.key;
  handle.result = ticket.result;
  handle.joined = ticket.joined;
  if (ticket.joined) return handle;

  notify(ticket.key, PipelineState::Pending, 0, 0);
  pool_.submit([this, request, ticket]() {
    GenerationResult result;
    try {
      result = run(request, *ticket.cancel);
    } catch (const std::exception& e) {
      // Joined requesters wait on the registry; always publish something.
      result.chapterKey = ticket.key;
      Error err;
      err.set(ErrorCode::SynthesisError, std::string("Unexpected failure: ") + e.what());
      recordFailure(result, err);
    }
    registry_.complete(ticket, std::move(result));
  });
  return handle;
}

GenerationResult SynthesisPipeline::generate(const ChapterRequest& request) {
  return submit(request).wait();
}

bool SynthesisPipeline::cancel(const std::string& chapterKey) {
  const bool found = registry_.cancel(chapterKey);
  if (found) DEBUG_LOG("%s: cancel requested", chapterKey.c_str());
  return found;
}

void SynthesisPipeline::recordFailure(GenerationResult& result, const Error& error) {
  result.state = PipelineState::Failed;
  result.error = error;
  result.audio = ChapterAudio{};
  DEBUG_ERROR("%s: failed: %s", result.chapterKey.c_str(), error.describe().c_str());
  notify(result.chapterKey, PipelineState::Failed, 0, 0);
}

GenerationResult SynthesisPipeline::fail(GenerationResult& result, const Error& error) {
  recordFailure(result, error);
  return std::move(result);
}

bool SynthesisPipeline::loadVoices(BookVoices& book, Error& outError) {
  if (!store_ || book.loaded()) return true;
  BookVoiceTable stored;
  if (!store_->load(book.bookId(), stored, outError)) return false;
  assigner_.adopt(book, std::move(stored));
  return true;
}

bool SynthesisPipeline::renderWithRetry(const Segment& seg, const VoiceProfile& voice, AudioClip& out, Error& outError) {
  Error first;
  if (backend_->render(seg.text, voice, out, first)) return true;
  DEBUG_WARN("Segment %zu: %s; retrying once", seg.index, first.describe().c_str());

  Error second;
  if (backend_->render(seg.text, voice, out, second)) return true;
  return outError.set(second.code, second.message, static_cast<int>(seg.index));
}

bool SynthesisPipeline::synthesizeAll(
  const std::string& key,
  const std::vector<Segment>& segments,
  const VoiceMap& voices,
  CancelToken& cancel,
  std::vector<AudioClip>& outClips,
  Error& outError
) {
  const std::size_t total = segments.size();
  outClips.assign(total, AudioClip{});

  std::atomic<std::size_t> nextIndex{0};
  std::atomic<std::size_t> done{0};
  std::atomic<bool> failed{false};
  std::mutex errorMutex;
  Error firstError;

  auto worker = [&]() {
    for (;;) {
      // Nothing new is started once the run failed or was cancelled; renders
      // already running finish.
      if (failed.load() || cancel.isCancelled()) return;
      const std::size_t i = nextIndex.fetch_add(1);
      if (i >= total) return;

      const Segment& seg = segments[i];
      auto it = voices.find(seg.speakerKey);
      const VoiceProfile& voice = it != voices.end() ? it->second : voices.at(kNarratorKey);

      Error err;
      AudioClip clip;
      if (!renderWithRetry(seg, voice, clip, err)) {
        std::lock_guard<std::mutex> lock(errorMutex);
        // Keep the lowest failing segment so the reason is deterministic.
        if (!failed.load() || err.segmentIndex < firstError.segmentIndex) firstError = err;
        failed.store(true);
        continue;
      }
      outClips[i] = std::move(clip);
      notify(key, PipelineState::Synthesizing, done.fetch_add(1) + 1, total);
    }
  };

  const std::size_t threads = std::min(options_.fanout, total);
  std::vector<std::thread> pool;
  pool.reserve(threads > 0 ? threads - 1 : 0);
  for (std::size_t t = 1; t < threads; ++t) pool.emplace_back(worker);
  worker();
  for (std::thread& t : pool) t.join();

  if (failed.load()) {
    outError = firstError;
    outClips.clear();
    return false;
  }
  if (cancel.isCancelled()) {
    outClips.clear();
    return outError.set(ErrorCode::Cancelled, "Generation cancelled");
  }
  return true;
}

GenerationResult SynthesisPipeline::run(const ChapterRequest& request, CancelToken& cancel) {
  GenerationResult result;
  result.chapterKey = request.key();
  const std::string& key = result.chapterKey;
  const auto started = std::chrono::steady_clock::now();
  Error err;

  auto cancelled = [&]() {
    if (!cancel.isCancelled()) return false;
    err.set(ErrorCode::Cancelled, "Generation cancelled");
    return true;
  };

  // Fail fast on a backend that cannot run at all.
  if (!backend_->checkAvailable(err)) return fail(result, err);
  if (cancelled()) return fail(result, err);

  result.state = PipelineState::Segmenting;
  notify(key, result.state, 0, 0);
  {
    TextSegmenter segmenter(request.text, options_.segmenter);
    result.segments = segmenter.segmentAll();
  }
  if (result.segments.empty()) {
    err.set(ErrorCode::InvalidInput, "Chapter has no speakable text");
    return fail(result, err);
  }
  if (cancelled()) return fail(result, err);

  result.state = PipelineState::Detecting;
  notify(key, result.state, 0, 0);
  result.characters = detector_->detectCached(key, request.text, result.segments, &result.detectionCached);
  if (cancelled()) return fail(result, err);

  result.state = PipelineState::Assigning;
  notify(key, result.state, 0, 0);
  std::shared_ptr<BookVoices> bookVoices = book(request.bookId);
  if (!loadVoices(*bookVoices, err)) return fail(result, err);
  VoiceMap voices;
  if (!assigner_.assign(*bookVoices, result.characters, voices, err)) return fail(result, err);

  // Unresolved speakers read as the narrator.
  for (Segment& seg : result.segments) {
    std::string speaker = kNarratorKey;
    if (seg.kind == SegmentKind::Dialogue && !seg.attributedName.empty()) {
      const std::string k = canonicalKey(seg.attributedName);
      if (voices.count(k) != 0) speaker = k;
    }
    seg.speakerKey = speaker;
  }
  if (cancelled()) return fail(result, err);

  result.state = PipelineState::Synthesizing;
  notify(key, result.state, 0, result.segments.size());
  std::vector<AudioClip> clips;
  if (!synthesizeAll(key, result.segments, voices, cancel, clips, err)) return fail(result, err);

  result.state = PipelineState::Concatenating;
  notify(key, result.state, result.segments.size(), result.segments.size());
  if (!concatenator_.concatenate(clips, result.audio, err)) return fail(result, err);
  result.audio.chapterKey = key;

  if (store_) {
    if (!assigner_.persist(*bookVoices, *store_, result.voices, err)) return fail(result, err);
  } else {
    result.voices = bookVoices->snapshot();
  }

  result.state = PipelineState::Ready;
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
  DEBUG_LOG("%s: ready, %zu segments, %.2f s of audio in %lld ms",
            key.c_str(), result.segments.size(), result.audio.clip.durationSeconds(), static_cast<long long>(ms));
  notify(key, result.state, result.segments.size(), result.segments.size());
  return result;
}

std::unique_ptr<SynthesisPipeline> createPipeline(const Settings& settings, bool useLlm, Error& outError) {
  std::unique_ptr<TtsBackend> backend = createBackend(settings, outError);
  if (!backend) return nullptr;

  std::shared_ptr<LlmClient> llm;
  if (useLlm && settings.llm.enabled) {
    llm = std::make_shared<OllamaClient>(settings.llm.url, settings.llm.model, settings.llm.timeoutSeconds);
  }
  DetectorOptions detect;
  detect.useLlm = llm != nullptr;
  detect.llmTimeout = std::chrono::seconds(settings.llm.timeoutSeconds);
  detect.excerptChars = settings.llm.excerptChars;

  PipelineOptions options;
  options.fanout = static_cast<std::size_t>(settings.pipeline.fanout);
  options.workers = static_cast<std::size_t>(settings.pipeline.workers);
  options.pauseMs = settings.pipeline.pauseMs;
  options.segmenter.maxChunkChars = settings.tts.maxChunkChars;
  options.narratorVoice = settings.narratorVoice;
  options.booksDir = settings.booksDir();

  return std::make_unique<SynthesisPipeline>(
    std::shared_ptr<TtsBackend>(std::move(backend)),
    std::make_shared<CharacterDetector>(std::move(llm), detect),
    std::move(options)
  );
}

} // namespace talevox
