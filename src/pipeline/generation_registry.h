/*
TaleVox — In-flight chapter generations keyed by chapter.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TALEVOX_PIPELINE_GENERATION_REGISTRY_H
#define TALEVOX_PIPELINE_GENERATION_REGISTRY_H

#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "generation.h"

namespace talevox {

// At most one generation per chapter key. The first requester becomes the
// owner and must call complete(); later requesters attach to its future.
class GenerationRegistry {
public:
  struct Ticket {
    std::string key;
    std::shared_future<GenerationResult> result;
    std::shared_ptr<CancelToken> cancel;
    // False for the requester that has to run the generation.
    bool joined = false;
    std::uint64_t id = 0;
  };

  Ticket acquire(const std::string& key);

  // Publish the owner's result and drop the entry.
  void complete(const Ticket& owner, GenerationResult result);

  // Flag the in-flight run for `key`. False if none.
  bool cancel(const std::string& key);

  bool isInFlight(const std::string& key) const;
  std::size_t inFlightCount() const;

private:
  struct Entry {
    std::uint64_t id = 0;
    std::shared_ptr<std::promise<GenerationResult>> promise;
    std::shared_future<GenerationResult> result;
    std::shared_ptr<CancelToken> cancel;
  };

  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
  std::uint64_t nextId_ = 1;
};

} // namespace talevox

#endif // TALEVOX_PIPELINE_GENERATION_REGISTRY_H
