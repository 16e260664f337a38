/*
TaleVox — In-flight chapter generations keyed by chapter.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "generation_registry.h"

#include <utility>

#include "../util/debug_log.h"

namespace talevox {

GenerationRegistry::Ticket GenerationRegistry::acquire(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  Ticket t;
  t.key = key;
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    t.result = it->second.result;
    t.cancel = it->second.cancel;
    t.id = it->second.id;
    t.joined = true;
    DEBUG_LOG("%s: joining generation already in flight", key.c_str());
    return t;
  }

  Entry e;
  e.id = nextId_++;
  e.promise = std::make_shared<std::promise<GenerationResult>>();
  e.result = e.promise->get_future().share();
  e.cancel = std::make_shared<CancelToken>();

  t.result = e.result;
  t.cancel = e.cancel;
  t.id = e.id;
  t.joined = false;
  entries_.emplace(key, std::move(e));
  return t;
}

void GenerationRegistry::complete(const Ticket& owner, GenerationResult result) {
  std::shared_ptr<std::promise<GenerationResult>> promise;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(owner.key);
    if (it == entries_.end() || it->second.id != owner.id) return;
    promise = it->second.promise;
    entries_.erase(it);
  }
  promise->set_value(std::move(result));
}

bool GenerationRegistry::cancel(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return false;
  it->second.cancel->cancel();
  return true;
}

bool GenerationRegistry::isInFlight(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(key) != 0;
}

std::size_t GenerationRegistry::inFlightCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace talevox
