/*
TaleVox — GenerationRegistry tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "pipeline/generation_registry.h"
#include "pipeline/worker_pool.h"

using namespace talevox;

TEST(GenerationRegistry, SecondRequesterJoins) {
  GenerationRegistry reg;
  const GenerationRegistry::Ticket owner = reg.acquire("b/c1");
  const GenerationRegistry::Ticket joiner = reg.acquire("b/c1");
  const GenerationRegistry::Ticket other = reg.acquire("b/c2");

  EXPECT_FALSE(owner.joined);
  EXPECT_TRUE(joiner.joined);
  EXPECT_FALSE(other.joined);
  EXPECT_EQ(owner.id, joiner.id);
  EXPECT_NE(owner.id, other.id);
  EXPECT_EQ(reg.inFlightCount(), 2u);

  GenerationResult r;
  r.chapterKey = "b/c1";
  r.state = PipelineState::Ready;
  reg.complete(owner, r);

  ASSERT_EQ(joiner.result.wait_for(std::chrono::seconds(1)), std::future_status::ready);
  EXPECT_EQ(joiner.result.get().state, PipelineState::Ready);
  EXPECT_EQ(owner.result.get().chapterKey, "b/c1");
  EXPECT_FALSE(reg.isInFlight("b/c1"));
  EXPECT_TRUE(reg.isInFlight("b/c2"));

  // A finished key starts a fresh generation.
  EXPECT_FALSE(reg.acquire("b/c1").joined);
}

TEST(GenerationRegistry, CancelReachesEveryRequester) {
  GenerationRegistry reg;
  EXPECT_FALSE(reg.cancel("b/none"));

  const GenerationRegistry::Ticket owner = reg.acquire("b/c1");
  const GenerationRegistry::Ticket joiner = reg.acquire("b/c1");
  EXPECT_TRUE(reg.cancel("b/c1"));
  EXPECT_TRUE(owner.cancel->isCancelled());
  EXPECT_TRUE(joiner.cancel->isCancelled());
}

TEST(GenerationRegistry, StaleOwnerCannotCompleteNewerRun) {
  GenerationRegistry reg;
  const GenerationRegistry::Ticket first = reg.acquire("b/c1");
  reg.complete(first, GenerationResult());
  const GenerationRegistry::Ticket second = reg.acquire("b/c1");

  reg.complete(first, GenerationResult());
  EXPECT_TRUE(reg.isInFlight("b/c1"));
  EXPECT_EQ(second.result.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);

  reg.complete(second, GenerationResult());
  EXPECT_EQ(reg.inFlightCount(), 0u);
}

TEST(WorkerPool, RunsEverythingBeforeShutdown) {
  std::atomic<int> ran{0};
  std::vector<std::future<int>> results;
  {
    WorkerPool pool(2);
    EXPECT_EQ(pool.size(), 2u);
    for (int i = 0; i < 20; ++i) {
      results.push_back(pool.submit([i, &ran]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        ++ran;
        return i * i;
      }));
    }
  }
  EXPECT_EQ(ran.load(), 20);
  for (int i = 0; i < 20; ++i) EXPECT_EQ(results[static_cast<std::size_t>(i)].get(), i * i);

  WorkerPool automatic(0);
  EXPECT_GE(automatic.size(), 1u);
}
