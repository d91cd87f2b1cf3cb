#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "progress.h"

TEST(IndexerProgress, JsonUsesWireNames)
{
  IndexerProgress p;
  p.running = true;
  p.phase = IndexerProgress::Phase::Embedding;
  p.currentFile = "notes.md";
  p.processed = 3;
  p.total = 10;
  p.errors = 1;
  p.lastResult = "previous";
  p.failures = { "/docs/bad.txt: timeout" };

  auto j = p.toJson();
  EXPECT_EQ(j["running"], true);
  EXPECT_EQ(j["phase"], "embedding");
  EXPECT_EQ(j["current_file"], "notes.md");
  EXPECT_EQ(j["processed"], 3);
  EXPECT_EQ(j["total"], 10);
  EXPECT_EQ(j["errors"], 1);
  EXPECT_EQ(j["last_result"], "previous");
  EXPECT_EQ(j["failures"], nlohmann::json::array({ "/docs/bad.txt: timeout" }));

  auto back = IndexerProgress::fromJson(j);
  EXPECT_EQ(back.phase, IndexerProgress::Phase::Embedding);
  EXPECT_EQ(back.currentFile, "notes.md");
  EXPECT_EQ(back.total, 10u);
  EXPECT_EQ(back.failures, p.failures);

  // Older daemons do not send the failure list.
  j.erase("failures");
  EXPECT_TRUE(IndexerProgress::fromJson(j).failures.empty());
}

TEST(IndexerProgress, UnknownPhaseReadsAsIdle)
{
  EXPECT_EQ(IndexerProgress::phaseFromStr("cleanup"), IndexerProgress::Phase::Cleanup);
  EXPECT_EQ(IndexerProgress::phaseFromStr("bogus"), IndexerProgress::Phase::Idle);
  EXPECT_THROW(IndexerProgress::fromJson(nlohmann::json::object()), nlohmann::json::exception);
}

TEST(ProgressTracker, TryBeginRunResetsCounters)
{
  ProgressTracker tracker;
  tracker.update([](IndexerProgress &p) {
    p.processed = 7;
    p.errors = 2;
    p.lastResult = "earlier run";
    p.failures = { "x: y" };
  });

  ASSERT_TRUE(tracker.tryBeginRun());
  auto p = tracker.snapshot();
  EXPECT_TRUE(p.running);
  EXPECT_EQ(p.phase, IndexerProgress::Phase::Scanning);
  EXPECT_EQ(p.processed, 0u);
  EXPECT_EQ(p.errors, 0u);
  EXPECT_TRUE(p.failures.empty());
  EXPECT_EQ(p.lastResult, "earlier run");

  EXPECT_FALSE(tracker.tryBeginRun());
}

TEST(ProgressTracker, FinishRunFreezesState)
{
  ProgressTracker tracker;
  ASSERT_TRUE(tracker.tryBeginRun());
  tracker.update([](IndexerProgress &p) {
    p.phase = IndexerProgress::Phase::Embedding;
    p.currentFile = "a.txt";
    p.processed = 1;
    p.total = 1;
  });
  tracker.finishRun("Indexed 1 files, 0 errors");

  auto p = tracker.snapshot();
  EXPECT_FALSE(p.running);
  EXPECT_FALSE(tracker.isRunning());
  EXPECT_EQ(p.phase, IndexerProgress::Phase::Idle);
  EXPECT_TRUE(p.currentFile.empty());
  EXPECT_EQ(p.processed, 1u);
  EXPECT_EQ(p.lastResult, "Indexed 1 files, 0 errors");

  EXPECT_TRUE(tracker.tryBeginRun());
}

TEST(ProgressTracker, ExactlyOneConcurrentCallerWinsTheRun)
{
  ProgressTracker tracker;
  std::atomic<int> winners{ 0 };
  std::atomic<bool> go{ false };
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&]() {
      while (!go) std::this_thread::yield();
      if (tracker.tryBeginRun()) winners++;
    });
  }
  go = true;
  for (auto &t : threads) t.join();
  EXPECT_EQ(winners, 1);
}

TEST(ProgressTracker, UpdatesFromManyThreadsAreNotLost)
{
  ProgressTracker tracker;
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      for (int k = 0; k < 1000; ++k) {
        tracker.update([](IndexerProgress &p) { p.processed++; });
      }
    });
  }
  for (auto &t : threads) t.join();
  EXPECT_EQ(tracker.snapshot().processed, 8000u);
}
