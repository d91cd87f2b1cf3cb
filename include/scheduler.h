#ifndef _SCHEDULER_H_
#define _SCHEDULER_H_

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include "indexer.h"

class Settings;

// Runs an incremental pass after `initialDelay`, then every `interval`.
// A tick is skipped when another run already holds the tracker.
class BackgroundIndexer {
public:
  BackgroundIndexer(const Settings &settings, VectorStore &store, ProgressTracker &progress,
    const EmbeddingProvider &embedder, const TextExtractor &extractor);
  ~BackgroundIndexer();

  void start(std::chrono::milliseconds initialDelay, std::chrono::milliseconds interval);
  void stop();
  bool isStarted() const { return worker_.joinable(); }

  // One pass. Returns nothing when vector search is disabled or a run is active.
  std::optional<IndexStats> runOnce();

  size_t completedRuns() const;

private:
  BackgroundIndexer(const BackgroundIndexer &) = delete;
  BackgroundIndexer &operator =(const BackgroundIndexer &) = delete;

  // Sleeps up to `d`; returns false when stop() was requested meanwhile.
  bool waitFor(std::chrono::milliseconds d);

  const Settings &settings_;
  VectorStore &store_;
  ProgressTracker &progress_;
  const EmbeddingProvider &embedder_;
  const TextExtractor &extractor_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopRequested_ = false;
  size_t completedRuns_ = 0;
  std::thread worker_;
};

#endif // _SCHEDULER_H_
