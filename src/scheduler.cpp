#include "scheduler.h"
#include "settings.h"
#include "progress.h"
#include "cutils.h"
#include <utils_log/logger.hpp>

BackgroundIndexer::BackgroundIndexer(const Settings &settings, VectorStore &store, ProgressTracker &progress,
  const EmbeddingProvider &embedder, const TextExtractor &extractor)
  : settings_(settings)
  , store_(store)
  , progress_(progress)
  , embedder_(embedder)
  , extractor_(extractor)
{
}

BackgroundIndexer::~BackgroundIndexer()
{
  stop();
}

void BackgroundIndexer::start(std::chrono::milliseconds initialDelay, std::chrono::milliseconds interval)
{
  if (worker_.joinable()) return;
  if (!settings_.vectorSearchEnabled()) {
    LOG_MSG << "Vector search is disabled; background indexer not started";
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopRequested_ = false;
  }
  worker_ = std::thread([this, initialDelay, interval]() {
    if (!waitFor(initialDelay)) return;
    while (true) {
      try {
        runOnce();
      } catch (const std::exception &e) {
        LOG_MSG << "[ERROR] Background indexing failed:" << e.what();
      }
      if (!waitFor(interval)) return;
    }
    });
}

void BackgroundIndexer::stop()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopRequested_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

bool BackgroundIndexer::waitFor(std::chrono::milliseconds d)
{
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, d, [this] { return stopRequested_; });
}

std::optional<IndexStats> BackgroundIndexer::runOnce()
{
  if (!settings_.vectorSearchEnabled()) return std::nullopt;
  if (!progress_.tryBeginRun()) {
    LOG_MSG << "Indexer is already running; skipping this tick";
    return std::nullopt;
  }
  Indexer indexer(store_, progress_, embedder_, extractor_);
  auto stats = indexer.runIncremental(settings_.indexerConfig());
  LOG_MSG << "[" << utils::currentTimestamp() << "] indexed=" << stats.indexed << "skipped=" << stats.skipped
    << "removed=" << stats.removed << "errors=" << stats.errors;
  std::lock_guard<std::mutex> lock(mutex_);
  ++completedRuns_;
  return stats;
}

size_t BackgroundIndexer::completedRuns() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return completedRuns_;
}
