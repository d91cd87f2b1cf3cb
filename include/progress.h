#ifndef _PROGRESS_H_
#define _PROGRESS_H_

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct IndexerProgress {
  enum class Phase { Idle, Scanning, Embedding, Cleanup };

  bool running = false;
  Phase phase = Phase::Idle;
  std::string currentFile;
  size_t processed = 0;
  size_t total = 0;
  size_t errors = 0;
  std::string lastResult;
  // "<path>: <message>" per failed file of the current or last run, capped at kMaxReportedFailures.
  std::vector<std::string> failures;

  static constexpr size_t kMaxReportedFailures = 100;

  static std::string phaseToStr(Phase p);
  static Phase phaseFromStr(const std::string &s);

  nlohmann::json toJson() const;
  static IndexerProgress fromJson(const nlohmann::json &j);
};

// Run state shared between the indexer and any number of pollers.
// Mutations are short closures executed under the tracker's lock; callers
// must not block inside them.
class ProgressTracker {
public:
  ProgressTracker() = default;

  IndexerProgress snapshot() const;
  void update(const std::function<void(IndexerProgress &)> &fn);

  // Claims the single run slot: flips `running` on and resets the counters
  // only if no run is active. Returns false when another run owns the slot.
  bool tryBeginRun();

  // Freezes the state at the end of a run and releases the run slot.
  void finishRun(const std::string &summary);

  bool isRunning() const;

private:
  ProgressTracker(const ProgressTracker &) = delete;
  ProgressTracker &operator =(const ProgressTracker &) = delete;

  mutable std::mutex mutex_;
  IndexerProgress state_;
};

#endif // _PROGRESS_H_
