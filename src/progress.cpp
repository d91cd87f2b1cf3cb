#include "progress.h"

using json = nlohmann::json;

std::string IndexerProgress::phaseToStr(Phase p)
{
  switch (p) {
  case Phase::Scanning: return "scanning";
  case Phase::Embedding: return "embedding";
  case Phase::Cleanup: return "cleanup";
  case Phase::Idle:
  default:
    return "idle";
  }
}

IndexerProgress::Phase IndexerProgress::phaseFromStr(const std::string &s)
{
  if (s == "scanning") return Phase::Scanning;
  if (s == "embedding") return Phase::Embedding;
  if (s == "cleanup") return Phase::Cleanup;
  return Phase::Idle;
}

json IndexerProgress::toJson() const
{
  return {
    {"running", running},
    {"phase", phaseToStr(phase)},
    {"current_file", currentFile},
    {"processed", processed},
    {"total", total},
    {"errors", errors},
    {"last_result", lastResult},
    {"failures", failures}
  };
}

IndexerProgress IndexerProgress::fromJson(const json &j)
{
  IndexerProgress p;
  p.running = j.at("running").get<bool>();
  p.phase = phaseFromStr(j.value("phase", "idle"));
  p.currentFile = j.value("current_file", "");
  p.processed = j.value("processed", size_t(0));
  p.total = j.value("total", size_t(0));
  p.errors = j.value("errors", size_t(0));
  p.lastResult = j.value("last_result", "");
  p.failures = j.value("failures", std::vector<std::string>{});
  return p;
}

//---------------------------------------------------------------------------

IndexerProgress ProgressTracker::snapshot() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void ProgressTracker::update(const std::function<void(IndexerProgress &)> &fn)
{
  std::lock_guard<std::mutex> lock(mutex_);
  fn(state_);
}

bool ProgressTracker::tryBeginRun()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.running) {
    return false;
  }
  state_.running = true;
  state_.phase = IndexerProgress::Phase::Scanning;
  state_.currentFile.clear();
  state_.processed = 0;
  state_.total = 0;
  state_.errors = 0;
  state_.failures.clear();
  return true;
}

void ProgressTracker::finishRun(const std::string &summary)
{
  std::lock_guard<std::mutex> lock(mutex_);
  state_.running = false;
  state_.phase = IndexerProgress::Phase::Idle;
  state_.currentFile.clear();
  state_.lastResult = summary;
}

bool ProgressTracker::isRunning() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.running;
}
