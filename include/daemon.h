#ifndef _DAEMON_H_
#define _DAEMON_H_

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "progress.h"
#include "health.h"

class Settings;
class VectorStore;
class EmbeddingProvider;
class EmbeddingClient;
class TextExtractor;

// Collaborators the daemon uses but does not own.
struct DaemonServices {
  const Settings &settings;
  VectorStore &store;
  const EmbeddingProvider &embedder;
  const TextExtractor &extractor;
  const EmbeddingClient &ollama;
  std::string historyDbPath;
};

struct DaemonState {
  ProgressTracker progress;
  std::chrono::steady_clock::time_point startedAt = std::chrono::steady_clock::now();
};

struct StartIndexerResult {
  bool started = false;
  std::string message;

  nlohmann::json toJson() const { return { {"started", started}, {"message", message} }; }
};

class Daemon {
public:
  Daemon(const DaemonServices &services, const std::string &runtimeDir);
  ~Daemon();

  static std::string socketPathIn(const std::string &runtimeDir);
  static std::string pidPathIn(const std::string &runtimeDir);

  // Takes the pid lease, binds the socket and starts serving in the background.
  // Returns false when another live daemon owns the runtime directory.
  bool start();

  // Blocks until a shutdown request arrives or `externalStop` returns true.
  void waitForShutdown(const std::function<bool()> &externalStop = {});

  // Stops serving, waits for an in-flight indexing run, removes the socket and pid file.
  void stop();

  // start() + waitForShutdown() + stop().
  bool run(const std::function<bool()> &externalStop = {});

  void requestShutdown();
  bool shutdownRequested() const;

  nlohmann::json statusJson() const;
  StartIndexerResult startIndexer(bool full);
  IndexerProgress progress() const;
  HealthStatus health() const;
  StatsInfo stats() const;
  size_t uptimeSeconds() const;

  std::string socketPath() const;
  std::string pidPath() const;

private:
  Daemon(const Daemon &) = delete;
  Daemon &operator =(const Daemon &) = delete;

  struct Impl;
  std::unique_ptr<Impl> imp;
};

#endif // _DAEMON_H_
