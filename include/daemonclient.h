#ifndef _DAEMONCLIENT_H_
#define _DAEMONCLIENT_H_

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "progress.h"
#include "health.h"
#include "daemon.h"

// Transport failure talking to the daemon.
class DaemonError : public std::runtime_error {
public:
  enum class Kind { Connect, Timeout, Status, Parse };

  DaemonError(Kind kind, const std::string &message, int status = 0)
    : std::runtime_error(message), kind_(kind), status_(status) {}

  Kind kind() const { return kind_; }
  int status() const { return status_; }

private:
  Kind kind_;
  int status_;
};

struct DaemonStatus {
  std::string version;
  uint32_t pid = 0;
  uint64_t uptimeSecs = 0;
};

// One fresh connection per call. `timeoutMs` bounds each call from connect
// to the last response byte.
class DaemonClient {
public:
  explicit DaemonClient(const std::string &socketPath, size_t timeoutMs = 5000);

  static std::string defaultSocketPath();

  DaemonStatus status() const;
  void shutdown() const;
  IndexerProgress progress() const;
  // "Indexer is already running" comes back as started=false, not as an error.
  StartIndexerResult startIndexer(bool full) const;
  HealthStatus health() const;
  StatsInfo stats() const;

  const std::string &socketPath() const { return socketPath_; }

private:
  nlohmann::json request(const std::string &method, const std::string &path, const std::string &body = {}) const;

  std::string socketPath_;
  size_t timeoutMs_;
};

struct PollOptions {
  std::chrono::milliseconds interval{ 200 };
  // Consecutive transport failures tolerated before giving up.
  size_t maxConsecutiveErrors = 5;
};

// Polls progress until `running` is false. `onChange` sees every snapshot whose
// phase or counters differ from the previous one. Throws DaemonError once
// `maxConsecutiveErrors` polls in a row fail.
IndexerProgress pollUntilDone(const DaemonClient &client,
  const std::function<void(const IndexerProgress &)> &onChange,
  const PollOptions &options = {});

// Pid of the daemon owning `runtimeDir`, clearing a stale pid file on the way.
std::optional<uint32_t> runningDaemonPid(const std::string &runtimeDir);

#endif // _DAEMONCLIENT_H_
