#include "daemon.h"
#include "httpserver.h"
#include "indexer.h"
#include "pidfile.h"
#include "settings.h"
#include "vectorstore.h"
#include "cutils.h"
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utils_log/logger.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

struct Daemon::Impl {
  DaemonServices services_;
  std::string runtimeDir_;
  DaemonState state_;
  std::unique_ptr<PidFile> pidFile_;
  std::unique_ptr<HttpServer> server_;
  std::thread serverThread_;

  std::mutex indexerMutex_;
  std::thread indexerThread_;

  std::atomic_bool shutdownRequested_{ false };
  std::mutex shutdownMutex_;
  std::condition_variable shutdownCv_;
  bool started_ = false;

  Impl(const DaemonServices &s, const std::string &dir) : services_(s), runtimeDir_(dir) {}
};

Daemon::Daemon(const DaemonServices &services, const std::string &runtimeDir)
  : imp(new Impl(services, runtimeDir))
{
  imp->pidFile_ = std::make_unique<PidFile>(pidPathIn(runtimeDir));
}

Daemon::~Daemon()
{
  try {
    stop();
  } catch (const std::exception &e) {
    LOG_MSG << "Error while stopping daemon:" << e.what();
  }
}

std::string Daemon::socketPathIn(const std::string &runtimeDir)
{
  return (fs::path(runtimeDir) / "burrow.sock").string();
}

std::string Daemon::pidPathIn(const std::string &runtimeDir)
{
  return (fs::path(runtimeDir) / "burrow.pid").string();
}

std::string Daemon::socketPath() const
{
  return socketPathIn(imp->runtimeDir_);
}

std::string Daemon::pidPath() const
{
  return pidPathIn(imp->runtimeDir_);
}

bool Daemon::start()
{
  if (imp->started_) return true;
  fs::create_directories(imp->runtimeDir_);

  if (!imp->pidFile_->acquire()) {
    LOG_MSG << "Another daemon owns" << imp->runtimeDir_;
    return false;
  }

  // Holding the lease makes any socket file left here stale.
  std::error_code ec;
  if (fs::exists(socketPath(), ec)) {
    LOG_MSG << "Removing stale socket" << socketPath();
    fs::remove(socketPath(), ec);
  }

  imp->server_ = std::make_unique<HttpServer>(*this);
  if (!imp->server_->bindToSocket(socketPath())) {
    imp->server_.reset();
    imp->pidFile_->release();
    throw std::runtime_error("Failed to bind daemon socket " + socketPath());
  }

  imp->state_.startedAt = std::chrono::steady_clock::now();
  imp->shutdownRequested_ = false;
  imp->serverThread_ = std::thread([this]() {
    try {
      imp->server_->startServer();
    } catch (const std::exception &e) {
      LOG_MSG << "[ERROR] Daemon server failed:" << e.what();
    }
    requestShutdown();
    });
  imp->server_->waitUntilReady();
  imp->started_ = true;
  LOG_MSG << "Daemon started with pid" << utils::currentProcessId();
  return true;
}

void Daemon::waitForShutdown(const std::function<bool()> &externalStop)
{
  std::unique_lock<std::mutex> lock(imp->shutdownMutex_);
  while (!imp->shutdownRequested_) {
    if (externalStop && externalStop()) {
      LOG_MSG << "Termination signal received";
      break;
    }
    imp->shutdownCv_.wait_for(lock, std::chrono::milliseconds(50));
  }
}

void Daemon::stop()
{
  if (!imp->started_) return;
  imp->started_ = false;
  LOG_MSG << "Shutting down gracefully...";

  imp->server_->stop();
  if (imp->serverThread_.joinable()) imp->serverThread_.join();

  {
    std::lock_guard<std::mutex> lock(imp->indexerMutex_);
    if (imp->indexerThread_.joinable()) {
      if (imp->state_.progress.isRunning()) {
        LOG_MSG << "Waiting for the running indexer to finish...";
      }
      imp->indexerThread_.join();
    }
  }
  imp->server_.reset();

  std::error_code ec;
  fs::remove(socketPath(), ec);
  imp->pidFile_->release();
  LOG_MSG << "Shutdown complete.";
}

bool Daemon::run(const std::function<bool()> &externalStop)
{
  if (!start()) return false;
  try {
    waitForShutdown(externalStop);
  } catch (...) {
    stop();
    throw;
  }
  stop();
  return true;
}

void Daemon::requestShutdown()
{
  {
    std::lock_guard<std::mutex> lock(imp->shutdownMutex_);
    imp->shutdownRequested_ = true;
  }
  imp->shutdownCv_.notify_all();
}

bool Daemon::shutdownRequested() const
{
  return imp->shutdownRequested_;
}

size_t Daemon::uptimeSeconds() const
{
  auto elapsed = std::chrono::steady_clock::now() - imp->state_.startedAt;
  return static_cast<size_t>(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count());
}

json Daemon::statusJson() const
{
  return {
    {"version", BURROW_VERSION},
    {"pid", utils::currentProcessId()},
    {"uptime_secs", uptimeSeconds()}
  };
}

StartIndexerResult Daemon::startIndexer(bool full)
{
  const auto &settings = imp->services_.settings;
  if (!settings.vectorSearchEnabled()) {
    return { false, "Vector search is disabled in config" };
  }
  auto cfg = settings.indexerConfig();
  // Claiming the run slot is atomic, so concurrent requests cannot both start a run.
  if (!imp->state_.progress.tryBeginRun()) {
    return { false, "Indexer is already running" };
  }

  std::lock_guard<std::mutex> lock(imp->indexerMutex_);
  // A previous run has already called finishRun; its thread is about to exit.
  if (imp->indexerThread_.joinable()) imp->indexerThread_.join();

  try {
    imp->indexerThread_ = std::thread([this, full, cfg]() {
      auto &s = imp->services_;
      Indexer indexer(s.store, imp->state_.progress, s.embedder, s.extractor);
      try {
        auto stats = full ? indexer.runFull(cfg) : indexer.runIncremental(cfg);
        LOG_MSG << "Daemon indexer run complete (" << (full ? "reindex" : "update") << "):"
          << "indexed" << stats.indexed << "skipped" << stats.skipped
          << "removed" << stats.removed << "errors" << stats.errors;
      } catch (const std::exception &e) {
        LOG_MSG << "[ERROR] Daemon indexer run failed:" << e.what();
      }
      });
  } catch (const std::exception &e) {
    imp->state_.progress.finishRun(std::string("Failed to start indexer: ") + e.what());
    throw;
  }

  return { true, full ? "Reindex started" : "Incremental update started" };
}

IndexerProgress Daemon::progress() const
{
  return imp->state_.progress.snapshot();
}

HealthStatus Daemon::health() const
{
  const auto &s = imp->services_;
  return checkHealth(s.settings, s.ollama, &s.store, imp->state_.progress.isRunning());
}

StatsInfo Daemon::stats() const
{
  const auto &s = imp->services_;
  return collectStats(s.store, s.historyDbPath);
}
