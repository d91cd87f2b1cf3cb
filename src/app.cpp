#include "app.h"
#include "settings.h"
#include "vectorstore.h"
#include "inference.h"
#include "textextract.h"
#include "indexer.h"
#include "progress.h"
#include "health.h"
#include "daemon.h"
#include "daemonclient.h"
#include "scheduler.h"
#include "search.h"
#include "cutils.h"
#include <iostream>
#include <filesystem>
#include <vector>
#include <optional>
#include <functional>
#include <algorithm>
#include <thread>
#include <stdexcept>
#include <chrono>
#include <exception>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <nlohmann/json.hpp>
#include <utils_log/logger.hpp>
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#ifndef _WIN32
#include <unistd.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#endif

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

  class SignalHandler {
  private:
    static volatile std::sig_atomic_t shutdownRequested;

  public:
    static void handleSignal(int) {
      shutdownRequested = 1;
    }

    static bool shouldShutdown() {
      return shutdownRequested != 0;
    }

    static void setup() {
      std::signal(SIGINT, handleSignal);
      std::signal(SIGTERM, handleSignal);
    }
  };
  volatile std::sig_atomic_t SignalHandler::shutdownRequested = 0;

  bool progressChanged(const IndexerProgress &a, const IndexerProgress &b) {
    return a.phase != b.phase || a.processed != b.processed || a.total != b.total || a.errors != b.errors;
  }

  std::string okFail(bool ok) {
    return ok ? "OK" : "FAIL";
  }

  std::string selfExecutablePath(const std::string &fallback) {
    std::error_code ec;
    auto p = fs::read_symlink("/proc/self/exe", ec);
    return ec ? fallback : p.string();
  }

} // anonymous namespace


struct App::Impl {
  std::unique_ptr<Settings> settings_;
  std::unique_ptr<VectorStore> store_;
  std::unique_ptr<EmbeddingClient> embedder_;
  PlainTextExtractor extractor_;
  ProgressTracker progress_;

  static std::string binaryName_;
  static std::string configPath_;

  // Opens the store for commands that can report a missing one.
  VectorStore *tryStore() {
    if (!store_) {
      try {
        store_ = std::make_unique<VectorStore>(VectorStore::defaultPath());
      } catch (const std::exception &e) {
        LOG_MSG << "Unable to open vector store:" << e.what();
        return nullptr;
      }
    }
    return store_.get();
  }
};

std::string App::Impl::binaryName_;
std::string App::Impl::configPath_;

App::App(std::unique_ptr<Settings> settings)
  : imp(new Impl)
{
  imp->settings_ = std::move(settings);
  imp->embedder_ = std::make_unique<EmbeddingClient>(*imp->settings_);
}

App::~App() = default;

const Settings &App::settings() const
{
  return *imp->settings_;
}

VectorStore &App::store()
{
  if (!imp->store_) {
    imp->store_ = std::make_unique<VectorStore>(VectorStore::defaultPath());
  }
  return *imp->store_;
}

void App::printProgressLine(const IndexerProgress &p)
{
  std::string file = p.currentFile.empty() ? std::string{} : fs::path(p.currentFile).filename().string();
  std::cout << fmt::format("\r[{}/{}] {:<9} errors: {}  {:<40.40}",
    p.processed, p.total, IndexerProgress::phaseToStr(p.phase), p.errors, file) << std::flush;
}

int App::reindex(bool quiet)
{
  return runIndexer(true, quiet);
}

int App::update(bool quiet)
{
  return runIndexer(false, quiet);
}

int App::runIndexer(bool full, bool quiet)
{
  if (!settings().vectorSearchEnabled()) {
    std::cerr << "Vector search is disabled in config\n";
    return 1;
  }

  auto runtimeDir = utils::runtimeDir();
  if (auto pid = runningDaemonPid(runtimeDir)) {
    DaemonClient client(Daemon::socketPathIn(runtimeDir));
    std::optional<StartIndexerResult> started;
    try {
      started = client.startIndexer(full);
    } catch (const DaemonError &e) {
      LOG_MSG << "Daemon" << *pid << "not reachable, indexing in-process:" << e.what();
    }
    if (started) {
      if (!started->started) {
        std::cerr << started->message << "\n";
        if (!client.progress().running) return 1;
      } else if (!quiet) {
        std::cout << started->message << " (daemon pid " << *pid << ")\n";
      }
      return runIndexerViaDaemon(client, full, quiet);
    }
  }
  return runIndexerInProcess(full, quiet);
}

int App::runIndexerViaDaemon(const DaemonClient &client, bool full, bool quiet)
{
  std::function<void(const IndexerProgress &)> onChange;
  if (!quiet) onChange = &App::printProgressLine;

  IndexerProgress result;
  try {
    result = pollUntilDone(client, onChange);
  } catch (const DaemonError &e) {
    if (!quiet) std::cout << "\n";
    std::cerr << "Lost contact with daemon: " << e.what() << "\n";
    return 1;
  }
  if (!quiet) {
    std::cout << "\n";
    if (!result.lastResult.empty()) {
      std::cout << result.lastResult << "\n";
    } else {
      std::cout << (full ? "Reindex finished" : "Update finished") << "\n";
    }
  }
  for (const auto &f : result.failures) {
    std::cerr << "  " << f << "\n";
  }
  if (result.errors > result.failures.size()) {
    std::cerr << "  ... and " << (result.errors - result.failures.size()) << " more; see the daemon log\n";
  }
  return result.errors > 0 ? 1 : 0;
}

int App::runIndexerInProcess(bool full, bool quiet)
{
  auto cfg = settings().indexerConfig();
  Indexer indexer(store(), imp->progress_, *imp->embedder_, imp->extractor_);

  // Claim the tracker before the worker starts so the poll below never sees an idle gap.
  if (!imp->progress_.tryBeginRun()) {
    std::cerr << "Indexer is already running\n";
    return 1;
  }

  IndexStats stats;
  std::exception_ptr failure;
  std::thread worker([&]() {
    try {
      stats = full ? indexer.runFull(cfg) : indexer.runIncremental(cfg);
    } catch (...) {
      failure = std::current_exception();
    }
    });

  std::optional<IndexerProgress> last;
  while (true) {
    auto p = imp->progress_.snapshot();
    if (!quiet && (!last || progressChanged(*last, p))) {
      printProgressLine(p);
    }
    if (!p.running) break;
    last = std::move(p);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  worker.join();
  if (!quiet) std::cout << "\n";
  if (failure) std::rethrow_exception(failure);

  for (const auto &f : stats.failures) {
    std::cerr << "  " << f << "\n";
  }
  if (stats.indexed == 0 && stats.errors == 0 && stats.removed == 0) {
    if (!quiet) std::cout << (full ? "No files to index" : "All files up to date") << "\n";
    return 0;
  }
  if (!quiet) {
    std::cout << (full ? summarizeFull(stats) : summarizeIncremental(stats)) << "\n";
  }
  return stats.errors > 0 ? 1 : 0;
}

int App::indexFile(const std::string &path, bool force)
{
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    std::cerr << "File not found: " << path << "\n";
    return 1;
  }
  if (!fs::is_regular_file(path, ec)) {
    std::cerr << "Not a file: " << path << "\n";
    return 1;
  }
  auto cfg = settings().indexerConfig();
  auto absPath = fs::absolute(path).lexically_normal().string();
  if (!isIndexableFile(absPath, cfg.maxFileSizeBytes, cfg.extensions)) {
    std::cerr << "File type not supported or too large: " << path << "\n";
    return 1;
  }

  if (!force) {
    auto stored = store().fileMtime(absPath);
    if (stored && !isFileModified(utils::getFileModificationTime(absPath), *stored)) {
      std::cout << "File unchanged, use --force to re-index: " << path << "\n";
      return 0;
    }
  }

  std::cout << "Indexing " << path << "..." << std::flush;
  Indexer indexer(store(), imp->progress_, *imp->embedder_, imp->extractor_);
  try {
    indexer.indexFile(absPath, cfg);
  } catch (const std::exception &e) {
    std::cout << "\n";
    std::cerr << "Failed: " << e.what() << "\n";
    return 1;
  }
  std::cout << "\rIndexed " << path << "      \n";
  return 0;
}

int App::progress()
{
  auto runtimeDir = utils::runtimeDir();
  if (!runningDaemonPid(runtimeDir)) {
    std::cout << "No daemon is running; indexer progress is tracked by the daemon\n";
    std::cout << "Use 'burrow stats' to see the indexed file count\n";
    return 0;
  }
  DaemonClient client(Daemon::socketPathIn(runtimeDir));
  IndexerProgress p;
  try {
    p = client.progress();
  } catch (const DaemonError &e) {
    std::cerr << "Unable to read progress from daemon: " << e.what() << "\n";
    return 1;
  }
  std::cout << "Indexer Progress\n";
  std::cout << "  Running: " << (p.running ? "yes" : "no") << "\n";
  std::cout << "  Phase: " << IndexerProgress::phaseToStr(p.phase) << "\n";
  std::cout << "  Processed: " << p.processed << "/" << p.total << "\n";
  std::cout << "  Errors: " << p.errors << "\n";
  if (!p.currentFile.empty()) {
    std::cout << "  Current file: " << p.currentFile << "\n";
  }
  if (!p.lastResult.empty()) {
    std::cout << "  Last result: " << p.lastResult << "\n";
  }
  return 0;
}

int App::health(bool asJson)
{
  HealthStatus status;
  bool fromDaemon = false;
  auto runtimeDir = utils::runtimeDir();
  if (runningDaemonPid(runtimeDir)) {
    try {
      status = DaemonClient(Daemon::socketPathIn(runtimeDir)).health();
      fromDaemon = true;
    } catch (const DaemonError &e) {
      LOG_MSG << "Daemon health check failed, checking locally:" << e.what();
    }
  }
  if (!fromDaemon) {
    status = checkHealth(settings(), *imp->embedder_, imp->tryStore(), imp->progress_.isRunning());
  }
  LOG_MSG << "Health:" << status.summaryLine();

  if (asJson) {
    std::cout << status.toJson().dump() << "\n";
  } else {
    std::cout << "System Health\n";
    std::cout << "  Ollama: " << okFail(status.ollama) << "\n";
    std::cout << "  Vector DB: " << okFail(status.vectorDb) << "\n";
    std::cout << "  API Key: " << okFail(status.apiKey) << "\n";
    if (status.indexing) {
      std::cout << "  Indexing: in progress\n";
    }
    if (!status.issues.empty()) {
      std::cout << "\nIssues\n";
      for (const auto &issue : status.issues) {
        std::cout << "  - " << issue << "\n";
      }
    }
  }
  // The API key only gates chat features.
  return status.ollama && status.vectorDb ? 0 : 1;
}

int App::search(const std::string &query, bool asJson)
{
  std::vector<SearchResult> results;
  try {
    results = searchByContent(query, settings(), *imp->embedder_, store());
  } catch (const std::exception &e) {
    std::cerr << "Search failed: " << e.what() << "\n";
    return 1;
  }

  if (asJson) {
    std::cout << searchResultsToJson(results).dump() << "\n";
    return 0;
  }
  if (results.empty()) {
    std::cout << "No matching files\n";
    return 0;
  }
  for (const auto &r : results) {
    std::cout << fmt::format("{:3.0f}%  {}\n", r.score * 100.0f, r.path);
    auto firstLine = utils::trimmed(r.preview.substr(0, r.preview.find('\n')));
    if (!firstLine.empty()) {
      std::cout << "      " << firstLine << "\n";
    }
  }
  return 0;
}

int App::stats(bool asJson)
{
  auto info = collectStats(store(), defaultHistoryDbPath());
  if (asJson) {
    std::cout << info.toJson().dump() << "\n";
  } else {
    std::cout << "Statistics\n";
    std::cout << "  Indexed files: " << info.indexedFiles << "\n";
    std::cout << "  Launch history: " << info.launchCount << " entries\n";
    std::cout << "  Last indexed: " << info.lastIndexed.value_or("never") << "\n";
  }
  return 0;
}

int App::daemonStart(bool background)
{
  auto runtimeDir = utils::runtimeDir();
  if (auto pid = runningDaemonPid(runtimeDir)) {
    std::cout << "Daemon already running (pid " << *pid << ")\n";
    return background ? 0 : 1;
  }
  if (background) {
    return spawnBackgroundDaemon();
  }

  DaemonServices services{ settings(), store(), *imp->embedder_, imp->extractor_, *imp->embedder_, defaultHistoryDbPath() };
  Daemon daemon(services, runtimeDir);
  if (!daemon.run([] { return SignalHandler::shouldShutdown(); })) {
    std::cerr << "Another daemon is already running\n";
    return 1;
  }
  return 0;
}

int App::spawnBackgroundDaemon()
{
#ifdef _WIN32
  std::cerr << "Background mode is not supported on this platform\n";
  return 1;
#else
  auto exe = selfExecutablePath(Impl::binaryName_);
  std::vector<std::string> args = { exe, "--config", Impl::configPath_, "daemon", "start" };

  pid_t child = fork();
  if (child < 0) {
    throw std::runtime_error(fmt::format("fork failed: {}", std::strerror(errno)));
  }
  if (child == 0) {
    setsid();
    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
      dup2(devnull, STDERR_FILENO);
      if (devnull > STDERR_FILENO) close(devnull);
    }
    std::vector<char *> argv;
    for (auto &a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    execv(exe.c_str(), argv.data());
    _exit(127);
  }

  LOG_MSG << "Spawned daemon process" << child;
  auto timeoutSecs = settings().daemonStartupTimeoutSecs();
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSecs);
  DaemonClient client(Daemon::socketPathIn(utils::runtimeDir()), 1000);
  while (std::chrono::steady_clock::now() < deadline) {
    int status = 0;
    if (waitpid(child, &status, WNOHANG) == child) {
      std::cerr << "Daemon exited during startup\n";
      return 1;
    }
    try {
      auto s = client.status();
      std::cout << "Daemon started (pid " << s.pid << ")\n";
      return 0;
    } catch (const DaemonError &) {
      // Not listening yet.
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  std::cerr << fmt::format("Daemon did not become ready within {}s\n", timeoutSecs);
  return 1;
#endif
}

int App::daemonStop()
{
  auto runtimeDir = utils::runtimeDir();
  auto pid = runningDaemonPid(runtimeDir);
  if (!pid) {
    std::cout << "Daemon is not running\n";
    return 0;
  }
  try {
    DaemonClient(Daemon::socketPathIn(runtimeDir)).shutdown();
  } catch (const DaemonError &e) {
    std::cerr << "Unable to stop daemon (pid " << *pid << "): " << e.what() << "\n";
    return 1;
  }

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(settings().daemonStartupTimeoutSecs());
  while (std::chrono::steady_clock::now() < deadline) {
    if (!runningDaemonPid(runtimeDir)) {
      std::cout << "Daemon stopped\n";
      return 0;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  std::cout << "Shutdown requested; daemon (pid " << *pid << ") is still finishing its current run\n";
  return 0;
}

int App::daemonStatus()
{
  auto runtimeDir = utils::runtimeDir();
  auto pid = runningDaemonPid(runtimeDir);
  if (!pid) {
    std::cout << "Daemon is not running\n";
    return 1;
  }
  try {
    auto s = DaemonClient(Daemon::socketPathIn(runtimeDir)).status();
    std::cout << "Daemon running\n";
    std::cout << "  pid: " << s.pid << "\n";
    std::cout << "  version: " << s.version << "\n";
    std::cout << "  uptime: " << s.uptimeSecs << "s\n";
    std::cout << "  socket: " << Daemon::socketPathIn(runtimeDir) << "\n";
  } catch (const DaemonError &e) {
    std::cerr << "Daemon process " << *pid << " is not responding: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

int App::watch()
{
  if (!settings().vectorSearchEnabled()) {
    std::cerr << "Vector search is disabled in config\n";
    return 1;
  }
  if (auto pid = runningDaemonPid(utils::runtimeDir())) {
    LOG_MSG << "Note: daemon" << *pid << "is running and may index the same store";
  }

  size_t hours = (std::max)(settings().indexerIntervalHours(), size_t(1));
  std::cout << "Starting watch mode (incremental update every " << hours << " hour(s))" << std::endl;
  std::cout << "Press Ctrl+C to stop" << std::endl;

  BackgroundIndexer background(settings(), store(), imp->progress_, *imp->embedder_, imp->extractor_);
  background.start(std::chrono::milliseconds(0), std::chrono::hours(hours));
  while (!SignalHandler::shouldShutdown()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  if (imp->progress_.isRunning()) {
    std::cout << "Waiting for the current run to finish..." << std::endl;
  }
  background.stop();
  std::cout << "Watch stopped after " << background.completedRuns() << " run(s)" << std::endl;
  return 0;
}

int App::config(bool pathOnly, bool init)
{
  auto path = settings().configPath();
  if (pathOnly) {
    std::cout << path << "\n";
    return 0;
  }
  if (init) {
    if (fs::exists(path)) {
      std::cerr << "Config file already exists: " << path << "\n";
      return 1;
    }
    Settings fresh(path);
    fresh.updateFromConfig(json::object());
    fresh.save();
    std::cout << "Wrote default settings to " << path << "\n";
    return 0;
  }
  std::cout << settings().configDump() << "\n";
  return 0;
}

int App::run(int argc, char *argv[])
{
  Impl::binaryName_ = argv[0];

  SignalHandler::setup();

  CLI::App app{ "Burrow semantic file index" };
  app.set_version_flag("--version,-v",
    fmt::format("Burrow\nVersion: {}\nBuild date: {} {}", BURROW_VERSION, __DATE__, __TIME__));
  app.require_subcommand(0, 1);

  std::string configPath = Settings::defaultPath();
  app.add_option("-c,--config", configPath, "Config file path")->envname("BURROW_CONFIG");

  auto cmdReindex = app.add_subcommand("reindex", "Clear the index and embed every file");
  bool reindexQuiet = false;
  cmdReindex->add_flag("--quiet,-q", reindexQuiet, "Suppress progress and summary output");

  auto cmdUpdate = app.add_subcommand("update", "Embed new and changed files, drop vanished ones");
  bool updateQuiet = false;
  cmdUpdate->add_flag("--quiet,-q", updateQuiet, "Suppress progress and summary output");

  auto cmdIndex = app.add_subcommand("index", "Index a single file");
  std::string indexPath;
  bool indexForce = false;
  cmdIndex->add_option("file", indexPath, "File to index")->required();
  cmdIndex->add_flag("--force,-f", indexForce, "Re-index even when unchanged");

  auto cmdProgress = app.add_subcommand("progress", "Show the daemon's indexer progress");

  auto cmdSearch = app.add_subcommand("search", "Find indexed files by meaning");
  std::string searchQuery;
  bool searchJson = false;
  cmdSearch->add_option("query", searchQuery, "Text to search for")->required();
  cmdSearch->add_flag("--json", searchJson, "Print JSON");

  auto cmdHealth = app.add_subcommand("health", "Check Ollama, vector store and API key");
  bool healthJson = false;
  cmdHealth->add_flag("--json", healthJson, "Print JSON");

  auto cmdStats = app.add_subcommand("stats", "Show index statistics");
  bool statsJson = false;
  cmdStats->add_flag("--json", statsJson, "Print JSON");

  auto cmdDaemon = app.add_subcommand("daemon", "Manage the background daemon");
  cmdDaemon->require_subcommand(1);
  auto cmdDaemonStart = cmdDaemon->add_subcommand("start", "Start the daemon");
  bool daemonBackground = false;
  cmdDaemonStart->add_flag("--background,-b", daemonBackground, "Detach and return once the daemon answers");
  auto cmdDaemonStop = cmdDaemon->add_subcommand("stop", "Ask the daemon to shut down");
  auto cmdDaemonStatus = cmdDaemon->add_subcommand("status", "Show daemon pid, version and uptime");

  auto cmdWatch = app.add_subcommand("watch", "Run incremental updates periodically until interrupted");

  auto cmdConfig = app.add_subcommand("config", "Show the effective configuration");
  bool configPathOnly = false;
  bool configInit = false;
  cmdConfig->add_flag("--path", configPathOnly, "Print the config file path only");
  cmdConfig->add_flag("--init", configInit, "Write a default config file");

  try {
    app.parse(argc, argv);

    Impl::configPath_ = configPath;
    std::unique_ptr<Settings> settings;
    try {
      settings = std::make_unique<Settings>(configPath);
    } catch (const std::exception &ex) {
      LOG_MSG << ex.what();
      std::cerr << "Unable to read settings file " << configPath << "\n";
      throw;
    }
    SET_LOG_OUTPUT_FILE_PATH(settings->loggingLoggingFile());
    SET_LOG_DIAGNOSTICS_FILE_PATH(settings->loggingDiagnosticsFile());
    SET_LOG_TO_FILE(settings->loggingLogToFile());
    SET_LOG_TO_CONSOLE(settings->loggingLogToConsole());
    LOG_MSG << "Build Date:" << __DATE__ << __TIME__;
    LOG_MSG << "Settings path" << configPath;

    App appInstance(std::move(settings));

    if (cmdReindex->parsed()) {
      return appInstance.reindex(reindexQuiet);
    } else if (cmdUpdate->parsed()) {
      return appInstance.update(updateQuiet);
    } else if (cmdIndex->parsed()) {
      return appInstance.indexFile(indexPath, indexForce);
    } else if (cmdProgress->parsed()) {
      return appInstance.progress();
    } else if (cmdSearch->parsed()) {
      return appInstance.search(searchQuery, searchJson);
    } else if (cmdHealth->parsed()) {
      return appInstance.health(healthJson);
    } else if (cmdStats->parsed()) {
      return appInstance.stats(statsJson);
    } else if (cmdDaemonStart->parsed()) {
      return appInstance.daemonStart(daemonBackground);
    } else if (cmdDaemonStop->parsed()) {
      return appInstance.daemonStop();
    } else if (cmdDaemonStatus->parsed()) {
      return appInstance.daemonStatus();
    } else if (cmdWatch->parsed()) {
      return appInstance.watch();
    } else if (cmdConfig->parsed()) {
      return appInstance.config(configPathOnly, configInit);
    } else {
      std::cout << app.help() << std::endl;
      return 1;
    }

  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  } catch (const std::filesystem::filesystem_error &e) {
    LOG_MSG << "Filesystem error: " << e.what();
    LOG_MSG << "Path: " << e.path1();
    return 1;
  } catch (const std::exception &e) {
    LOG_MSG << "Error: " << e.what();
    LOG_MSG << "Run with --help for usage information";
    return 1;
  }
  return 0;
}
