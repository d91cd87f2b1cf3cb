#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <cstring>
#include <fstream>
#include <thread>
#include <httplib.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include "daemon.h"
#include "daemonclient.h"
#include "settings.h"
#include "vectorstore.h"
#include "inference.h"
#include "textextract.h"
#include "pidfile.h"
#include "testutils.h"

namespace fs = std::filesystem;
using json = nlohmann::json;
using testutils::writeFile;

namespace {

  constexpr PollOptions kFastPoll{ std::chrono::milliseconds(10), 5 };

  // Accepts one connection and answers with a status line and headers sent
  // one byte every 50ms, never finishing the response.
  class TricklingServer {
  public:
    explicit TricklingServer(const std::string &path) {
      fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
      sockaddr_un addr{};
      addr.sun_family = AF_UNIX;
      std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
      ready_ = fd_ >= 0
        && ::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0
        && ::listen(fd_, 1) == 0;
      if (ready_) thread_ = std::thread([this] { serve(); });
    }
    ~TricklingServer() {
      stop_ = true;
      if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
      }
      if (thread_.joinable()) thread_.join();
    }
    bool ready() const { return ready_; }

  private:
    void serve() {
      int conn = ::accept(fd_, nullptr, nullptr);
      if (conn < 0) return;
      char buf[1024];
      ::recv(conn, buf, sizeof(buf), 0);
      const std::string head = "HTTP/1.1 200 OK\r\nX-Slow: ";
      size_t i = 0;
      while (!stop_) {
        char ch = i < head.size() ? head[i++] : 'a';
        if (::send(conn, &ch, 1, MSG_NOSIGNAL) != 1) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
      ::close(conn);
    }

    int fd_ = -1;
    bool ready_ = false;
    std::atomic<bool> stop_{ false };
    std::thread thread_;
  };

  class DaemonTest : public ::testing::Test {
  protected:
    void SetUp() override {
      fs::create_directories(docs());
      settings.updateFromConfig({
        {"vector_search", {{"index_dirs", json::array({ docs().string() })}}},
        {"indexer", {{"file_extensions", json::array({ "txt" })}}}
      });
    }

    fs::path docs() const { return tmp.path() / "docs"; }
    std::string runtime() const { return tmp.file("run"); }

    DaemonServices services(const EmbeddingProvider &e) {
      return { settings, store, e, extractor, ollama, tmp.file("history.db") };
    }

    testutils::TempDir tmp;
    Settings settings{ tmp.file("settings.json") };
    VectorStore store{ ":memory:" };
    testutils::FakeEmbedder embedder;
    PlainTextExtractor extractor;
    // Nothing listens on the discard port.
    EmbeddingClient ollama{ "http://127.0.0.1:9", "fake-embed", 200 };
  };

} // anonymous namespace

TEST_F(DaemonTest, ServesStatusAndCleansUpOnStop)
{
  Daemon daemon(services(embedder), runtime());
  ASSERT_TRUE(daemon.start());
  EXPECT_TRUE(fs::exists(daemon.socketPath()));
  EXPECT_TRUE(fs::exists(daemon.pidPath()));
  EXPECT_EQ(runningDaemonPid(runtime()).value_or(0), static_cast<uint32_t>(getpid()));

  DaemonClient client(daemon.socketPath());
  auto status = client.status();
  EXPECT_EQ(status.pid, static_cast<uint32_t>(getpid()));
  EXPECT_EQ(status.version, BURROW_VERSION);
  EXPECT_LT(status.uptimeSecs, 60u);

  daemon.stop();
  EXPECT_FALSE(fs::exists(daemon.socketPath()));
  EXPECT_FALSE(fs::exists(daemon.pidPath()));
  EXPECT_FALSE(runningDaemonPid(runtime()).has_value());
  EXPECT_THROW(client.status(), DaemonError);
}

TEST_F(DaemonTest, SecondInstanceIsRefused)
{
  Daemon first(services(embedder), runtime());
  ASSERT_TRUE(first.start());

  Daemon second(services(embedder), runtime());
  EXPECT_FALSE(second.start());
  // The refused instance must not disturb the owner.
  EXPECT_NO_THROW(DaemonClient(first.socketPath()).status());
  EXPECT_TRUE(fs::exists(first.pidPath()));
}

TEST_F(DaemonTest, TakesOverStaleMarkers)
{
  fs::create_directories(runtime());
  std::ofstream(Daemon::pidPathIn(runtime())) << 0x7ffffffe;
  std::ofstream(Daemon::socketPathIn(runtime())) << "leftover";

  Daemon daemon(services(embedder), runtime());
  ASSERT_TRUE(daemon.start());
  EXPECT_NO_THROW(DaemonClient(daemon.socketPath()).status());
}

TEST_F(DaemonTest, FullThenIncrementalRunThroughClient)
{
  writeFile(docs() / "a.txt", "apple");
  writeFile(docs() / "b.txt", "banana");
  writeFile(docs() / "sub" / "c.txt", "cherry");

  Daemon daemon(services(embedder), runtime());
  ASSERT_TRUE(daemon.start());
  DaemonClient client(daemon.socketPath());

  auto started = client.startIndexer(true);
  EXPECT_TRUE(started.started);
  EXPECT_EQ(started.message, "Reindex started");

  size_t changes = 0;
  auto done = pollUntilDone(client, [&](const IndexerProgress &) { changes++; }, kFastPoll);
  EXPECT_FALSE(done.running);
  EXPECT_EQ(done.processed, 3u);
  EXPECT_EQ(done.errors, 0u);
  EXPECT_EQ(done.lastResult, "Indexed 3 files, 0 errors");
  EXPECT_GE(changes, 1u);
  EXPECT_EQ(store.count(), 3);

  started = client.startIndexer(false);
  EXPECT_TRUE(started.started);
  EXPECT_EQ(started.message, "Incremental update started");
  done = pollUntilDone(client, nullptr, kFastPoll);
  EXPECT_EQ(done.lastResult, "Indexed 0, skipped 3, removed 0, 0 errors");

  auto stats = client.stats();
  EXPECT_EQ(stats.indexedFiles, 3);
  EXPECT_EQ(stats.launchCount, 0);
  EXPECT_EQ(stats.lastIndexed.value_or(""), "available");
}

TEST_F(DaemonTest, NonUtf8FilenameKeepsProgressReadable)
{
  writeFile(docs() / "\xff.txt", "latin-1 name");
  auto failing = writeFile(docs() / "broken.txt", "EMBED_FAIL");
  testutils::FakeEmbedder slow(std::chrono::milliseconds(150));
  Daemon daemon(services(slow), runtime());
  ASSERT_TRUE(daemon.start());
  DaemonClient client(daemon.socketPath());

  ASSERT_TRUE(client.startIndexer(true).started);
  // Every poll must succeed while the oddly named file is being embedded.
  std::vector<std::string> seenFiles;
  IndexerProgress done;
  do {
    ASSERT_NO_THROW(done = client.progress());
    seenFiles.push_back(done.currentFile);
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  } while (done.running);

  EXPECT_EQ(done.processed, 2u);
  EXPECT_EQ(done.errors, 1u);
  EXPECT_NE(std::find(seenFiles.begin(), seenFiles.end(), "\xEF\xBF\xBD.txt"), seenFiles.end());
  ASSERT_EQ(done.failures.size(), 1u);
  EXPECT_EQ(done.failures[0], failing + ": embedding service rejected input");
  EXPECT_EQ(store.count(), 1);
}

TEST_F(DaemonTest, ConcurrentStartRequestIsBenign)
{
  for (int i = 0; i < 5; ++i) {
    writeFile(docs() / ("f" + std::to_string(i) + ".txt"), "text " + std::to_string(i));
  }
  testutils::FakeEmbedder slow(std::chrono::milliseconds(80));
  Daemon daemon(services(slow), runtime());
  ASSERT_TRUE(daemon.start());
  DaemonClient client(daemon.socketPath());

  ASSERT_TRUE(client.startIndexer(false).started);
  auto second = client.startIndexer(true);
  EXPECT_FALSE(second.started);
  EXPECT_EQ(second.message, "Indexer is already running");
  EXPECT_TRUE(client.progress().running);
  EXPECT_TRUE(client.health().indexing);

  auto done = pollUntilDone(client, nullptr, kFastPoll);
  EXPECT_EQ(done.processed, 5u);
  EXPECT_EQ(slow.calls(), 5u);
}

TEST_F(DaemonTest, DisabledVectorSearchDoesNotStart)
{
  settings.updateFromConfig({ {"vector_search", {{"enabled", false}}} });
  Daemon daemon(services(embedder), runtime());
  ASSERT_TRUE(daemon.start());

  auto result = DaemonClient(daemon.socketPath()).startIndexer(true);
  EXPECT_FALSE(result.started);
  EXPECT_EQ(result.message, "Vector search is disabled in config");
}

TEST_F(DaemonTest, RejectsMalformedStartBody)
{
  Daemon daemon(services(embedder), runtime());
  ASSERT_TRUE(daemon.start());

  httplib::Client raw(daemon.socketPath(), 80);
  raw.set_address_family(AF_UNIX);

  auto notJson = raw.Post("/indexer/start", "{full", "application/json");
  ASSERT_TRUE(notJson);
  EXPECT_EQ(notJson->status, 400);
  EXPECT_TRUE(json::parse(notJson->body).contains("error"));

  auto wrongType = raw.Post("/indexer/start", R"({"full": "yes"})", "application/json");
  ASSERT_TRUE(wrongType);
  EXPECT_EQ(wrongType->status, 400);

  auto missing = raw.Get("/no/such/endpoint");
  ASSERT_TRUE(missing);
  EXPECT_EQ(missing->status, 404);

  // An empty body means an incremental run.
  auto empty = raw.Post("/indexer/start", "", "application/json");
  ASSERT_TRUE(empty);
  EXPECT_EQ(empty->status, 200);
  EXPECT_EQ(json::parse(empty->body)["message"], "Incremental update started");
  pollUntilDone(DaemonClient(daemon.socketPath()), nullptr, kFastPoll);
}

TEST_F(DaemonTest, HealthReportsUnreachableOllama)
{
  Daemon daemon(services(embedder), runtime());
  ASSERT_TRUE(daemon.start());

  auto health = DaemonClient(daemon.socketPath()).health();
  EXPECT_FALSE(health.ollama);
  EXPECT_TRUE(health.vectorDb);
  EXPECT_FALSE(health.indexing);
  ASSERT_FALSE(health.issues.empty());
  EXPECT_EQ(health.issues[0].rfind("Ollama: unreachable", 0), 0u);
}

TEST_F(DaemonTest, ShutdownRequestEndsRun)
{
  Daemon daemon(services(embedder), runtime());
  std::atomic<bool> finished{ false };
  std::thread serving([&]() {
    daemon.run();
    finished = true;
    });

  DaemonClient client(Daemon::socketPathIn(runtime()));
  bool up = false;
  for (int i = 0; i < 200 && !up; ++i) {
    try {
      client.status();
      up = true;
    } catch (const DaemonError &) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  ASSERT_TRUE(up);

  client.shutdown();
  serving.join();
  EXPECT_TRUE(finished);
  EXPECT_FALSE(fs::exists(Daemon::socketPathIn(runtime())));
  EXPECT_FALSE(fs::exists(Daemon::pidPathIn(runtime())));
}

TEST_F(DaemonTest, ExternalStopEndsRun)
{
  Daemon daemon(services(embedder), runtime());
  std::atomic<bool> stopFlag{ false };
  std::thread serving([&]() { daemon.run([&] { return stopFlag.load(); }); });

  for (int i = 0; i < 200 && !fs::exists(Daemon::pidPathIn(runtime())); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  stopFlag = true;
  serving.join();
  EXPECT_FALSE(fs::exists(Daemon::pidPathIn(runtime())));
}

TEST(DaemonClientErrors, MissingSocketIsConnectError)
{
  testutils::TempDir tmp;
  DaemonClient client(tmp.file("absent.sock"), 500);
  try {
    client.status();
    FAIL() << "expected DaemonError";
  } catch (const DaemonError &e) {
    EXPECT_EQ(e.kind(), DaemonError::Kind::Connect);
  }
}

TEST(DaemonClientErrors, PollGivesUpAfterConsecutiveFailures)
{
  testutils::TempDir tmp;
  DaemonClient client(tmp.file("absent.sock"), 200);
  PollOptions options{ std::chrono::milliseconds(1), 3 };
  try {
    pollUntilDone(client, nullptr, options);
    FAIL() << "expected DaemonError";
  } catch (const DaemonError &e) {
    EXPECT_NE(std::string(e.what()).find("after 3 attempts"), std::string::npos);
  }
}

TEST(DaemonClientErrors, SlowPeerHitsOverallDeadline)
{
  testutils::TempDir tmp;
  TricklingServer server(tmp.file("slow.sock"));
  ASSERT_TRUE(server.ready());

  DaemonClient client(tmp.file("slow.sock"), 400);
  auto begin = std::chrono::steady_clock::now();
  try {
    client.status();
    FAIL() << "expected DaemonError";
  } catch (const DaemonError &e) {
    EXPECT_EQ(e.kind(), DaemonError::Kind::Timeout);
  }
  auto elapsed = std::chrono::steady_clock::now() - begin;
  EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
}
