#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include "indexer.h"
#include "progress.h"
#include "textextract.h"
#include "vectorstore.h"
#include "cutils.h"
#include "testutils.h"

namespace fs = std::filesystem;
using testutils::writeFile;

namespace {

  const std::vector<std::string> kExts = { "txt", "md", "pdf" };

  class IndexerTest : public ::testing::Test {
  protected:
    IndexerConfig config() const {
      IndexerConfig cfg;
      cfg.indexDirs = { root.str() };
      cfg.extensions = kExts;
      cfg.maxFileSizeBytes = 1000;
      cfg.maxContentChars = 4096;
      cfg.model = "fake-embed";
      return cfg;
    }

    testutils::TempDir root;
    VectorStore store{ ":memory:" };
    ProgressTracker progress;
    testutils::FakeEmbedder embedder;
    PlainTextExtractor extractor;
    Indexer indexer{ store, progress, embedder, extractor };
  };

} // anonymous namespace

TEST(IsIndexableFile, AcceptsAllowedExtensionUnderCap)
{
  testutils::TempDir tmp;
  auto ok = writeFile(tmp.path() / "notes.md", "hello");
  auto upper = writeFile(tmp.path() / "README.TXT", "hello");
  EXPECT_TRUE(isIndexableFile(ok, 1000, kExts));
  EXPECT_TRUE(isIndexableFile(upper, 1000, kExts));
}

TEST(IsIndexableFile, RejectsDotfilesOversizedAndForeignExtensions)
{
  testutils::TempDir tmp;
  auto hidden = writeFile(tmp.path() / ".secret.txt", "x");
  auto big = writeFile(tmp.path() / "big.txt", std::string(2000, 'x'));
  auto foreign = writeFile(tmp.path() / "image.png", "x");
  auto noExt = writeFile(tmp.path() / "Makefile", "x");
  fs::create_directories(tmp.path() / "dir.txt");

  EXPECT_FALSE(isIndexableFile(hidden, 1000, kExts));
  EXPECT_FALSE(isIndexableFile(big, 1000, kExts));
  EXPECT_FALSE(isIndexableFile(foreign, 1000, kExts));
  EXPECT_FALSE(isIndexableFile(noExt, 1000, kExts));
  EXPECT_FALSE(isIndexableFile((tmp.path() / "dir.txt").string(), 1000, kExts));
  EXPECT_FALSE(isIndexableFile(tmp.file("missing.txt"), 1000, kExts));
}

TEST(IsFileModified, UsesOneSecondEpsilon)
{
  EXPECT_FALSE(isFileModified(100.0, 100.0));
  EXPECT_FALSE(isFileModified(100.9, 100.0));
  EXPECT_TRUE(isFileModified(101.0, 100.0));
  EXPECT_TRUE(isFileModified(98.0, 100.0));
}

TEST(Summaries, OneLineCounts)
{
  IndexStats s;
  s.indexed = 3;
  s.skipped = 4;
  s.removed = 1;
  s.errors = 2;
  EXPECT_EQ(summarizeFull(s), "Indexed 3 files, 2 errors");
  EXPECT_EQ(summarizeIncremental(s), "Indexed 3, skipped 4, removed 1, 2 errors");
}

TEST_F(IndexerTest, CollectSkipsHiddenTreesAndMissingRoots)
{
  writeFile(root.path() / "a.txt", "a");
  writeFile(root.path() / "sub" / "b.md", "b");
  writeFile(root.path() / ".git" / "c.txt", "hidden tree");
  writeFile(root.path() / "sub" / ".hidden" / "d.txt", "hidden tree");
  writeFile(root.path() / "e.png", "not allowed");

  auto cfg = config();
  cfg.indexDirs.push_back(root.file("does-not-exist"));
  auto paths = collectIndexablePaths(cfg);
  std::sort(paths.begin(), paths.end());

  ASSERT_EQ(paths.size(), 2u);
  EXPECT_EQ(fs::path(paths[0]).filename(), "a.txt");
  EXPECT_EQ(fs::path(paths[1]).filename(), "b.md");
}

TEST_F(IndexerTest, CollectFollowsSymlinksWithoutLooping)
{
  testutils::TempDir outside;
  writeFile(outside.path() / "linked.txt", "via symlink");
  fs::create_directory_symlink(outside.path(), root.path() / "link");
  fs::create_directory_symlink(root.path(), root.path() / "loop");
  writeFile(root.path() / "own.txt", "own");

  auto paths = collectIndexablePaths(config());
  std::vector<std::string> names;
  for (const auto &p : paths) names.push_back(fs::path(p).filename().string());
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{ "linked.txt", "own.txt" }));
}

TEST_F(IndexerTest, CollectListsEveryRouteToASiblingDirectory)
{
  auto real = writeFile(root.path() / "docs" / "a.txt", "reachable twice");
  fs::create_directory_symlink(root.path() / "docs", root.path() / "link");

  auto paths = collectIndexablePaths(config());
  std::sort(paths.begin(), paths.end());
  auto viaLink = (root.path() / "link" / "a.txt").string();
  EXPECT_EQ(paths, (std::vector<std::string>{ real, viaLink }));

  // Both rows survive the cleanup pass on repeated runs.
  ASSERT_EQ(indexer.runIncremental(config()).indexed, 2u);
  auto stats = indexer.runIncremental(config());
  EXPECT_EQ(stats.skipped, 2u);
  EXPECT_EQ(stats.removed, 0u);
  EXPECT_EQ(store.count(), 2);
}

TEST_F(IndexerTest, IncrementalOnEmptyStoreIndexesNewFile)
{
  auto file = writeFile(root.path() / "only.txt", "the only document");

  auto stats = indexer.runIncremental(config());
  EXPECT_EQ(stats.indexed, 1u);
  EXPECT_EQ(stats.skipped, 0u);
  EXPECT_EQ(stats.removed, 0u);
  EXPECT_EQ(stats.errors, 0u);

  ASSERT_EQ(store.allPaths(), std::vector<std::string>{ file });
  auto mtime = store.fileMtime(file);
  ASSERT_TRUE(mtime.has_value());
  EXPECT_NEAR(*mtime, utils::getFileModificationTime(file), 1e-6);
}

TEST_F(IndexerTest, IncrementalSkipsUnchangedAndReindexesChanged)
{
  auto same = writeFile(root.path() / "same.txt", "unchanged");
  auto changed = writeFile(root.path() / "changed.txt", "will change");
  testutils::setMtime(same, 1'700'000'000.0);
  testutils::setMtime(changed, 1'700'000'000.0);
  ASSERT_EQ(indexer.runIncremental(config()).indexed, 2u);

  testutils::setMtime(changed, 1'700'000'002.0);
  size_t callsBefore = embedder.calls();
  auto stats = indexer.runIncremental(config());
  EXPECT_EQ(stats.indexed, 1u);
  EXPECT_EQ(stats.skipped, 1u);
  EXPECT_EQ(embedder.calls() - callsBefore, 1u);
  EXPECT_DOUBLE_EQ(store.fileMtime(changed).value(), 1'700'000'002.0);
  EXPECT_DOUBLE_EQ(store.fileMtime(same).value(), 1'700'000'000.0);
}

TEST_F(IndexerTest, IncrementalRemovesVanishedAndOutOfRootEntries)
{
  auto gone = writeFile(root.path() / "gone.txt", "temporary");
  auto kept = writeFile(root.path() / "kept.txt", "stays");
  ASSERT_EQ(indexer.runIncremental(config()).indexed, 2u);

  // A row from a root that is no longer configured.
  store.upsert("/elsewhere/old.txt", "", { 1, 0 }, "fake-embed", 1.0);
  fs::remove(gone);

  auto stats = indexer.runIncremental(config());
  EXPECT_EQ(stats.removed, 2u);
  EXPECT_EQ(stats.skipped, 1u);
  EXPECT_EQ(store.allPaths(), std::vector<std::string>{ kept });
}

TEST_F(IndexerTest, PerFileFailuresDoNotAbortRun)
{
  writeFile(root.path() / "good.txt", "fine");
  auto rejected = writeFile(root.path() / "bad.txt", "EMBED_FAIL please");
  auto binary = writeFile(root.path() / "paper.pdf", "%PDF-1.7");

  auto stats = indexer.runIncremental(config());
  EXPECT_EQ(stats.indexed, 1u);
  EXPECT_EQ(stats.errors, 2u);
  ASSERT_EQ(stats.failures.size(), 2u);
  std::sort(stats.failures.begin(), stats.failures.end());
  EXPECT_EQ(stats.failures[0], rejected + ": embedding service rejected input");
  EXPECT_EQ(stats.failures[1], binary + ": Unsupported format: pdf");
  EXPECT_EQ(store.count(), 1);

  auto p = progress.snapshot();
  EXPECT_FALSE(p.running);
  EXPECT_EQ(p.errors, 2u);
  EXPECT_EQ(p.processed, 3u);
  std::sort(p.failures.begin(), p.failures.end());
  EXPECT_EQ(p.failures, stats.failures);

  // A clean run clears the previous failure list.
  fs::remove(rejected);
  fs::remove(binary);
  indexer.runIncremental(config());
  EXPECT_TRUE(progress.snapshot().failures.empty());
}

TEST_F(IndexerTest, FullRunClearsStoreFirst)
{
  writeFile(root.path() / "a.txt", "a");
  writeFile(root.path() / "b.txt", "b");
  store.upsert("/stale/entry.txt", "", { 1, 0 }, "fake-embed", 1.0);

  auto stats = indexer.runFull(config());
  EXPECT_EQ(stats.indexed, 2u);
  EXPECT_EQ(stats.errors, 0u);
  EXPECT_EQ(store.count(), 2);
  EXPECT_FALSE(store.fileMtime("/stale/entry.txt").has_value());
  EXPECT_EQ(progress.snapshot().lastResult, "Indexed 2 files, 0 errors");
}

TEST_F(IndexerTest, ProgressEndsIdleWithSummary)
{
  writeFile(root.path() / "a.txt", "a");
  indexer.runIncremental(config());

  auto p = progress.snapshot();
  EXPECT_FALSE(p.running);
  EXPECT_EQ(p.phase, IndexerProgress::Phase::Idle);
  EXPECT_TRUE(p.currentFile.empty());
  EXPECT_EQ(p.total, 1u);
  EXPECT_EQ(p.processed, 1u);
  EXPECT_EQ(p.lastResult, "Indexed 1, skipped 0, removed 0, 0 errors");
}

TEST_F(IndexerTest, PreviewIsFirst200Characters)
{
  std::string text;
  for (int i = 0; i < 300; ++i) text += static_cast<char>('a' + i % 26);
  auto file = writeFile(root.path() / "long.txt", text);
  indexer.indexFile(file, config());

  auto results = store.search(embedder.generateEmbedding(text), 1, 0.0f);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].preview, text.substr(0, kPreviewChars));
}

TEST_F(IndexerTest, ExtractionIsBoundedByMaxContentChars)
{
  auto file = writeFile(root.path() / "bounded.txt", std::string(500, 'q'));
  auto cfg = config();
  cfg.maxContentChars = 50;
  EXPECT_EQ(extractor.extractText(file, cfg.maxContentChars).size(), 50u);
}
