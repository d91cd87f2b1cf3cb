#include "indexer.h"
#include "vectorstore.h"
#include "progress.h"
#include "inference.h"
#include "textextract.h"
#include "cutils.h"
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <unordered_set>
#include <utils_log/logger.hpp>
#include <fmt/core.h>

namespace fs = std::filesystem;

namespace {

  bool isHiddenName(const fs::path &p) {
    auto name = p.filename().string();
    return !name.empty() && name.front() == '.';
  }

  // Filenames are bytes on Linux; the wire form must be valid UTF-8.
  std::string displayName(const std::string &path) {
    auto name = fs::path(path).filename().string();
    return utils::toValidUtf8(name.empty() ? path : name);
  }

  void walkRoot(const fs::path &root, const IndexerConfig &cfg, std::vector<std::string> &out) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
      LOG_MSG << "Index root" << root.string() << "does not exist. Skipped.";
      return;
    }
    // Canonical paths of the directories on the current descent, root first.
    // A directory that resolves to one of its own ancestors is a symlink cycle;
    // other routes to an already seen directory are walked again.
    std::vector<std::string> ancestors{ fs::canonical(root, ec).string() };

    auto options = fs::directory_options::follow_directory_symlink | fs::directory_options::skip_permission_denied;
    fs::recursive_directory_iterator it(root, options, ec);
    if (ec) {
      LOG_MSG << "Cannot read index root" << root.string() << ":" << ec.message();
      return;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) {
        LOG_MSG << "Walk error under" << root.string() << ":" << ec.message();
        ec.clear();
        continue;
      }
      const auto &entry = *it;
      std::error_code sec;
      bool isDir = entry.is_directory(sec);
      if (isHiddenName(entry.path())) {
        if (isDir) it.disable_recursion_pending();
        continue;
      }
      if (isDir) {
        auto canon = fs::canonical(entry.path(), sec).string();
        ancestors.resize(static_cast<size_t>(it.depth()) + 1);
        if (sec || std::find(ancestors.begin(), ancestors.end(), canon) != ancestors.end()) {
          it.disable_recursion_pending();
        } else {
          ancestors.push_back(std::move(canon));
        }
        continue;
      }
      auto path = entry.path().string();
      if (isIndexableFile(path, cfg.maxFileSizeBytes, cfg.extensions)) {
        out.push_back(std::move(path));
      }
    }
  }

} // anonymous namespace


bool isIndexableFile(const std::string &path, size_t maxSizeBytes, const std::vector<std::string> &extensions)
{
  fs::path p(path);
  if (isHiddenName(p)) {
    return false;
  }
  auto ext = p.extension().string();
  if (ext.size() < 2) {
    return false;
  }
  ext = utils::toLower(ext.substr(1));
  if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end()) {
    return false;
  }
  std::error_code ec;
  if (!fs::is_regular_file(p, ec)) {
    return false;
  }
  auto size = fs::file_size(p, ec);
  return !ec && size <= maxSizeBytes;
}

std::vector<std::string> collectIndexablePaths(const IndexerConfig &cfg)
{
  std::vector<std::string> paths;
  for (const auto &dir : cfg.indexDirs) {
    walkRoot(fs::path(utils::expandHome(dir)), cfg, paths);
  }
  return paths;
}

std::string summarizeFull(const IndexStats &stats)
{
  return fmt::format("Indexed {} files, {} errors", stats.indexed, stats.errors);
}

std::string summarizeIncremental(const IndexStats &stats)
{
  return fmt::format("Indexed {}, skipped {}, removed {}, {} errors", stats.indexed, stats.skipped, stats.removed, stats.errors);
}

//---------------------------------------------------------------------------

Indexer::Indexer(VectorStore &store, ProgressTracker &progress, const EmbeddingProvider &embedder, const TextExtractor &extractor)
  : store_(store)
  , progress_(progress)
  , embedder_(embedder)
  , extractor_(extractor)
{
}

void Indexer::indexFile(const std::string &path, const IndexerConfig &cfg)
{
  auto text = extractor_.extractText(path, cfg.maxContentChars);
  auto embedding = embedder_.generateEmbedding(text);
  if (embedding.empty()) {
    throw std::runtime_error("Empty embedding returned");
  }
  auto preview = utils::utf8Prefix(text, kPreviewChars);
  auto model = cfg.model.empty() ? embedder_.modelName() : cfg.model;
  store_.upsert(path, preview, embedding, model, utils::getFileModificationTime(path));
}

void Indexer::indexPaths(const std::vector<std::string> &paths, const IndexerConfig &cfg, IndexStats &stats)
{
  progress_.update([&](IndexerProgress &p) {
    p.total = paths.size();
    p.phase = IndexerProgress::Phase::Embedding;
  });

  for (const auto &path : paths) {
    const auto name = displayName(path);
    progress_.update([&](IndexerProgress &p) { p.currentFile = name; });
    try {
      indexFile(path, cfg);
      stats.indexed++;
    } catch (const std::exception &e) {
      stats.errors++;
      stats.failures.push_back(fmt::format("{}: {}", path, e.what()));
      LOG_MSG << "Failed to index" << path << ":" << e.what();
    }
    progress_.update([&](IndexerProgress &p) {
      p.processed = stats.indexed + stats.errors;
      p.errors = stats.errors;
      if (p.failures.size() < stats.failures.size() && p.failures.size() < IndexerProgress::kMaxReportedFailures) {
        p.failures.push_back(utils::toValidUtf8(stats.failures.back()));
      }
    });
  }
}

size_t Indexer::removeStale(const std::vector<std::string> &validPaths)
{
  std::unordered_set<std::string> valid(validPaths.begin(), validPaths.end());
  size_t removed = 0;
  for (const auto &path : store_.allPaths()) {
    std::error_code ec;
    bool exists = fs::exists(path, ec);
    if (exists && valid.count(path)) {
      continue;
    }
    try {
      if (store_.remove(path)) {
        removed++;
      }
    } catch (const std::exception &e) {
      LOG_MSG << "Warning: failed to remove stale entry" << path << ":" << e.what();
    }
  }
  return removed;
}

IndexStats Indexer::runFull(const IndexerConfig &cfg)
{
  IndexStats stats;
  progress_.update([](IndexerProgress &p) {
    p.running = true;
    p.phase = IndexerProgress::Phase::Scanning;
    p.currentFile.clear();
    p.processed = p.total = p.errors = 0;
    p.failures.clear();
  });
  try {
    store_.clear();
    auto paths = collectIndexablePaths(cfg);
    LOG_MSG << "Full reindex of" << paths.size() << "files";
    indexPaths(paths, cfg, stats);
    stats.skipped = paths.size() - stats.indexed - stats.errors;
  } catch (const std::exception &e) {
    progress_.finishRun(fmt::format("Reindex failed: {}", e.what()));
    throw;
  }
  auto summary = summarizeFull(stats);
  LOG_MSG << summary;
  progress_.finishRun(summary);
  return stats;
}

IndexStats Indexer::runIncremental(const IndexerConfig &cfg)
{
  IndexStats stats;
  progress_.update([](IndexerProgress &p) {
    p.running = true;
    p.phase = IndexerProgress::Phase::Scanning;
    p.currentFile.clear();
    p.processed = p.total = p.errors = 0;
    p.failures.clear();
  });
  try {
    auto existing = store_.fileMtimes();
    auto paths = collectIndexablePaths(cfg);

    std::vector<std::string> toIndex;
    for (const auto &path : paths) {
      auto it = existing.find(path);
      if (it == existing.end() || isFileModified(utils::getFileModificationTime(path), it->second)) {
        toIndex.push_back(path);
      }
    }
    stats.skipped = paths.size() - toIndex.size();
    LOG_MSG << "Incremental update:" << toIndex.size() << "of" << paths.size() << "files changed";

    indexPaths(toIndex, cfg, stats);

    progress_.update([](IndexerProgress &p) {
      p.phase = IndexerProgress::Phase::Cleanup;
      p.currentFile.clear();
    });
    stats.removed = removeStale(paths);
  } catch (const std::exception &e) {
    progress_.finishRun(fmt::format("Update failed: {}", e.what()));
    throw;
  }
  auto summary = summarizeIncremental(stats);
  LOG_MSG << summary;
  progress_.finishRun(summary);
  return stats;
}
