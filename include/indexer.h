#ifndef _INDEXER_H_
#define _INDEXER_H_

#include <string>
#include <vector>
#include "settings.h"

class VectorStore;
class ProgressTracker;
class EmbeddingProvider;
class TextExtractor;

constexpr double kMtimeEpsilon = 1.0;
constexpr size_t kPreviewChars = 200;

struct IndexStats {
  size_t indexed = 0;
  size_t skipped = 0;
  size_t removed = 0;
  size_t errors = 0;
  // "<path>: <message>" for every file that failed.
  std::vector<std::string> failures;
};

bool isIndexableFile(const std::string &path, size_t maxSizeBytes, const std::vector<std::string> &extensions);

// Recursive walk of every root, following symlinks and skipping dot-prefixed
// entries. Missing roots are skipped.
std::vector<std::string> collectIndexablePaths(const IndexerConfig &cfg);

inline bool isFileModified(double currentMtime, double storedMtime) {
  return kMtimeEpsilon <= (currentMtime > storedMtime ? currentMtime - storedMtime : storedMtime - currentMtime);
}

std::string summarizeFull(const IndexStats &stats);
std::string summarizeIncremental(const IndexStats &stats);

class Indexer {
public:
  Indexer(VectorStore &store, ProgressTracker &progress, const EmbeddingProvider &embedder, const TextExtractor &extractor);

  // Clears the store, then indexes every discoverable file.
  IndexStats runFull(const IndexerConfig &cfg);

  // Indexes new or changed files, then removes rows for vanished files.
  IndexStats runIncremental(const IndexerConfig &cfg);

  // Extract, embed and upsert one file. Throws on failure.
  void indexFile(const std::string &path, const IndexerConfig &cfg);

private:
  void indexPaths(const std::vector<std::string> &paths, const IndexerConfig &cfg, IndexStats &stats);
  size_t removeStale(const std::vector<std::string> &validPaths);

  VectorStore &store_;
  ProgressTracker &progress_;
  const EmbeddingProvider &embedder_;
  const TextExtractor &extractor_;
};

#endif // _INDEXER_H_
