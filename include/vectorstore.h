#ifndef _VECTORSTORE_H_
#define _VECTORSTORE_H_

#include <memory>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct SearchResult {
  float score = 0;
  std::string path;
  std::string preview;
};

// Cosine similarity of two vectors. Returns 0 for mismatched lengths,
// empty input or a zero norm.
float cosineSimilarity(const std::vector<float> &a, const std::vector<float> &b);

// Little-endian 32-bit floats, back to back.
std::vector<unsigned char> serializeEmbedding(const std::vector<float> &v);
std::vector<float> deserializeEmbedding(const unsigned char *data, size_t size);
inline std::vector<float> deserializeEmbedding(const std::vector<unsigned char> &bytes) {
  return deserializeEmbedding(bytes.data(), bytes.size());
}

// One row per indexed file in a SQLite table. All access goes through one
// connection guarded by `mutex_`.
class VectorStore {
public:
  // ":memory:" opens a private in-memory store.
  explicit VectorStore(const std::string &dbPath);
  ~VectorStore();

  static std::string defaultPath();

  void upsert(const std::string &path, const std::string &preview, const std::vector<float> &embedding,
    const std::string &model, double mtime);

  // Scores rows whose dimension matches the query (and model, when non-empty),
  // drops scores below `minScore`, sorts by score descending then path, keeps `topK`.
  std::vector<SearchResult> search(const std::vector<float> &queryEmbedding, size_t topK, float minScore,
    const std::string &model = {}) const;

  bool remove(const std::string &path);
  void clear();

  std::vector<std::string> allPaths() const;
  std::unordered_map<std::string, double> fileMtimes() const;
  std::optional<double> fileMtime(const std::string &path) const;
  int64_t count() const;

  // Julian day of the most recent upsert, nullopt when the store is empty.
  std::optional<double> maxIndexedAt() const;

  std::string dbPath() const;

private:
  void initializeDatabase();
  void executeSql(const std::string &sql);

  VectorStore(const VectorStore &) = delete;
  VectorStore &operator =(const VectorStore &) = delete;

  struct Impl;
  std::unique_ptr<Impl> imp;
  mutable std::mutex mutex_;
};

#endif // _VECTORSTORE_H_
