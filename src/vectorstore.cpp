#include "vectorstore.h"
#include "cutils.h"
#include <hnswlib/hnswlib.h>
#include <sqlite3.h>
#include <algorithm>
#include <bit>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <filesystem>
#include <utils_log/logger.hpp>
#include <fmt/core.h>


namespace {

  struct SqliteErrorChecker {
    sqlite3 *sq_ = nullptr;
    SqliteErrorChecker &operator=(sqlite3 *sq) { sq_ = sq; return *this; }
    SqliteErrorChecker &operator=(int rc) {
      if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return *this;
      const char *msg = sq_ ? sqlite3_errmsg(sq_) : "SQLite error (no handle)";
      throw std::runtime_error(std::string("SQLite error: ") + msg);
    }
  };

  // The raw sum; the space's distance function is `1 - <a, b>` and loses
  // every product below float epsilon.
  float dotProduct(const std::vector<float> &a, const std::vector<float> &b) {
    size_t dim = a.size();
    return hnswlib::InnerProduct(a.data(), b.data(), &dim);
  }

} // anonymous namespace


float cosineSimilarity(const std::vector<float> &a, const std::vector<float> &b)
{
  if (a.size() != b.size() || a.empty()) {
    return 0.0f;
  }
  float normA = std::sqrt(dotProduct(a, a));
  float normB = std::sqrt(dotProduct(b, b));
  if (normA == 0.0f || normB == 0.0f || std::isnan(normA) || std::isnan(normB)) {
    return 0.0f;
  }
  return dotProduct(a, b) / (normA * normB);
}

std::vector<unsigned char> serializeEmbedding(const std::vector<float> &v)
{
  std::vector<unsigned char> bytes(v.size() * sizeof(float));
  for (size_t i = 0; i < v.size(); ++i) {
    uint32_t bits = std::bit_cast<uint32_t>(v[i]);
    for (size_t k = 0; k < 4; ++k) {
      bytes[i * 4 + k] = static_cast<unsigned char>((bits >> (8 * k)) & 0xFF);
    }
  }
  return bytes;
}

std::vector<float> deserializeEmbedding(const unsigned char *data, size_t size)
{
  if (size % 4 != 0) {
    LOG_MSG << "Embedding blob of" << size << "bytes is not a multiple of 4. Ignored.";
    return {};
  }
  std::vector<float> v(size / 4);
  for (size_t i = 0; i < v.size(); ++i) {
    uint32_t bits = 0;
    for (size_t k = 0; k < 4; ++k) {
      bits |= static_cast<uint32_t>(data[i * 4 + k]) << (8 * k);
    }
    v[i] = std::bit_cast<float>(bits);
  }
  return v;
}

//---------------------------------------------------------------------------


struct VectorStore::Impl {
  sqlite3 *db_ = nullptr;
  std::string dbPath_;
  SqliteErrorChecker checkErr_;
};


VectorStore::VectorStore(const std::string &dbPath)
  : imp(std::make_unique<Impl>())
{
  imp->dbPath_ = dbPath;
  initializeDatabase();
}

VectorStore::~VectorStore()
{
  if (imp->db_) {
    sqlite3_close(imp->db_);
  }
}

std::string VectorStore::defaultPath()
{
  return (std::filesystem::path(utils::dataDir()) / "vectors.db").string();
}

void VectorStore::initializeDatabase()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (imp->dbPath_ != ":memory:") {
    auto parent = std::filesystem::path(imp->dbPath_).parent_path();
    if (!parent.empty()) {
      std::filesystem::create_directories(parent);
    }
    LOG_MSG << "Opening vector store at" << std::filesystem::absolute(imp->dbPath_);
  }
  int rc = sqlite3_open(imp->dbPath_.c_str(), &imp->db_);
  if (rc != SQLITE_OK) {
    std::string msg = imp->db_ ? sqlite3_errmsg(imp->db_) : "out of memory";
    if (imp->db_) {
      sqlite3_close(imp->db_);
      imp->db_ = nullptr;
    }
    throw std::runtime_error("Cannot open vector store: " + msg);
  }
  imp->checkErr_ = imp->db_;
  sqlite3_busy_timeout(imp->db_, 5000);

  const char *vectorsTable = R"(
      CREATE TABLE IF NOT EXISTS vectors (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          file_path TEXT NOT NULL UNIQUE,
          content_preview TEXT NOT NULL,
          embedding BLOB NOT NULL,
          dimension INTEGER NOT NULL,
          model TEXT NOT NULL,
          indexed_at REAL NOT NULL,
          file_mtime REAL NOT NULL
      );
      CREATE INDEX IF NOT EXISTS idx_vectors_path ON vectors(file_path);
      CREATE INDEX IF NOT EXISTS idx_vectors_mtime ON vectors(file_mtime);
  )";
  executeSql(vectorsTable);
}

void VectorStore::executeSql(const std::string &sql)
{
  char *errorMessage = nullptr;
  int rc = sqlite3_exec(imp->db_, sql.c_str(), nullptr, nullptr, &errorMessage);
  if (rc != SQLITE_OK) {
    std::string error = errorMessage ? errorMessage : "Unknown error";
    if (errorMessage) sqlite3_free(errorMessage);
    throw std::runtime_error("SQL error: " + error);
  }
}

void VectorStore::upsert(const std::string &path, const std::string &preview, const std::vector<float> &embedding,
  const std::string &model, double mtime)
{
  const char *sql = R"(
      INSERT INTO vectors (file_path, content_preview, embedding, dimension, model, indexed_at, file_mtime)
      VALUES (?1, ?2, ?3, ?4, ?5, julianday('now'), ?6)
      ON CONFLICT(file_path) DO UPDATE SET
          content_preview = excluded.content_preview,
          embedding = excluded.embedding,
          dimension = excluded.dimension,
          model = excluded.model,
          indexed_at = excluded.indexed_at,
          file_mtime = excluded.file_mtime
  )";
  const auto blob = serializeEmbedding(embedding);

  std::lock_guard<std::mutex> lock(mutex_);
  auto &checkErr = imp->checkErr_;
  utils::SqliteStmt stmt(imp->db_);
  checkErr = sqlite3_prepare_v2(imp->db_, sql, -1, &stmt.ref(), nullptr);
  checkErr = sqlite3_bind_text(stmt.ref(), 1, path.c_str(), -1, SQLITE_STATIC);
  checkErr = sqlite3_bind_text(stmt.ref(), 2, preview.c_str(), -1, SQLITE_STATIC);
  checkErr = sqlite3_bind_blob(stmt.ref(), 3, blob.data(), static_cast<int>(blob.size()), SQLITE_STATIC);
  checkErr = sqlite3_bind_int64(stmt.ref(), 4, static_cast<sqlite3_int64>(embedding.size()));
  checkErr = sqlite3_bind_text(stmt.ref(), 5, model.c_str(), -1, SQLITE_STATIC);
  checkErr = sqlite3_bind_double(stmt.ref(), 6, mtime);
  int rc = sqlite3_step(stmt.ref());
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(fmt::format("Failed to upsert {}: {}", path, sqlite3_errmsg(imp->db_)));
  }
}

std::vector<SearchResult> VectorStore::search(const std::vector<float> &queryEmbedding, size_t topK, float minScore,
  const std::string &model) const
{
  if (queryEmbedding.empty() || topK == 0) {
    return {};
  }
  std::vector<SearchResult> results;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &checkErr = imp->checkErr_;
    utils::SqliteStmt stmt(imp->db_);
    if (model.empty()) {
      const char *sql = "SELECT file_path, content_preview, embedding FROM vectors WHERE dimension = ?1";
      checkErr = sqlite3_prepare_v2(imp->db_, sql, -1, &stmt.ref(), nullptr);
      checkErr = sqlite3_bind_int64(stmt.ref(), 1, static_cast<sqlite3_int64>(queryEmbedding.size()));
    } else {
      const char *sql = "SELECT file_path, content_preview, embedding FROM vectors WHERE dimension = ?1 AND model = ?2";
      checkErr = sqlite3_prepare_v2(imp->db_, sql, -1, &stmt.ref(), nullptr);
      checkErr = sqlite3_bind_int64(stmt.ref(), 1, static_cast<sqlite3_int64>(queryEmbedding.size()));
      checkErr = sqlite3_bind_text(stmt.ref(), 2, model.c_str(), -1, SQLITE_STATIC);
    }
    int rc;
    while ((rc = sqlite3_step(stmt.ref())) == SQLITE_ROW) {
      auto embedding = deserializeEmbedding(stmt.getBlob(2));
      float score = cosineSimilarity(queryEmbedding, embedding);
      if (score >= minScore) {
        results.push_back({ score, stmt.getStr(0), stmt.getStr(1) });
      }
    }
    checkErr = rc;
  }
  std::sort(results.begin(), results.end(),
    [](const SearchResult &a, const SearchResult &b) {
      if (a.score != b.score) return a.score > b.score;
      return a.path < b.path;
    });
  if (topK < results.size()) {
    results.resize(topK);
  }
  return results;
}

bool VectorStore::remove(const std::string &path)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto &checkErr = imp->checkErr_;
  utils::SqliteStmt stmt(imp->db_);
  const char *sql = "DELETE FROM vectors WHERE file_path = ?1";
  checkErr = sqlite3_prepare_v2(imp->db_, sql, -1, &stmt.ref(), nullptr);
  checkErr = sqlite3_bind_text(stmt.ref(), 1, path.c_str(), -1, SQLITE_STATIC);
  checkErr = sqlite3_step(stmt.ref());
  return 0 < sqlite3_changes(imp->db_);
}

void VectorStore::clear()
{
  std::lock_guard<std::mutex> lock(mutex_);
  executeSql("DELETE FROM vectors");
}

std::vector<std::string> VectorStore::allPaths() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> paths;
  utils::SqliteStmt stmt(imp->db_);
  imp->checkErr_ = sqlite3_prepare_v2(imp->db_, "SELECT file_path FROM vectors", -1, &stmt.ref(), nullptr);
  while (sqlite3_step(stmt.ref()) == SQLITE_ROW) {
    paths.push_back(stmt.getStr(0));
  }
  return paths;
}

std::unordered_map<std::string, double> VectorStore::fileMtimes() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_map<std::string, double> mtimes;
  utils::SqliteStmt stmt(imp->db_);
  imp->checkErr_ = sqlite3_prepare_v2(imp->db_, "SELECT file_path, file_mtime FROM vectors", -1, &stmt.ref(), nullptr);
  while (sqlite3_step(stmt.ref()) == SQLITE_ROW) {
    mtimes.emplace(stmt.getStr(0), stmt.getDouble(1));
  }
  return mtimes;
}

std::optional<double> VectorStore::fileMtime(const std::string &path) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto &checkErr = imp->checkErr_;
  utils::SqliteStmt stmt(imp->db_);
  checkErr = sqlite3_prepare_v2(imp->db_, "SELECT file_mtime FROM vectors WHERE file_path = ?1", -1, &stmt.ref(), nullptr);
  checkErr = sqlite3_bind_text(stmt.ref(), 1, path.c_str(), -1, SQLITE_STATIC);
  if (sqlite3_step(stmt.ref()) == SQLITE_ROW) {
    return stmt.getDouble(0);
  }
  return std::nullopt;
}

int64_t VectorStore::count() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  utils::SqliteStmt stmt(imp->db_);
  imp->checkErr_ = sqlite3_prepare_v2(imp->db_, "SELECT COUNT(*) FROM vectors", -1, &stmt.ref(), nullptr);
  int64_t n = 0;
  if (sqlite3_step(stmt.ref()) == SQLITE_ROW) {
    n = stmt.getInt64(0);
  }
  return n;
}

std::optional<double> VectorStore::maxIndexedAt() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  utils::SqliteStmt stmt(imp->db_);
  imp->checkErr_ = sqlite3_prepare_v2(imp->db_, "SELECT MAX(indexed_at) FROM vectors", -1, &stmt.ref(), nullptr);
  if (sqlite3_step(stmt.ref()) == SQLITE_ROW && !stmt.isNull(0)) {
    return stmt.getDouble(0);
  }
  return std::nullopt;
}

std::string VectorStore::dbPath() const
{
  return imp->dbPath_;
}
