#include "health.h"
#include "settings.h"
#include "vectorstore.h"
#include "inference.h"
#include "cutils.h"
#include <filesystem>
#include <stdexcept>
#include <sqlite3.h>
#include <utils_log/logger.hpp>
#include <fmt/core.h>

using json = nlohmann::json;

json HealthStatus::toJson() const
{
  return {
    {"ollama", ollama},
    {"vector_db", vectorDb},
    {"api_key", apiKey},
    {"indexing", indexing},
    {"issues", issues}
  };
}

HealthStatus HealthStatus::fromJson(const json &j)
{
  HealthStatus h;
  h.ollama = j.at("ollama").get<bool>();
  h.vectorDb = j.at("vector_db").get<bool>();
  h.apiKey = j.at("api_key").get<bool>();
  h.indexing = j.value("indexing", false);
  h.issues = j.value("issues", std::vector<std::string>{});
  return h;
}

std::string HealthStatus::summaryLine() const
{
  auto ok = [](bool b) { return b ? "OK" : "FAIL"; };
  auto line = fmt::format("Ollama: {} | Vector DB: {} | API Key: {}", ok(ollama), ok(vectorDb), ok(apiKey));
  if (indexing) {
    line += " | Indexing: running";
  }
  if (!issues.empty()) {
    line += " | Issues: ";
    for (size_t i = 0; i < issues.size(); ++i) {
      if (i) line += "; ";
      line += issues[i];
    }
  }
  return line;
}

json StatsInfo::toJson() const
{
  return {
    {"indexed_files", indexedFiles},
    {"launch_count", launchCount},
    {"last_indexed", lastIndexed ? json(*lastIndexed) : json(nullptr)}
  };
}

StatsInfo StatsInfo::fromJson(const json &j)
{
  StatsInfo s;
  s.indexedFiles = j.at("indexed_files").get<int64_t>();
  s.launchCount = j.at("launch_count").get<int64_t>();
  if (j.contains("last_indexed") && j["last_indexed"].is_string()) {
    s.lastIndexed = j["last_indexed"].get<std::string>();
  }
  return s;
}

//---------------------------------------------------------------------------

HealthStatus checkHealth(const Settings &settings, const EmbeddingClient &ollama, const VectorStore *store, bool indexing)
{
  HealthStatus h;
  h.indexing = indexing;

  std::string reason;
  h.ollama = ollama.isReachable(&reason);
  if (!h.ollama) {
    h.issues.push_back("Ollama: " + reason);
  }

  if (!store) {
    h.issues.push_back("Vector DB: unavailable");
  } else {
    try {
      store->count();
      h.vectorDb = true;
    } catch (const std::exception &e) {
      h.issues.push_back(fmt::format("Vector DB: query failed ({})", e.what()));
    }
  }

  h.apiKey = !settings.openrouterApiKey().empty();
  if (!h.apiKey) {
    h.issues.push_back("OpenRouter API key not configured");
  }
  return h;
}

std::string defaultHistoryDbPath()
{
  return (std::filesystem::path(utils::dataDir()) / "history.db").string();
}

int64_t countLaunches(const std::string &historyDbPath)
{
  std::error_code ec;
  if (!std::filesystem::exists(historyDbPath, ec)) {
    return 0;
  }
  sqlite3 *db = nullptr;
  if (sqlite3_open_v2(historyDbPath.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    if (db) sqlite3_close(db);
    throw std::runtime_error("Failed to open history DB: " + msg);
  }
  int64_t n = 0;
  {
    utils::SqliteStmt stmt(db);
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM launches", -1, &stmt.ref(), nullptr) != SQLITE_OK) {
      LOG_MSG << "History DB has no launches table:" << sqlite3_errmsg(db);
    } else if (sqlite3_step(stmt.ref()) == SQLITE_ROW) {
      n = stmt.getInt64(0);
    }
  }
  sqlite3_close(db);
  return n;
}

StatsInfo collectStats(const VectorStore &store, const std::string &historyDbPath)
{
  StatsInfo s;
  s.indexedFiles = store.count();
  s.launchCount = countLaunches(historyDbPath);
  if (store.maxIndexedAt()) {
    s.lastIndexed = "available";
  }
  return s;
}
