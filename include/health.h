#ifndef _HEALTH_H_
#define _HEALTH_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class Settings;
class VectorStore;
class EmbeddingClient;

struct HealthStatus {
  bool ollama = false;
  bool vectorDb = false;
  bool apiKey = false;
  bool indexing = false;
  std::vector<std::string> issues;

  nlohmann::json toJson() const;
  static HealthStatus fromJson(const nlohmann::json &j);
  // "Ollama: OK | Vector DB: OK | API Key: FAIL | Issues: ..."
  std::string summaryLine() const;
};

struct StatsInfo {
  int64_t indexedFiles = 0;
  int64_t launchCount = 0;
  std::optional<std::string> lastIndexed;

  nlohmann::json toJson() const;
  static StatsInfo fromJson(const nlohmann::json &j);
};

// `store` may be null when the vector store could not be opened.
HealthStatus checkHealth(const Settings &settings, const EmbeddingClient &ollama, const VectorStore *store, bool indexing);

StatsInfo collectStats(const VectorStore &store, const std::string &historyDbPath);

// Rows in the launcher's `launches` table; 0 when the history database or table is absent.
int64_t countLaunches(const std::string &historyDbPath);

std::string defaultHistoryDbPath();

#endif // _HEALTH_H_
