#ifndef _SETTINGS_H_
#define _SETTINGS_H_

#define _CRT_SECURE_NO_WARNINGS

#include <string>
#include <vector>
#include "nlohmann/json.hpp"

// Snapshot of the settings the indexer consumes during one run.
struct IndexerConfig {
  std::vector<std::string> indexDirs;
  std::vector<std::string> extensions;
  size_t maxFileSizeBytes = 1'000'000;
  size_t maxContentChars = 4096;
  std::string model;
};

class Settings {
private:
  nlohmann::json config_;
  std::string path_;

public:
  // Loads `path` when it exists, otherwise starts from built-in defaults.
  // Environment overrides are applied on top in both cases.
  explicit Settings(const std::string &path = {});

  static std::string defaultPath();
  static nlohmann::json defaults();

  void updateFromConfig(const nlohmann::json &config);
  void updateFromPath(const std::string &path);
  void applyEnvOverrides();
  void save();
  std::string configPath() const { return path_; }

  std::string ollamaUrl() const { return config_["ollama"].value("url", "http://localhost:11434"); }
  size_t ollamaTimeoutSecs() const { return config_["ollama"].value("timeout_secs", size_t(30)); }
  std::string embeddingModel() const { return config_["ollama"].value("embedding_model", "qwen3-embedding:8b"); }

  bool vectorSearchEnabled() const { return config_["vector_search"].value("enabled", true); }
  size_t vectorSearchTopK() const { return config_["vector_search"].value("top_k", size_t(10)); }
  float vectorSearchMinScore() const { return config_["vector_search"].value("min_score", 0.3f); }
  size_t maxFileSizeBytes() const { return config_["vector_search"].value("max_file_size_bytes", size_t(1'000'000)); }
  std::vector<std::string> indexDirs() const;

  size_t indexerIntervalHours() const { return config_["indexer"].value("interval_hours", size_t(24)); }
  size_t indexerMaxContentChars() const { return config_["indexer"].value("max_content_chars", size_t(4096)); }
  std::vector<std::string> indexerFileExtensions() const;

  size_t daemonStartupTimeoutSecs() const { return config_["daemon"].value("startup_timeout_secs", size_t(5)); }

  std::string openrouterApiKey() const { return config_.value("openrouter_api_key", ""); }

  std::string loggingLoggingFile() const {
    return config_.contains("logging") ? config_["logging"].value("log_file", "burrow.log") : std::string("burrow.log");
  }
  std::string loggingDiagnosticsFile() const {
    return config_.contains("logging") ? config_["logging"].value("diagnostics_file", "burrow-diagnostics.log") : std::string("burrow-diagnostics.log");
  }
  bool loggingLogToFile() const {
    return config_.contains("logging") ? config_["logging"].value("log_to_file", false) : false;
  }
  bool loggingLogToConsole() const {
    return config_.contains("logging") ? config_["logging"].value("log_to_console", true) : true;
  }

  IndexerConfig indexerConfig() const;

  std::string configDump() const { return config_.dump(2); }
  nlohmann::json configJson() const { return config_; }
};


#endif // _SETTINGS_H_
