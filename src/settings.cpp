#include "settings.h"
#include "cutils.h"
#include <fstream>
#include <stdexcept>
#include <filesystem>
#include <cstdlib>
#include <utils_log/logger.hpp>

namespace {
  std::string envValue(const char *name) {
    const char *v = std::getenv(name);
    return v ? std::string(v) : std::string{};
  }

  std::vector<std::string> stringList(const nlohmann::json &section, const char *key, const std::vector<std::string> &def) {
    if (!section.contains(key) || !section[key].is_array()) return def;
    std::vector<std::string> v;
    for (const auto &item : section[key]) {
      if (item.is_string())
        v.push_back(item.get<std::string>());
    }
    return v;
  }
} // anonymous namespace

Settings::Settings(const std::string &path)
  : config_(defaults())
  , path_(path.empty() ? defaultPath() : path)
{
  if (std::filesystem::exists(path_)) {
    updateFromPath(path_);
  }
  applyEnvOverrides();
}

std::string Settings::defaultPath()
{
  return (std::filesystem::path(utils::configDir()) / "settings.json").string();
}

nlohmann::json Settings::defaults()
{
  return {
    {"ollama", {
      {"url", "http://localhost:11434"},
      {"timeout_secs", 30},
      {"embedding_model", "qwen3-embedding:8b"}
    }},
    {"vector_search", {
      {"enabled", true},
      {"top_k", 10},
      {"min_score", 0.3},
      {"max_file_size_bytes", 1'000'000},
      {"index_dirs", {"~/Documents", "~/Projects", "~/Downloads"}}
    }},
    {"indexer", {
      {"interval_hours", 24},
      {"max_content_chars", 4096},
      {"file_extensions", {
        "txt", "md", "rs", "ts", "tsx", "js", "py", "toml", "yaml", "yml", "json", "sh", "css", "html",
        "pdf", "doc", "docx", "xlsx", "xls", "pptx", "odt", "ods", "odp", "csv", "rtf"
      }}
    }},
    {"daemon", {
      {"startup_timeout_secs", 5}
    }},
    {"logging", {
      {"log_file", "burrow.log"},
      {"diagnostics_file", "burrow-diagnostics.log"},
      {"log_to_file", false},
      {"log_to_console", true}
    }}
  };
}

void Settings::updateFromConfig(const nlohmann::json &config)
{
  if (!config.is_object()) {
    throw std::runtime_error("Settings must be a JSON object");
  }
  auto def = defaults();
  config_ = def;
  config_.merge_patch(config);
  // Sections nulled or replaced by a scalar fall back to their defaults.
  for (auto it = def.begin(); it != def.end(); ++it) {
    if (it->is_object() && (!config_.contains(it.key()) || !config_[it.key()].is_object())) {
      config_[it.key()] = it.value();
    }
  }
}

void Settings::updateFromPath(const std::string &path)
{
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open settings file: " + path);
  }
  nlohmann::json loaded;
  try {
    file >> loaded;
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error("Invalid settings file " + path + ": " + e.what());
  }
  updateFromConfig(loaded);
  path_ = path;
}

void Settings::applyEnvOverrides()
{
  if (auto url = envValue("BURROW_OLLAMA_URL"); !url.empty()) {
    config_["ollama"]["url"] = url;
  }
  if (auto model = envValue("BURROW_MODEL_EMBEDDING"); !model.empty()) {
    config_["ollama"]["embedding_model"] = model;
  }
  if (auto enabled = utils::toLower(envValue("BURROW_VECTOR_SEARCH_ENABLED")); !enabled.empty()) {
    if (enabled == "true" || enabled == "1") {
      config_["vector_search"]["enabled"] = true;
    } else if (enabled == "false" || enabled == "0") {
      config_["vector_search"]["enabled"] = false;
    } else {
      LOG_MSG << "Ignoring invalid BURROW_VECTOR_SEARCH_ENABLED value:" << enabled;
    }
  }
  auto key = envValue("BURROW_OPENROUTER_API_KEY");
  if (key.empty()) key = envValue("OPENROUTER_API_KEY");
  if (!key.empty()) {
    config_["openrouter_api_key"] = key;
  }
}

void Settings::save()
{
  auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }
  std::ofstream file(path_);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot write settings file: " + path_);
  }
  // Secrets stay in the environment.
  auto out = config_;
  out.erase("openrouter_api_key");
  file << out.dump(2);
}

std::vector<std::string> Settings::indexDirs() const
{
  auto dirs = stringList(config_["vector_search"], "index_dirs", {});
  for (auto &d : dirs) {
    d = utils::expandHome(d);
  }
  return dirs;
}

std::vector<std::string> Settings::indexerFileExtensions() const
{
  auto exts = stringList(config_["indexer"], "file_extensions", {});
  for (auto &e : exts) {
    if (e.starts_with(".")) e.erase(0, 1);
    e = utils::toLower(e);
  }
  return exts;
}

IndexerConfig Settings::indexerConfig() const
{
  IndexerConfig cfg;
  cfg.indexDirs = indexDirs();
  cfg.extensions = indexerFileExtensions();
  cfg.maxFileSizeBytes = maxFileSizeBytes();
  cfg.maxContentChars = indexerMaxContentChars();
  cfg.model = embeddingModel();
  return cfg;
}
