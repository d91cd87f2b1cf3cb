#include "inference.h"
#include "settings.h"
#include <stdexcept>
#include <mutex>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <utils_log/logger.hpp>
#include <fmt/core.h>


namespace {
  // Splits "http://host:port/prefix" into "http://host:port" and "/prefix".
  std::pair<std::string, std::string> splitUrl(const std::string &url) {
    size_t protocolEnd = url.find("://");
    if (protocolEnd == std::string::npos) {
      throw std::runtime_error("Invalid server URL format: " + url);
    }
    size_t hostStart = protocolEnd + 3;
    size_t pathStart = url.find("/", hostStart);
    if (pathStart == std::string::npos) {
      pathStart = url.size();
    }
    auto path = url.substr(pathStart);
    while (!path.empty() && path.back() == '/') path.pop_back();
    return { url.substr(0, pathStart), path };
  }

  void applyTimeouts(httplib::Client &client, size_t timeoutMs) {
    client.set_connection_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
    client.set_read_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
    client.set_write_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
  }
}

struct EmbeddingClient::Impl {
  std::string baseUrl_;
  std::string model_;
  size_t timeoutMs_ = 30'000;
  std::unique_ptr<httplib::Client> client_;
  std::string pathPrefix_;
  std::mutex clientMutex_;

  httplib::Client &httpClient();
};

httplib::Client &EmbeddingClient::Impl::httpClient()
{
  if (!client_) {
    const auto [schemaHostPort, prefix] = splitUrl(baseUrl_);
    client_ = std::make_unique<httplib::Client>(schemaHostPort);
    applyTimeouts(*client_, timeoutMs_);
    pathPrefix_ = prefix;
  }
  return *client_;
}

EmbeddingClient::EmbeddingClient(const std::string &baseUrl, const std::string &model, size_t timeoutMs)
  : imp(new Impl)
{
  imp->baseUrl_ = baseUrl;
  imp->model_ = model;
  imp->timeoutMs_ = timeoutMs;
}

EmbeddingClient::EmbeddingClient(const Settings &settings)
  : EmbeddingClient(settings.ollamaUrl(), settings.embeddingModel(), settings.ollamaTimeoutSecs() * 1000)
{
}

EmbeddingClient::~EmbeddingClient()
{
}

std::string EmbeddingClient::modelName() const
{
  return imp->model_;
}

std::vector<float> EmbeddingClient::generateEmbedding(const std::string &text) const
{
  nlohmann::json requestBody = {
    {"model", imp->model_},
    {"input", text}
  };
  std::string bodyStr = requestBody.dump();

  std::lock_guard<std::mutex> lock(imp->clientMutex_);
  auto &client = imp->httpClient();
  auto res = client.Post(imp->pathPrefix_ + "/api/embed", bodyStr, "application/json");
  if (!res) {
    throw std::runtime_error(fmt::format("Failed to connect to embedding server at {}: {}", imp->baseUrl_, httplib::to_string(res.error())));
  }
  if (res->status != 200) {
    throw std::runtime_error("Embedding server returned error: " + std::to_string(res->status) + " - " + res->body);
  }
  try {
    nlohmann::json response = nlohmann::json::parse(res->body);
    if (!response.contains("embeddings") || !response["embeddings"].is_array() || response["embeddings"].empty()) {
      throw std::runtime_error("No embeddings in response");
    }
    const auto &embeddingData = response["embeddings"][0];
    if (!embeddingData.is_array() || embeddingData.empty()) {
      throw std::runtime_error("Invalid embedding structure");
    }
    std::vector<float> embedding;
    embedding.reserve(embeddingData.size());
    for (const auto &value : embeddingData) {
      if (!value.is_number()) {
        throw std::runtime_error("Non-numeric value in embedding data");
      }
      embedding.push_back(value.get<float>());
    }
    return embedding;
  } catch (const nlohmann::json::exception &e) {
    LOG_MSG << "JSON parsing error: " << e.what();
    throw std::runtime_error("Failed to parse embedding server response");
  }
}

bool EmbeddingClient::isReachable(std::string *error, size_t timeoutMs) const
{
  std::string reason;
  try {
    const auto [schemaHostPort, prefix] = splitUrl(imp->baseUrl_);
    httplib::Client client(schemaHostPort);
    applyTimeouts(client, timeoutMs);
    auto res = client.Get(prefix + "/api/tags");
    if (!res) {
      reason = fmt::format("unreachable ({})", httplib::to_string(res.error()));
    } else if (res->status != 200) {
      reason = fmt::format("unhealthy (status {})", res->status);
    } else {
      return true;
    }
  } catch (const std::exception &e) {
    reason = e.what();
  }
  LOG_MSG << "Ollama health check failed:" << reason;
  if (error) *error = reason;
  return false;
}
