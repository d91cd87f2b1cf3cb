#ifndef _INFERENCE_H_
#define _INFERENCE_H_

#include <vector>
#include <string>
#include <memory>

// Text -> fixed-length float vector.
class EmbeddingProvider {
public:
  virtual ~EmbeddingProvider() = default;
  virtual std::vector<float> generateEmbedding(const std::string &text) const = 0;
  virtual std::string modelName() const = 0;
};

class Settings;

// Ollama `/api/embed` client.
class EmbeddingClient : public EmbeddingProvider {
public:
  EmbeddingClient(const std::string &baseUrl, const std::string &model, size_t timeoutMs);
  explicit EmbeddingClient(const Settings &settings);
  ~EmbeddingClient() override;

  std::vector<float> generateEmbedding(const std::string &text) const override;
  std::string modelName() const override;

  // GET /api/tags with its own short timeout. On failure `error` receives the reason.
  bool isReachable(std::string *error = nullptr, size_t timeoutMs = 3000) const;

private:
  EmbeddingClient(const EmbeddingClient &) = delete;
  EmbeddingClient &operator =(const EmbeddingClient &) = delete;

  struct Impl;
  std::unique_ptr<Impl> imp;
};

#endif // _INFERENCE_H_
