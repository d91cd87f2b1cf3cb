#include "search.h"
#include "settings.h"
#include "inference.h"
#include "cutils.h"
#include <stdexcept>
#include <utils_log/logger.hpp>

using json = nlohmann::json;

std::vector<SearchResult> searchByContent(const std::string &query, const Settings &settings,
  const EmbeddingProvider &embedder, const VectorStore &store)
{
  if (!settings.vectorSearchEnabled()) {
    throw std::runtime_error("Vector search is disabled in config");
  }
  auto text = utils::trimmed(query);
  if (text.empty()) {
    return {};
  }
  auto queryEmbedding = embedder.generateEmbedding(text);
  if (queryEmbedding.empty()) {
    throw std::runtime_error("Empty embedding returned for query");
  }
  // Must match the model the indexer records.
  auto model = settings.embeddingModel();
  if (model.empty()) model = embedder.modelName();

  auto results = store.search(queryEmbedding, settings.vectorSearchTopK(), settings.vectorSearchMinScore(), model);
  LOG_MSG << "Content search returned" << results.size() << "results";
  return results;
}

json searchResultsToJson(const std::vector<SearchResult> &results)
{
  json arr = json::array();
  for (const auto &r : results) {
    arr.push_back({
      {"path", utils::toValidUtf8(r.path)},
      {"score", r.score},
      {"preview", utils::toValidUtf8(r.preview)}
    });
  }
  return arr;
}
