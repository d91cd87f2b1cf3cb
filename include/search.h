#ifndef _SEARCH_H_
#define _SEARCH_H_

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "vectorstore.h"

class Settings;
class EmbeddingProvider;

// Embeds `query` and ranks the stored files against it with the configured
// `vector_search.top_k` and `min_score`. Only rows embedded by the configured
// model are scored. Throws when vector search is disabled or embedding fails.
std::vector<SearchResult> searchByContent(const std::string &query, const Settings &settings,
  const EmbeddingProvider &embedder, const VectorStore &store);

nlohmann::json searchResultsToJson(const std::vector<SearchResult> &results);

#endif // _SEARCH_H_
