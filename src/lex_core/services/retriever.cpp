#include "lex_core/services/retriever.hpp"

#include <stdexcept>

namespace lex_core {

Retriever::Retriever(std::shared_ptr<EmbeddingProvider> embedder) : embedder_(std::move(embedder)) {
  if (!embedder_) {
    throw std::invalid_argument("Retriever requires an embedding provider");
  }
}

std::vector<RetrievalResult> Retriever::search(const VectorIndex &index,
                                               const std::string &query,
                                               int top_k) {
  if (index.empty() || top_k <= 0) {
    return {};
  }

  std::vector<float> query_vector = embedder_->embed_query(query);
  std::vector<IndexHit> hits = index.search(query_vector, top_k);

  std::vector<RetrievalResult> results;
  results.reserve(hits.size());
  for (const auto &hit : hits) {
    results.push_back(to_retrieval_result(*hit.chunk, hit.distance));
  }
  return results;
}

}  // namespace lex_core
