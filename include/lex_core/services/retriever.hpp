#pragma once

#include <memory>
#include <string>
#include <vector>

#include "lex_core/embeddings/embedding_provider.hpp"
#include "lex_core/index/vector_index.hpp"
#include "lex_core/types/chunk.hpp"

namespace lex_core {

class Retriever {
 public:
  explicit Retriever(std::shared_ptr<EmbeddingProvider> embedder);

  // At most top_k results, closest first. An empty index or top_k <= 0 never reaches the model.
  std::vector<RetrievalResult> search(const VectorIndex &index, const std::string &query, int top_k);

 private:
  std::shared_ptr<EmbeddingProvider> embedder_;
};

}  // namespace lex_core
