#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "lex_core/corpus/corpus_loader.hpp"
#include "lex_core/embeddings/embedding_provider.hpp"
#include "lex_core/index/index_store.hpp"
#include "lex_core/index/vector_index.hpp"
#include "lex_core/types/chunk.hpp"

namespace lex_core {

struct RebuildResult {
  BuildReport report;
  // Empty when the corpus produced no chunks
  std::optional<VectorIndex> index;
};

/**
 * @class IndexManager
 * @brief Builds the vector index from the corpus and keeps its on-disk copy current.
 *
 * Chunks are embedded in batches of index_batch_size. Each batch becomes its own sub-index,
 * keyed by the chunks' global positions, and is merged into the accumulator before the next
 * batch starts.
 */
class IndexManager {
 public:
  IndexManager(std::shared_ptr<EmbeddingProvider> embedder,
               std::shared_ptr<CorpusLoader> loader,
               size_t index_batch_size);

  // Propagates EmbeddingError and VectorIndexError
  VectorIndex build(const std::vector<Chunk> &chunks);

  void save(const VectorIndex &index, const std::filesystem::path &path, double build_time_ms);

  // Throws IndexUnavailableError for an unusable artifact
  std::optional<VectorIndex> load(const std::filesystem::path &path);

  /**
   * @brief Loads the artifact at path, or builds from corpus_root and saves when it is missing or
   * unusable. A persisted index is never checked against the corpus.
   */
  VectorIndex build_or_load(const std::filesystem::path &corpus_root,
                            const std::filesystem::path &path);

  /**
   * @brief Rebuilds from corpus_root regardless of what is on disk. An empty corpus reports
   * failure and leaves the artifact at path untouched.
   */
  RebuildResult force_rebuild(const std::filesystem::path &corpus_root,
                              const std::filesystem::path &path);

 private:
  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<CorpusLoader> loader_;
  size_t index_batch_size_;
};

}  // namespace lex_core
