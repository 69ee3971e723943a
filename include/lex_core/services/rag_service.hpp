#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "lex_core/embeddings/embedding_provider.hpp"
#include "lex_core/index/index_manager.hpp"
#include "lex_core/index/vector_index.hpp"
#include "lex_core/llm/completion_client.hpp"
#include "lex_core/llm/ollama_client.hpp"
#include "lex_core/rag_settings.hpp"
#include "lex_core/services/answer_synthesizer.hpp"
#include "lex_core/services/retriever.hpp"
#include "lex_core/types/chunk.hpp"

namespace lex_core {

struct IndexStatus {
  bool vectorstore_loaded = false;
  size_t document_count = 0;
  std::string embedding_model;
  bool index_saved = false;
  std::string status;
  std::string llm_model;
};

/**
 * @class RagService
 * @brief Owns the RAG pipeline and the live index snapshot.
 *
 * The index is loaded or built once, by initialize() or by the first query. Queries copy the
 * current snapshot and read it without holding any lock. force_rebuild() builds a replacement on
 * the side and swaps it in when complete.
 */
class RagService {
 public:
  explicit RagService(const RagSettings &settings);
  RagService(const RagSettings &settings,
             std::shared_ptr<OllamaClient> ollama_client,
             std::shared_ptr<CompletionClient> completion_client,
             std::shared_ptr<EmbeddingProvider> embedder);

  RagService(const RagService &) = delete;
  RagService &operator=(const RagService &) = delete;

  // Loads or builds the index. A failed attempt is retried by the next caller. Waits for a
  // rebuild in progress, and keeps the rebuilt index if one was installed.
  void initialize();

  // Never throws
  Answer generate_answer(const std::string &query);

  // Propagates EmbeddingError, IndexStoreError and filesystem errors
  BuildReport force_rebuild();

  // Does not trigger initialization
  IndexStatus status() const;

  std::shared_ptr<const VectorIndex> snapshot() const;

  bool model_server_available() const;

 private:
  void swap_snapshot(std::shared_ptr<const VectorIndex> index);

  RagSettings settings_;
  std::shared_ptr<OllamaClient> ollama_client_;
  std::shared_ptr<CompletionClient> completion_client_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<IndexManager> index_manager_;
  std::shared_ptr<Retriever> retriever_;
  std::unique_ptr<AnswerSynthesizer> synthesizer_;

  std::once_flag init_flag_;
  std::mutex rebuild_mutex_;
  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const VectorIndex> index_;
};

}  // namespace lex_core
