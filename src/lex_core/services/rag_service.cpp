#include "lex_core/services/rag_service.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace lex_core {

RagService::RagService(const RagSettings &settings)
    : RagService(settings,
                 std::make_shared<OllamaClient>(settings.ollama_url, settings.llm_timeout_seconds),
                 std::make_shared<CompletionClient>(settings.ollama_url,
                                                    settings.llm_timeout_seconds),
                 nullptr) {}

RagService::RagService(const RagSettings &settings,
                       std::shared_ptr<OllamaClient> ollama_client,
                       std::shared_ptr<CompletionClient> completion_client,
                       std::shared_ptr<EmbeddingProvider> embedder)
    : settings_(settings),
      ollama_client_(std::move(ollama_client)),
      completion_client_(std::move(completion_client)),
      embedder_(std::move(embedder)) {
  if (!ollama_client_ || !completion_client_) {
    throw std::invalid_argument("RagService requires an Ollama client and a completion client");
  }
  if (!embedder_) {
    embedder_ = make_embedding_provider(settings_, ollama_client_);
  }

  auto loader = std::make_shared<CorpusLoader>(settings_.chunk_size, settings_.chunk_overlap);
  index_manager_ = std::make_shared<IndexManager>(embedder_, loader, settings_.index_batch_size);
  retriever_ = std::make_shared<Retriever>(embedder_);
  synthesizer_ = std::make_unique<AnswerSynthesizer>(retriever_, ollama_client_, completion_client_,
                                                     settings_.llm_model, settings_.top_k);
}

void RagService::initialize() {
  std::call_once(init_flag_, [this]() {
    // Shares the artifact path with force_rebuild
    std::lock_guard<std::mutex> rebuild_lock(rebuild_mutex_);
    if (snapshot()) {
      // A rebuild already installed an index
      return;
    }
    std::cout << "Initializing RAG service (index: " << settings_.index_path << ")" << std::endl;
    VectorIndex index = index_manager_->build_or_load(settings_.corpus_dir, settings_.index_path);
    swap_snapshot(std::make_shared<const VectorIndex>(std::move(index)));
  });
}

std::shared_ptr<const VectorIndex> RagService::snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return index_;
}

void RagService::swap_snapshot(std::shared_ptr<const VectorIndex> index) {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  index_ = std::move(index);
}

Answer RagService::generate_answer(const std::string &query) {
  try {
    initialize();
  } catch (const std::exception &e) {
    std::cerr << "Error: RAG service initialization failed: " << e.what() << std::endl;
    return Answer{kApologyAnswer, {}};
  }
  return synthesizer_->generate_answer(snapshot(), query);
}

BuildReport RagService::force_rebuild() {
  std::lock_guard<std::mutex> rebuild_lock(rebuild_mutex_);
  std::cout << "Rebuilding index from " << settings_.corpus_dir << std::endl;

  RebuildResult result = index_manager_->force_rebuild(settings_.corpus_dir, settings_.index_path);
  if (result.index) {
    swap_snapshot(std::make_shared<const VectorIndex>(std::move(*result.index)));
    std::cout << "Rebuilt index with " << result.report.document_count << " documents in "
              << result.report.build_time_ms << " ms" << std::endl;
  }
  return result.report;
}

bool RagService::model_server_available() const {
  return ollama_client_->is_server_available();
}

IndexStatus RagService::status() const {
  std::shared_ptr<const VectorIndex> current = snapshot();
  std::error_code ec;

  IndexStatus status;
  status.vectorstore_loaded = current != nullptr;
  status.document_count = current ? current->size() : 0;
  status.embedding_model = embedder_->model_name();
  status.index_saved = std::filesystem::exists(settings_.index_path, ec);
  status.status = status.vectorstore_loaded ? "ready" : "not_loaded";
  status.llm_model = settings_.llm_model;
  return status;
}

}  // namespace lex_core
