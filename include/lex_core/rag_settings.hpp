#pragma once

#include <filesystem>
#include <string>

namespace lex_core {

enum class EmbeddingVariant { Generic, Instruct };

std::string to_string(EmbeddingVariant variant);
EmbeddingVariant embedding_variant_from_string(const std::string &str);

// Everything the RAG core needs to know, independent of where it was configured.
struct RagSettings {
  std::filesystem::path corpus_dir = "./data/corpus";
  std::filesystem::path index_path = "./data/index/lexrag_index.db";

  std::string ollama_url = "http://localhost:11434";
  std::string embedding_model = "multilingual-e5-large-instruct";
  EmbeddingVariant embedding_variant = EmbeddingVariant::Instruct;
  std::string query_instruction =
      "Given a question about the law, retrieve the legal passages that answer it";
  std::string llm_model = "llama3.1:8b";

  int top_k = 5;
  size_t chunk_size = 1000;
  size_t chunk_overlap = 200;
  size_t embed_batch_size = 8;
  size_t index_batch_size = 50;
  int llm_timeout_seconds = 60;
};

}  // namespace lex_core
