#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "lex_core/rag_settings.hpp"

class Config {
 public:
  std::string api_base_url;
  std::string corpus_dir;
  std::string index_path;
  std::string ollama_url;
  std::string embedding_model;
  std::string embedding_variant;
  std::string query_instruction;
  std::string llm_model;

  // Retrieval and chunking
  int top_k;
  int chunk_size;
  int chunk_overlap;
  int embed_batch_size;
  int index_batch_size;

  int llm_timeout_seconds;
  bool eager_init;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }

    Config config;
    const lex_core::RagSettings defaults;

    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:8080"));
      config.corpus_dir = json_config.value("corpus_dir", defaults.corpus_dir.string());
      config.index_path = json_config.value("index_path", defaults.index_path.string());
      config.ollama_url = json_config.value("ollama_url", defaults.ollama_url);
      config.embedding_model = json_config.value("embedding_model", defaults.embedding_model);
      config.embedding_variant =
          json_config.value("embedding_variant", lex_core::to_string(defaults.embedding_variant));
      config.query_instruction = json_config.value("query_instruction", defaults.query_instruction);
      config.llm_model = json_config.value("llm_model", defaults.llm_model);

      config.top_k = json_config.value("top_k", defaults.top_k);
      config.chunk_size = json_config.value("chunk_size", static_cast<int>(defaults.chunk_size));
      config.chunk_overlap = json_config.value("chunk_overlap", static_cast<int>(defaults.chunk_overlap));
      config.embed_batch_size =
          json_config.value("embed_batch_size", static_cast<int>(defaults.embed_batch_size));
      config.index_batch_size =
          json_config.value("index_batch_size", static_cast<int>(defaults.index_batch_size));

      config.llm_timeout_seconds = json_config.value("llm_timeout_seconds", defaults.llm_timeout_seconds);
      config.eager_init = json_config.value("eager_init", true);
    } catch (const nlohmann::json::type_error& e) {
      throw std::runtime_error(std::string("Invalid value type in config: ") + e.what());
    }

    config.validate();
    return config;
  }

  // The subset of the configuration the RAG core uses
  lex_core::RagSettings rag_settings() const {
    lex_core::RagSettings settings;
    settings.corpus_dir = corpus_dir;
    settings.index_path = index_path;
    settings.ollama_url = ollama_url;
    settings.embedding_model = embedding_model;
    settings.embedding_variant = lex_core::embedding_variant_from_string(embedding_variant);
    settings.query_instruction = query_instruction;
    settings.llm_model = llm_model;
    settings.top_k = top_k;
    settings.chunk_size = static_cast<size_t>(chunk_size);
    settings.chunk_overlap = static_cast<size_t>(chunk_overlap);
    settings.embed_batch_size = static_cast<size_t>(embed_batch_size);
    settings.index_batch_size = static_cast<size_t>(index_batch_size);
    settings.llm_timeout_seconds = llm_timeout_seconds;
    return settings;
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    if (api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must be in host:port form");
    }
    if (corpus_dir.empty()) {
      throw std::runtime_error("corpus_dir cannot be empty");
    }
    if (index_path.empty()) {
      throw std::runtime_error("index_path cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (llm_model.empty()) {
      throw std::runtime_error("llm_model cannot be empty");
    }
    if (embedding_variant != "generic" && embedding_variant != "instruct") {
      throw std::runtime_error("embedding_variant must be \"generic\" or \"instruct\"");
    }
    if (embedding_variant == "instruct" && query_instruction.empty()) {
      throw std::runtime_error("query_instruction cannot be empty for the instruct embedding variant");
    }
    if (top_k <= 0) {
      throw std::runtime_error("top_k must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be at least 0 and smaller than chunk_size");
    }
    if (embed_batch_size <= 0) {
      throw std::runtime_error("embed_batch_size must be greater than 0");
    }
    if (index_batch_size <= 0) {
      throw std::runtime_error("index_batch_size must be greater than 0");
    }
    if (llm_timeout_seconds <= 0) {
      throw std::runtime_error("llm_timeout_seconds must be greater than 0");
    }
  }
};
