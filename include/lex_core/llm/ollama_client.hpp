#pragma once

#include <string>
#include <vector>

#include "lex_core/llm/model_service_error.hpp"

namespace lex_core {

/**
 * Thin wrapper over ollama-hpp. Used for embeddings and for the primary generation path.
 * Methods are virtual so tests can substitute a gmock double.
 */
class OllamaClient {
 public:
  OllamaClient(const std::string &ollama_url, int timeout_seconds);
  virtual ~OllamaClient() = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  virtual std::vector<float> get_embedding(const std::string &model, const std::string &text);

  // Single non-streaming completion
  virtual std::string generate(const std::string &model, const std::string &prompt);

  // Never throws
  virtual bool is_server_available();

 private:
  std::string ollama_url_;
  int timeout_seconds_;

  void setup_server_connection();
};

}  // namespace lex_core
