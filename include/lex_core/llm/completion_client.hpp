#pragma once

#include <string>

#include "lex_core/llm/model_service_error.hpp"

namespace lex_core {

/**
 * Calls the Ollama completion endpoint (POST {ollama_url}/api/generate) directly over libcurl.
 * This is the low-level path used when the ollama-hpp pipeline fails. A non-2xx status, a
 * transport error, a timeout or a body without a "response" field all throw ModelServiceError.
 */
class CompletionClient {
 public:
  CompletionClient(const std::string &ollama_url, int timeout_seconds);
  virtual ~CompletionClient() = default;

  CompletionClient(const CompletionClient &) = delete;
  CompletionClient &operator=(const CompletionClient &) = delete;

  virtual std::string complete(const std::string &model, const std::string &prompt);

  const std::string &endpoint() const {
    return endpoint_;
  }

 private:
  std::string endpoint_;
  long timeout_seconds_;

  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace lex_core
