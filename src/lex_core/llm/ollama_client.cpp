#include "lex_core/llm/ollama_client.hpp"

#include <nlohmann/json.hpp>

#include "ollama.hpp"

namespace lex_core {

OllamaClient::OllamaClient(const std::string &ollama_url, int timeout_seconds)
    : ollama_url_(ollama_url), timeout_seconds_(timeout_seconds) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  // ollama-hpp keeps the server URL and timeouts as process-wide settings
  ollama::setServerURL(ollama_url_);
  ollama::setReadTimeout(timeout_seconds_);
  ollama::setWriteTimeout(timeout_seconds_);
}

std::vector<float> OllamaClient::get_embedding(const std::string &model, const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(model, text);
    auto json_response = response.as_json();

    // /api/embed answers with "embeddings", the legacy endpoint with "embedding"
    if (json_response.contains("embeddings")) {
      auto embeddings = json_response["embeddings"];
      if (!embeddings.is_array()) {
        throw ModelServiceError("Embeddings field is not an array");
      }
      if (embeddings.size() > 0 && embeddings[0].is_array()) {
        return embeddings[0].get<std::vector<float>>();
      }
      return embeddings.get<std::vector<float>>();
    }
    if (json_response.contains("embedding")) {
      return json_response["embedding"].get<std::vector<float>>();
    }
    throw ModelServiceError("Response does not contain embedding field");

  } catch (const ollama::exception &e) {
    throw ModelServiceError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw ModelServiceError("Malformed embedding response: " + std::string(e.what()));
  }
}

std::string OllamaClient::generate(const std::string &model, const std::string &prompt) {
  try {
    ollama::response response = ollama::generate(model, prompt);
    auto json_response = response.as_json();
    if (json_response.contains("error")) {
      throw ModelServiceError("Ollama returned an error: " + json_response["error"].dump());
    }
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw ModelServiceError("Text generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw ModelServiceError("Malformed generation response: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace lex_core
