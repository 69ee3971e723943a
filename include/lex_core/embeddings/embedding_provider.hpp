#pragma once

#include <memory>
#include <string>
#include <vector>

#include "lex_core/llm/ollama_client.hpp"
#include "lex_core/rag_settings.hpp"

namespace lex_core {

class EmbeddingError : public std::exception {
 public:
  explicit EmbeddingError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Scales the vector to unit length. Returns false for a zero vector, which is left untouched.
bool l2_normalize(std::vector<float> &vector);

/**
 * Turns text into fixed-dimension, unit-length vectors. Documents and queries have separate
 * entry points because some models encode them differently.
 */
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  // Output order matches input order. Throws EmbeddingError on any encoding failure.
  virtual std::vector<std::vector<float>> embed_documents(const std::vector<std::string> &texts) = 0;
  virtual std::vector<float> embed_query(const std::string &text) = 0;

  virtual const std::string &model_name() const = 0;
};

/**
 * Shared Ollama-backed implementation: sequential fixed-size document batches, L2 normalization
 * and dimension checks. Subclasses decide how a query is presented to the model.
 */
class OllamaEmbeddingProvider : public EmbeddingProvider {
 public:
  OllamaEmbeddingProvider(std::shared_ptr<OllamaClient> client, std::string model, size_t batch_size);

  std::vector<std::vector<float>> embed_documents(const std::vector<std::string> &texts) override;
  std::vector<float> embed_query(const std::string &text) override;

  const std::string &model_name() const override {
    return model_;
  }
  size_t batch_size() const {
    return batch_size_;
  }

  // The exact string sent to the model for a query
  virtual std::string prepare_query(const std::string &text) const = 0;

 private:
  std::vector<float> encode(const std::string &input);
  std::vector<std::vector<float>> encode_batch(const std::vector<std::string> &texts,
                                               size_t begin,
                                               size_t end,
                                               size_t batch_number);

  std::shared_ptr<OllamaClient> client_;
  std::string model_;
  size_t batch_size_;
};

// Same input for documents and queries
class GenericEmbeddingProvider : public OllamaEmbeddingProvider {
 public:
  using OllamaEmbeddingProvider::OllamaEmbeddingProvider;

  std::string prepare_query(const std::string &text) const override;
};

// Queries carry a task instruction, documents are encoded as-is
class InstructEmbeddingProvider : public OllamaEmbeddingProvider {
 public:
  InstructEmbeddingProvider(std::shared_ptr<OllamaClient> client,
                            std::string model,
                            size_t batch_size,
                            std::string instruction);

  std::string prepare_query(const std::string &text) const override;

  const std::string &instruction() const {
    return instruction_;
  }

 private:
  std::string instruction_;
};

std::shared_ptr<EmbeddingProvider> make_embedding_provider(const RagSettings &settings,
                                                           std::shared_ptr<OllamaClient> client);

}  // namespace lex_core
