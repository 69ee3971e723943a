#include "lex_core/embeddings/embedding_provider.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace lex_core {

bool l2_normalize(std::vector<float> &vector) {
  double norm = 0.0;
  for (float val : vector) {
    norm += static_cast<double>(val) * val;
  }
  norm = std::sqrt(norm);
  if (norm <= 0.0 || !std::isfinite(norm)) {
    return false;
  }
  for (float &val : vector) {
    val = static_cast<float>(val / norm);
  }
  return true;
}

OllamaEmbeddingProvider::OllamaEmbeddingProvider(std::shared_ptr<OllamaClient> client,
                                                 std::string model,
                                                 size_t batch_size)
    : client_(std::move(client)), model_(std::move(model)), batch_size_(batch_size) {
  if (!client_) {
    throw std::invalid_argument("OllamaEmbeddingProvider requires a client");
  }
  if (batch_size_ == 0) {
    throw std::invalid_argument("Embedding batch size must be greater than 0");
  }
}

std::vector<float> OllamaEmbeddingProvider::encode(const std::string &input) {
  std::vector<float> vector = client_->get_embedding(model_, input);
  if (vector.empty()) {
    throw EmbeddingError("Received empty embedding from model " + model_);
  }
  if (!l2_normalize(vector)) {
    throw EmbeddingError("Received zero-norm embedding from model " + model_);
  }
  return vector;
}

std::vector<std::vector<float>> OllamaEmbeddingProvider::encode_batch(
    const std::vector<std::string> &texts, size_t begin, size_t end, size_t batch_number) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(end - begin);
  try {
    for (size_t i = begin; i < end; ++i) {
      vectors.push_back(encode(texts[i]));
    }
  } catch (const ModelServiceError &e) {
    throw EmbeddingError("Embedding batch " + std::to_string(batch_number) + " failed: " + e.what());
  } catch (const EmbeddingError &e) {
    throw EmbeddingError("Embedding batch " + std::to_string(batch_number) + " failed: " + e.what());
  }
  return vectors;
}

std::vector<std::vector<float>> OllamaEmbeddingProvider::embed_documents(
    const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  size_t dimension = 0;

  for (size_t begin = 0, batch_number = 0; begin < texts.size(); begin += batch_size_, ++batch_number) {
    size_t end = std::min(begin + batch_size_, texts.size());
    std::vector<std::vector<float>> batch = encode_batch(texts, begin, end, batch_number);

    for (auto &vector : batch) {
      if (dimension == 0) {
        dimension = vector.size();
      } else if (vector.size() != dimension) {
        throw EmbeddingError("Embedding batch " + std::to_string(batch_number) +
                             " returned dimension " + std::to_string(vector.size()) +
                             ", expected " + std::to_string(dimension));
      }
      vectors.push_back(std::move(vector));
    }
  }
  return vectors;
}

std::vector<float> OllamaEmbeddingProvider::embed_query(const std::string &text) {
  try {
    return encode(prepare_query(text));
  } catch (const ModelServiceError &e) {
    throw EmbeddingError("Query embedding failed: " + std::string(e.what()));
  }
}

std::string GenericEmbeddingProvider::prepare_query(const std::string &text) const {
  return text;
}

InstructEmbeddingProvider::InstructEmbeddingProvider(std::shared_ptr<OllamaClient> client,
                                                     std::string model,
                                                     size_t batch_size,
                                                     std::string instruction)
    : OllamaEmbeddingProvider(std::move(client), std::move(model), batch_size),
      instruction_(std::move(instruction)) {
  if (instruction_.empty()) {
    throw std::invalid_argument("InstructEmbeddingProvider requires a task instruction");
  }
}

std::string InstructEmbeddingProvider::prepare_query(const std::string &text) const {
  return "Instruct: " + instruction_ + "\nQuery: " + text;
}

std::shared_ptr<EmbeddingProvider> make_embedding_provider(const RagSettings &settings,
                                                           std::shared_ptr<OllamaClient> client) {
  switch (settings.embedding_variant) {
    case EmbeddingVariant::Generic:
      std::cout << "Using generic embedding model: " << settings.embedding_model << std::endl;
      return std::make_shared<GenericEmbeddingProvider>(std::move(client), settings.embedding_model,
                                                        settings.embed_batch_size);
    case EmbeddingVariant::Instruct:
      std::cout << "Using instruction-tuned embedding model: " << settings.embedding_model
                << std::endl;
      return std::make_shared<InstructEmbeddingProvider>(std::move(client),
                                                         settings.embedding_model,
                                                         settings.embed_batch_size,
                                                         settings.query_instruction);
  }
  throw std::invalid_argument("Unsupported embedding variant");
}

}  // namespace lex_core
