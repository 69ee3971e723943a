#include "lex_core/rag_settings.hpp"

#include <stdexcept>

namespace lex_core {

std::string to_string(EmbeddingVariant variant) {
  switch (variant) {
    case EmbeddingVariant::Generic:
      return "generic";
    case EmbeddingVariant::Instruct:
      return "instruct";
    default:
      return "unknown";
  }
}

EmbeddingVariant embedding_variant_from_string(const std::string &str) {
  if (str == "generic")
    return EmbeddingVariant::Generic;
  if (str == "instruct")
    return EmbeddingVariant::Instruct;
  throw std::invalid_argument("Unknown EmbeddingVariant: " + str);
}

}  // namespace lex_core
