#include "lex_core/types/chunk.hpp"

namespace lex_core {

RetrievalResult to_retrieval_result(const Chunk &chunk, std::optional<float> distance) {
  RetrievalResult result;
  result.chapter_title = chunk.chapter_title;
  result.article_title = chunk.article_title;
  result.content = chunk.text;
  result.distance = distance;
  result.source = chunk.source();
  return result;
}

}  // namespace lex_core
