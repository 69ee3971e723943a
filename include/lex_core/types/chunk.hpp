#pragma once

#include <optional>
#include <string>
#include <vector>

namespace lex_core {

// One indexed unit of corpus text together with where it came from.
struct Chunk {
  std::string text;
  std::string source_file;
  std::string chapter_title;
  std::string article_title;
  // Only set when an article was split into several sub-chunks
  std::optional<int> chunk_ordinal;
  std::optional<int> total_chunks;

  std::string source() const {
    return chapter_title + ", " + article_title;
  }
};

struct RetrievalResult {
  std::string chapter_title;
  std::string article_title;
  std::string content;
  std::optional<float> distance;
  std::string source;
};

struct Answer {
  std::string text;
  std::vector<RetrievalResult> sources;
};

struct BuildReport {
  bool success = false;
  int document_count = 0;
  double build_time_ms = 0.0;
};

RetrievalResult to_retrieval_result(const Chunk &chunk, std::optional<float> distance);

}  // namespace lex_core
