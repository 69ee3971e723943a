#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lex_core/corpus/text_splitter.hpp"
#include "lex_core/types/chunk.hpp"

namespace fs = std::filesystem;

namespace lex_core {

class CorpusFileError : public std::exception {
 public:
  explicit CorpusFileError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class CorpusLoader
 * @brief Reads structured legal-text JSON files and turns every article into chunks.
 *
 * A corpus file looks like
 *   {"chapters": [{"chapter_title": "...",
 *                  "articles": [{"article_title": "...", "content": ["...", ...]}]}]}
 *
 * Each article's content fragments are normalized and joined with newlines. Articles longer than
 * the splitter's chunk_size are cut into overlapping sub-chunks that carry their ordinal and
 * the total count.
 */
class CorpusLoader {
 public:
  CorpusLoader(size_t chunk_size, size_t chunk_overlap);

  /**
   * @brief Loads every *.json file under corpus_root (recursively, in sorted order).
   *
   * A file that cannot be read or parsed is logged and skipped. A missing root yields an empty
   * result.
   */
  std::vector<Chunk> load_and_chunk(const fs::path &corpus_root) const;

  // Throws CorpusFileError for an unreadable or malformed file
  std::vector<Chunk> load_file(const fs::path &file_path, const std::string &source_name) const;

  // Control characters become spaces, whitespace runs collapse to one space, ends are trimmed
  static std::string normalize_fragment(const std::string &fragment);

 private:
  std::vector<fs::path> list_corpus_files(const fs::path &corpus_root) const;
  std::vector<Chunk> chunks_from_json(const nlohmann::json &document,
                                      const std::string &source_name) const;
  void append_article_chunks(const std::string &blob,
                             const std::string &source_name,
                             const std::string &chapter_title,
                             const std::string &article_title,
                             std::vector<Chunk> &out) const;

  RecursiveTextSplitter splitter_;
};

}  // namespace lex_core
