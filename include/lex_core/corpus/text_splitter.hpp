#pragma once

#include <string>
#include <vector>

namespace lex_core {

/**
 * @class RecursiveTextSplitter
 * @brief Splits long text into overlapping pieces at the coarsest boundary that fits.
 *
 * Separators are tried in order: line (one content fragment per line), sentence, word and
 * finally single code points. Pieces produced by a separator are greedily merged back together
 * up to chunk_size, and each emitted chunk hands up to chunk_overlap code points of trailing
 * context to the next one. Pieces that are still too long are split again with the next
 * separator.
 *
 * All lengths are measured in UTF-8 code points, so multi-byte text never gets cut inside a
 * character. Every returned chunk is trimmed, non-empty and at most chunk_size code points.
 */
class RecursiveTextSplitter {
 public:
  RecursiveTextSplitter(size_t chunk_size, size_t chunk_overlap);

  // Throws std::invalid_argument if the text is not valid UTF-8
  std::vector<std::string> split_text(const std::string &text) const;

  size_t chunk_size() const {
    return chunk_size_;
  }
  size_t chunk_overlap() const {
    return chunk_overlap_;
  }

  // Number of code points in a valid UTF-8 string
  static size_t length(const std::string &text);
  static std::string trim(const std::string &text);

 private:
  std::vector<std::string> split_recursive(const std::string &text,
                                           const std::vector<std::string> &separators) const;
  std::vector<std::string> merge_splits(const std::vector<std::string> &splits) const;

  // The separator stays attached to the end of the piece before it
  static std::vector<std::string> split_on(const std::string &text, const std::string &separator);
  static std::vector<std::string> split_code_points(const std::string &text);

  size_t chunk_size_;
  size_t chunk_overlap_;
  std::vector<std::string> separators_;
};

}  // namespace lex_core
