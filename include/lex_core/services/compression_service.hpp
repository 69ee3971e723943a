#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lex_core {

class CompressionError : public std::exception {
 public:
  explicit CompressionError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// zstd frames for chunk text stored in the index artifact
class CompressionService {
 public:
  /**
   * @brief Compresses text into a single zstd frame.
   * @param data The text to compress. Empty input gives an empty buffer.
   * @param compression_level zstd level, 1 to ZSTD_maxCLevel().
   * @return The compressed frame.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Inverse of compress(). Throws CompressionError for anything that is not a complete
   * zstd frame with a recorded content size.
   */
  static std::string decompress(const std::vector<char> &compressed_data);
};

}  // namespace lex_core
