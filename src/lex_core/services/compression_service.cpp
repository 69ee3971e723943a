#include "lex_core/services/compression_service.hpp"

#include <zstd.h>

namespace lex_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }
  if (compression_level < 1 || compression_level > ZSTD_maxCLevel()) {
    throw CompressionError("Invalid zstd compression level " + std::to_string(compression_level));
  }

  std::vector<char> frame(ZSTD_compressBound(data.size()));
  size_t const written =
      ZSTD_compress(frame.data(), frame.size(), data.data(), data.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw CompressionError("zstd compression failed: " + std::string(ZSTD_getErrorName(written)));
  }
  frame.resize(written);
  return frame;
}

std::string CompressionService::decompress(const std::vector<char> &compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  unsigned long long const content_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("Stored chunk text is not a sized zstd frame");
  }

  std::string text(content_size, '\0');
  size_t const read =
      ZSTD_decompress(text.data(), text.size(), compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(read)) {
    throw CompressionError("zstd decompression failed: " + std::string(ZSTD_getErrorName(read)));
  }
  if (read != content_size) {
    throw CompressionError("zstd decompression produced " + std::to_string(read) +
                           " bytes, expected " + std::to_string(content_size));
  }
  return text;
}

}  // namespace lex_core
