#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "lex_core/index/vector_index.hpp"

namespace lex_core {

// The artifact exists but cannot be used
class IndexUnavailableError : public std::exception {
 public:
  explicit IndexUnavailableError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The artifact could not be written
class IndexStoreError : public std::exception {
 public:
  explicit IndexStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct IndexInfo {
  int format_version = 0;
  size_t dimension = 0;
  size_t vector_count = 0;
  std::string embedding_model;
  double build_time_ms = 0.0;
  std::string built_at;
  std::string checksum;
};

struct StoredIndex {
  VectorIndex index;
  IndexInfo info;
};

/**
 * Persists a VectorIndex as one SQLite file with three tables:
 *   index_info   single row of IndexInfo
 *   faiss_index  single row holding the faiss blob
 *   chunks       one row per chunk, text zstd-compressed
 *
 * save() goes through a temporary sibling file and a rename, so the target is either the old
 * artifact or the complete new one.
 */
class IndexStore {
 public:
  static constexpr int kFormatVersion = 1;

  // Throws IndexStoreError
  static void save(const VectorIndex &index,
                   const std::filesystem::path &path,
                   const std::string &embedding_model,
                   double build_time_ms);

  // std::nullopt when path does not exist. Throws IndexUnavailableError when it is unusable.
  static std::optional<VectorIndex> load(const std::filesystem::path &path);
  static std::optional<StoredIndex> load_with_info(const std::filesystem::path &path);

  // Hex SHA-256
  static std::string checksum(const std::vector<uint8_t> &data);

 private:
  static std::filesystem::path temp_path_for(const std::filesystem::path &path);
  static void write_artifact(const VectorIndex &index,
                             const std::filesystem::path &path,
                             const std::string &embedding_model,
                             double build_time_ms);
  static StoredIndex read_artifact(const std::filesystem::path &path);
};

}  // namespace lex_core
