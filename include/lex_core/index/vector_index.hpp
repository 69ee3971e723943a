#pragma once

#include <faiss/IndexIDMap.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "lex_core/types/chunk.hpp"

namespace lex_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct IndexHit {
  int64_t id;
  float distance;
  const Chunk *chunk;
};

/**
 * Exact inner-product nearest-neighbor index over unit-length vectors, with the chunk that each
 * vector was computed from. Ids are caller-assigned and unique within one index.
 *
 * An index starts without a dimension; the first non-empty add or merge fixes it.
 */
class VectorIndex {
 public:
  VectorIndex() = default;
  ~VectorIndex();

  VectorIndex(VectorIndex &&) noexcept;
  VectorIndex &operator=(VectorIndex &&) noexcept;
  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  // Adds chunks[i] with vectors[i] under id first_id + i
  void add(const std::vector<Chunk> &chunks,
           const std::vector<std::vector<float>> &vectors,
           int64_t first_id);

  // Moves every entry of other into this index. other is left empty.
  void merge_from(VectorIndex &&other);

  // Up to k hits in non-decreasing distance order. Distance is 1 - cosine similarity.
  std::vector<IndexHit> search(const std::vector<float> &query, int k) const;

  size_t size() const {
    return chunks_.size();
  }
  bool empty() const {
    return chunks_.empty();
  }
  size_t dimension() const {
    return dimension_;
  }
  const std::map<int64_t, Chunk> &chunks() const {
    return chunks_;
  }

  // faiss binary form of the vectors and ids, without chunk data
  std::vector<uint8_t> serialize_vectors() const;

  // Rebuilds an index from serialize_vectors() output and the matching chunks.
  // Throws VectorIndexError if the blob is unreadable or does not match the chunks.
  static VectorIndex from_serialized(const std::vector<uint8_t> &blob,
                                     std::map<int64_t, Chunk> chunks);

 private:
  static std::unique_ptr<faiss::IndexIDMap> create_base_index(size_t dimension);
  void ensure_dimension(size_t dimension);

  size_t dimension_ = 0;
  std::unique_ptr<faiss::IndexIDMap> index_;
  std::map<int64_t, Chunk> chunks_;
};

}  // namespace lex_core
