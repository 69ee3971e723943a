#include "lex_core/index/vector_index.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/impl/FaissException.h>
#include <faiss/impl/io.h>
#include <faiss/index_io.h>

#include <algorithm>

namespace lex_core {

VectorIndex::~VectorIndex() = default;
VectorIndex::VectorIndex(VectorIndex &&) noexcept = default;
VectorIndex &VectorIndex::operator=(VectorIndex &&) noexcept = default;

std::unique_ptr<faiss::IndexIDMap> VectorIndex::create_base_index(size_t dimension) {
  auto base_index = new faiss::IndexFlatIP(static_cast<faiss::idx_t>(dimension));
  auto id_map = std::make_unique<faiss::IndexIDMap>(base_index);
  // The id map deletes the flat index with it
  id_map->own_fields = true;
  return id_map;
}

void VectorIndex::ensure_dimension(size_t dimension) {
  if (dimension == 0) {
    throw VectorIndexError("Vector dimension must be greater than 0");
  }
  if (!index_) {
    index_ = create_base_index(dimension);
    dimension_ = dimension;
    return;
  }
  if (dimension != dimension_) {
    throw VectorIndexError("Vector dimension mismatch. Expected " + std::to_string(dimension_) +
                           ", got " + std::to_string(dimension));
  }
}

void VectorIndex::add(const std::vector<Chunk> &chunks,
                      const std::vector<std::vector<float>> &vectors,
                      int64_t first_id) {
  if (chunks.size() != vectors.size()) {
    throw VectorIndexError("Got " + std::to_string(vectors.size()) + " vectors for " +
                           std::to_string(chunks.size()) + " chunks");
  }
  if (chunks.empty()) {
    return;
  }

  ensure_dimension(vectors.front().size());

  std::vector<float> flat;
  flat.reserve(vectors.size() * dimension_);
  std::vector<faiss::idx_t> ids;
  ids.reserve(vectors.size());
  for (size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].size() != dimension_) {
      throw VectorIndexError("Vector dimension mismatch. Expected " + std::to_string(dimension_) +
                             ", got " + std::to_string(vectors[i].size()));
    }
    faiss::idx_t id = first_id + static_cast<faiss::idx_t>(i);
    if (chunks_.count(id) > 0) {
      throw VectorIndexError("Duplicate vector id " + std::to_string(id));
    }
    flat.insert(flat.end(), vectors[i].begin(), vectors[i].end());
    ids.push_back(id);
  }

  try {
    index_->add_with_ids(static_cast<faiss::idx_t>(ids.size()), flat.data(), ids.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to add vectors: " + std::string(e.what()));
  }
  for (size_t i = 0; i < chunks.size(); ++i) {
    chunks_.emplace(ids[i], chunks[i]);
  }
}

void VectorIndex::merge_from(VectorIndex &&other) {
  if (&other == this || other.empty()) {
    return;
  }
  if (empty()) {
    *this = std::move(other);
    other = VectorIndex();
    return;
  }
  if (other.dimension_ != dimension_) {
    throw VectorIndexError("Cannot merge index of dimension " + std::to_string(other.dimension_) +
                           " into index of dimension " + std::to_string(dimension_));
  }
  for (const auto &[id, chunk] : other.chunks_) {
    if (chunks_.count(id) > 0) {
      throw VectorIndexError("Duplicate vector id " + std::to_string(id) + " during merge");
    }
  }

  try {
    index_->merge_from(*other.index_);
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to merge indexes: " + std::string(e.what()));
  }
  chunks_.merge(other.chunks_);
  other = VectorIndex();
}

std::vector<IndexHit> VectorIndex::search(const std::vector<float> &query, int k) const {
  if (empty() || k <= 0) {
    return {};
  }
  if (query.size() != dimension_) {
    throw VectorIndexError("Query vector dimension mismatch. Expected " +
                           std::to_string(dimension_) + ", got " + std::to_string(query.size()));
  }

  int actual_k = std::min(k, static_cast<int>(index_->ntotal));
  std::vector<float> similarities(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  try {
    index_->search(1, query.data(), actual_k, similarities.data(), labels.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Search failed: " + std::string(e.what()));
  }

  std::vector<IndexHit> hits;
  hits.reserve(actual_k);
  for (int i = 0; i < actual_k; ++i) {
    // faiss pads with -1 when fewer than k results exist
    if (labels[i] < 0) {
      continue;
    }
    auto it = chunks_.find(labels[i]);
    if (it == chunks_.end()) {
      throw VectorIndexError("Search returned unknown id " + std::to_string(labels[i]));
    }
    hits.push_back({labels[i], 1.0f - similarities[i], &it->second});
  }
  return hits;
}

std::vector<uint8_t> VectorIndex::serialize_vectors() const {
  if (!index_) {
    return {};
  }
  faiss::VectorIOWriter writer;
  try {
    faiss::write_index(index_.get(), &writer);
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to serialize index: " + std::string(e.what()));
  }
  return std::move(writer.data);
}

VectorIndex VectorIndex::from_serialized(const std::vector<uint8_t> &blob,
                                         std::map<int64_t, Chunk> chunks) {
  VectorIndex result;
  if (blob.empty()) {
    if (!chunks.empty()) {
      throw VectorIndexError("Index blob is empty but " + std::to_string(chunks.size()) +
                             " chunks were given");
    }
    return result;
  }

  faiss::VectorIOReader reader;
  reader.data = blob;
  std::unique_ptr<faiss::Index> raw;
  try {
    raw.reset(faiss::read_index(&reader));
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to deserialize index: " + std::string(e.what()));
  }

  auto *id_map = dynamic_cast<faiss::IndexIDMap *>(raw.get());
  if (!id_map) {
    throw VectorIndexError("Serialized index is not an id-mapped index");
  }
  raw.release();
  result.index_.reset(id_map);
  result.dimension_ = static_cast<size_t>(id_map->d);

  if (static_cast<size_t>(id_map->ntotal) != chunks.size()) {
    throw VectorIndexError("Index holds " + std::to_string(id_map->ntotal) + " vectors but " +
                           std::to_string(chunks.size()) + " chunks were given");
  }
  for (faiss::idx_t id : id_map->id_map) {
    if (chunks.count(id) == 0) {
      throw VectorIndexError("No chunk stored for vector id " + std::to_string(id));
    }
  }
  result.chunks_ = std::move(chunks);
  return result;
}

}  // namespace lex_core
