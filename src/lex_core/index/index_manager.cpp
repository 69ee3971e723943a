#include "lex_core/index/index_manager.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace lex_core {

IndexManager::IndexManager(std::shared_ptr<EmbeddingProvider> embedder,
                           std::shared_ptr<CorpusLoader> loader,
                           size_t index_batch_size)
    : embedder_(std::move(embedder)),
      loader_(std::move(loader)),
      index_batch_size_(index_batch_size) {
  if (!embedder_ || !loader_) {
    throw std::invalid_argument("IndexManager requires an embedder and a corpus loader");
  }
  if (index_batch_size_ == 0) {
    throw std::invalid_argument("Index batch size must be greater than 0");
  }
}

VectorIndex IndexManager::build(const std::vector<Chunk> &chunks) {
  VectorIndex accumulator;
  if (chunks.empty()) {
    return accumulator;
  }

  const size_t total_batches = (chunks.size() + index_batch_size_ - 1) / index_batch_size_;
  for (size_t begin = 0, batch = 1; begin < chunks.size(); begin += index_batch_size_, ++batch) {
    const size_t end = std::min(begin + index_batch_size_, chunks.size());
    std::cout << "Indexing batch " << batch << "/" << total_batches << " (" << (end - begin)
              << " chunks)" << std::endl;

    std::vector<Chunk> batch_chunks(chunks.begin() + begin, chunks.begin() + end);
    std::vector<std::string> texts;
    texts.reserve(batch_chunks.size());
    for (const auto &chunk : batch_chunks) {
      texts.push_back(chunk.text);
    }

    std::vector<std::vector<float>> vectors = embedder_->embed_documents(texts);

    VectorIndex sub_index;
    sub_index.add(batch_chunks, vectors, static_cast<int64_t>(begin));
    accumulator.merge_from(std::move(sub_index));
  }

  std::cout << "Built index with " << accumulator.size() << " vectors of dimension "
            << accumulator.dimension() << std::endl;
  return accumulator;
}

void IndexManager::save(const VectorIndex &index,
                        const std::filesystem::path &path,
                        double build_time_ms) {
  IndexStore::save(index, path, embedder_->model_name(), build_time_ms);
}

std::optional<VectorIndex> IndexManager::load(const std::filesystem::path &path) {
  std::optional<StoredIndex> stored = IndexStore::load_with_info(path);
  if (!stored) {
    return std::nullopt;
  }
  if (stored->info.embedding_model != embedder_->model_name()) {
    std::cerr << "Warning: index at " << path << " was built with embedding model "
              << stored->info.embedding_model << " but " << embedder_->model_name()
              << " is configured. Rebuild the index if search results look wrong." << std::endl;
  }
  std::cout << "Loaded index with " << stored->index.size() << " vectors from " << path
            << " (built " << stored->info.built_at << ")" << std::endl;
  return std::move(stored->index);
}

VectorIndex IndexManager::build_or_load(const std::filesystem::path &corpus_root,
                                        const std::filesystem::path &path) {
  try {
    std::optional<VectorIndex> loaded = load(path);
    if (loaded) {
      return std::move(*loaded);
    }
    std::cout << "No saved index at " << path << ", building from " << corpus_root << std::endl;
  } catch (const IndexUnavailableError &e) {
    std::cerr << "Warning: saved index is unusable, rebuilding: " << e.what() << std::endl;
  }

  auto start = std::chrono::steady_clock::now();
  std::vector<Chunk> chunks = loader_->load_and_chunk(corpus_root);
  if (chunks.empty()) {
    std::cerr << "Warning: corpus at " << corpus_root << " produced no chunks; index is empty"
              << std::endl;
    return VectorIndex();
  }

  VectorIndex index = build(chunks);
  auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
  save(index, path, elapsed.count());
  return index;
}

RebuildResult IndexManager::force_rebuild(const std::filesystem::path &corpus_root,
                                          const std::filesystem::path &path) {
  auto start = std::chrono::steady_clock::now();
  RebuildResult result;

  std::vector<Chunk> chunks = loader_->load_and_chunk(corpus_root);
  if (chunks.empty()) {
    std::cerr << "Warning: no documents found under " << corpus_root
              << "; keeping the existing index" << std::endl;
    result.report.build_time_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    return result;
  }

  VectorIndex index = build(chunks);
  double build_time_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  save(index, path, build_time_ms);

  result.report.success = true;
  result.report.document_count = static_cast<int>(index.size());
  result.report.build_time_ms = build_time_ms;
  result.index = std::move(index);
  return result;
}

}  // namespace lex_core
