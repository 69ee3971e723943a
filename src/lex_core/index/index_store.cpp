#include "lex_core/index/index_store.hpp"

#include <openssl/evp.h>
#include <sqlite_modern_cpp.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

#include "lex_core/index/sqlite_error_utils.hpp"
#include "lex_core/index/transaction.hpp"
#include "lex_core/services/compression_service.hpp"

namespace lex_core {

namespace fs = std::filesystem;

namespace {

std::string now_utc_string() {
  auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

void create_schema(sqlite::database &db) {
  db << R"(
      CREATE TABLE index_info (
          id INTEGER PRIMARY KEY CHECK (id = 1),
          format_version INTEGER NOT NULL,
          dimension INTEGER NOT NULL,
          vector_count INTEGER NOT NULL,
          embedding_model TEXT NOT NULL,
          build_time_ms REAL NOT NULL,
          built_at TEXT NOT NULL,
          checksum TEXT NOT NULL
      );
  )";
  db << R"(
      CREATE TABLE faiss_index (
          id INTEGER PRIMARY KEY CHECK (id = 1),
          data BLOB
      );
  )";
  db << R"(
      CREATE TABLE chunks (
          id INTEGER PRIMARY KEY,
          source_file TEXT NOT NULL,
          chapter_title TEXT NOT NULL,
          article_title TEXT NOT NULL,
          chunk_ordinal INTEGER,
          total_chunks INTEGER,
          text_zstd BLOB
      );
  )";
}

std::unique_ptr<int> nullable(const std::optional<int> &value) {
  return value ? std::make_unique<int>(*value) : nullptr;
}

std::optional<int> from_nullable(const std::unique_ptr<int> &value) {
  return value ? std::optional<int>(*value) : std::nullopt;
}

}  // namespace

std::string IndexStore::checksum(const std::vector<uint8_t> &data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(),
                                                                 EVP_MD_CTX_free);
  if (!mdctx) {
    throw IndexStoreError("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
    throw IndexStoreError("Failed to initialize SHA256 digest");
  }
  if (EVP_DigestUpdate(mdctx.get(), data.data(), data.size()) != 1) {
    throw IndexStoreError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1) {
    throw IndexStoreError("Failed to finalize SHA256 digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

fs::path IndexStore::temp_path_for(const fs::path &path) {
  fs::path temp = path;
  temp += ".tmp";
  return temp;
}

void IndexStore::save(const VectorIndex &index,
                      const fs::path &path,
                      const std::string &embedding_model,
                      double build_time_ms) {
  const fs::path temp = temp_path_for(path);
  std::error_code ec;

  try {
    if (path.has_parent_path()) {
      fs::create_directories(path.parent_path());
    }
    // A leftover from an interrupted save would make CREATE TABLE fail
    fs::remove(temp);
    write_artifact(index, temp, embedding_model, build_time_ms);
    fs::rename(temp, path);
  } catch (const sqlite::sqlite_exception &e) {
    fs::remove(temp, ec);
    throw IndexStoreError(format_db_error("save_index", e));
  } catch (const fs::filesystem_error &e) {
    fs::remove(temp, ec);
    throw IndexStoreError("Failed to write index to " + path.string() + ": " + e.what());
  } catch (const VectorIndexError &e) {
    fs::remove(temp, ec);
    throw IndexStoreError("Failed to serialize index: " + std::string(e.what()));
  } catch (const CompressionError &e) {
    fs::remove(temp, ec);
    throw IndexStoreError("Failed to compress chunk text: " + std::string(e.what()));
  }

  std::cout << "Saved index with " << index.size() << " vectors to " << path << std::endl;
}

void IndexStore::write_artifact(const VectorIndex &index,
                                const fs::path &path,
                                const std::string &embedding_model,
                                double build_time_ms) {
  const std::vector<uint8_t> blob = index.serialize_vectors();
  const std::string blob_checksum = checksum(blob);

  // Closed at scope exit, before the caller renames the file
  sqlite::database db(path.string());
  create_schema(db);

  Transaction tx(db);
  db << "INSERT INTO index_info (id, format_version, dimension, vector_count, embedding_model, "
        "build_time_ms, built_at, checksum) VALUES (1,?,?,?,?,?,?,?)"
     << kFormatVersion << static_cast<int64_t>(index.dimension())
     << static_cast<int64_t>(index.size()) << embedding_model << build_time_ms << now_utc_string()
     << blob_checksum;
  db << "INSERT INTO faiss_index (id, data) VALUES (1,?)" << blob;

  if (!index.empty()) {
    // An unexecuted binder runs itself on destruction, so only prepare it when there are rows
    auto insert = db << "INSERT INTO chunks (id, source_file, chapter_title, article_title, "
                        "chunk_ordinal, total_chunks, text_zstd) VALUES (?,?,?,?,?,?,?)";
    for (const auto &[id, chunk] : index.chunks()) {
      insert << id << chunk.source_file << chunk.chapter_title << chunk.article_title
             << nullable(chunk.chunk_ordinal) << nullable(chunk.total_chunks)
             << CompressionService::compress(chunk.text);
      insert++;
    }
  }
  tx.commit();
}

std::optional<VectorIndex> IndexStore::load(const fs::path &path) {
  std::optional<StoredIndex> stored = load_with_info(path);
  if (!stored) {
    return std::nullopt;
  }
  return std::move(stored->index);
}

std::optional<StoredIndex> IndexStore::load_with_info(const fs::path &path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return std::nullopt;
  }

  try {
    return read_artifact(path);
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexUnavailableError(format_db_error("load_index", e));
  } catch (const VectorIndexError &e) {
    throw IndexUnavailableError("Stored index is unusable: " + std::string(e.what()));
  } catch (const CompressionError &e) {
    throw IndexUnavailableError("Stored chunk text is unusable: " + std::string(e.what()));
  }
}

StoredIndex IndexStore::read_artifact(const fs::path &path) {
  sqlite::sqlite_config config;
  config.flags = sqlite::OpenFlags::READONLY;
  sqlite::database db(path.string(), config);

  IndexInfo info;
  int info_rows = 0;
  db << "SELECT format_version, dimension, vector_count, embedding_model, build_time_ms, "
        "built_at, checksum FROM index_info WHERE id = 1" >>
      [&](int format_version, int64_t dimension, int64_t vector_count, std::string embedding_model,
          double build_time_ms, std::string built_at, std::string stored_checksum) {
        info.format_version = format_version;
        info.dimension = static_cast<size_t>(dimension);
        info.vector_count = static_cast<size_t>(vector_count);
        info.embedding_model = std::move(embedding_model);
        info.build_time_ms = build_time_ms;
        info.built_at = std::move(built_at);
        info.checksum = std::move(stored_checksum);
        ++info_rows;
      };
  if (info_rows != 1) {
    throw IndexUnavailableError("Index artifact " + path.string() + " has no index_info row");
  }
  if (info.format_version != kFormatVersion) {
    throw IndexUnavailableError("Unsupported index format version " +
                                std::to_string(info.format_version));
  }

  std::vector<uint8_t> blob;
  int blob_rows = 0;
  db << "SELECT data FROM faiss_index WHERE id = 1" >> [&](std::vector<uint8_t> data) {
    blob = std::move(data);
    ++blob_rows;
  };
  if (blob_rows != 1) {
    throw IndexUnavailableError("Index artifact " + path.string() + " has no faiss blob");
  }
  if (checksum(blob) != info.checksum) {
    throw IndexUnavailableError("Checksum mismatch for index artifact " + path.string());
  }

  std::map<int64_t, Chunk> chunks;
  db << "SELECT id, source_file, chapter_title, article_title, chunk_ordinal, total_chunks, "
        "text_zstd FROM chunks ORDER BY id" >>
      [&](int64_t id, std::string source_file, std::string chapter_title,
          std::string article_title, std::unique_ptr<int> chunk_ordinal,
          std::unique_ptr<int> total_chunks, std::vector<char> text_zstd) {
        Chunk chunk;
        chunk.text = CompressionService::decompress(text_zstd);
        chunk.source_file = std::move(source_file);
        chunk.chapter_title = std::move(chapter_title);
        chunk.article_title = std::move(article_title);
        chunk.chunk_ordinal = from_nullable(chunk_ordinal);
        chunk.total_chunks = from_nullable(total_chunks);
        chunks.emplace(id, std::move(chunk));
      };

  if (chunks.size() != info.vector_count) {
    throw IndexUnavailableError("Index artifact records " + std::to_string(info.vector_count) +
                                " vectors but holds " + std::to_string(chunks.size()) + " chunks");
  }

  VectorIndex index = VectorIndex::from_serialized(blob, std::move(chunks));
  if (!index.empty() && index.dimension() != info.dimension) {
    throw IndexUnavailableError("Index artifact records dimension " +
                                std::to_string(info.dimension) + " but holds vectors of dimension " +
                                std::to_string(index.dimension()));
  }

  return StoredIndex{std::move(index), std::move(info)};
}

}  // namespace lex_core
