#include "lex_core/corpus/corpus_loader.hpp"

#include <utf8.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace lex_core {

namespace {

bool is_blank_code_point(uint32_t cp) {
  return cp <= 0x20 || cp == 0x7f || (cp >= 0x80 && cp <= 0xa0) || (cp >= 0x2000 && cp <= 0x200a) ||
         cp == 0x2028 || cp == 0x2029 || cp == 0x3000 || cp == 0xfeff;
}

}  // namespace

CorpusLoader::CorpusLoader(size_t chunk_size, size_t chunk_overlap)
    : splitter_(chunk_size, chunk_overlap) {}

std::string CorpusLoader::normalize_fragment(const std::string &fragment) {
  std::string normalized;
  normalized.reserve(fragment.size());
  bool pending_space = false;

  auto it = fragment.begin();
  while (it != fragment.end()) {
    uint32_t cp = utf8::next(it, fragment.end());
    if (is_blank_code_point(cp)) {
      pending_space = !normalized.empty();
      continue;
    }
    if (pending_space) {
      normalized.push_back(' ');
      pending_space = false;
    }
    utf8::append(cp, std::back_inserter(normalized));
  }
  return normalized;
}

std::vector<Chunk> CorpusLoader::load_and_chunk(const fs::path &corpus_root) const {
  std::vector<Chunk> chunks;
  std::vector<fs::path> files = list_corpus_files(corpus_root);
  const bool root_is_directory = fs::is_directory(corpus_root);
  int skipped = 0;

  for (const auto &file_path : files) {
    std::string source_name = root_is_directory
                                  ? fs::relative(file_path, corpus_root).generic_string()
                                  : file_path.filename().string();
    try {
      std::vector<Chunk> file_chunks = load_file(file_path, source_name);
      std::cout << "Loaded " << file_chunks.size() << " chunks from " << source_name << std::endl;
      chunks.insert(chunks.end(), std::make_move_iterator(file_chunks.begin()),
                    std::make_move_iterator(file_chunks.end()));
    } catch (const CorpusFileError &e) {
      ++skipped;
      std::cerr << "Warning: Skipping corpus file " << file_path << ": " << e.what() << std::endl;
    }
  }

  std::cout << "Loaded and chunked corpus: " << chunks.size() << " chunks from "
            << (files.size() - skipped) << " files (" << skipped << " skipped)" << std::endl;
  return chunks;
}

std::vector<Chunk> CorpusLoader::load_file(const fs::path &file_path,
                                           const std::string &source_name) const {
  std::ifstream file_stream(file_path);
  if (!file_stream.is_open()) {
    throw CorpusFileError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw CorpusFileError("Could not read file: " + file_path.string());
  }

  try {
    nlohmann::json document = nlohmann::json::parse(buffer.str());
    return chunks_from_json(document, source_name);
  } catch (const nlohmann::json::exception &e) {
    throw CorpusFileError("Malformed JSON in " + file_path.string() + ": " + e.what());
  } catch (const utf8::exception &e) {
    throw CorpusFileError("Invalid UTF-8 in " + file_path.string() + ": " + e.what());
  }
}

std::vector<Chunk> CorpusLoader::chunks_from_json(const nlohmann::json &document,
                                                  const std::string &source_name) const {
  if (!document.is_object() || !document.contains("chapters") || !document["chapters"].is_array()) {
    throw CorpusFileError("Expected an object with a \"chapters\" array in " + source_name);
  }

  std::vector<Chunk> chunks;
  for (const auto &chapter : document["chapters"]) {
    if (!chapter.is_object()) {
      throw CorpusFileError("Chapter entry is not an object in " + source_name);
    }
    std::string chapter_title = normalize_fragment(chapter.value("chapter_title", std::string()));
    if (!chapter.contains("articles")) {
      continue;
    }

    for (const auto &article : chapter.at("articles")) {
      if (!article.is_object()) {
        throw CorpusFileError("Article entry is not an object in " + source_name);
      }
      std::string article_title = normalize_fragment(article.value("article_title", std::string()));

      std::string blob;
      if (article.contains("content")) {
        for (const auto &fragment : article.at("content")) {
          std::string normalized = normalize_fragment(fragment.get<std::string>());
          if (normalized.empty()) {
            continue;
          }
          if (!blob.empty()) {
            blob.push_back('\n');
          }
          blob += normalized;
        }
      }

      if (blob.empty()) {
        continue;
      }
      append_article_chunks(blob, source_name, chapter_title, article_title, chunks);
    }
  }
  return chunks;
}

void CorpusLoader::append_article_chunks(const std::string &blob,
                                         const std::string &source_name,
                                         const std::string &chapter_title,
                                         const std::string &article_title,
                                         std::vector<Chunk> &out) const {
  Chunk base;
  base.source_file = source_name;
  base.chapter_title = chapter_title;
  base.article_title = article_title;

  if (RecursiveTextSplitter::length(blob) <= splitter_.chunk_size()) {
    base.text = blob;
    out.push_back(std::move(base));
    return;
  }

  std::vector<std::string> pieces = splitter_.split_text(blob);
  const int total = static_cast<int>(pieces.size());
  for (int i = 0; i < total; ++i) {
    Chunk chunk = base;
    chunk.text = std::move(pieces[i]);
    chunk.chunk_ordinal = i;
    chunk.total_chunks = total;
    out.push_back(std::move(chunk));
  }
}

std::vector<fs::path> CorpusLoader::list_corpus_files(const fs::path &corpus_root) const {
  std::vector<fs::path> files;
  std::error_code ec;

  if (!fs::exists(corpus_root, ec)) {
    std::cerr << "Warning: Corpus path does not exist: " << corpus_root << std::endl;
    return files;
  }

  if (fs::is_regular_file(corpus_root, ec)) {
    files.push_back(corpus_root);
    return files;
  }

  fs::recursive_directory_iterator it(corpus_root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    std::cerr << "Warning: Cannot open corpus directory " << corpus_root << ": " << ec.message()
              << std::endl;
    return files;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      std::cerr << "Warning: Error while scanning corpus directory: " << ec.message() << std::endl;
      break;
    }
    if (it->is_regular_file(ec) && it->path().extension() == ".json") {
      files.push_back(it->path());
    }
  }

  std::sort(files.begin(), files.end());
  return files;
}

}  // namespace lex_core
