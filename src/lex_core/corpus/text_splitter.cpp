#include "lex_core/corpus/text_splitter.hpp"

#include <utf8.h>

#include <deque>
#include <stdexcept>

namespace lex_core {

RecursiveTextSplitter::RecursiveTextSplitter(size_t chunk_size, size_t chunk_overlap)
    : chunk_size_(chunk_size), chunk_overlap_(chunk_overlap), separators_({"\n", ". ", " ", ""}) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("chunk_size must be greater than 0");
  }
  if (chunk_overlap_ >= chunk_size_) {
    throw std::invalid_argument("chunk_overlap must be smaller than chunk_size");
  }
}

size_t RecursiveTextSplitter::length(const std::string &text) {
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

std::string RecursiveTextSplitter::trim(const std::string &text) {
  const char *whitespace = " \t\n\r\f\v";
  size_t first = text.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return "";
  }
  size_t last = text.find_last_not_of(whitespace);
  return text.substr(first, last - first + 1);
}

std::vector<std::string> RecursiveTextSplitter::split_text(const std::string &text) const {
  if (!utf8::is_valid(text.begin(), text.end())) {
    throw std::invalid_argument("Text is not valid UTF-8");
  }

  std::string trimmed = trim(text);
  if (trimmed.empty()) {
    return {};
  }
  if (length(trimmed) <= chunk_size_) {
    return {trimmed};
  }
  return split_recursive(trimmed, separators_);
}

std::vector<std::string> RecursiveTextSplitter::split_recursive(
    const std::string &text, const std::vector<std::string> &separators) const {
  // Pick the first separator that actually occurs in this text
  std::string separator = separators.back();
  std::vector<std::string> remaining;
  for (size_t i = 0; i < separators.size(); ++i) {
    if (separators[i].empty()) {
      separator.clear();
      break;
    }
    if (text.find(separators[i]) != std::string::npos) {
      separator = separators[i];
      remaining.assign(separators.begin() + i + 1, separators.end());
      break;
    }
  }

  std::vector<std::string> pieces =
      separator.empty() ? split_code_points(text) : split_on(text, separator);

  std::vector<std::string> final_chunks;
  std::vector<std::string> fitting;
  for (const auto &piece : pieces) {
    if (length(piece) <= chunk_size_) {
      fitting.push_back(piece);
      continue;
    }

    if (!fitting.empty()) {
      auto merged = merge_splits(fitting);
      final_chunks.insert(final_chunks.end(), merged.begin(), merged.end());
      fitting.clear();
    }

    if (remaining.empty()) {
      std::string trimmed = trim(piece);
      if (!trimmed.empty()) {
        final_chunks.push_back(trimmed);
      }
    } else {
      auto sub_chunks = split_recursive(piece, remaining);
      final_chunks.insert(final_chunks.end(), sub_chunks.begin(), sub_chunks.end());
    }
  }

  if (!fitting.empty()) {
    auto merged = merge_splits(fitting);
    final_chunks.insert(final_chunks.end(), merged.begin(), merged.end());
  }
  return final_chunks;
}

std::vector<std::string> RecursiveTextSplitter::merge_splits(
    const std::vector<std::string> &splits) const {
  std::vector<std::string> docs;
  std::deque<std::pair<std::string, size_t>> window;
  size_t total = 0;

  auto emit = [&]() {
    std::string joined;
    for (const auto &entry : window) {
      joined += entry.first;
    }
    std::string trimmed = trim(joined);
    if (!trimmed.empty() && (docs.empty() || docs.back() != trimmed)) {
      docs.push_back(std::move(trimmed));
    }
  };

  for (const auto &split : splits) {
    size_t split_length = length(split);

    if (total + split_length > chunk_size_ && !window.empty()) {
      emit();
      // Keep at most chunk_overlap code points of context, and always leave room for the next piece
      while (!window.empty() && (total > chunk_overlap_ || total + split_length > chunk_size_)) {
        total -= window.front().second;
        window.pop_front();
      }
    }

    window.emplace_back(split, split_length);
    total += split_length;
  }

  if (!window.empty()) {
    emit();
  }
  return docs;
}

std::vector<std::string> RecursiveTextSplitter::split_on(const std::string &text,
                                                         const std::string &separator) {
  std::vector<std::string> pieces;
  size_t start = 0;
  size_t pos = text.find(separator, start);
  while (pos != std::string::npos) {
    size_t end = pos + separator.size();
    pieces.push_back(text.substr(start, end - start));
    start = end;
    pos = text.find(separator, start);
  }
  if (start < text.size()) {
    pieces.push_back(text.substr(start));
  }
  return pieces;
}

std::vector<std::string> RecursiveTextSplitter::split_code_points(const std::string &text) {
  std::vector<std::string> pieces;
  auto it = text.begin();
  while (it != text.end()) {
    auto start = it;
    utf8::next(it, text.end());
    pieces.emplace_back(start, it);
  }
  return pieces;
}

}  // namespace lex_core
