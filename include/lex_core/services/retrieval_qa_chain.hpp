#pragma once

#include <memory>
#include <string>

#include "lex_core/index/vector_index.hpp"
#include "lex_core/llm/ollama_client.hpp"
#include "lex_core/services/prompt_template.hpp"
#include "lex_core/services/retriever.hpp"
#include "lex_core/types/chunk.hpp"

namespace lex_core {

class PipelineError : public std::exception {
 public:
  explicit PipelineError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * Retrieve-then-generate over one index snapshot. All retrieved passages are "stuffed" into a
 * single prompt, separated by blank lines, and the model is called once.
 *
 * Every failure surfaces as PipelineError, including finding nothing to answer from.
 */
class RetrievalQaChain {
 public:
  RetrievalQaChain(std::shared_ptr<const VectorIndex> index,
                   std::shared_ptr<Retriever> retriever,
                   std::shared_ptr<OllamaClient> client,
                   std::string llm_model,
                   PromptTemplate prompt,
                   int top_k);

  Answer invoke(const std::string &query);

  static std::string stuff_context(const std::vector<RetrievalResult> &passages);

 private:
  std::shared_ptr<const VectorIndex> index_;
  std::shared_ptr<Retriever> retriever_;
  std::shared_ptr<OllamaClient> client_;
  std::string llm_model_;
  PromptTemplate prompt_;
  int top_k_;
};

}  // namespace lex_core
