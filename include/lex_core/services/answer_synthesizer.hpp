#pragma once

#include <memory>
#include <string>
#include <vector>

#include "lex_core/index/vector_index.hpp"
#include "lex_core/llm/completion_client.hpp"
#include "lex_core/llm/ollama_client.hpp"
#include "lex_core/services/prompt_template.hpp"
#include "lex_core/services/retriever.hpp"
#include "lex_core/types/chunk.hpp"

namespace lex_core {

extern const char *const kNoInformationAnswer;
extern const char *const kApologyAnswer;

/**
 * @class AnswerSynthesizer
 * @brief Answers a question from an index snapshot.
 *
 * The retrieval chain is tried first. If it fails for any reason the synthesizer retrieves again
 * itself, labels each passage with its source and calls the completion endpoint directly.
 * generate_answer() always returns an Answer.
 */
class AnswerSynthesizer {
 public:
  AnswerSynthesizer(std::shared_ptr<Retriever> retriever,
                    std::shared_ptr<OllamaClient> ollama_client,
                    std::shared_ptr<CompletionClient> completion_client,
                    std::string llm_model,
                    int top_k,
                    PromptTemplate prompt = PromptTemplate());

  Answer generate_answer(std::shared_ptr<const VectorIndex> index, const std::string &query);

  // "Source i: {chapter}, {article}\n{content}" parts, 1-based, separated by blank lines
  static std::string labeled_context(const std::vector<RetrievalResult> &passages);

 private:
  Answer run_primary(std::shared_ptr<const VectorIndex> index, const std::string &query);
  Answer run_fallback(const std::shared_ptr<const VectorIndex> &index, const std::string &query);

  std::shared_ptr<Retriever> retriever_;
  std::shared_ptr<OllamaClient> ollama_client_;
  std::shared_ptr<CompletionClient> completion_client_;
  std::string llm_model_;
  int top_k_;
  PromptTemplate prompt_;
};

}  // namespace lex_core
