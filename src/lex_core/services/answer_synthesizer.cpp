#include "lex_core/services/answer_synthesizer.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <stdexcept>

#include "lex_core/embeddings/embedding_provider.hpp"
#include "lex_core/services/retrieval_qa_chain.hpp"

namespace lex_core {

const char *const kNoInformationAnswer =
    "I could not find relevant information in the legal corpus.";
const char *const kApologyAnswer = "Sorry, an error occurred while processing your question.";

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

AnswerSynthesizer::AnswerSynthesizer(std::shared_ptr<Retriever> retriever,
                                     std::shared_ptr<OllamaClient> ollama_client,
                                     std::shared_ptr<CompletionClient> completion_client,
                                     std::string llm_model,
                                     int top_k,
                                     PromptTemplate prompt)
    : retriever_(std::move(retriever)),
      ollama_client_(std::move(ollama_client)),
      completion_client_(std::move(completion_client)),
      llm_model_(std::move(llm_model)),
      top_k_(top_k),
      prompt_(std::move(prompt)) {
  if (!retriever_ || !completion_client_) {
    throw std::invalid_argument("AnswerSynthesizer requires a retriever and a completion client");
  }
}

std::string AnswerSynthesizer::labeled_context(const std::vector<RetrievalResult> &passages) {
  std::string context;
  for (size_t i = 0; i < passages.size(); ++i) {
    if (i > 0) {
      context += "\n\n";
    }
    context += "Source " + std::to_string(i + 1) + ": " + passages[i].chapter_title + ", " +
               passages[i].article_title + "\n" + passages[i].content;
  }
  return context;
}

Answer AnswerSynthesizer::generate_answer(std::shared_ptr<const VectorIndex> index,
                                          const std::string &query) {
  try {
    try {
      return run_primary(index, query);
    } catch (const PipelineError &e) {
      std::cerr << "Warning: retrieval chain failed, using direct completion: " << e.what()
                << std::endl;
    }
    return run_fallback(index, query);
  } catch (const std::exception &e) {
    std::cerr << "Error: failed to generate answer: " << e.what() << std::endl;
    return Answer{kApologyAnswer, {}};
  }
}

Answer AnswerSynthesizer::run_primary(std::shared_ptr<const VectorIndex> index,
                                      const std::string &query) {
  auto start = std::chrono::steady_clock::now();
  RetrievalQaChain chain(std::move(index), retriever_, ollama_client_, llm_model_, prompt_, top_k_);
  Answer answer = chain.invoke(query);
  std::cout << "Generated answer using retrieval chain in " << std::fixed << std::setprecision(2)
            << seconds_since(start) << " seconds" << std::endl;
  return answer;
}

Answer AnswerSynthesizer::run_fallback(const std::shared_ptr<const VectorIndex> &index,
                                       const std::string &query) {
  auto start = std::chrono::steady_clock::now();

  std::vector<RetrievalResult> passages;
  if (index) {
    try {
      passages = retriever_->search(*index, query, top_k_);
    } catch (const EmbeddingError &e) {
      std::cerr << "Warning: direct retrieval failed: " << e.what() << std::endl;
    } catch (const VectorIndexError &e) {
      std::cerr << "Warning: direct retrieval failed: " << e.what() << std::endl;
    }
  }
  if (passages.empty()) {
    std::cout << "No relevant passages for query, answered in " << std::fixed
              << std::setprecision(2) << seconds_since(start) << " seconds" << std::endl;
    return Answer{kNoInformationAnswer, {}};
  }

  std::string prompt = prompt_.render(labeled_context(passages), query);
  std::string text;
  try {
    text = completion_client_->complete(llm_model_, prompt);
  } catch (const ModelServiceError &e) {
    std::cerr << "Error: completion endpoint failed: " << e.what() << std::endl;
    return Answer{kApologyAnswer, {}};
  }

  std::cout << "Generated answer using direct completion in " << std::fixed << std::setprecision(2)
            << seconds_since(start) << " seconds" << std::endl;
  return Answer{std::move(text), std::move(passages)};
}

}  // namespace lex_core
