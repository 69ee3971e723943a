#include "lex_core/services/retrieval_qa_chain.hpp"

#include "lex_core/embeddings/embedding_provider.hpp"

namespace lex_core {

RetrievalQaChain::RetrievalQaChain(std::shared_ptr<const VectorIndex> index,
                                   std::shared_ptr<Retriever> retriever,
                                   std::shared_ptr<OllamaClient> client,
                                   std::string llm_model,
                                   PromptTemplate prompt,
                                   int top_k)
    : index_(std::move(index)),
      retriever_(std::move(retriever)),
      client_(std::move(client)),
      llm_model_(std::move(llm_model)),
      prompt_(std::move(prompt)),
      top_k_(top_k) {
  if (!index_ || !retriever_ || !client_) {
    throw PipelineError("Retrieval chain is missing an index, retriever or model client");
  }
  if (llm_model_.empty()) {
    throw PipelineError("Retrieval chain has no language model configured");
  }
}

std::string RetrievalQaChain::stuff_context(const std::vector<RetrievalResult> &passages) {
  std::string context;
  for (size_t i = 0; i < passages.size(); ++i) {
    if (i > 0) {
      context += "\n\n";
    }
    context += passages[i].content;
  }
  return context;
}

Answer RetrievalQaChain::invoke(const std::string &query) {
  std::vector<RetrievalResult> passages;
  try {
    passages = retriever_->search(*index_, query, top_k_);
  } catch (const EmbeddingError &e) {
    throw PipelineError("Retrieval failed: " + std::string(e.what()));
  } catch (const VectorIndexError &e) {
    throw PipelineError("Retrieval failed: " + std::string(e.what()));
  }
  if (passages.empty()) {
    throw PipelineError("No passages retrieved for query");
  }

  std::string prompt = prompt_.render(stuff_context(passages), query);
  std::string text;
  try {
    text = client_->generate(llm_model_, prompt);
  } catch (const ModelServiceError &e) {
    throw PipelineError("Generation failed: " + std::string(e.what()));
  }
  if (text.empty()) {
    throw PipelineError("Model returned an empty answer");
  }

  return Answer{std::move(text), std::move(passages)};
}

}  // namespace lex_core
