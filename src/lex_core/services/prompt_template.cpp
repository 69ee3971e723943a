#include "lex_core/services/prompt_template.hpp"

#include <stdexcept>

namespace lex_core {

namespace {
constexpr const char *kContextPlaceholder = "{context}";
constexpr const char *kQuestionPlaceholder = "{question}";
}  // namespace

const char *const kDefaultPromptTemplate = R"(
You are an AI assistant specialized in road traffic law.
Use only the following context to answer the user's question.
If the information is not in the context, say clearly that you could not find relevant information in the law.
Answer briefly and concisely, in an advisory tone that is easy for the user to understand.

Context:
{context}

Question: {question}

Answer:
)";

PromptTemplate::PromptTemplate(std::string text) : text_(std::move(text)) {
  if (text_.find(kContextPlaceholder) == std::string::npos ||
      text_.find(kQuestionPlaceholder) == std::string::npos) {
    throw std::invalid_argument("Prompt template must contain {context} and {question}");
  }
}

std::string PromptTemplate::render(const std::string &context, const std::string &question) const {
  const std::string context_key = kContextPlaceholder;
  const std::string question_key = kQuestionPlaceholder;

  std::string rendered;
  rendered.reserve(text_.size() + context.size() + question.size());
  size_t pos = 0;
  while (pos < text_.size()) {
    if (text_.compare(pos, context_key.size(), context_key) == 0) {
      rendered += context;
      pos += context_key.size();
    } else if (text_.compare(pos, question_key.size(), question_key) == 0) {
      rendered += question;
      pos += question_key.size();
    } else {
      rendered.push_back(text_[pos]);
      ++pos;
    }
  }
  return rendered;
}

}  // namespace lex_core
