#pragma once

#include <string>

namespace lex_core {

// Default legal-assistant prompt with {context} and {question} placeholders
extern const char *const kDefaultPromptTemplate;

/**
 * A prompt with {context} and {question} placeholders. Substitution is a single left-to-right
 * pass, so braces inside the substituted text are never expanded again.
 */
class PromptTemplate {
 public:
  // Throws std::invalid_argument if either placeholder is missing
  explicit PromptTemplate(std::string text = kDefaultPromptTemplate);

  std::string render(const std::string &context, const std::string &question) const;

  const std::string &text() const {
    return text_;
  }

 private:
  std::string text_;
};

}  // namespace lex_core
