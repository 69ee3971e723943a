#pragma once

#include <stdexcept>
#include <string>

namespace lex_core {

// Non-success response, transport failure or timeout from the language-model service
class ModelServiceError : public std::exception {
 public:
  explicit ModelServiceError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace lex_core
