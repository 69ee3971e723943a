#include <gtest/gtest.h>

#include "lex_core/services/prompt_template.hpp"

namespace lex_core {

TEST(PromptTemplateTest, DefaultTemplateHasBothPlaceholders) {
  PromptTemplate prompt;
  EXPECT_NE(prompt.text().find("{context}"), std::string::npos);
  EXPECT_NE(prompt.text().find("{question}"), std::string::npos);
}

TEST(PromptTemplateTest, RendersContextAndQuestion) {
  PromptTemplate prompt("Context:\n{context}\nQuestion: {question}\nAnswer:");
  EXPECT_EQ(prompt.render("Drivers must stop at red lights.", "Must I stop at a red light?"),
            "Context:\nDrivers must stop at red lights.\nQuestion: Must I stop at a red light?\nAnswer:");
}

TEST(PromptTemplateTest, DefaultTemplateRendersWithoutPlaceholdersLeft) {
  std::string rendered = PromptTemplate().render("Speed limit is 50 km/h.", "How fast?");
  EXPECT_EQ(rendered.find("{context}"), std::string::npos);
  EXPECT_EQ(rendered.find("{question}"), std::string::npos);
  EXPECT_NE(rendered.find("Speed limit is 50 km/h."), std::string::npos);
  EXPECT_NE(rendered.find("How fast?"), std::string::npos);
}

TEST(PromptTemplateTest, SubstitutedTextIsNotExpandedAgain) {
  PromptTemplate prompt("{context}|{question}");
  EXPECT_EQ(prompt.render("see {question}", "what is {context}?"), "see {question}|what is {context}?");
}

TEST(PromptTemplateTest, RepeatedPlaceholdersAreAllReplaced) {
  PromptTemplate prompt("{question} {context} {question}");
  EXPECT_EQ(prompt.render("C", "Q"), "Q C Q");
}

TEST(PromptTemplateTest, MissingPlaceholderThrows) {
  EXPECT_THROW(PromptTemplate("Only {context}"), std::invalid_argument);
  EXPECT_THROW(PromptTemplate("Only {question}"), std::invalid_argument);
  EXPECT_THROW(PromptTemplate(""), std::invalid_argument);
}

}  // namespace lex_core
