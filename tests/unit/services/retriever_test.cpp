#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "common/mocks_test.hpp"
#include "lex_core/services/retriever.hpp"

namespace lex_tests {

using lex_core::Retriever;
using lex_core::VectorIndex;
using testing::_;
using testing::NiceMock;
using testing::Throw;

class RetrieverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    embedder_ = std::make_shared<NiceMock<MockEmbeddingProvider>>();
    retriever_ = std::make_unique<Retriever>(embedder_);

    std::vector<lex_core::Chunk> chunks = {
        TestUtilities::make_chunk("Drivers must stop at red lights.", "Chapter 1", "Article 1"),
        TestUtilities::make_chunk("The speed limit in urban areas is 50 km/h.", "Chapter 2",
                                  "Article 7"),
        TestUtilities::make_chunk("Parking is forbidden on bridges.", "Chapter 3", "Article 12")};
    std::vector<std::string> texts;
    for (const auto& chunk : chunks) {
      texts.push_back(chunk.text);
    }
    index_.add(chunks, embedder_->embed_documents(texts), 0);
  }

  std::shared_ptr<NiceMock<MockEmbeddingProvider>> embedder_;
  std::unique_ptr<Retriever> retriever_;
  VectorIndex index_;
};

TEST_F(RetrieverTest, RequiresAnEmbedder) {
  EXPECT_THROW(Retriever(nullptr), std::invalid_argument);
}

TEST_F(RetrieverTest, ClosestPassageComesFirst) {
  auto results = retriever_->search(index_, "What is the speed limit?", 2);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].content, "The speed limit in urban areas is 50 km/h.");
  EXPECT_EQ(results[0].chapter_title, "Chapter 2");
  EXPECT_EQ(results[0].article_title, "Article 7");
  EXPECT_EQ(results[0].source, "Chapter 2, Article 7");
  ASSERT_TRUE(results[0].distance.has_value());
  ASSERT_TRUE(results[1].distance.has_value());
  EXPECT_LE(*results[0].distance, *results[1].distance);
}

TEST_F(RetrieverTest, DrivingSpeedQuestionFindsSpeedLimitArticle) {
  std::vector<lex_core::Chunk> chunks = {
      TestUtilities::make_chunk("Speed limit: drivers must not drive faster than 50 km/h.",
                                "Chapter 2", "Speed limit"),
      TestUtilities::make_chunk("Parking rules: vehicles may park only in marked bays.",
                                "Chapter 3", "Parking rules")};
  VectorIndex index;
  index.add(chunks, embedder_->embed_documents({chunks[0].text, chunks[1].text}), 0);

  auto results = retriever_->search(index, "how fast can I drive", 1);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].article_title, "Speed limit");
}

TEST_F(RetrieverTest, TopKBoundsTheResultCount) {
  EXPECT_EQ(retriever_->search(index_, "stop", 1).size(), 1u);
  EXPECT_EQ(retriever_->search(index_, "stop", 3).size(), 3u);
  EXPECT_EQ(retriever_->search(index_, "stop", 10).size(), 3u);
}

TEST_F(RetrieverTest, EmptyIndexNeverEmbedsTheQuery) {
  EXPECT_CALL(*embedder_, embed_query(_)).Times(0);
  VectorIndex empty;
  EXPECT_TRUE(retriever_->search(empty, "What is the speed limit?", 5).empty());
}

TEST_F(RetrieverTest, NonPositiveTopKNeverEmbedsTheQuery) {
  EXPECT_CALL(*embedder_, embed_query(_)).Times(0);
  EXPECT_TRUE(retriever_->search(index_, "stop", 0).empty());
  EXPECT_TRUE(retriever_->search(index_, "stop", -3).empty());
}

TEST_F(RetrieverTest, EmbeddingFailurePropagates) {
  ON_CALL(*embedder_, embed_query(_))
      .WillByDefault(Throw(lex_core::EmbeddingError("Query embedding failed: timeout")));
  EXPECT_THROW(retriever_->search(index_, "stop", 3), lex_core::EmbeddingError);
}

}  // namespace lex_tests
