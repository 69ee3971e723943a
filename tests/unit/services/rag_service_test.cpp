#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include "common/mocks_test.hpp"
#include "lex_core/services/rag_service.hpp"

namespace lex_tests {

using lex_core::RagService;
using lex_core::RagSettings;
using testing::_;
using testing::HasSubstr;
using testing::NiceMock;
using testing::Return;
using testing::Throw;

class RagServiceTest : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    settings_.corpus_dir = temp_dir_ / "corpus";
    settings_.index_path = temp_dir_ / "index" / "lexrag_index.db";
    settings_.llm_model = "llm-model";
    settings_.top_k = 2;
    settings_.index_batch_size = 2;

    embedder_ = std::make_shared<NiceMock<MockEmbeddingProvider>>();
    ollama_ = std::make_shared<NiceMock<MockOllamaClient>>();
    completion_ = std::make_shared<NiceMock<MockCompletionClient>>();
  }

  std::unique_ptr<RagService> make_service() {
    return std::make_unique<RagService>(settings_, ollama_, completion_, embedder_);
  }

  void write_corpus(const std::vector<nlohmann::json>& chapters) {
    TestUtilities::write_corpus_file(settings_.corpus_dir, "traffic.json",
                                     nlohmann::json(chapters));
  }

  RagSettings settings_;
  std::shared_ptr<NiceMock<MockEmbeddingProvider>> embedder_;
  std::shared_ptr<NiceMock<MockOllamaClient>> ollama_;
  std::shared_ptr<NiceMock<MockCompletionClient>> completion_;
};

TEST_F(RagServiceTest, ConstructorRequiresClients) {
  EXPECT_THROW(RagService(settings_, nullptr, completion_, embedder_), std::invalid_argument);
  EXPECT_THROW(RagService(settings_, ollama_, nullptr, embedder_), std::invalid_argument);
}

TEST_F(RagServiceTest, StatusBeforeInitializationDoesNotLoad) {
  write_corpus({TestUtilities::make_chapter("Chapter 1", "Article 1", {"Stop at red lights."})});
  EXPECT_CALL(*embedder_, embed_documents(_)).Times(0);

  auto service = make_service();
  auto status = service->status();

  EXPECT_FALSE(status.vectorstore_loaded);
  EXPECT_EQ(status.document_count, 0u);
  EXPECT_EQ(status.status, "not_loaded");
  EXPECT_FALSE(status.index_saved);
  EXPECT_EQ(status.embedding_model, "mock-embedding-model");
  EXPECT_EQ(status.llm_model, "llm-model");
  EXPECT_FALSE(service->snapshot());
}

TEST_F(RagServiceTest, FirstQueryBuildsIndexAndAnswers) {
  write_corpus({TestUtilities::make_chapter("Chapter 1", "Article 1",
                                            {"Drivers must stop at red lights."})});
  EXPECT_CALL(*ollama_, generate("llm-model", HasSubstr("Drivers must stop at red lights.")))
      .WillOnce(Return(std::string("You must stop at a red light.")));

  auto service = make_service();
  auto answer = service->generate_answer("Do I have to stop at a red light?");

  EXPECT_EQ(answer.text, "You must stop at a red light.");
  ASSERT_EQ(answer.sources.size(), 1u);
  EXPECT_EQ(answer.sources[0].chapter_title, "Chapter 1");
  EXPECT_EQ(answer.sources[0].article_title, "Article 1");

  auto status = service->status();
  EXPECT_TRUE(status.vectorstore_loaded);
  EXPECT_EQ(status.document_count, 1u);
  EXPECT_EQ(status.status, "ready");
  EXPECT_TRUE(status.index_saved);
}

TEST_F(RagServiceTest, InitializeRunsOnce) {
  write_corpus({TestUtilities::make_chapter("Chapter 1", "Article 1", {"Stop at red lights."})});
  EXPECT_CALL(*embedder_, embed_documents(_)).Times(1);

  auto service = make_service();
  service->initialize();
  auto first = service->snapshot();
  service->initialize();
  service->generate_answer("stop");

  EXPECT_EQ(service->snapshot().get(), first.get());
}

TEST_F(RagServiceTest, SavedIndexIsReusedByNextService) {
  write_corpus({TestUtilities::make_chapter("Chapter 1", "Article 1", {"Stop at red lights."})});
  make_service()->initialize();

  auto embedder = std::make_shared<NiceMock<MockEmbeddingProvider>>();
  EXPECT_CALL(*embedder, embed_documents(_)).Times(0);
  RagService second(settings_, ollama_, completion_, embedder);
  second.initialize();

  EXPECT_EQ(second.status().document_count, 1u);
}

TEST_F(RagServiceTest, FailedInitializationGivesApologyAndIsRetried) {
  write_corpus({TestUtilities::make_chapter("Chapter 1", "Article 1", {"Stop at red lights."})});
  EXPECT_CALL(*embedder_, embed_documents(_))
      .WillOnce(Throw(lex_core::EmbeddingError("Embedding batch 0 failed: refused")))
      .WillRepeatedly(testing::DoDefault());

  auto service = make_service();
  auto failed = service->generate_answer("stop");
  EXPECT_EQ(failed.text, lex_core::kApologyAnswer);
  EXPECT_FALSE(service->status().vectorstore_loaded);

  auto answered = service->generate_answer("stop");
  EXPECT_EQ(answered.text, "Generated answer");
  EXPECT_TRUE(service->status().vectorstore_loaded);
}

TEST_F(RagServiceTest, EmptyCorpusAnswersNoInformation) {
  auto service = make_service();
  auto answer = service->generate_answer("What is the speed limit?");

  EXPECT_EQ(answer.text, lex_core::kNoInformationAnswer);
  EXPECT_TRUE(answer.sources.empty());
  EXPECT_TRUE(service->status().vectorstore_loaded);
  EXPECT_EQ(service->status().document_count, 0u);
}

TEST_F(RagServiceTest, ForceRebuildSwapsSnapshot) {
  write_corpus({TestUtilities::make_chapter("Chapter 1", "Article 1", {"Stop at red lights."})});
  auto service = make_service();
  service->initialize();
  auto before = service->snapshot();
  ASSERT_EQ(before->size(), 1u);

  write_corpus({TestUtilities::make_chapter("Chapter 1", "Article 1", {"Stop at red lights."}),
                TestUtilities::make_chapter("Chapter 2", "Article 2", {"Speed limit is 50 km/h."}),
                TestUtilities::make_chapter("Chapter 3", "Article 3", {"No parking on bridges."})});
  auto report = service->force_rebuild();

  EXPECT_TRUE(report.success);
  EXPECT_EQ(report.document_count, 3);
  EXPECT_EQ(service->snapshot()->size(), 3u);
  // Readers holding the old snapshot keep a complete index
  EXPECT_EQ(before->size(), 1u);
  EXPECT_EQ(service->status().document_count, 3u);
}

TEST_F(RagServiceTest, ForceRebuildBeforeInitializeIsKept) {
  write_corpus({TestUtilities::make_chapter("Chapter 1", "Article 1", {"Stop at red lights."})});
  auto service = make_service();

  auto report = service->force_rebuild();
  ASSERT_TRUE(report.success);
  auto rebuilt = service->snapshot();

  service->initialize();
  EXPECT_EQ(service->snapshot().get(), rebuilt.get());
}

TEST_F(RagServiceTest, ForceRebuildOfEmptyCorpusKeepsCurrentIndex) {
  write_corpus({TestUtilities::make_chapter("Chapter 1", "Article 1", {"Stop at red lights."})});
  auto service = make_service();
  service->initialize();
  auto before = service->snapshot();

  TestUtilities::cleanup_temp_dir(settings_.corpus_dir);
  auto report = service->force_rebuild();

  EXPECT_FALSE(report.success);
  EXPECT_EQ(report.document_count, 0);
  EXPECT_EQ(service->snapshot().get(), before.get());
  EXPECT_TRUE(service->status().index_saved);
}

TEST_F(RagServiceTest, ForceRebuildPropagatesEmbeddingFailure) {
  write_corpus({TestUtilities::make_chapter("Chapter 1", "Article 1", {"Stop at red lights."})});
  ON_CALL(*embedder_, embed_documents(_))
      .WillByDefault(Throw(lex_core::EmbeddingError("Embedding batch 0 failed: refused")));

  auto service = make_service();
  EXPECT_THROW(service->force_rebuild(), lex_core::EmbeddingError);
  EXPECT_FALSE(service->snapshot());
}

TEST_F(RagServiceTest, ConcurrentFirstQueriesBuildIndexOnce) {
  write_corpus({TestUtilities::make_chapter("Chapter 1", "Article 1", {"Stop at red lights."})});
  EXPECT_CALL(*embedder_, embed_documents(_)).Times(1);

  auto service = make_service();
  constexpr int kThreads = 8;
  std::vector<std::future<lex_core::Answer>> answers;
  for (int i = 0; i < kThreads; ++i) {
    answers.push_back(
        std::async(std::launch::async, [&service]() { return service->generate_answer("stop"); }));
  }

  for (auto &answer : answers) {
    EXPECT_EQ(answer.get().text, "Generated answer");
  }
  ASSERT_TRUE(service->snapshot());
  EXPECT_EQ(service->snapshot()->size(), 1u);
}

TEST_F(RagServiceTest, QueriesDuringRebuildSeeCompleteSnapshots) {
  write_corpus({TestUtilities::make_chapter("Chapter 1", "Article 1", {"Stop at red lights."})});
  auto service = make_service();
  service->initialize();

  write_corpus({TestUtilities::make_chapter("Chapter 1", "Article 1", {"Stop at red lights."}),
                TestUtilities::make_chapter("Chapter 2", "Article 2", {"Speed limit is 50 km/h."}),
                TestUtilities::make_chapter("Chapter 3", "Article 3", {"No parking on bridges."})});

  std::atomic<bool> rebuild_done = false;
  auto observe = [&service, &rebuild_done]() {
    std::set<size_t> sizes;
    do {
      sizes.insert(service->snapshot()->size());
      service->generate_answer("stop");
    } while (!rebuild_done.load());
    sizes.insert(service->snapshot()->size());
    return sizes;
  };
  auto reader_a = std::async(std::launch::async, observe);
  auto reader_b = std::async(std::launch::async, observe);

  auto report = service->force_rebuild();
  rebuild_done = true;

  EXPECT_TRUE(report.success);
  for (auto *reader : {&reader_a, &reader_b}) {
    std::set<size_t> sizes = reader->get();
    for (size_t size : sizes) {
      EXPECT_TRUE(size == 1u || size == 3u) << "observed snapshot of size " << size;
    }
    EXPECT_EQ(sizes.count(3u), 1u);
  }
}

TEST_F(RagServiceTest, RebuildWaitsForFirstQueryInitialization) {
  write_corpus({TestUtilities::make_chapter("Chapter 1", "Article 1", {"Stop at red lights."})});

  std::promise<void> init_embedding_started;
  std::promise<void> release_init;
  std::shared_future<void> release = release_init.get_future().share();
  NiceMock<MockEmbeddingProvider> reference_embedder;
  EXPECT_CALL(*embedder_, embed_documents(_))
      .WillOnce([&](const std::vector<std::string> &texts) {
        init_embedding_started.set_value();
        release.wait();
        return reference_embedder.embed_documents(texts);
      })
      .WillRepeatedly(testing::DoDefault());

  auto service = make_service();
  auto query = std::async(std::launch::async,
                          [&service]() { return service->generate_answer("stop"); });
  init_embedding_started.get_future().wait();

  // The initializing thread has already read the one-chapter corpus
  write_corpus({TestUtilities::make_chapter("Chapter 1", "Article 1", {"Stop at red lights."}),
                TestUtilities::make_chapter("Chapter 2", "Article 2", {"Speed limit is 50 km/h."}),
                TestUtilities::make_chapter("Chapter 3", "Article 3", {"No parking on bridges."})});
  std::atomic<bool> rebuild_done = false;
  auto rebuild = std::async(std::launch::async, [&service, &rebuild_done]() {
    auto report = service->force_rebuild();
    rebuild_done = true;
    return report;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_FALSE(rebuild_done.load());

  release_init.set_value();
  EXPECT_EQ(query.get().text, "Generated answer");
  auto report = rebuild.get();

  EXPECT_TRUE(report.success);
  EXPECT_EQ(report.document_count, 3);
  ASSERT_TRUE(service->snapshot());
  EXPECT_EQ(service->snapshot()->size(), 3u);

  // The artifact on disk is the rebuilt one
  auto embedder = std::make_shared<NiceMock<MockEmbeddingProvider>>();
  EXPECT_CALL(*embedder, embed_documents(_)).Times(0);
  RagService reloaded(settings_, ollama_, completion_, embedder);
  reloaded.initialize();
  EXPECT_EQ(reloaded.status().document_count, 3u);
}

TEST_F(RagServiceTest, ReportsModelServerAvailability) {
  auto service = make_service();
  EXPECT_CALL(*ollama_, is_server_available())
      .WillOnce(Return(true))
      .WillOnce(Return(false));

  EXPECT_TRUE(service->model_server_available());
  EXPECT_FALSE(service->model_server_available());
}

}  // namespace lex_tests
