#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "localmind_core/classify/keyword_classifier.hpp"
#include "localmind_core/db/chunk_store.hpp"
#include "localmind_core/db/conversation_repo.hpp"
#include "localmind_core/db/database_manager.hpp"
#include "localmind_core/db/pooled_connection.hpp"
#include "localmind_core/db/task_queue_repo.hpp"
#include "localmind_core/extractors/content_extractor_factory.hpp"
#include "localmind_core/index/knowledge_base.hpp"
#include "localmind_core/ingest/indexing_pipeline.hpp"
#include "localmind_core/llm/embedding_port.hpp"
#include "localmind_core/types.hpp"

namespace localmind_tests {

/**
 * Deterministic bag-of-words embedder. Every token is hashed (FNV-1a) into a
 * bucket, so texts sharing words have a high cosine similarity and identical
 * texts always map to identical vectors.
 */
class HashingEmbedder : public localmind_core::EmbeddingPort {
 public:
  explicit HashingEmbedder(size_t dimension = 64) : dimension_(dimension) {}

  std::vector<float> get_embedding(const std::string& text) override;
  std::vector<std::vector<float>> get_embeddings(const std::vector<std::string>& texts) override;

  size_t dimension() const { return dimension_; }
  size_t calls() const { return calls_; }

 private:
  size_t dimension_;
  size_t calls_ = 0;
};

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  static std::filesystem::path create_temp_dir(const std::string& prefix = "localmind_tests");
  static std::filesystem::path create_temp_test_db();
  static void cleanup_temp_db(const std::filesystem::path& db_path);
  static void remove_dir(const std::filesystem::path& dir);

  static std::filesystem::path write_file(const std::filesystem::path& path, const std::string& content);

  static std::vector<float> create_test_vector(const std::string& seed_text, size_t dimension = 64);

  static localmind_core::Chunk create_test_chunk(const std::string& document_id,
                                                 int chunk_index,
                                                 const std::string& content,
                                                 size_t dimension = 64);

  static localmind_core::Document create_test_document(const std::string& id,
                                                       const std::string& text,
                                                       localmind_core::FileType type =
                                                           localmind_core::FileType::Text);

  static localmind_core::ConversationTurn create_test_turn(const std::string& conversation_id,
                                                           const std::string& query,
                                                           const std::string& response,
                                                           const std::string& category = "");
};

/**
 * Base test fixture: a fresh encrypted database per test.
 */
class DatabaseTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_db_path_ = TestUtilities::create_temp_test_db();
    const std::string test_db_key = "localmind_test_key";
    auto& mgr = localmind_core::DatabaseManager::get_instance();
    // A previous test may have left the singleton initialized
    mgr.shutdown();
    mgr.initialize(temp_db_path_, test_db_key, /*pool_size*/ 4);
    db_manager_ = &mgr;
    task_queue_repo_ = std::make_shared<localmind_core::TaskQueueRepo>(*db_manager_);
    conversation_repo_ = std::make_shared<localmind_core::ConversationRepo>(*db_manager_);
    chunk_store_ = std::make_shared<localmind_core::ChunkStore>(*db_manager_);
  }

  void TearDown() override {
    task_queue_repo_.reset();
    conversation_repo_.reset();
    chunk_store_.reset();
    if (db_manager_) {
      db_manager_->shutdown();
    }
    TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  std::filesystem::path temp_db_path_;
  localmind_core::DatabaseManager* db_manager_ = nullptr;
  std::shared_ptr<localmind_core::TaskQueueRepo> task_queue_repo_;
  std::shared_ptr<localmind_core::ConversationRepo> conversation_repo_;
  std::shared_ptr<localmind_core::ChunkStore> chunk_store_;
};

/**
 * Adds an opened flat KnowledgeBase, a HashingEmbedder and an
 * IndexingPipeline on top of the database fixture.
 */
class KnowledgeBaseTestBase : public DatabaseTestBase {
 protected:
  static constexpr size_t kDimension = 64;

  void SetUp() override {
    DatabaseTestBase::SetUp();
    work_dir_ = TestUtilities::create_temp_dir("localmind_kb");
    snapshot_path_ = work_dir_ / "index.faiss";

    index_options_.dimension = kDimension;
    index_options_.type = localmind_core::IndexType::Flat;

    embedder_ = std::make_shared<HashingEmbedder>(kDimension);
    classifier_ = std::make_shared<localmind_core::KeywordClassifier>();
    extractor_factory_ = std::make_shared<localmind_core::ContentExtractorFactory>();
    open_knowledge_base();
  }

  void TearDown() override {
    pipeline_.reset();
    knowledge_base_.reset();
    TestUtilities::remove_dir(work_dir_);
    DatabaseTestBase::TearDown();
  }

  void open_knowledge_base(localmind_core::PipelineOptions options = {}) {
    knowledge_base_ =
        std::make_shared<localmind_core::KnowledgeBase>(chunk_store_, index_options_, snapshot_path_);
    knowledge_base_->open();
    pipeline_ = std::make_shared<localmind_core::IndexingPipeline>(knowledge_base_, embedder_, extractor_factory_,
                                                                   classifier_, options);
  }

  std::filesystem::path work_dir_;
  std::filesystem::path snapshot_path_;
  localmind_core::VectorIndexOptions index_options_;
  std::shared_ptr<HashingEmbedder> embedder_;
  std::shared_ptr<localmind_core::KeywordClassifier> classifier_;
  std::shared_ptr<localmind_core::ContentExtractorFactory> extractor_factory_;
  std::shared_ptr<localmind_core::KnowledgeBase> knowledge_base_;
  std::shared_ptr<localmind_core::IndexingPipeline> pipeline_;
};

}  // namespace localmind_tests
