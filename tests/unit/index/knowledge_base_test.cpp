#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "../../common/utilities_test.hpp"

namespace localmind_core {

class KnowledgeBaseTest : public localmind_tests::KnowledgeBaseTestBase {
 protected:
  IngestResult ingest_text(const std::string& id, const std::string& text) {
    return pipeline_->ingest(localmind_tests::TestUtilities::create_test_document(id, text));
  }

  // Simulates a restart: a fresh KnowledgeBase over the same store and snapshot.
  std::shared_ptr<KnowledgeBase> reopen() {
    knowledge_base_->close();
    return std::make_shared<KnowledgeBase>(chunk_store_, index_options_, snapshot_path_);
  }
};

TEST_F(KnowledgeBaseTest, OpensEmptyWithoutSnapshot) {
  auto stats = knowledge_base_->stats();
  EXPECT_EQ(stats.document_count, 0u);
  EXPECT_EQ(stats.indexed_vectors, 0u);
  EXPECT_EQ(stats.index_type, "flat");
  EXPECT_FALSE(knowledge_base_->is_mutation_locked());
  EXPECT_NO_THROW(knowledge_base_->verify_consistency());
}

TEST_F(KnowledgeBaseTest, IngestKeepsIndexAndStoreInStep) {
  ingest_text("doc1", "Vector search uses embeddings.\n\nSQLite stores the chunk text.");
  ingest_text("doc2", "A second document about project planning.");

  auto stats = knowledge_base_->stats();
  EXPECT_EQ(stats.document_count, 2u);
  EXPECT_EQ(stats.chunk_count, stats.indexed_vectors);
  EXPECT_EQ(stats.snapshot_version, 2u);
  EXPECT_EQ(chunk_store_->snapshot_version(), 2u);
  EXPECT_NO_THROW(knowledge_base_->verify_consistency());
}

TEST_F(KnowledgeBaseTest, SnapshotSurvivesRestart) {
  ingest_text("doc1", "Embeddings map text to vectors for similarity search.");
  auto query = embedder_->get_embedding("similarity search with vectors");
  auto before = knowledge_base_->search(query, 3);

  auto restarted = reopen();
  ASSERT_NO_THROW(restarted->open());

  auto after = restarted->search(query, 3);
  ASSERT_EQ(before.size(), after.size());
  for (size_t i = 0; i < before.size(); ++i) {
    EXPECT_EQ(before[i].id, after[i].id);
    EXPECT_NEAR(before[i].score, after[i].score, 1e-5);
  }
  EXPECT_EQ(restarted->stats().snapshot_version, 1u);
}

TEST_F(KnowledgeBaseTest, StaleSnapshotIsRejectedAndLocksMutation) {
  ingest_text("doc1", "First version of the knowledge base.");
  auto stale = snapshot_path_.parent_path() / "stale.faiss";
  std::filesystem::copy_file(snapshot_path_, stale);
  std::filesystem::copy_file(VectorIndex::manifest_path_for(snapshot_path_), VectorIndex::manifest_path_for(stale));

  ingest_text("doc2", "A later document that the stale snapshot does not know about.");

  KnowledgeBase restarted(chunk_store_, index_options_, stale);
  EXPECT_THROW(restarted.open(), IndexInconsistencyError);
  EXPECT_TRUE(restarted.is_mutation_locked());
}

TEST_F(KnowledgeBaseTest, MissingSnapshotWithStoredChunksIsInconsistent) {
  ingest_text("doc1", "Some stored text.");

  KnowledgeBase restarted(chunk_store_, index_options_, work_dir_ / "missing.faiss");
  EXPECT_THROW(restarted.open(), IndexInconsistencyError);
  EXPECT_TRUE(restarted.is_mutation_locked());
}

TEST_F(KnowledgeBaseTest, RebuildFromStoreRepairsAndUnlocks) {
  ingest_text("doc1", "Paragraph one.\n\nParagraph two.");
  const size_t chunks = chunk_store_->chunk_count();

  auto restarted = std::make_shared<KnowledgeBase>(chunk_store_, index_options_, work_dir_ / "fresh.faiss");
  EXPECT_THROW(restarted->open(), IndexInconsistencyError);

  EXPECT_EQ(restarted->rebuild_index_from_store(), chunks);
  EXPECT_FALSE(restarted->is_mutation_locked());
  EXPECT_NO_THROW(restarted->verify_consistency());
  EXPECT_TRUE(std::filesystem::exists(work_dir_ / "fresh.faiss"));
}

TEST_F(KnowledgeBaseTest, VerifyConsistencyDetectsOutOfBandDeletes) {
  ingest_text("doc1", "Text that will be deleted behind the index's back.");

  chunk_store_->delete_chunks(chunk_store_->all_chunk_ids());

  EXPECT_THROW(knowledge_base_->verify_consistency(), IndexInconsistencyError);
  EXPECT_TRUE(knowledge_base_->is_mutation_locked());
  EXPECT_THROW(ingest_text("doc2", "Rejected while locked."), IndexInconsistencyError);
}

TEST_F(KnowledgeBaseTest, RetrieveHydratesChunksInScoreOrder) {
  ingest_text("doc1", "Alpha beta gamma.");
  ingest_text("doc2", "Delta epsilon zeta.");

  auto hits = knowledge_base_->retrieve(embedder_->get_embedding("delta epsilon zeta"), 2);
  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].chunk.document_id, "doc2");
  EXPECT_EQ(hits[0].chunk.content, "Delta epsilon zeta.");
  EXPECT_GE(hits[0].score, hits[1].score);
}

TEST_F(KnowledgeBaseTest, RemoveDocumentBumpsVersionAndDropsVectors) {
  ingest_text("doc1", "Keep me.");
  ingest_text("doc2", "Remove me.");

  EXPECT_EQ(pipeline_->remove_document("doc2"), 1u);

  auto stats = knowledge_base_->stats();
  EXPECT_EQ(stats.document_count, 1u);
  EXPECT_EQ(stats.indexed_vectors, 1u);
  EXPECT_EQ(stats.snapshot_version, 3u);
  EXPECT_FALSE(knowledge_base_->document("doc2").has_value());
}

}  // namespace localmind_core
