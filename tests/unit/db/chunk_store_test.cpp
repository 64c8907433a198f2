#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"

namespace localmind_core {

class ChunkStoreTest : public localmind_tests::DatabaseTestBase {
 protected:
  DocumentInfo make_document(const std::string& id, size_t chunk_count = 0) {
    DocumentInfo info;
    info.id = id;
    info.file_type = FileType::Markdown;
    info.content_hash = "hash_" + id;
    info.file_size = 128;
    info.chunk_count = chunk_count;
    info.ingested_at = std::chrono::system_clock::now();
    return info;
  }

  // Writes a document with n chunks in one batch and returns the chunk ids.
  std::vector<ChunkId> write_document(const std::string& id, int n) {
    auto batch = chunk_store_->begin_write();
    batch->upsert_document(make_document(id, n));
    std::vector<ChunkId> ids;
    for (int i = 0; i < n; ++i) {
      auto chunk = localmind_tests::TestUtilities::create_test_chunk(id, i, id + " chunk " + std::to_string(i));
      ids.push_back(batch->insert_chunk(chunk));
    }
    batch->bump_snapshot_version();
    batch->commit();
    return ids;
  }
};

TEST_F(ChunkStoreTest, InsertAndGet_RoundTripsAllFields) {
  auto batch = chunk_store_->begin_write();
  batch->upsert_document(make_document("doc1", 1));
  auto chunk = localmind_tests::TestUtilities::create_test_chunk("doc1", 0, "데이터베이스 설계에 대한 메모");
  chunk.start_offset = 7;
  chunk.end_offset = 42;
  chunk.categories = {"기술", "학습"};
  ChunkId id = batch->insert_chunk(chunk);
  batch->commit();

  Chunk stored = chunk_store_->get(id);
  EXPECT_EQ(stored.id, id);
  EXPECT_EQ(stored.document_id, "doc1");
  EXPECT_EQ(stored.chunk_index, 0);
  EXPECT_EQ(stored.start_offset, 7u);
  EXPECT_EQ(stored.end_offset, 42u);
  EXPECT_EQ(stored.content, "데이터베이스 설계에 대한 메모");
  EXPECT_EQ(stored.categories, (std::set<std::string>{"기술", "학습"}));
  EXPECT_EQ(stored.vector_embedding, chunk.vector_embedding);
}

TEST_F(ChunkStoreTest, Get_UnknownIdThrows) {
  EXPECT_THROW(chunk_store_->get(999), ChunkStoreError);
}

TEST_F(ChunkStoreTest, GetMany_PreservesRequestOrder) {
  auto ids = write_document("doc1", 3);

  auto chunks = chunk_store_->get_many({ids[2], ids[0], ids[1]});
  ASSERT_EQ(chunks.size(), 3);
  EXPECT_EQ(chunks[0].id, ids[2]);
  EXPECT_EQ(chunks[1].id, ids[0]);
  EXPECT_EQ(chunks[2].id, ids[1]);
}

TEST_F(ChunkStoreTest, GetMany_MissingIdIsAnInconsistency) {
  auto ids = write_document("doc1", 1);
  EXPECT_THROW(chunk_store_->get_many({ids[0], ids[0] + 100}), IndexInconsistencyError);
}

TEST_F(ChunkStoreTest, UncommittedBatchRollsBack) {
  {
    auto batch = chunk_store_->begin_write();
    batch->upsert_document(make_document("doc1", 1));
    batch->insert_chunk(localmind_tests::TestUtilities::create_test_chunk("doc1", 0, "never committed"));
    batch->bump_snapshot_version();
  }

  EXPECT_EQ(chunk_store_->chunk_count(), 0u);
  EXPECT_EQ(chunk_store_->document_count(), 0u);
  EXPECT_EQ(chunk_store_->snapshot_version(), 0u);
}

TEST_F(ChunkStoreTest, DeleteDocument_RemovesItsChunksOnly) {
  auto doc1_ids = write_document("doc1", 2);
  auto doc2_ids = write_document("doc2", 3);

  auto batch = chunk_store_->begin_write();
  auto removed = batch->delete_document("doc1");
  batch->commit();

  EXPECT_EQ(removed, doc1_ids);
  EXPECT_FALSE(chunk_store_->get_document("doc1").has_value());
  EXPECT_TRUE(chunk_store_->get_document("doc2").has_value());
  EXPECT_EQ(chunk_store_->chunk_count(), 3u);
  EXPECT_EQ(chunk_store_->chunk_ids_for_document("doc2"), doc2_ids);
}

TEST_F(ChunkStoreTest, ChunkRequiresExistingDocument) {
  EXPECT_THROW(chunk_store_->put(localmind_tests::TestUtilities::create_test_chunk("orphan", 0, "text")),
               ChunkStoreError);
}

TEST_F(ChunkStoreTest, SnapshotVersionIncrementsPerCommittedBatch) {
  write_document("doc1", 1);
  write_document("doc2", 1);
  EXPECT_EQ(chunk_store_->snapshot_version(), 2u);
}

TEST_F(ChunkStoreTest, LoadAllVectors_ReturnsEveryChunk) {
  auto ids = write_document("doc1", 2);
  auto more = write_document("doc2", 1);
  ids.insert(ids.end(), more.begin(), more.end());

  auto vectors = chunk_store_->load_all_vectors();
  ASSERT_EQ(vectors.size(), 3u);
  for (const auto& [id, vector] : vectors) {
    EXPECT_NE(std::find(ids.begin(), ids.end(), id), ids.end());
    EXPECT_EQ(vector.size(), 64u);
  }
  EXPECT_EQ(chunk_store_->all_chunk_ids().size(), 3u);
}

TEST_F(ChunkStoreTest, ListDocumentsAndCategoryCounts) {
  auto batch = chunk_store_->begin_write();
  batch->upsert_document(make_document("doc1", 2));
  auto a = localmind_tests::TestUtilities::create_test_chunk("doc1", 0, "a");
  a.categories = {"기술"};
  auto b = localmind_tests::TestUtilities::create_test_chunk("doc1", 1, "b");
  b.categories = {"기술", "업무"};
  batch->insert_chunk(a);
  batch->insert_chunk(b);
  batch->commit();

  auto documents = chunk_store_->list_documents();
  ASSERT_EQ(documents.size(), 1u);
  EXPECT_EQ(documents[0].id, "doc1");
  EXPECT_EQ(documents[0].file_type, FileType::Markdown);
  EXPECT_EQ(documents[0].chunk_count, 2u);

  auto counts = chunk_store_->category_counts();
  EXPECT_EQ(counts["기술"], 2u);
  EXPECT_EQ(counts["업무"], 1u);
}

}  // namespace localmind_core
