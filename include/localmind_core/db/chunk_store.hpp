#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "localmind_core/db/database_manager.hpp"
#include "localmind_core/db/pooled_connection.hpp"
#include "localmind_core/db/transaction.hpp"
#include "localmind_core/errors.hpp"
#include "localmind_core/types/chunk.hpp"
#include "localmind_core/types/document.hpp"

namespace localmind_core {

class ChunkStoreError : public StorageError {
 public:
  explicit ChunkStoreError(const std::string& message) : StorageError(message) {}
};

/**
 * @class ChunkStore
 * @brief Durable text side of the knowledge base.
 *
 * Holds documents and their chunks, keyed by the same ids the vector index
 * uses. Chunk text is stored zstd-compressed and the embedding is kept as a
 * float blob so the index can be rebuilt from the store alone.
 *
 * Reads are safe from any thread. Multi-row mutations go through a
 * WriteBatch, which wraps a single IMMEDIATE transaction.
 */
class ChunkStore {
 public:
  class WriteBatch {
   public:
    explicit WriteBatch(DatabaseManager& db_manager);

    WriteBatch(const WriteBatch&) = delete;
    WriteBatch& operator=(const WriteBatch&) = delete;

    void upsert_document(const DocumentInfo& info);

    // Removes the document row and its chunks. Returns the removed chunk ids.
    std::vector<ChunkId> delete_document(const std::string& document_id);
    std::vector<ChunkId> delete_document_chunks(const std::string& document_id);

    // Inserts the chunk. An id of 0 asks the store to allocate a fresh one.
    ChunkId insert_chunk(const Chunk& chunk);
    void delete_chunks(const std::vector<ChunkId>& ids);

    // Increments and returns the snapshot version inside this transaction.
    std::uint64_t bump_snapshot_version();

    void commit();

   private:
    std::vector<ChunkId> chunk_ids_of(const std::string& document_id);

    PooledConnection conn_;
    Transaction tx_;
  };

  explicit ChunkStore(DatabaseManager& db_manager);

  // Throws ChunkStoreError if the id is unknown.
  Chunk get(ChunkId id);

  // Result is aligned with the input. A missing id means the caller holds an
  // id the store does not know, which is reported as IndexInconsistencyError.
  std::vector<Chunk> get_many(const std::vector<ChunkId>& ids);

  ChunkId put(const Chunk& chunk);
  void delete_chunks(const std::vector<ChunkId>& ids);

  std::unique_ptr<WriteBatch> begin_write();

  std::optional<DocumentInfo> get_document(const std::string& document_id);
  std::vector<DocumentInfo> list_documents();
  std::vector<ChunkId> chunk_ids_for_document(const std::string& document_id);
  std::vector<ChunkId> all_chunk_ids();

  // (id, embedding) of every chunk, for rebuilding the vector index.
  std::vector<std::pair<ChunkId, std::vector<float>>> load_all_vectors();

  size_t document_count();
  size_t chunk_count();
  std::map<std::string, size_t> category_counts();

  std::uint64_t snapshot_version();

 private:
  DatabaseManager& db_manager_;
};

}  // namespace localmind_core
