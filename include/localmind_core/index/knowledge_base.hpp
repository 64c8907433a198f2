#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "localmind_core/db/chunk_store.hpp"
#include "localmind_core/index/vector_index.hpp"
#include "localmind_core/types/chunk.hpp"
#include "localmind_core/types/document.hpp"

namespace localmind_core {

class IndexingPipeline;

struct KnowledgeBaseStats {
  size_t document_count = 0;
  size_t chunk_count = 0;
  size_t indexed_vectors = 0;
  std::map<std::string, size_t> category_counts;
  std::uint64_t snapshot_version = 0;
  std::string index_type;
};

struct RetrievedChunk {
  Chunk chunk;
  float score = 0.0f;
};

struct DocumentUpdate {
  std::vector<ChunkId> added;
  std::vector<ChunkId> removed;
  // Set when the change committed but the snapshot write after it failed.
  std::string snapshot_warning;
};

/**
 * @class KnowledgeBase
 * @brief Process-wide pairing of the vector index with the chunk store.
 *
 * Every chunk id in the index has exactly one row in the store and vice
 * versa. Readers take a shared lock and see the state before or after an
 * ingestion, never a mix. Writers are serialised and only reach this class
 * through IndexingPipeline.
 *
 * Lifecycle: open() restores the persisted snapshot (or starts empty when
 * neither the snapshot nor the store holds anything), close() writes the
 * final snapshot. A snapshot whose version differs from the store's is
 * rejected with IndexInconsistencyError; rebuild_index_from_store() is the
 * explicit repair.
 */
class KnowledgeBase {
 public:
  KnowledgeBase(std::shared_ptr<ChunkStore> chunk_store,
                const VectorIndexOptions& index_options,
                std::filesystem::path snapshot_path);

  KnowledgeBase(const KnowledgeBase&) = delete;
  KnowledgeBase& operator=(const KnowledgeBase&) = delete;

  void open();
  void close();

  RetrievalResult search(const std::vector<float>& query_vector, size_t k, size_t candidate_count = 0) const;

  // Search and hydrate under a single read lock.
  std::vector<RetrievedChunk> retrieve(const std::vector<float>& query_vector,
                                       size_t k,
                                       size_t candidate_count = 0) const;

  std::vector<Chunk> hydrate(const std::vector<ChunkId>& ids) const;

  std::optional<DocumentInfo> document(const std::string& document_id) const;
  std::vector<DocumentInfo> documents() const;
  KnowledgeBaseStats stats() const;
  size_t dimension() const;

  // Compares index ids with store ids. On mismatch, locks out further
  // mutation and throws IndexInconsistencyError.
  void verify_consistency();
  bool is_mutation_locked() const;

  void save_snapshot();
  const std::filesystem::path& snapshot_path() const { return snapshot_path_; }

  // Explicit repair: rebuilds the index from stored vectors, writes a fresh
  // snapshot and lifts the mutation lock. Returns the number of vectors.
  size_t rebuild_index_from_store();

 private:
  friend class IndexingPipeline;

  // Replaces all chunks of the document. Chunk ids are assigned here.
  DocumentUpdate replace_document(const DocumentInfo& info, std::vector<Chunk>& chunks);
  std::vector<ChunkId> remove_document(const std::string& document_id);

  void ensure_mutable() const;
  void verify_consistency_locked();
  void save_snapshot_locked();
  // Returns an empty string on success, the failure message otherwise.
  std::string save_snapshot_after_commit();

  std::shared_ptr<ChunkStore> chunk_store_;
  VectorIndexOptions index_options_;
  std::filesystem::path snapshot_path_;

  std::unique_ptr<VectorIndex> index_;
  std::uint64_t snapshot_version_ = 0;
  // Raised by readers too, hence mutable.
  mutable std::atomic<bool> mutation_locked_{false};
  bool opened_ = false;

  mutable std::shared_mutex mutex_;
  std::mutex snapshot_mutex_;
};

}  // namespace localmind_core
