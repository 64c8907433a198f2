#pragma once

#include <faiss/IndexIDMap.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "localmind_core/types/chunk.hpp"

namespace localmind_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

enum class IndexType { Flat, HNSW };

std::string to_string(IndexType type);
IndexType index_type_from_string(const std::string& str);

struct VectorIndexOptions {
  size_t dimension = 1024;
  IndexType type = IndexType::Flat;
  int hnsw_m = 32;
  int hnsw_ef_construction = 80;
  int hnsw_ef_search = 64;
  // HNSW only: compact once tombstones exceed this share of stored vectors.
  float compaction_ratio = 0.2f;
};

// Written next to the index file as <index>.meta.json.
struct IndexManifest {
  int format_version = 1;
  std::uint64_t snapshot_version = 0;
  size_t dimension = 0;
  size_t count = 0;
  IndexType type = IndexType::Flat;
};

/**
 * @class VectorIndex
 * @brief Cosine-similarity search over chunk embeddings, addressed by chunk id.
 *
 * Vectors are L2-normalised on the way in, so inner product equals cosine
 * similarity. Results are ordered by score descending with ties broken by id
 * ascending, which makes identical queries on an unchanged index return
 * identical lists.
 *
 * The flat index removes ids directly. HNSW cannot remove graph nodes, so
 * removed ids are tombstoned, filtered out of results, and physically dropped
 * by compact().
 *
 * Not thread-safe for mutation; KnowledgeBase serialises writers and swaps
 * in mutated clones.
 */
class VectorIndex {
 public:
  explicit VectorIndex(const VectorIndexOptions& options);
  ~VectorIndex();

  VectorIndex(const VectorIndex&) = delete;
  VectorIndex& operator=(const VectorIndex&) = delete;

  std::unique_ptr<VectorIndex> clone() const;

  void add(const std::vector<ChunkId>& ids, const std::vector<std::vector<float>>& vectors);
  void remove(const std::vector<ChunkId>& ids);

  // At most k results. candidate_count widens the HNSW beam (efSearch);
  // a larger value never lowers recall. Ignored by the flat index.
  RetrievalResult search(const std::vector<float>& query_vector,
                         size_t k,
                         size_t candidate_count = 0) const;

  size_t size() const;
  size_t tombstone_count() const;
  bool contains(ChunkId id) const;
  std::set<ChunkId> ids() const;
  size_t dimension() const { return options_.dimension; }
  const VectorIndexOptions& options() const { return options_; }

  // Rebuilds the HNSW graph without tombstoned ids. No-op for the flat index.
  void compact();

  void save(const std::filesystem::path& index_path, std::uint64_t snapshot_version) const;
  static std::unique_ptr<VectorIndex> load(const std::filesystem::path& index_path,
                                           const VectorIndexOptions& options,
                                           IndexManifest& manifest_out);
  static std::filesystem::path manifest_path_for(const std::filesystem::path& index_path);
  static IndexManifest read_manifest(const std::filesystem::path& index_path);

 private:
  VectorIndex(const VectorIndexOptions& options, std::unique_ptr<faiss::IndexIDMap2> index);

  std::unique_ptr<faiss::IndexIDMap2> create_base_index() const;
  std::vector<float> normalized(const std::vector<float>& vector) const;
  void check_dimension(const std::vector<float>& vector) const;
  void maybe_compact();

  VectorIndexOptions options_;
  std::unique_ptr<faiss::IndexIDMap2> index_;
  std::set<ChunkId> tombstones_;
};

}  // namespace localmind_core
