#include "localmind_core/index/knowledge_base.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <sstream>

#include "localmind_core/errors.hpp"

namespace localmind_core {

namespace {

std::string sample_ids(const std::vector<ChunkId>& ids) {
  std::stringstream ss;
  const size_t shown = std::min<size_t>(ids.size(), 5);
  for (size_t i = 0; i < shown; ++i) {
    if (i > 0)
      ss << ", ";
    ss << ids[i];
  }
  if (ids.size() > shown) {
    ss << ", ...";
  }
  return ss.str();
}

}  // namespace

KnowledgeBase::KnowledgeBase(std::shared_ptr<ChunkStore> chunk_store,
                             const VectorIndexOptions& index_options,
                             std::filesystem::path snapshot_path)
    : chunk_store_(std::move(chunk_store)),
      index_options_(index_options),
      snapshot_path_(std::move(snapshot_path)) {}

void KnowledgeBase::open() {
  std::unique_lock lock(mutex_);
  if (opened_) {
    return;
  }

  const std::uint64_t store_version = chunk_store_->snapshot_version();
  const size_t store_chunks = chunk_store_->chunk_count();
  const bool have_snapshot = std::filesystem::exists(snapshot_path_) &&
                             std::filesystem::exists(VectorIndex::manifest_path_for(snapshot_path_));

  if (!have_snapshot) {
    if (store_chunks > 0) {
      mutation_locked_ = true;
      throw IndexInconsistencyError("Chunk store holds " + std::to_string(store_chunks) +
                                    " chunks at version " + std::to_string(store_version) +
                                    " but no index snapshot exists at " + snapshot_path_.string() +
                                    "; rebuild the index from the store to repair");
    }
    index_ = std::make_unique<VectorIndex>(index_options_);
    snapshot_version_ = store_version;
    opened_ = true;
    std::cout << "[KnowledgeBase] Starting with an empty " << to_string(index_options_.type)
              << " index (dimension " << index_options_.dimension << ")." << std::endl;
    return;
  }

  IndexManifest manifest;
  try {
    index_ = VectorIndex::load(snapshot_path_, index_options_, manifest);
  } catch (const VectorIndexError& e) {
    mutation_locked_ = true;
    throw IndexInconsistencyError(std::string("Failed to load index snapshot: ") + e.what());
  }

  if (manifest.snapshot_version != store_version) {
    index_.reset();
    mutation_locked_ = true;
    throw IndexInconsistencyError("Index snapshot version " +
                                  std::to_string(manifest.snapshot_version) +
                                  " does not match chunk store version " +
                                  std::to_string(store_version));
  }
  snapshot_version_ = store_version;
  opened_ = true;
  verify_consistency_locked();
  std::cout << "[KnowledgeBase] Restored snapshot version " << snapshot_version_ << " with "
            << index_->size() << " vectors." << std::endl;
}

void KnowledgeBase::close() {
  {
    std::shared_lock lock(mutex_);
    if (!opened_ || !index_) {
      return;
    }
    if (mutation_locked_) {
      std::cerr << "[KnowledgeBase] Index is inconsistent with the store; final snapshot skipped."
                << std::endl;
      return;
    }
  }
  save_snapshot();
  std::cout << "[KnowledgeBase] Final snapshot written to " << snapshot_path_.string() << std::endl;
}

RetrievalResult KnowledgeBase::search(const std::vector<float>& query_vector,
                                      size_t k,
                                      size_t candidate_count) const {
  std::shared_lock lock(mutex_);
  if (!index_) {
    throw IndexInconsistencyError("Knowledge base is not open");
  }
  try {
    return index_->search(query_vector, k, candidate_count);
  } catch (const VectorIndexError& e) {
    throw InvalidArgumentError(e.what());
  }
}

std::vector<RetrievedChunk> KnowledgeBase::retrieve(const std::vector<float>& query_vector,
                                                    size_t k,
                                                    size_t candidate_count) const {
  std::shared_lock lock(mutex_);
  if (!index_) {
    throw IndexInconsistencyError("Knowledge base is not open");
  }

  RetrievalResult hits;
  try {
    hits = index_->search(query_vector, k, candidate_count);
  } catch (const VectorIndexError& e) {
    throw InvalidArgumentError(e.what());
  }

  std::vector<ChunkId> ids;
  ids.reserve(hits.size());
  for (const auto& hit : hits) {
    ids.push_back(hit.id);
  }

  std::vector<Chunk> chunks;
  try {
    chunks = chunk_store_->get_many(ids);
  } catch (const IndexInconsistencyError&) {
    mutation_locked_ = true;
    throw;
  }

  std::vector<RetrievedChunk> result;
  result.reserve(hits.size());
  for (size_t i = 0; i < hits.size(); ++i) {
    result.push_back({std::move(chunks[i]), hits[i].score});
  }
  return result;
}

std::vector<Chunk> KnowledgeBase::hydrate(const std::vector<ChunkId>& ids) const {
  std::shared_lock lock(mutex_);
  return chunk_store_->get_many(ids);
}

std::optional<DocumentInfo> KnowledgeBase::document(const std::string& document_id) const {
  return chunk_store_->get_document(document_id);
}

std::vector<DocumentInfo> KnowledgeBase::documents() const {
  return chunk_store_->list_documents();
}

KnowledgeBaseStats KnowledgeBase::stats() const {
  std::shared_lock lock(mutex_);
  KnowledgeBaseStats stats;
  stats.document_count = chunk_store_->document_count();
  stats.chunk_count = chunk_store_->chunk_count();
  stats.indexed_vectors = index_ ? index_->size() : 0;
  stats.category_counts = chunk_store_->category_counts();
  stats.snapshot_version = snapshot_version_;
  stats.index_type = to_string(index_options_.type);
  return stats;
}

size_t KnowledgeBase::dimension() const {
  return index_options_.dimension;
}

bool KnowledgeBase::is_mutation_locked() const {
  return mutation_locked_;
}

void KnowledgeBase::ensure_mutable() const {
  if (!opened_ || !index_) {
    throw IndexInconsistencyError("Knowledge base is not open");
  }
  if (mutation_locked_) {
    throw IndexInconsistencyError(
        "Knowledge base is locked after an index/store inconsistency; rebuild the index to repair");
  }
}

void KnowledgeBase::verify_consistency() {
  std::unique_lock lock(mutex_);
  if (!index_) {
    throw IndexInconsistencyError("Knowledge base is not open");
  }
  verify_consistency_locked();
}

void KnowledgeBase::verify_consistency_locked() {
  const std::set<ChunkId> index_ids = index_->ids();
  const std::vector<ChunkId> stored = chunk_store_->all_chunk_ids();
  const std::set<ChunkId> store_ids(stored.begin(), stored.end());
  if (index_ids == store_ids) {
    return;
  }

  std::vector<ChunkId> only_in_index;
  std::vector<ChunkId> only_in_store;
  std::set_difference(index_ids.begin(), index_ids.end(), store_ids.begin(), store_ids.end(),
                      std::back_inserter(only_in_index));
  std::set_difference(store_ids.begin(), store_ids.end(), index_ids.begin(), index_ids.end(),
                      std::back_inserter(only_in_store));
  mutation_locked_ = true;
  std::cerr << "[KnowledgeBase] FATAL: index/store mismatch, mutation disabled." << std::endl;
  throw IndexInconsistencyError(
      "Vector index holds " + std::to_string(index_ids.size()) + " ids, chunk store holds " +
      std::to_string(store_ids.size()) + "; only in index: [" + sample_ids(only_in_index) +
      "], only in store: [" + sample_ids(only_in_store) + "]");
}

DocumentUpdate KnowledgeBase::replace_document(const DocumentInfo& info, std::vector<Chunk>& chunks) {
  DocumentUpdate update;
  {
    std::unique_lock lock(mutex_);
    ensure_mutable();

    auto batch = chunk_store_->begin_write();
    update.removed = batch->delete_document_chunks(info.id);

    DocumentInfo stored = info;
    stored.chunk_count = chunks.size();
    batch->upsert_document(stored);

    std::vector<std::vector<float>> vectors;
    vectors.reserve(chunks.size());
    for (auto& chunk : chunks) {
      chunk.id = 0;
      chunk.document_id = info.id;
      chunk.id = batch->insert_chunk(chunk);
      update.added.push_back(chunk.id);
      vectors.push_back(chunk.vector_embedding);
    }

    // Readers keep using index_ until the store transaction has committed.
    std::unique_ptr<VectorIndex> staging = index_->clone();
    try {
      staging->remove(update.removed);
      staging->add(update.added, vectors);
    } catch (const VectorIndexError& e) {
      throw InvalidArgumentError(std::string("Rejected by vector index: ") + e.what());
    }

    const std::uint64_t version = batch->bump_snapshot_version();
    batch->commit();
    index_ = std::move(staging);
    snapshot_version_ = version;
  }
  update.snapshot_warning = save_snapshot_after_commit();
  return update;
}

std::vector<ChunkId> KnowledgeBase::remove_document(const std::string& document_id) {
  std::vector<ChunkId> removed;
  {
    std::unique_lock lock(mutex_);
    ensure_mutable();

    auto batch = chunk_store_->begin_write();
    removed = batch->delete_document(document_id);

    std::unique_ptr<VectorIndex> staging = index_->clone();
    try {
      staging->remove(removed);
    } catch (const VectorIndexError& e) {
      throw InvalidArgumentError(std::string("Rejected by vector index: ") + e.what());
    }

    const std::uint64_t version = batch->bump_snapshot_version();
    batch->commit();
    index_ = std::move(staging);
    snapshot_version_ = version;
  }
  save_snapshot_after_commit();
  return removed;
}

void KnowledgeBase::save_snapshot() {
  std::lock_guard<std::mutex> snapshot_lock(snapshot_mutex_);
  std::shared_lock lock(mutex_);
  save_snapshot_locked();
}

void KnowledgeBase::save_snapshot_locked() {
  if (!index_) {
    throw IndexInconsistencyError("Knowledge base is not open");
  }
  try {
    index_->save(snapshot_path_, snapshot_version_);
  } catch (const VectorIndexError& e) {
    throw StorageError(std::string("Failed to write index snapshot: ") + e.what());
  } catch (const std::filesystem::filesystem_error& e) {
    throw StorageError(std::string("Failed to write index snapshot: ") + e.what());
  }
}

std::string KnowledgeBase::save_snapshot_after_commit() {
  // The store already holds the change, so a failed write only leaves the
  // snapshot behind. The next successful save or a rebuild catches it up.
  try {
    save_snapshot();
  } catch (const StorageError& e) {
    std::cerr << "[KnowledgeBase] Change committed but the snapshot was not written: " << e.what()
              << std::endl;
    return e.what();
  }
  return {};
}

size_t KnowledgeBase::rebuild_index_from_store() {
  size_t count = 0;
  std::uint64_t version = 0;
  {
    std::unique_lock lock(mutex_);
    auto stored = chunk_store_->load_all_vectors();
    auto fresh = std::make_unique<VectorIndex>(index_options_);

    std::vector<ChunkId> ids;
    std::vector<std::vector<float>> vectors;
    ids.reserve(stored.size());
    vectors.reserve(stored.size());
    for (auto& entry : stored) {
      ids.push_back(entry.first);
      vectors.push_back(std::move(entry.second));
    }
    try {
      fresh->add(ids, vectors);
    } catch (const VectorIndexError& e) {
      throw IndexInconsistencyError(std::string("Stored vectors cannot be indexed: ") + e.what());
    }

    count = fresh->size();
    index_ = std::move(fresh);
    version = chunk_store_->snapshot_version();
    snapshot_version_ = version;
    opened_ = true;
    mutation_locked_ = false;
  }
  save_snapshot();
  std::cout << "[KnowledgeBase] Rebuilt index from store: " << count << " vectors at version "
            << version << "." << std::endl;
  return count;
}

}  // namespace localmind_core
