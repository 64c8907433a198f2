#include "localmind_core/db/chunk_store.hpp"

#include <sqlite_modern_cpp.h>

#include <algorithm>
#include <cstring>
#include <sstream>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "localmind_core/db/compression.hpp"
#include "localmind_core/db/sql_time.hpp"
#include "localmind_core/db/sqlite_error_utils.hpp"

namespace localmind_core {

namespace {

// Keeps IN (...) lists well below SQLITE_MAX_VARIABLE_NUMBER-sized statements.
constexpr size_t kIdBatchSize = 500;

std::vector<char> vector_to_blob(const std::vector<float>& vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), vector.data(), blob.size());
  }
  return blob;
}

std::vector<float> blob_to_vector(const std::vector<char>& blob) {
  if (blob.size() % sizeof(float) != 0) {
    throw ChunkStoreError("Stored vector blob has a size that is not a multiple of float: " +
                          std::to_string(blob.size()));
  }
  std::vector<float> vector(blob.size() / sizeof(float));
  if (!vector.empty()) {
    std::memcpy(vector.data(), blob.data(), blob.size());
  }
  return vector;
}

std::string categories_to_json(const std::set<std::string>& categories) {
  return nlohmann::json(categories).dump();
}

std::set<std::string> categories_from_json(const std::string& text) {
  std::set<std::string> categories;
  nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_array()) {
    for (const auto& item : parsed) {
      if (item.is_string()) {
        categories.insert(item.get<std::string>());
      }
    }
  }
  return categories;
}

std::string id_list(std::vector<ChunkId>::const_iterator begin,
                    std::vector<ChunkId>::const_iterator end) {
  std::stringstream ss;
  for (auto it = begin; it != end; ++it) {
    if (it != begin)
      ss << ",";
    ss << *it;
  }
  return ss.str();
}

const char* kChunkColumns =
    "SELECT id, document_id, chunk_index, start_offset, end_offset, content, categories, "
    "vector_blob FROM chunks";

}  // namespace

// ---------------------------------------------------------------------------
// WriteBatch
// ---------------------------------------------------------------------------

ChunkStore::WriteBatch::WriteBatch(DatabaseManager& db_manager)
    : conn_(db_manager), tx_(*conn_, true) {}

void ChunkStore::WriteBatch::upsert_document(const DocumentInfo& info) {
  try {
    *conn_ << "INSERT INTO documents (id, content_hash, file_type, file_size, chunk_count, "
              "ingested_at) VALUES (?, ?, ?, ?, ?, ?) "
              "ON CONFLICT(id) DO UPDATE SET content_hash = excluded.content_hash, "
              "file_type = excluded.file_type, file_size = excluded.file_size, "
              "chunk_count = excluded.chunk_count, ingested_at = excluded.ingested_at"
           << info.id << info.content_hash << to_string(info.file_type)
           << static_cast<long long>(info.file_size) << static_cast<long long>(info.chunk_count)
           << time_point_to_string(info.ingested_at);
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("upsert_document", e));
  }
}

std::vector<ChunkId> ChunkStore::WriteBatch::chunk_ids_of(const std::string& document_id) {
  std::vector<ChunkId> ids;
  *conn_ << "SELECT id FROM chunks WHERE document_id = ? ORDER BY id" << document_id >>
      [&](long long id) { ids.push_back(id); };
  return ids;
}

std::vector<ChunkId> ChunkStore::WriteBatch::delete_document_chunks(const std::string& document_id) {
  try {
    std::vector<ChunkId> ids = chunk_ids_of(document_id);
    *conn_ << "DELETE FROM chunks WHERE document_id = ?" << document_id;
    return ids;
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("delete_document_chunks", e));
  }
}

std::vector<ChunkId> ChunkStore::WriteBatch::delete_document(const std::string& document_id) {
  std::vector<ChunkId> ids = delete_document_chunks(document_id);
  try {
    *conn_ << "DELETE FROM documents WHERE id = ?" << document_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("delete_document", e));
  }
  return ids;
}

ChunkId ChunkStore::WriteBatch::insert_chunk(const Chunk& chunk) {
  try {
    std::vector<char> content = compression::compress(chunk.content);
    std::vector<char> vector_blob = vector_to_blob(chunk.vector_embedding);
    if (chunk.id == 0) {
      *conn_ << "INSERT INTO chunks (document_id, chunk_index, start_offset, end_offset, content, "
                "categories, vector_blob) VALUES (?, ?, ?, ?, ?, ?, ?)"
             << chunk.document_id << chunk.chunk_index << static_cast<long long>(chunk.start_offset)
             << static_cast<long long>(chunk.end_offset) << content
             << categories_to_json(chunk.categories) << vector_blob;
      return static_cast<ChunkId>(conn_->last_insert_rowid());
    }
    *conn_ << "INSERT INTO chunks (id, document_id, chunk_index, start_offset, end_offset, content, "
              "categories, vector_blob) VALUES (?, ?, ?, ?, ?, ?, ?, ?)"
           << static_cast<long long>(chunk.id) << chunk.document_id << chunk.chunk_index
           << static_cast<long long>(chunk.start_offset) << static_cast<long long>(chunk.end_offset)
           << content << categories_to_json(chunk.categories) << vector_blob;
    return chunk.id;
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("insert_chunk", e));
  }
}

void ChunkStore::WriteBatch::delete_chunks(const std::vector<ChunkId>& ids) {
  try {
    for (size_t offset = 0; offset < ids.size(); offset += kIdBatchSize) {
      auto begin = ids.begin() + offset;
      auto end = ids.begin() + std::min(ids.size(), offset + kIdBatchSize);
      *conn_ << "DELETE FROM chunks WHERE id IN (" + id_list(begin, end) + ")";
    }
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("delete_chunks", e));
  }
}

std::uint64_t ChunkStore::WriteBatch::bump_snapshot_version() {
  try {
    std::string current = "0";
    *conn_ << "SELECT value FROM store_meta WHERE key = 'snapshot_version'" >>
        [&](std::string value) { current = value; };
    std::uint64_t next = std::stoull(current) + 1;
    *conn_ << "INSERT INTO store_meta (key, value) VALUES ('snapshot_version', ?) "
              "ON CONFLICT(key) DO UPDATE SET value = excluded.value"
           << std::to_string(next);
    return next;
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("bump_snapshot_version", e));
  }
}

void ChunkStore::WriteBatch::commit() {
  try {
    tx_.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("commit", e));
  }
}

// ---------------------------------------------------------------------------
// ChunkStore
// ---------------------------------------------------------------------------

ChunkStore::ChunkStore(DatabaseManager& db_manager) : db_manager_(db_manager) {}

std::unique_ptr<ChunkStore::WriteBatch> ChunkStore::begin_write() {
  try {
    return std::make_unique<WriteBatch>(db_manager_);
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("begin_write", e));
  }
}

Chunk ChunkStore::get(ChunkId id) {
  std::vector<Chunk> found;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string(kChunkColumns) + " WHERE id = ?" << static_cast<long long>(id) >>
        [&](long long chunk_id, std::string document_id, int chunk_index, long long start_offset,
            long long end_offset, std::vector<char> content, std::string categories,
            std::vector<char> vector_blob) {
          Chunk chunk;
          chunk.id = chunk_id;
          chunk.document_id = std::move(document_id);
          chunk.chunk_index = chunk_index;
          chunk.start_offset = static_cast<size_t>(start_offset);
          chunk.end_offset = static_cast<size_t>(end_offset);
          chunk.content = compression::decompress(content);
          chunk.categories = categories_from_json(categories);
          chunk.vector_embedding = blob_to_vector(vector_blob);
          found.push_back(std::move(chunk));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("get", e));
  }
  if (found.empty()) {
    throw ChunkStoreError("Chunk not found: " + std::to_string(id));
  }
  return std::move(found.front());
}

std::vector<Chunk> ChunkStore::get_many(const std::vector<ChunkId>& ids) {
  std::unordered_map<ChunkId, Chunk> by_id;
  try {
    PooledConnection conn(db_manager_);
    for (size_t offset = 0; offset < ids.size(); offset += kIdBatchSize) {
      auto begin = ids.begin() + offset;
      auto end = ids.begin() + std::min(ids.size(), offset + kIdBatchSize);
      *conn << std::string(kChunkColumns) + " WHERE id IN (" + id_list(begin, end) + ")" >>
          [&](long long chunk_id, std::string document_id, int chunk_index, long long start_offset,
              long long end_offset, std::vector<char> content, std::string categories,
              std::vector<char> vector_blob) {
            Chunk chunk;
            chunk.id = chunk_id;
            chunk.document_id = std::move(document_id);
            chunk.chunk_index = chunk_index;
            chunk.start_offset = static_cast<size_t>(start_offset);
            chunk.end_offset = static_cast<size_t>(end_offset);
            chunk.content = compression::decompress(content);
            chunk.categories = categories_from_json(categories);
            chunk.vector_embedding = blob_to_vector(vector_blob);
            by_id.emplace(chunk.id, std::move(chunk));
          };
    }
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("get_many", e));
  }

  std::vector<Chunk> result;
  result.reserve(ids.size());
  for (ChunkId id : ids) {
    auto it = by_id.find(id);
    if (it == by_id.end()) {
      throw IndexInconsistencyError("Chunk id " + std::to_string(id) +
                                    " is present in the vector index but missing from the chunk store");
    }
    result.push_back(it->second);
  }
  return result;
}

ChunkId ChunkStore::put(const Chunk& chunk) {
  auto batch = begin_write();
  ChunkId id = batch->insert_chunk(chunk);
  batch->commit();
  return id;
}

void ChunkStore::delete_chunks(const std::vector<ChunkId>& ids) {
  if (ids.empty()) {
    return;
  }
  auto batch = begin_write();
  batch->delete_chunks(ids);
  batch->commit();
}

std::optional<DocumentInfo> ChunkStore::get_document(const std::string& document_id) {
  std::optional<DocumentInfo> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, content_hash, file_type, file_size, chunk_count, ingested_at "
             "FROM documents WHERE id = ?"
          << document_id >>
        [&](std::string id, std::string content_hash, std::string file_type, long long file_size,
            long long chunk_count, std::string ingested_at) {
          DocumentInfo info;
          info.id = std::move(id);
          info.content_hash = std::move(content_hash);
          info.file_type = file_type_from_string(file_type);
          info.file_size = static_cast<size_t>(file_size);
          info.chunk_count = static_cast<size_t>(chunk_count);
          info.ingested_at = string_to_time_point(ingested_at);
          result = std::move(info);
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("get_document", e));
  }
  return result;
}

std::vector<DocumentInfo> ChunkStore::list_documents() {
  std::vector<DocumentInfo> documents;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, content_hash, file_type, file_size, chunk_count, ingested_at "
             "FROM documents ORDER BY id" >>
        [&](std::string id, std::string content_hash, std::string file_type, long long file_size,
            long long chunk_count, std::string ingested_at) {
          DocumentInfo info;
          info.id = std::move(id);
          info.content_hash = std::move(content_hash);
          info.file_type = file_type_from_string(file_type);
          info.file_size = static_cast<size_t>(file_size);
          info.chunk_count = static_cast<size_t>(chunk_count);
          info.ingested_at = string_to_time_point(ingested_at);
          documents.push_back(std::move(info));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("list_documents", e));
  }
  return documents;
}

std::vector<ChunkId> ChunkStore::chunk_ids_for_document(const std::string& document_id) {
  std::vector<ChunkId> ids;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id FROM chunks WHERE document_id = ? ORDER BY chunk_index" << document_id >>
        [&](long long id) { ids.push_back(id); };
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("chunk_ids_for_document", e));
  }
  return ids;
}

std::vector<ChunkId> ChunkStore::all_chunk_ids() {
  std::vector<ChunkId> ids;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id FROM chunks ORDER BY id" >> [&](long long id) { ids.push_back(id); };
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("all_chunk_ids", e));
  }
  return ids;
}

std::vector<std::pair<ChunkId, std::vector<float>>> ChunkStore::load_all_vectors() {
  std::vector<std::pair<ChunkId, std::vector<float>>> vectors;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, vector_blob FROM chunks ORDER BY id" >>
        [&](long long id, std::vector<char> vector_blob) {
          vectors.emplace_back(id, blob_to_vector(vector_blob));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("load_all_vectors", e));
  }
  return vectors;
}

size_t ChunkStore::document_count() {
  long long count = 0;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*) FROM documents" >> count;
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("document_count", e));
  }
  return static_cast<size_t>(count);
}

size_t ChunkStore::chunk_count() {
  long long count = 0;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*) FROM chunks" >> count;
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("chunk_count", e));
  }
  return static_cast<size_t>(count);
}

std::map<std::string, size_t> ChunkStore::category_counts() {
  std::map<std::string, size_t> counts;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT categories FROM chunks" >> [&](std::string categories) {
      for (const auto& category : categories_from_json(categories)) {
        ++counts[category];
      }
    };
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("category_counts", e));
  }
  return counts;
}

std::uint64_t ChunkStore::snapshot_version() {
  std::string value = "0";
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT value FROM store_meta WHERE key = 'snapshot_version'" >>
        [&](std::string stored) { value = stored; };
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("snapshot_version", e));
  }
  return std::stoull(value);
}

}  // namespace localmind_core
