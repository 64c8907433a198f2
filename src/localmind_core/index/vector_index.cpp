#include "localmind_core/index/vector_index.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/IndexHNSW.h>
#include <faiss/clone_index.h>
#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/index_io.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace localmind_core {

namespace {
// Extra results fetched so that ties straddling the k-th slot are resolved by id.
constexpr size_t kTieSlack = 8;
}  // namespace

std::string to_string(IndexType type) {
  switch (type) {
    case IndexType::Flat:
      return "flat";
    case IndexType::HNSW:
      return "hnsw";
  }
  return "flat";
}

IndexType index_type_from_string(const std::string& str) {
  if (str == "flat")
    return IndexType::Flat;
  if (str == "hnsw")
    return IndexType::HNSW;
  throw VectorIndexError("Unknown index type: " + str);
}

VectorIndex::VectorIndex(const VectorIndexOptions& options) : options_(options) {
  if (options_.dimension == 0) {
    throw VectorIndexError("Vector dimension must be positive");
  }
  index_ = create_base_index();
}

VectorIndex::VectorIndex(const VectorIndexOptions& options, std::unique_ptr<faiss::IndexIDMap2> index)
    : options_(options), index_(std::move(index)) {}

VectorIndex::~VectorIndex() = default;

std::unique_ptr<faiss::IndexIDMap2> VectorIndex::create_base_index() const {
  const auto d = static_cast<faiss::idx_t>(options_.dimension);
  faiss::Index* base = nullptr;
  if (options_.type == IndexType::HNSW) {
    auto* hnsw = new faiss::IndexHNSWFlat(d, options_.hnsw_m, faiss::METRIC_INNER_PRODUCT);
    hnsw->hnsw.efConstruction = options_.hnsw_ef_construction;
    hnsw->hnsw.efSearch = options_.hnsw_ef_search;
    base = hnsw;
  } else {
    base = new faiss::IndexFlatIP(d);
  }
  // IDMap2 keeps a reverse map, needed for reconstruct() during compaction.
  auto id_map = std::make_unique<faiss::IndexIDMap2>(base);
  id_map->own_fields = true;
  return id_map;
}

void VectorIndex::check_dimension(const std::vector<float>& vector) const {
  if (vector.size() != options_.dimension) {
    throw VectorIndexError("Vector dimension mismatch. Expected " +
                           std::to_string(options_.dimension) + ", got " +
                           std::to_string(vector.size()));
  }
}

std::vector<float> VectorIndex::normalized(const std::vector<float>& vector) const {
  std::vector<float> copy = vector;
  faiss::fvec_renormalize_L2(options_.dimension, 1, copy.data());
  return copy;
}

std::unique_ptr<VectorIndex> VectorIndex::clone() const {
  std::unique_ptr<faiss::Index> copied;
  try {
    copied.reset(faiss::clone_index(index_.get()));
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError(std::string("Failed to clone index: ") + e.what());
  }
  auto* id_map = dynamic_cast<faiss::IndexIDMap2*>(copied.get());
  if (!id_map) {
    throw VectorIndexError("Cloned index is not an IndexIDMap2");
  }
  copied.release();
  auto result = std::unique_ptr<VectorIndex>(
      new VectorIndex(options_, std::unique_ptr<faiss::IndexIDMap2>(id_map)));
  result->tombstones_ = tombstones_;
  return result;
}

void VectorIndex::add(const std::vector<ChunkId>& ids, const std::vector<std::vector<float>>& vectors) {
  if (ids.size() != vectors.size()) {
    throw VectorIndexError("add: " + std::to_string(ids.size()) + " ids but " +
                           std::to_string(vectors.size()) + " vectors");
  }
  if (ids.empty()) {
    return;
  }

  std::set<ChunkId> seen;
  std::vector<faiss::idx_t> faiss_ids;
  std::vector<float> flat;
  faiss_ids.reserve(ids.size());
  flat.reserve(ids.size() * options_.dimension);
  for (size_t i = 0; i < ids.size(); ++i) {
    check_dimension(vectors[i]);
    if (!seen.insert(ids[i]).second || index_->rev_map.count(ids[i]) > 0) {
      throw VectorIndexError("add: id " + std::to_string(ids[i]) + " is already present");
    }
    faiss_ids.push_back(static_cast<faiss::idx_t>(ids[i]));
    flat.insert(flat.end(), vectors[i].begin(), vectors[i].end());
  }
  faiss::fvec_renormalize_L2(options_.dimension, ids.size(), flat.data());

  try {
    index_->add_with_ids(static_cast<faiss::idx_t>(ids.size()), flat.data(), faiss_ids.data());
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError(std::string("add_with_ids failed: ") + e.what());
  }
}

void VectorIndex::remove(const std::vector<ChunkId>& ids) {
  if (ids.empty()) {
    return;
  }
  if (options_.type == IndexType::Flat) {
    std::vector<faiss::idx_t> faiss_ids(ids.begin(), ids.end());
    faiss::IDSelectorBatch selector(faiss_ids.size(), faiss_ids.data());
    try {
      index_->remove_ids(selector);
    } catch (const faiss::FaissException& e) {
      throw VectorIndexError(std::string("remove_ids failed: ") + e.what());
    }
    return;
  }

  for (ChunkId id : ids) {
    if (index_->rev_map.count(id) > 0) {
      tombstones_.insert(id);
    }
  }
  maybe_compact();
}

void VectorIndex::maybe_compact() {
  if (index_->ntotal == 0) {
    return;
  }
  const float ratio = static_cast<float>(tombstones_.size()) / static_cast<float>(index_->ntotal);
  if (ratio > options_.compaction_ratio) {
    compact();
  }
}

void VectorIndex::compact() {
  if (options_.type == IndexType::Flat || tombstones_.empty()) {
    return;
  }

  std::vector<faiss::idx_t> live_ids;
  std::vector<float> flat;
  live_ids.reserve(index_->id_map.size());
  std::vector<float> buffer(options_.dimension);
  try {
    for (faiss::idx_t id : index_->id_map) {
      if (tombstones_.count(id) > 0) {
        continue;
      }
      index_->reconstruct(id, buffer.data());
      live_ids.push_back(id);
      flat.insert(flat.end(), buffer.begin(), buffer.end());
    }

    auto fresh = create_base_index();
    if (!live_ids.empty()) {
      fresh->add_with_ids(static_cast<faiss::idx_t>(live_ids.size()), flat.data(), live_ids.data());
    }
    index_ = std::move(fresh);
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError(std::string("compact failed: ") + e.what());
  }
  std::cout << "[VectorIndex] Compacted HNSW index, dropped " << tombstones_.size()
            << " tombstones, " << live_ids.size() << " vectors remain." << std::endl;
  tombstones_.clear();
}

RetrievalResult VectorIndex::search(const std::vector<float>& query_vector,
                                    size_t k,
                                    size_t candidate_count) const {
  check_dimension(query_vector);
  if (k == 0 || size() == 0) {
    return {};
  }

  const std::vector<float> query = normalized(query_vector);
  const size_t total = static_cast<size_t>(index_->ntotal);
  const size_t fetch = std::min(total, k + tombstones_.size() + kTieSlack);

  std::vector<float> distances(fetch);
  std::vector<faiss::idx_t> labels(fetch, -1);
  try {
    if (options_.type == IndexType::HNSW) {
      faiss::SearchParametersHNSW params;
      params.efSearch = static_cast<int>(
          std::max({static_cast<size_t>(options_.hnsw_ef_search), candidate_count, fetch}));
      index_->search(1, query.data(), static_cast<faiss::idx_t>(fetch), distances.data(),
                     labels.data(), &params);
    } else {
      index_->search(1, query.data(), static_cast<faiss::idx_t>(fetch), distances.data(),
                     labels.data());
    }
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError(std::string("search failed: ") + e.what());
  }

  RetrievalResult result;
  result.reserve(fetch);
  for (size_t i = 0; i < fetch; ++i) {
    if (labels[i] < 0 || tombstones_.count(labels[i]) > 0) {
      continue;
    }
    result.push_back({static_cast<ChunkId>(labels[i]), distances[i]});
  }
  std::sort(result.begin(), result.end(), [](const ScoredChunkId& a, const ScoredChunkId& b) {
    if (a.score != b.score)
      return a.score > b.score;
    return a.id < b.id;
  });
  if (result.size() > k) {
    result.resize(k);
  }
  return result;
}

size_t VectorIndex::size() const {
  return static_cast<size_t>(index_->ntotal) - tombstones_.size();
}

size_t VectorIndex::tombstone_count() const {
  return tombstones_.size();
}

bool VectorIndex::contains(ChunkId id) const {
  return index_->rev_map.count(id) > 0 && tombstones_.count(id) == 0;
}

std::set<ChunkId> VectorIndex::ids() const {
  std::set<ChunkId> result;
  for (faiss::idx_t id : index_->id_map) {
    if (tombstones_.count(id) == 0) {
      result.insert(static_cast<ChunkId>(id));
    }
  }
  return result;
}

std::filesystem::path VectorIndex::manifest_path_for(const std::filesystem::path& index_path) {
  return std::filesystem::path(index_path.string() + ".meta.json");
}

void VectorIndex::save(const std::filesystem::path& index_path, std::uint64_t snapshot_version) const {
  // Tombstones are never persisted; a compacted copy is written instead.
  std::unique_ptr<VectorIndex> compacted;
  const VectorIndex* source = this;
  if (!tombstones_.empty()) {
    compacted = clone();
    compacted->compact();
    source = compacted.get();
  }

  if (index_path.has_parent_path()) {
    std::filesystem::create_directories(index_path.parent_path());
  }
  const std::filesystem::path tmp_index = index_path.string() + ".tmp";
  const std::filesystem::path manifest_path = manifest_path_for(index_path);
  const std::filesystem::path tmp_manifest = manifest_path.string() + ".tmp";

  try {
    faiss::write_index(source->index_.get(), tmp_index.c_str());
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError(std::string("write_index failed: ") + e.what());
  }

  nlohmann::json manifest;
  manifest["format_version"] = 1;
  manifest["snapshot_version"] = snapshot_version;
  manifest["dimension"] = options_.dimension;
  manifest["count"] = source->size();
  manifest["index_type"] = to_string(options_.type);
  {
    std::ofstream out(tmp_manifest);
    if (!out.is_open()) {
      throw VectorIndexError("Failed to open manifest for writing: " + tmp_manifest.string());
    }
    out << manifest.dump(2);
    if (!out.good()) {
      throw VectorIndexError("Failed to write manifest: " + tmp_manifest.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_index, index_path, ec);
  if (!ec) {
    std::filesystem::rename(tmp_manifest, manifest_path, ec);
  }
  if (ec) {
    throw VectorIndexError("Failed to move snapshot into place: " + ec.message());
  }
}

IndexManifest VectorIndex::read_manifest(const std::filesystem::path& index_path) {
  const std::filesystem::path manifest_path = manifest_path_for(index_path);
  std::ifstream in(manifest_path);
  if (!in.is_open()) {
    throw VectorIndexError("Index manifest not found: " + manifest_path.string());
  }
  nlohmann::json json;
  try {
    in >> json;
  } catch (const nlohmann::json::exception& e) {
    throw VectorIndexError("Index manifest is not valid JSON: " + std::string(e.what()));
  }

  IndexManifest manifest;
  try {
    manifest.format_version = json.at("format_version").get<int>();
    manifest.snapshot_version = json.at("snapshot_version").get<std::uint64_t>();
    manifest.dimension = json.at("dimension").get<size_t>();
    manifest.count = json.at("count").get<size_t>();
    manifest.type = index_type_from_string(json.at("index_type").get<std::string>());
  } catch (const nlohmann::json::exception& e) {
    throw VectorIndexError("Index manifest is missing fields: " + std::string(e.what()));
  }
  if (manifest.format_version != 1) {
    throw VectorIndexError("Unsupported index manifest version: " +
                           std::to_string(manifest.format_version));
  }
  return manifest;
}

std::unique_ptr<VectorIndex> VectorIndex::load(const std::filesystem::path& index_path,
                                               const VectorIndexOptions& options,
                                               IndexManifest& manifest_out) {
  IndexManifest manifest = read_manifest(index_path);
  if (manifest.dimension != options.dimension) {
    throw VectorIndexError("Snapshot dimension " + std::to_string(manifest.dimension) +
                           " does not match configured dimension " +
                           std::to_string(options.dimension));
  }
  if (manifest.type != options.type) {
    throw VectorIndexError("Snapshot index type " + to_string(manifest.type) +
                           " does not match configured type " + to_string(options.type));
  }

  std::unique_ptr<faiss::Index> raw;
  try {
    raw.reset(faiss::read_index(index_path.c_str()));
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError(std::string("read_index failed: ") + e.what());
  }
  auto* id_map = dynamic_cast<faiss::IndexIDMap2*>(raw.get());
  if (!id_map) {
    throw VectorIndexError("Snapshot at " + index_path.string() + " is not an IndexIDMap2");
  }
  raw.release();
  std::unique_ptr<faiss::IndexIDMap2> owned(id_map);
  // read_index rebuilds the reverse map for IndexIDMap2 and owns the sub-index.
  owned->own_fields = true;

  if (static_cast<size_t>(owned->ntotal) != manifest.count) {
    throw VectorIndexError("Snapshot holds " + std::to_string(owned->ntotal) +
                           " vectors but its manifest declares " + std::to_string(manifest.count));
  }

  manifest_out = manifest;
  return std::unique_ptr<VectorIndex>(new VectorIndex(options, std::move(owned)));
}

}  // namespace localmind_core
