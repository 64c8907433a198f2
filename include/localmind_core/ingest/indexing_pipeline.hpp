#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "localmind_core/classify/keyword_classifier.hpp"
#include "localmind_core/errors.hpp"
#include "localmind_core/extractors/content_extractor_factory.hpp"
#include "localmind_core/index/knowledge_base.hpp"
#include "localmind_core/ingest/text_chunker.hpp"
#include "localmind_core/llm/embedding_port.hpp"
#include "localmind_core/types/document.hpp"

namespace localmind_core {

struct PipelineOptions {
  ChunkerOptions chunker;
  size_t embedding_batch_size = 32;
  size_t max_file_size = 100 * 1024 * 1024;
};

struct IngestResult {
  std::string document_id;
  size_t chunks_added = 0;
  size_t chunks_removed = 0;
  // Identical content was already indexed; nothing changed.
  bool unchanged = false;
  // The document is stored and searchable but the index snapshot on disk
  // could not be refreshed.
  std::string snapshot_warning;
};

struct IngestFailure {
  std::string path;
  ErrorKind kind = ErrorKind::Internal;
  std::string message;
};

struct IngestReport {
  std::vector<IngestResult> succeeded;
  std::vector<IngestFailure> failed;
};

// percent in [0, 100]
using ProgressCallback = std::function<void(float percent, const std::string& message)>;

/**
 * @class IndexingPipeline
 * @brief The only path by which documents enter or leave the knowledge base.
 *
 * A document is chunked, tagged and embedded before anything is written.
 * The write itself replaces every prior chunk of the document in one store
 * transaction and one index swap, so a failure at any step leaves the
 * knowledge base as it was.
 */
class IndexingPipeline {
 public:
  IndexingPipeline(std::shared_ptr<KnowledgeBase> knowledge_base,
                   std::shared_ptr<EmbeddingPort> embedder,
                   std::shared_ptr<ContentExtractorFactory> extractor_factory,
                   std::shared_ptr<KeywordClassifier> classifier,
                   PipelineOptions options = {});

  // Always replaces the stored chunks of document.id.
  IngestResult ingest(const Document& document, const ProgressCallback& progress = nullptr);

  // Loads, validates and ingests a .txt or .md file. With skip_unchanged, a
  // file whose hash matches the stored document is reported as unchanged.
  IngestResult ingest_file(const std::filesystem::path& file_path,
                           const ProgressCallback& progress = nullptr,
                           bool skip_unchanged = true);

  // Failures are recorded per file and never abort the rest of the batch.
  IngestReport ingest_batch(const std::vector<std::filesystem::path>& file_paths);

  // Returns the number of chunks removed. Throws InvalidArgumentError for an
  // unknown document.
  size_t remove_document(const std::string& document_id);

  const PipelineOptions& options() const { return options_; }

 private:
  IngestResult ingest_document(const Document& document, size_t file_size, const ProgressCallback& progress);
  void embed_chunks(std::vector<Chunk>& chunks, const ProgressCallback& progress);

  std::shared_ptr<KnowledgeBase> knowledge_base_;
  std::shared_ptr<EmbeddingPort> embedder_;
  std::shared_ptr<ContentExtractorFactory> extractor_factory_;
  std::shared_ptr<KeywordClassifier> classifier_;
  PipelineOptions options_;
  TextChunker chunker_;
};

}  // namespace localmind_core
