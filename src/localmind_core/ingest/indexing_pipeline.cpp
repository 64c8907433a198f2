#include "localmind_core/ingest/indexing_pipeline.hpp"

#include <algorithm>
#include <iostream>

#include "localmind_core/text/text_utils.hpp"

namespace localmind_core {

namespace {

void report(const ProgressCallback& progress, float percent, const std::string& message) {
  if (progress) {
    progress(percent, message);
  }
}

}  // namespace

IndexingPipeline::IndexingPipeline(std::shared_ptr<KnowledgeBase> knowledge_base,
                                   std::shared_ptr<EmbeddingPort> embedder,
                                   std::shared_ptr<ContentExtractorFactory> extractor_factory,
                                   std::shared_ptr<KeywordClassifier> classifier,
                                   PipelineOptions options)
    : knowledge_base_(std::move(knowledge_base)),
      embedder_(std::move(embedder)),
      extractor_factory_(std::move(extractor_factory)),
      classifier_(std::move(classifier)),
      options_(options),
      chunker_(options.chunker) {
  if (options_.embedding_batch_size == 0) {
    throw InvalidArgumentError("embedding_batch_size must be positive");
  }
}

IngestResult IndexingPipeline::ingest(const Document& document, const ProgressCallback& progress) {
  return ingest_document(document, document.text.size(), progress);
}

IngestResult IndexingPipeline::ingest_file(const std::filesystem::path& file_path,
                                           const ProgressCallback& progress,
                                           bool skip_unchanged) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    throw ContentError("Not a readable file: " + file_path.string());
  }
  const auto file_size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    throw ContentError("Could not stat file " + file_path.string() + ": " + ec.message());
  }
  if (file_size == 0) {
    throw ContentError("Document is empty: " + file_path.string());
  }
  if (file_size > options_.max_file_size) {
    throw ContentError("File " + file_path.string() + " is " + std::to_string(file_size) +
                       " bytes, above the limit of " + std::to_string(options_.max_file_size));
  }

  const ContentExtractor& extractor = extractor_factory_->get_extractor_for(file_path);
  report(progress, 5.0f, "Reading " + file_path.filename().string());
  Document document = extractor.extract(file_path);

  if (skip_unchanged) {
    auto existing = knowledge_base_->document(document.id);
    if (existing && existing->content_hash == document.content_hash) {
      std::cout << "[IndexingPipeline] " << document.id << " is unchanged, skipping." << std::endl;
      report(progress, 100.0f, "Unchanged");
      return {.document_id = document.id, .unchanged = true};
    }
  }

  return ingest_document(document, static_cast<size_t>(file_size), progress);
}

IngestResult IndexingPipeline::ingest_document(const Document& document,
                                               size_t file_size,
                                               const ProgressCallback& progress) {
  if (document.id.empty()) {
    throw InvalidArgumentError("Document id must not be empty");
  }
  if (text::is_blank(document.text)) {
    throw ContentError("Document is empty: " + document.id);
  }

  report(progress, 10.0f, "Chunking");
  std::vector<Chunk> chunks = chunker_.split(document.text, document.file_type);
  if (chunks.empty()) {
    throw ContentError("Document produced no chunks: " + document.id);
  }
  for (auto& chunk : chunks) {
    chunk.document_id = document.id;
    chunk.categories = classifier_->classify(chunk.content);
  }

  embed_chunks(chunks, progress);

  DocumentInfo info;
  info.id = document.id;
  info.file_type = document.file_type;
  info.content_hash = document.content_hash.empty()
                          ? ContentExtractor::compute_hash_from_content(document.text)
                          : document.content_hash;
  info.file_size = file_size;
  info.chunk_count = chunks.size();
  info.ingested_at = std::chrono::system_clock::now();

  report(progress, 90.0f, "Writing " + std::to_string(chunks.size()) + " chunks");
  DocumentUpdate update = knowledge_base_->replace_document(info, chunks);

  std::cout << "[IndexingPipeline] Ingested " << document.id << ": " << update.added.size()
            << " chunks added, " << update.removed.size() << " removed." << std::endl;
  report(progress, 100.0f, "Done");
  return {.document_id = document.id,
          .chunks_added = update.added.size(),
          .chunks_removed = update.removed.size(),
          .snapshot_warning = std::move(update.snapshot_warning)};
}

void IndexingPipeline::embed_chunks(std::vector<Chunk>& chunks, const ProgressCallback& progress) {
  const size_t dimension = knowledge_base_->dimension();
  const size_t batch_size = options_.embedding_batch_size;

  for (size_t begin = 0; begin < chunks.size(); begin += batch_size) {
    const size_t end = std::min(begin + batch_size, chunks.size());
    std::vector<std::string> texts;
    texts.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
      texts.push_back(chunks[i].content);
    }

    std::vector<std::vector<float>> vectors;
    try {
      vectors = embedder_->get_embeddings(texts);
    } catch (const EmbeddingUnavailableError&) {
      throw;
    } catch (const std::exception& e) {
      throw EmbeddingUnavailableError(std::string("Embedding request failed: ") + e.what());
    }

    if (vectors.size() != texts.size()) {
      throw EmbeddingUnavailableError("Embedder returned " + std::to_string(vectors.size()) +
                                      " vectors for " + std::to_string(texts.size()) + " texts");
    }
    for (size_t i = 0; i < vectors.size(); ++i) {
      if (vectors[i].size() != dimension) {
        throw EmbeddingUnavailableError("Embedding has dimension " + std::to_string(vectors[i].size()) +
                                        ", index expects " + std::to_string(dimension));
      }
      chunks[begin + i].vector_embedding = std::move(vectors[i]);
    }

    const float percent = 10.0f + 80.0f * static_cast<float>(end) / static_cast<float>(chunks.size());
    report(progress, percent, "Embedded " + std::to_string(end) + "/" + std::to_string(chunks.size()));
  }
}

IngestReport IndexingPipeline::ingest_batch(const std::vector<std::filesystem::path>& file_paths) {
  IngestReport report_out;
  for (const auto& path : file_paths) {
    try {
      report_out.succeeded.push_back(ingest_file(path));
    } catch (const LocalMindError& e) {
      std::cerr << "[IndexingPipeline] Failed to ingest " << path.string() << ": " << e.what()
                << std::endl;
      report_out.failed.push_back({path.string(), e.kind(), e.what()});
    } catch (const std::exception& e) {
      std::cerr << "[IndexingPipeline] Failed to ingest " << path.string() << ": " << e.what()
                << std::endl;
      report_out.failed.push_back({path.string(), ErrorKind::Internal, e.what()});
    }
  }
  return report_out;
}

size_t IndexingPipeline::remove_document(const std::string& document_id) {
  if (!knowledge_base_->document(document_id)) {
    throw InvalidArgumentError("Unknown document: " + document_id);
  }
  const auto removed = knowledge_base_->remove_document(document_id);
  std::cout << "[IndexingPipeline] Removed " << document_id << " (" << removed.size() << " chunks)."
            << std::endl;
  return removed.size();
}

}  // namespace localmind_core
