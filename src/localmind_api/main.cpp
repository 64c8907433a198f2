#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "localmind_api/config.hpp"
#include "localmind_api/routes.hpp"
#include "localmind_api/server.hpp"
#include "localmind_core/async/service_provider.hpp"
#include "localmind_core/async/worker_pool.hpp"
#include "localmind_core/classify/keyword_classifier.hpp"
#include "localmind_core/classify/keyword_extractor.hpp"
#include "localmind_core/db/chunk_store.hpp"
#include "localmind_core/db/conversation_repo.hpp"
#include "localmind_core/db/database_manager.hpp"
#include "localmind_core/db/task_queue_repo.hpp"
#include "localmind_core/extractors/content_extractor_factory.hpp"
#include "localmind_core/index/knowledge_base.hpp"
#include "localmind_core/ingest/indexing_pipeline.hpp"
#include "localmind_core/llm/ollama_client.hpp"
#include "localmind_core/rag/prompt_builder.hpp"
#include "localmind_core/rag/query_planner.hpp"
#include "localmind_core/rag/rag_orchestrator.hpp"
#include "localmind_core/rag/retriever.hpp"
#include "localmind_core/rag/style_analyzer.hpp"
#include "localmind_core/tools/builtin_tools.hpp"
#include "localmind_core/tools/chat_exporter.hpp"
#include "localmind_core/tools/tool_registry.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

namespace {

void print_usage() {
  std::cout << "Usage: localmind_api [--config <path>] [--rebuild-index]" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path = "localmindrc.json";
  bool rebuild_index = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--rebuild-index") == 0) {
      rebuild_index = true;
    } else {
      print_usage();
      return 1;
    }
  }

  try {
    Config config = Config::from_file(config_path);

    std::cout << "Starting LocalMind API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Database Path: " << config.db_path << std::endl;
    std::cout << "Index Path: " << config.index_path << " (" << config.index_type << ")" << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << " (dimension " << config.embedding_dimension
              << ")" << std::endl;
    std::cout << "Generation Model: " << config.generation_model << std::endl;

    // --- 1. CORE COMPONENTS ---
    std::filesystem::create_directories(std::filesystem::path(config.db_path).parent_path().empty()
                                            ? std::filesystem::path(".")
                                            : std::filesystem::path(config.db_path).parent_path());

    localmind_core::OllamaClientOptions ollama_options;
    ollama_options.url = config.ollama_url;
    ollama_options.embedding_model = config.embedding_model;
    ollama_options.generation_model = config.generation_model;
    ollama_options.embedding_timeout_seconds = config.embedding_timeout_seconds;
    ollama_options.generation_timeout_seconds = config.generation_timeout_seconds;
    auto ollama_client = std::make_shared<localmind_core::OllamaClient>(ollama_options);

    auto& db_manager = localmind_core::DatabaseManager::get_instance();
    // One connection per worker plus headroom for the HTTP threads.
    db_manager.initialize(config.db_path, config.db_key, config.num_workers + 4);

    auto chunk_store = std::make_shared<localmind_core::ChunkStore>(db_manager);
    auto conversation_repo = std::make_shared<localmind_core::ConversationRepo>(db_manager);
    auto task_queue_repo = std::make_shared<localmind_core::TaskQueueRepo>(db_manager);

    localmind_core::VectorIndexOptions index_options;
    index_options.dimension = static_cast<size_t>(config.embedding_dimension);
    index_options.type = localmind_core::index_type_from_string(config.index_type);
    index_options.hnsw_m = config.hnsw_m;
    index_options.hnsw_ef_construction = config.hnsw_ef_construction;
    index_options.hnsw_ef_search = config.hnsw_ef_search;
    auto knowledge_base =
        std::make_shared<localmind_core::KnowledgeBase>(chunk_store, index_options, config.index_path);

    if (rebuild_index) {
      std::cout << "Rebuilding vector index from the chunk store..." << std::endl;
      knowledge_base->rebuild_index_from_store();
    } else {
      knowledge_base->open();
    }

    auto classifier = std::make_shared<localmind_core::KeywordClassifier>(
        config.category_dictionary_path.empty()
            ? localmind_core::KeywordClassifier()
            : localmind_core::KeywordClassifier::from_file(config.category_dictionary_path));
    auto keyword_extractor = std::make_shared<localmind_core::KeywordExtractor>();
    auto extractor_factory = std::make_shared<localmind_core::ContentExtractorFactory>();

    localmind_core::PipelineOptions pipeline_options;
    pipeline_options.chunker.max_chunk_chars = static_cast<size_t>(config.chunk_size);
    pipeline_options.chunker.overlap_chars = static_cast<size_t>(config.chunk_overlap);
    pipeline_options.embedding_batch_size = static_cast<size_t>(config.embedding_batch_size);
    pipeline_options.max_file_size = static_cast<size_t>(config.max_file_size);
    auto pipeline = std::make_shared<localmind_core::IndexingPipeline>(
        knowledge_base, ollama_client, extractor_factory, classifier, pipeline_options);

    localmind_core::RetrievalOptions retrieval_options;
    retrieval_options.top_k = static_cast<size_t>(config.top_k);
    retrieval_options.max_top_k = static_cast<size_t>(config.max_top_k);
    retrieval_options.candidate_multiplier = static_cast<size_t>(config.candidate_multiplier);
    retrieval_options.min_score = config.min_score;
    retrieval_options.category_boost = config.category_boost;
    auto retriever =
        std::make_shared<localmind_core::Retriever>(knowledge_base, ollama_client, classifier, retrieval_options);

    auto exporter = std::make_shared<localmind_core::ChatExporter>(conversation_repo, config.export_dir);
    auto tools = std::make_shared<localmind_core::ToolRegistry>(std::chrono::seconds(config.tool_timeout_seconds));
    localmind_core::register_builtin_tools(
        *tools, {retriever, knowledge_base, conversation_repo, classifier, keyword_extractor, exporter});

    localmind_core::OrchestratorOptions orchestrator_options;
    orchestrator_options.max_tool_iterations = static_cast<size_t>(config.max_tool_iterations);
    orchestrator_options.history_turns = static_cast<size_t>(config.history_turns);
    orchestrator_options.generation.max_tokens = config.max_tokens;
    orchestrator_options.generation.temperature = config.temperature;
    orchestrator_options.generation.top_p = config.top_p;

    localmind_core::OrchestratorComponents components;
    components.retriever = retriever;
    components.tools = tools;
    components.generator = ollama_client;
    components.conversations = conversation_repo;
    components.classifier = classifier;
    components.keyword_extractor = keyword_extractor;
    components.planner = std::make_shared<localmind_core::HeuristicPlanner>(tools, keyword_extractor);
    components.prompt_builder = std::make_shared<localmind_core::PromptBuilder>(
        localmind_core::PromptBudget{static_cast<size_t>(config.context_budget_chars)}, config.response_language);
    components.style_analyzer = std::make_shared<localmind_core::StyleAnalyzer>(keyword_extractor);
    auto orchestrator = std::make_shared<localmind_core::RagOrchestrator>(components, orchestrator_options);

    auto services = std::make_shared<localmind_core::ServiceProvider>(task_queue_repo, pipeline);
    auto worker_pool =
        std::make_unique<localmind_core::async::WorkerPool>(static_cast<size_t>(config.num_workers), services);

    localmind_api::Server server(config.host(), config.port(), static_cast<unsigned int>(config.http_threads));
    localmind_api::Routes routes({knowledge_base, pipeline, retriever, orchestrator, tools, conversation_repo,
                                  exporter, task_queue_repo, extractor_factory});
    routes.register_routes(server);

    // --- 2. START BACKGROUND SERVICES ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    worker_pool->start();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/5] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/5] Stopping worker pool to finish processing..." << std::endl;
    worker_pool->stop();
    worker_pool.reset();  // joins the worker threads

    std::cout << "[3/5] Waiting for timed-out tool calls..." << std::endl;
    tools->wait_for_outstanding();

    std::cout << "[4/5] Writing final index snapshot..." << std::endl;
    knowledge_base->close();

    std::cout << "[5/5] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const localmind_core::IndexInconsistencyError& e) {
    std::cerr << "Index inconsistency: " << e.what() << std::endl;
    std::cerr << "Restart with --rebuild-index to rebuild the vector index from the chunk store." << std::endl;
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
