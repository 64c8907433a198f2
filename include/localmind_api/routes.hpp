#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "localmind_core/errors.hpp"
#include "server.hpp"

namespace localmind_core {
class ChatExporter;
class ContentExtractorFactory;
class ConversationRepo;
class IndexingPipeline;
class KnowledgeBase;
class RagOrchestrator;
class Retriever;
class StyleAnalyzer;
class TaskQueueRepo;
class ToolRegistry;
}  // namespace localmind_core

namespace localmind_api {

struct RouteServices {
  std::shared_ptr<localmind_core::KnowledgeBase> knowledge_base;
  std::shared_ptr<localmind_core::IndexingPipeline> pipeline;
  std::shared_ptr<localmind_core::Retriever> retriever;
  std::shared_ptr<localmind_core::RagOrchestrator> orchestrator;
  std::shared_ptr<localmind_core::ToolRegistry> tools;
  std::shared_ptr<localmind_core::ConversationRepo> conversations;
  std::shared_ptr<localmind_core::ChatExporter> exporter;
  std::shared_ptr<localmind_core::TaskQueueRepo> task_queue_repo;
  std::shared_ptr<localmind_core::ContentExtractorFactory> extractors;
};

class Routes {
 public:
  explicit Routes(RouteServices services);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  Routes(Routes &&) noexcept = default;
  Routes &operator=(Routes &&) noexcept = default;

  void register_routes(Server &server);

  // Handlers are public so they can be driven without a listening socket.
  crow::response handle_health_check(const crow::request &req);

  crow::response handle_ingest_document(const crow::request &req);
  crow::response handle_list_documents(const crow::request &req);
  crow::response handle_remove_document(const crow::request &req);

  crow::response handle_search(const crow::request &req);
  crow::response handle_chat(const crow::request &req);
  crow::response handle_style(const crow::request &req);

  crow::response handle_create_conversation(const crow::request &req);
  crow::response handle_list_conversations(const crow::request &req);
  crow::response handle_get_turns(const crow::request &req, const std::string &conversation_id);
  crow::response handle_export_conversation(const crow::request &req, const std::string &conversation_id);
  crow::response handle_delete_conversation(const crow::request &req, const std::string &conversation_id);

  crow::response handle_statistics(const crow::request &req);
  crow::response handle_list_categories(const crow::request &req);
  crow::response handle_create_category(const crow::request &req);

  crow::response handle_list_tools(const crow::request &req);
  crow::response handle_invoke_tool(const crow::request &req, const std::string &tool_name);

  crow::response handle_list_tasks(const crow::request &req);
  crow::response handle_get_task_status(const crow::request &req, const std::string &task_id);
  crow::response handle_get_task_progress(const crow::request &req, const std::string &task_id);
  crow::response handle_clear_tasks(const crow::request &req);

  crow::response handle_save_snapshot(const crow::request &req);
  crow::response handle_rebuild_index(const crow::request &req);
  crow::response handle_verify_index(const crow::request &req);

  static int status_for(localmind_core::ErrorKind kind);

 private:
  RouteServices services_;

  crow::response run_builtin_tool(const std::string &tool_name, const nlohmann::json &arguments);

  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error,
                                       const std::string &kind = "");
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  crow::response create_error_json(const localmind_core::LocalMindError &e);
};

}  // namespace localmind_api
