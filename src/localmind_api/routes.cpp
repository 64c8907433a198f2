#include "localmind_api/routes.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <set>

#include "localmind_core/db/conversation_repo.hpp"
#include "localmind_core/db/sql_time.hpp"
#include "localmind_core/db/task_queue_repo.hpp"
#include "localmind_core/extractors/content_extractor_factory.hpp"
#include "localmind_core/index/knowledge_base.hpp"
#include "localmind_core/ingest/indexing_pipeline.hpp"
#include "localmind_core/rag/rag_orchestrator.hpp"
#include "localmind_core/rag/retriever.hpp"
#include "localmind_core/tools/chat_exporter.hpp"
#include "localmind_core/tools/tool_registry.hpp"

namespace localmind_api {

using namespace localmind_core;

namespace {

nlohmann::json task_to_json(const TaskDTO &task) {
  nlohmann::json task_json;
  task_json["id"] = task.id;
  task_json["task_type"] = task.task_type;
  task_json["status"] = to_string(task.status);
  task_json["priority"] = task.priority;
  task_json["target_path"] = task.target_path ? nlohmann::json(*task.target_path) : nlohmann::json(nullptr);
  task_json["error_message"] =
      task.error_message ? nlohmann::json(*task.error_message) : nlohmann::json(nullptr);
  task_json["created_at"] = time_point_to_string(task.created_at);
  task_json["updated_at"] = time_point_to_string(task.updated_at);
  return task_json;
}

nlohmann::json conversation_to_json(const Conversation &conversation) {
  return {{"id", conversation.id},
          {"title", conversation.title},
          {"category", conversation.category},
          {"turn_count", conversation.turn_count},
          {"created_at", time_point_to_string(conversation.created_at)},
          {"updated_at", time_point_to_string(conversation.updated_at)}};
}

nlohmann::json turn_to_json(const ConversationTurn &turn) {
  nlohmann::json calls = nlohmann::json::array();
  for (const auto &call : turn.tool_calls) {
    calls.push_back(to_json(call));
  }
  return {{"id", turn.id},
          {"conversation_id", turn.conversation_id},
          {"user_query", turn.user_query},
          {"response", turn.response},
          {"category", turn.category},
          {"keywords", turn.keywords},
          {"retrieved_chunk_ids", turn.retrieved_chunk_ids},
          {"tool_calls", calls},
          {"created_at", time_point_to_string(turn.created_at)}};
}

nlohmann::json document_to_json(const DocumentInfo &info) {
  return {{"id", info.id},
          {"file_type", to_string(info.file_type)},
          {"content_hash", info.content_hash},
          {"file_size", info.file_size},
          {"chunk_count", info.chunk_count},
          {"ingested_at", time_point_to_string(info.ingested_at)}};
}

std::set<std::string> read_categories(const nlohmann::json &body) {
  std::set<std::string> categories;
  if (!body.contains("categories")) {
    return categories;
  }
  const auto &value = body.at("categories");
  if (!value.is_array()) {
    throw InvalidArgumentError("categories must be an array of strings");
  }
  for (const auto &category : value) {
    if (!category.is_string()) {
      throw InvalidArgumentError("categories must be an array of strings");
    }
    categories.insert(category.get<std::string>());
  }
  return categories;
}

// Clamped to max_top_k.
size_t read_top_k(const nlohmann::json &body, size_t max_top_k) {
  if (!body.contains("top_k")) {
    return 0;
  }
  const auto &value = body.at("top_k");
  if (value.is_number_unsigned()) {
    return static_cast<size_t>(std::min<std::uint64_t>(value.get<std::uint64_t>(), max_top_k));
  }
  long long top_k = value.get<long long>();
  if (top_k < 0) {
    throw InvalidArgumentError("top_k cannot be negative");
  }
  return std::min(static_cast<size_t>(top_k), max_top_k);
}

std::vector<ToolCallRequest> read_tool_requests(const nlohmann::json &body) {
  std::vector<ToolCallRequest> requests;
  if (!body.contains("tools")) {
    return requests;
  }
  const auto &tools = body.at("tools");
  if (!tools.is_array()) {
    throw InvalidArgumentError("tools must be an array");
  }
  for (const auto &entry : tools) {
    if (!entry.is_object() || !entry.contains("name") || !entry.at("name").is_string()) {
      throw InvalidArgumentError("Each tool request needs a name");
    }
    ToolCallRequest request;
    request.name = entry.at("name").get<std::string>();
    request.arguments = entry.value("arguments", nlohmann::json::object());
    request.required = entry.value("required", false);
    requests.push_back(std::move(request));
  }
  return requests;
}

TurnRequest read_turn_request(const nlohmann::json &body, size_t max_top_k) {
  TurnRequest request;
  request.query = body.value("query", std::string());
  request.conversation_id = body.value("conversation_id", std::string());
  request.tool_requests = read_tool_requests(body);
  request.retrieve = body.value("retrieve", true);
  request.top_k = read_top_k(body, max_top_k);
  request.categories = read_categories(body);
  request.category_scoped = body.value("category_scoped", false);
  if (body.contains("min_score")) {
    request.min_score = body.at("min_score").get<float>();
  }
  request.persist = body.value("persist", true);
  return request;
}

}  // namespace

Routes::Routes(RouteServices services) : services_(std::move(services)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // Documents
  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::GET)([this](const crow::request &req) { return handle_list_documents(req); });
  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req) { return handle_ingest_document(req); });
  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req) { return handle_remove_document(req); });

  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });
  CROW_ROUTE(app, "/chat").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_chat(req);
  });
  CROW_ROUTE(app, "/style").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_style(req);
  });

  // Conversations
  CROW_ROUTE(app, "/conversations")
      .methods(crow::HTTPMethod::GET)([this](const crow::request &req) { return handle_list_conversations(req); });
  CROW_ROUTE(app, "/conversations")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req) { return handle_create_conversation(req); });
  CROW_ROUTE(app, "/conversations/<string>/turns")
  ([this](const crow::request &req, const std::string &id) { return handle_get_turns(req, id); });
  CROW_ROUTE(app, "/conversations/<string>/export")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &id) {
        return handle_export_conversation(req, id);
      });
  CROW_ROUTE(app, "/conversations/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, const std::string &id) {
        return handle_delete_conversation(req, id);
      });

  CROW_ROUTE(app, "/statistics")
  ([this](const crow::request &req) { return handle_statistics(req); });

  CROW_ROUTE(app, "/categories")
      .methods(crow::HTTPMethod::GET)([this](const crow::request &req) { return handle_list_categories(req); });
  CROW_ROUTE(app, "/categories")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req) { return handle_create_category(req); });

  // Tools
  CROW_ROUTE(app, "/tools")
  ([this](const crow::request &req) { return handle_list_tools(req); });
  CROW_ROUTE(app, "/tools/<string>/invoke")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &name) {
        return handle_invoke_tool(req, name);
      });

  // Task management
  CROW_ROUTE(app, "/tasks")
  ([this](const crow::request &req) { return handle_list_tasks(req); });
  CROW_ROUTE(app, "/tasks/<string>/status")
  ([this](const crow::request &req, const std::string &task_id) { return handle_get_task_status(req, task_id); });
  CROW_ROUTE(app, "/tasks/<string>/progress")
  ([this](const crow::request &req, const std::string &task_id) {
    return handle_get_task_progress(req, task_id);
  });
  CROW_ROUTE(app, "/tasks/clear").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_clear_tasks(req);
  });

  // Index maintenance
  CROW_ROUTE(app, "/index/snapshot").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_save_snapshot(req);
  });
  CROW_ROUTE(app, "/index/rebuild").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_rebuild_index(req);
  });
  CROW_ROUTE(app, "/index/verify")
  ([this](const crow::request &req) { return handle_verify_index(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

int Routes::status_for(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidArgument:
    case ErrorKind::ContentError:
      return 400;
    case ErrorKind::UnknownTool:
      return 404;
    case ErrorKind::IndexInconsistency:
    case ErrorKind::Cancelled:
      return 409;
    case ErrorKind::ToolLoopExceeded:
    case ErrorKind::ToolFailure:
      return 422;
    case ErrorKind::EmbeddingUnavailable:
    case ErrorKind::GenerationUnavailable:
      return 503;
    case ErrorKind::ToolTimeout:
      return 504;
    default:
      return 500;
  }
}

crow::response Routes::handle_health_check(const crow::request &) {
  nlohmann::json response = create_success_response("LocalMind API is running");
  response["version"] = "0.1.0";
  response["status"] = services_.knowledge_base->is_mutation_locked() ? "degraded" : "healthy";
  return create_json_response(response);
}

// ============================================================================
// Documents
// ============================================================================

crow::response Routes::handle_ingest_document(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    std::string file_path = body.value("file_path", std::string());
    if (file_path.empty()) {
      throw InvalidArgumentError("file_path is required");
    }
    if (!std::filesystem::exists(file_path)) {
      throw InvalidArgumentError("File not found: " + file_path);
    }
    if (!services_.extractors->is_supported(file_path)) {
      throw ContentError("Unsupported file type: " + file_path);
    }

    long long task_id = services_.task_queue_repo->enqueue_ingest(file_path);
    std::cout << "Queued ingestion of " << file_path << " as task " << task_id << std::endl;
    return create_json_response(create_success_response("Document ingestion queued", {{"task_id", task_id}}), 202);
  } catch (const LocalMindError &e) {
    return create_error_json(e);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_ingest_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_list_documents(const crow::request &) {
  try {
    nlohmann::json documents = nlohmann::json::array();
    for (const auto &info : services_.knowledge_base->documents()) {
      documents.push_back(document_to_json(info));
    }
    return create_json_response(create_success_response("Documents retrieved", documents));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_list_documents: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_remove_document(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    std::string document_id = body.value("document_id", std::string());
    if (document_id.empty()) {
      throw InvalidArgumentError("document_id is required");
    }
    if (!services_.knowledge_base->document(document_id)) {
      return create_json_response(create_error_response("Unknown document: " + document_id, "InvalidArgument"),
                                  404);
    }
    long long task_id = services_.task_queue_repo->enqueue_remove(document_id);
    return create_json_response(create_success_response("Document removal queued", {{"task_id", task_id}}), 202);
  } catch (const LocalMindError &e) {
    return create_error_json(e);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_remove_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

// ============================================================================
// Query endpoints
// ============================================================================

crow::response Routes::handle_search(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    RetrievalRequest request;
    request.query = body.value("query", std::string());
    request.top_k = read_top_k(body, services_.retriever->options().max_top_k);
    request.categories = read_categories(body);
    request.category_scoped = body.value("category_scoped", false);
    if (body.contains("min_score")) {
      request.min_score = body.at("min_score").get<float>();
    }

    std::cout << "Search for: " << request.query << " with top_k: " << request.top_k << std::endl;
    RetrievalOutcome outcome = services_.retriever->retrieve(request);

    nlohmann::json chunks = nlohmann::json::array();
    for (const auto &scored : outcome.chunks) {
      chunks.push_back({{"id", scored.chunk.id},
                        {"document_id", scored.chunk.document_id},
                        {"chunk_index", scored.chunk.chunk_index},
                        {"start_offset", scored.chunk.start_offset},
                        {"end_offset", scored.chunk.end_offset},
                        {"content", scored.chunk.content},
                        {"categories", scored.chunk.categories},
                        {"score", scored.score},
                        {"adjusted_score", scored.adjusted_score},
                        {"category_match", scored.category_match}});
    }
    nlohmann::json data = {{"query_categories", outcome.query_categories}, {"chunks", chunks}};
    return create_json_response(create_success_response("Search completed", data));
  } catch (const LocalMindError &e) {
    return create_error_json(e);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what(), "InvalidArgument"), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_search: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_chat(const crow::request &req) {
  try {
    TurnRequest request = read_turn_request(parse_json_body(req.body), services_.retriever->options().max_top_k);
    TurnOutcome outcome = services_.orchestrator->run(request);
    int status = outcome.ok() ? 200 : status_for(*outcome.error_kind);
    nlohmann::json response = outcome.to_json();
    response["success"] = outcome.ok();
    return create_json_response(response, status);
  } catch (const LocalMindError &e) {
    return create_error_json(e);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what(), "InvalidArgument"), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_chat: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_style(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    TurnRequest request = read_turn_request(body, services_.retriever->options().max_top_k);
    request.style_mode = true;
    request.style_exemplar = body.value("exemplar", std::string());
    TurnOutcome outcome = services_.orchestrator->run(request);
    int status = outcome.ok() ? 200 : status_for(*outcome.error_kind);
    nlohmann::json response = outcome.to_json();
    response["success"] = outcome.ok();
    return create_json_response(response, status);
  } catch (const LocalMindError &e) {
    return create_error_json(e);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what(), "InvalidArgument"), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_style: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

// ============================================================================
// Conversations
// ============================================================================

crow::response Routes::handle_create_conversation(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    std::string id = services_.conversations->create_conversation(body.value("title", std::string("New chat")),
                                                                  body.value("category", std::string()));
    return create_json_response(create_success_response("Conversation created", {{"conversation_id", id}}), 201);
  } catch (const LocalMindError &e) {
    return create_error_json(e);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_create_conversation: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_list_conversations(const crow::request &req) {
  try {
    size_t limit = 50;
    if (const char *param = req.url_params.get("limit")) {
      limit = static_cast<size_t>(std::stoul(param));
    }
    nlohmann::json conversations = nlohmann::json::array();
    for (const auto &conversation : services_.conversations->list_conversations(limit)) {
      conversations.push_back(conversation_to_json(conversation));
    }
    return create_json_response(create_success_response("Conversations retrieved", conversations));
  } catch (const std::invalid_argument &) {
    return create_json_response(create_error_response("Invalid limit", "InvalidArgument"), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_list_conversations: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_get_turns(const crow::request &, const std::string &conversation_id) {
  try {
    auto conversation = services_.conversations->get_conversation(conversation_id);
    if (!conversation) {
      return create_json_response(create_error_response("Conversation not found"), 404);
    }
    nlohmann::json turns = nlohmann::json::array();
    for (const auto &turn : services_.conversations->get_turns(conversation_id)) {
      turns.push_back(turn_to_json(turn));
    }
    nlohmann::json data = conversation_to_json(*conversation);
    data["turns"] = turns;
    return create_json_response(create_success_response("Turns retrieved", data));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_get_turns: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_export_conversation(const crow::request &req, const std::string &conversation_id) {
  try {
    auto body = parse_json_body(req.body);
    ExportResult result =
        services_.exporter->export_conversation(conversation_id, body.value("format", std::string("md")));
    nlohmann::json data = {
        {"filename", result.filename}, {"path", result.path.string()}, {"turn_count", result.turn_count}};
    return create_json_response(create_success_response("Conversation exported", data));
  } catch (const LocalMindError &e) {
    return create_error_json(e);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_export_conversation: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_delete_conversation(const crow::request &, const std::string &conversation_id) {
  try {
    if (!services_.conversations->delete_conversation(conversation_id)) {
      return create_json_response(create_error_response("Conversation not found"), 404);
    }
    return create_json_response(create_success_response("Conversation deleted"));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_delete_conversation: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

// ============================================================================
// Statistics, categories and tools
// ============================================================================

crow::response Routes::run_builtin_tool(const std::string &tool_name, const nlohmann::json &arguments) {
  ToolCallRecord record = services_.tools->invoke({tool_name, arguments, true}, ToolContext{});
  if (!record.success) {
    ErrorKind kind = error_kind_from_string(record.error_kind);
    return create_json_response(create_error_response(record.error, record.error_kind), status_for(kind));
  }
  return create_json_response(create_success_response(record.summary, record.result));
}

crow::response Routes::handle_statistics(const crow::request &) {
  try {
    return run_builtin_tool("get_statistics", nlohmann::json::object());
  } catch (const LocalMindError &e) {
    return create_error_json(e);
  }
}

crow::response Routes::handle_list_categories(const crow::request &) {
  try {
    return run_builtin_tool("list_categories", nlohmann::json::object());
  } catch (const LocalMindError &e) {
    return create_error_json(e);
  }
}

crow::response Routes::handle_create_category(const crow::request &req) {
  try {
    return run_builtin_tool("create_category", parse_json_body(req.body));
  } catch (const LocalMindError &e) {
    return create_error_json(e);
  }
}

crow::response Routes::handle_list_tools(const crow::request &) {
  return create_json_response(create_success_response("Tools retrieved", services_.tools->describe_all()));
}

crow::response Routes::handle_invoke_tool(const crow::request &req, const std::string &tool_name) {
  try {
    auto body = parse_json_body(req.body);
    ToolContext context;
    context.conversation_id = body.value("conversation_id", std::string());
    ToolCallRequest request{tool_name, body.value("arguments", nlohmann::json::object()), false};

    ToolCallRecord record = services_.tools->invoke(request, context);
    nlohmann::json response = to_json(record);
    int status = 200;
    if (!record.success) {
      status = status_for(error_kind_from_string(record.error_kind));
    }
    response["success"] = record.success;
    return create_json_response(response, status);
  } catch (const LocalMindError &e) {
    return create_error_json(e);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what(), "InvalidArgument"), 400);
  }
}

// ============================================================================
// Task Management Route Handlers
// ============================================================================

crow::response Routes::handle_list_tasks(const crow::request &req) {
  try {
    std::string status_param = req.url_params.get("status") ? req.url_params.get("status") : "";

    std::vector<TaskDTO> tasks;
    if (!status_param.empty()) {
      TaskStatus status;
      try {
        status = task_status_from_string(status_param);
      } catch (const std::invalid_argument &) {
        return create_json_response(create_error_response("Invalid status filter: " + status_param), 400);
      }
      tasks = services_.task_queue_repo->get_tasks_by_status(status);
    } else {
      tasks = services_.task_queue_repo->list_tasks();
    }

    nlohmann::json tasks_json = nlohmann::json::array();
    for (const auto &task : tasks) {
      tasks_json.push_back(task_to_json(task));
    }
    nlohmann::json response = create_success_response("Tasks retrieved successfully");
    response["data"]["tasks"] = tasks_json;
    response["data"]["count"] = tasks_json.size();
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_list_tasks: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_get_task_status(const crow::request &, const std::string &task_id) {
  try {
    long long id = std::stoll(task_id);
    auto task = services_.task_queue_repo->get_task(id);
    if (!task) {
      return create_json_response(create_error_response("Task not found"), 404);
    }
    nlohmann::json response = create_success_response("Task status retrieved successfully");
    response["data"] = task_to_json(*task);
    return create_json_response(response);
  } catch (const std::invalid_argument &) {
    return create_json_response(create_error_response("Invalid task ID format"), 400);
  } catch (const std::out_of_range &) {
    return create_json_response(create_error_response("Invalid task ID format"), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_get_task_status: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_get_task_progress(const crow::request &, const std::string &task_id) {
  try {
    long long id = std::stoll(task_id);
    auto progress = services_.task_queue_repo->get_task_progress(id);
    if (!progress.has_value()) {
      return create_json_response(create_error_response("Task progress not found"), 404);
    }

    nlohmann::json progress_json;
    progress_json["task_id"] = progress->task_id;
    progress_json["progress_percent"] = progress->progress_percent;
    progress_json["status_message"] = progress->status_message;
    progress_json["updated_at"] = progress->updated_at;

    nlohmann::json response = create_success_response("Task progress retrieved successfully");
    response["data"] = progress_json;
    return create_json_response(response);
  } catch (const std::invalid_argument &) {
    return create_json_response(create_error_response("Invalid task ID format"), 400);
  } catch (const std::out_of_range &) {
    return create_json_response(create_error_response("Invalid task ID format"), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_get_task_progress: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_clear_tasks(const crow::request &req) {
  try {
    int older_than_days = 7;
    if (!req.body.empty()) {
      older_than_days = parse_json_body(req.body).value("older_than_days", 7);
    }
    if (older_than_days < 0) {
      throw InvalidArgumentError("older_than_days cannot be negative");
    }

    int removed = services_.task_queue_repo->clear_finished_tasks(older_than_days);
    nlohmann::json response = create_success_response("Finished tasks cleared successfully");
    response["data"]["older_than_days"] = older_than_days;
    response["data"]["removed"] = removed;
    return create_json_response(response);
  } catch (const LocalMindError &e) {
    return create_error_json(e);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_clear_tasks: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

// ============================================================================
// Index maintenance
// ============================================================================

crow::response Routes::handle_save_snapshot(const crow::request &) {
  try {
    services_.knowledge_base->save_snapshot();
    nlohmann::json data = {{"snapshot_version", services_.knowledge_base->stats().snapshot_version},
                           {"path", services_.knowledge_base->snapshot_path().string()}};
    return create_json_response(create_success_response("Snapshot written", data));
  } catch (const LocalMindError &e) {
    return create_error_json(e);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_save_snapshot: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_rebuild_index(const crow::request &) {
  try {
    size_t vectors = services_.knowledge_base->rebuild_index_from_store();
    return create_json_response(create_success_response("Index rebuilt from store", {{"vectors", vectors}}));
  } catch (const LocalMindError &e) {
    return create_error_json(e);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_rebuild_index: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_verify_index(const crow::request &) {
  try {
    services_.knowledge_base->verify_consistency();
    return create_json_response(create_success_response("Index and store are consistent"));
  } catch (const LocalMindError &e) {
    return create_error_json(e);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_verify_index: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

// ============================================================================
// Helpers
// ============================================================================

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

crow::response Routes::create_error_json(const LocalMindError &e) {
  return create_json_response(create_error_response(e.what(), to_string(e.kind())), status_for(e.kind()));
}

nlohmann::json Routes::create_success_response(const std::string &message, const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error, const std::string &kind) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  if (!kind.empty()) {
    response["kind"] = kind;
  }
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  if (body.empty()) {
    return nlohmann::json::object();
  }
  try {
    auto json = nlohmann::json::parse(body);
    if (!json.is_object()) {
      throw InvalidArgumentError("Request body must be a JSON object");
    }
    return json;
  } catch (const nlohmann::json::parse_error &e) {
    throw InvalidArgumentError(std::string("Malformed JSON body: ") + e.what());
  }
}

}  // namespace localmind_api
